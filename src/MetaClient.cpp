// src/MetaClient.cpp
#include <Piston/MetaClient.hpp>
#include <Piston/HttpManager.hpp>
#include <Piston/FetchError.hpp>
#include <Piston/Utils/Logger.hpp>

#include <nlohmann/json.hpp> // Full include for json::parse and usage
#include <utility>

namespace Piston {

static std::shared_ptr<spdlog::logger>& get_meta_logger() {
    static std::shared_ptr<spdlog::logger> meta_logger = Utils::Logger::GetOrCreateLogger("MetaClient");
    return meta_logger;
}

namespace {
    template <typename T, typename Decoder>
    T decodeDocument(const std::string& body, const std::string& url, Decoder decoder) {
        nlohmann::json document;
        try {
            document = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            get_meta_logger()->error("Failed to parse JSON from {}: {}", url, e.what());
            throw FetchError(FetchError::Kind::DECODE, url, 200, e.what());
        }

        try {
            return decoder(document);
        } catch (const nlohmann::json::exception& e) {
            get_meta_logger()->error("Unexpected document shape at {}: {}", url, e.what());
            throw FetchError(FetchError::Kind::DECODE, url, 200, e.what());
        } catch (const std::runtime_error& e) {
            get_meta_logger()->error("Unexpected value in document at {}: {}", url, e.what());
            throw FetchError(FetchError::Kind::DECODE, url, 200, e.what());
        }
    }
}

DownloadType mapping_download_type(MappingSide side) {
    return side == MappingSide::SERVER ? DownloadType::SERVER_MAPPINGS : DownloadType::CLIENT_MAPPINGS;
}

MetaClient::MetaClient(HttpManager& httpManager, std::string manifestUrl)
    : m_httpManager(httpManager), m_manifestUrl(std::move(manifestUrl)) {
    m_logger = get_meta_logger();
    m_logger->trace("Initialized with manifest URL {}", m_manifestUrl);
}

void MetaClient::checkResponse(const cpr::Response& response, const std::string& url) {
    if (response.error.code != cpr::ErrorCode::OK) {
        get_meta_logger()->error("Request to {} failed: {}", url, response.error.message);
        throw FetchError(FetchError::Kind::NETWORK, url, response.status_code, response.error.message);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        get_meta_logger()->error("Request to {} returned status {}", url, response.status_code);
        if (!response.text.empty() && response.status_code >= 400) {
            get_meta_logger()->debug("Response: {:.200}", response.text);
        }
        throw FetchError(FetchError::Kind::STATUS, url, response.status_code,
                         "HTTP status " + std::to_string(response.status_code));
    }
}

RootManifest MetaClient::decodeRootManifest(const std::string& body, const std::string& url) {
    return decodeDocument<RootManifest>(body, url, [](const nlohmann::json& j) { return RootManifest::from_json(j); });
}

VersionManifest MetaClient::decodeVersionManifest(const std::string& body, const std::string& url) {
    return decodeDocument<VersionManifest>(body, url, [](const nlohmann::json& j) { return VersionManifest::from_json(j); });
}

std::string MetaClient::fetchBody(const std::string& url) {
    cpr::Response response = m_httpManager.Get(cpr::Url{url});
    checkResponse(response, url);
    m_logger->debug("Fetched {} ({} bytes)", url, response.text.size());
    return std::move(response.text);
}

RootManifest MetaClient::fetchRootManifest() {
    return fetchRootManifest(m_manifestUrl);
}

RootManifest MetaClient::fetchRootManifest(const std::string& url) {
    m_logger->info("Fetching version manifest from {}", url);
    return decodeRootManifest(fetchBody(url), url);
}

VersionManifest MetaClient::fetchVersionManifest(const VersionRelease& release) {
    m_logger->info("Fetching version details for {}", release.id);
    return fetchVersionManifest(release.url);
}

VersionManifest MetaClient::fetchVersionManifest(const std::string& url) {
    return decodeVersionManifest(fetchBody(url), url);
}

Bytes MetaClient::downloadBytes(const std::string& url) {
    std::string body = fetchBody(url);
    return Bytes(body.begin(), body.end());
}

std::string MetaClient::downloadText(const std::string& url) {
    return fetchBody(url);
}

void MetaClient::downloadStream(const std::string& url, const std::function<bool(std::string_view)>& sink) {
    bool stoppedBySink = false;
    cpr::WriteCallback write{[&](std::string_view data, intptr_t) -> bool {
        if (!sink(data)) {
            stoppedBySink = true;
            return false;
        }
        return true;
    }};

    cpr::Response response = m_httpManager.Download(write, cpr::Url{url});
    if (stoppedBySink) {
        m_logger->debug("Stream from {} stopped by consumer after {} bytes", url, response.downloaded_bytes);
        return;
    }
    checkResponse(response, url);
}

std::optional<LibraryFiles> MetaClient::downloadLibrary(const Library& library) {
    if (!library.isAllowed()) {
        m_logger->debug("Library {} is excluded by its rules on this host", library.name);
        return std::nullopt;
    }

    LibraryFiles files;
    if (const auto& artifact = library.artifact()) {
        files.artifact = DownloadedFile{artifact->path, downloadBytes(artifact->url)};
    }
    if (auto native = library.native()) {
        files.native = DownloadedFile{native->path, downloadBytes(native->url)};
    }
    m_logger->debug("Downloaded library {} (artifact: {}, native: {})",
        library.name, files.artifact.has_value(), files.native.has_value());
    return files;
}

bool MetaClient::downloadLibraryStream(const Library& library, const LibraryChunkSink& sink) {
    if (!library.isAllowed()) {
        m_logger->debug("Library {} is excluded by its rules on this host", library.name);
        return false;
    }

    bool stopped = false;
    auto streamFile = [&](const LibraryArtifact& file) {
        downloadStream(file.url, [&](std::string_view chunk) {
            if (!sink(file.path, chunk)) {
                stopped = true;
                return false;
            }
            return true;
        });
    };

    if (const auto& artifact = library.artifact()) {
        streamFile(*artifact);
    }
    if (!stopped) {
        if (auto native = library.native()) {
            streamFile(*native);
        }
    }
    m_logger->debug("Streamed library {}{}", library.name, stopped ? " (stopped by consumer)" : "");
    return true;
}

std::optional<VersionRelease> MetaClient::resolveRelease(const RootManifest& manifest, const std::string& versionIdOrAlias) {
    if (versionIdOrAlias == "latest") {
        return manifest.latestRelease();
    }
    if (versionIdOrAlias == "snapshot") {
        return manifest.latestSnapshot();
    }
    return manifest.find(versionIdOrAlias);
}

ConvertedMappings MetaClient::fetchMappings(const std::string& versionIdOrAlias, MappingSide side) {
    RootManifest root = fetchRootManifest();
    auto release = resolveRelease(root, versionIdOrAlias);
    if (!release) {
        throw FetchError(FetchError::Kind::DECODE, m_manifestUrl, 200,
                         "version '" + versionIdOrAlias + "' is not listed in the manifest");
    }

    VersionManifest version = fetchVersionManifest(*release);
    DownloadType type = mapping_download_type(side);
    auto mappings = version.download(type);
    if (!mappings) {
        throw FetchError(FetchError::Kind::DECODE, release->url, 200,
                         "version " + version.id + " publishes no " + download_type_to_string(type));
    }

    m_logger->info("Downloading {} for {} ({} bytes)", download_type_to_string(type), version.id, mappings->size);
    std::string text = downloadText(mappings->url);

    ConvertedMappings converted;
    converted.versionId = version.id;
    converted.text = Mappings::convertMappings(text, converted.stats);
    m_logger->info("Converted {} mappings: {} classes, {} methods, {} fields",
        version.id, converted.stats.classes, converted.stats.methods, converted.stats.fields);
    return converted;
}

} // namespace Piston
