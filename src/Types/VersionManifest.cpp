// src/Types/VersionManifest.cpp
#include <Piston/Types/VersionManifest.hpp>
#include <Piston/Utils/Logger.hpp>

namespace Piston {

std::optional<DownloadInfo> VersionManifest::download(DownloadType type) const {
    auto it = downloads.find(type);
    if (it == downloads.end()) {
        return std::nullopt;
    }
    return it->second;
}

VersionManifest VersionManifest::from_json(const nlohmann::json& j) {
    CORE_LOG_TRACE("[VersionParser] Parsing version JSON for ID: {}", j.value("id", "UNKNOWN_VERSION_ID"));
    VersionManifest version;

    version.id = j.at("id").get<std::string>();

    if (j.contains("downloads") && j.at("downloads").is_object()) {
        for (auto& [key, val_json] : j.at("downloads").items()) {
            try {
                DownloadType type = string_to_download_type(key);
                version.downloads[type] = DownloadInfo::from_json(val_json);
            } catch (const std::runtime_error& e) {
                CORE_LOG_WARN("[VersionParser] Skipping unknown download type '{}': {}", key, e.what());
            }
        }
    }

    if (j.contains("libraries") && j.at("libraries").is_array()) {
        for (const auto& lib_json : j.at("libraries")) {
            version.libraries.push_back(Library::from_json(lib_json));
        }
    }

    CORE_LOG_TRACE("[VersionParser] Parsed version {}: {} downloads, {} libraries",
        version.id, version.downloads.size(), version.libraries.size());
    return version;
}

} // namespace Piston
