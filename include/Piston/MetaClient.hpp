// include/Piston/MetaClient.hpp
#ifndef PISTON_META_CLIENT_HPP
#define PISTON_META_CLIENT_HPP

#include <Piston/Config.hpp>
#include <Piston/Mappings/MappingConverter.hpp>
#include <Piston/Types/RootManifest.hpp>
#include <Piston/Types/VersionManifest.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <cpr/cpr.h>
#include <spdlog/logger.h>

namespace Piston {

    class HttpManager; // Forward declaration

    enum class MappingSide {
        CLIENT,
        SERVER,
    };

    DownloadType mapping_download_type(MappingSide side);

    using Bytes = std::vector<unsigned char>;

    struct DownloadedFile {
        std::string path; // library-relative path, e.g. "org/lwjgl/lwjgl/3.3.1/lwjgl-3.3.1.jar"
        Bytes content;
    };

    struct LibraryFiles {
        std::optional<DownloadedFile> artifact;
        std::optional<DownloadedFile> native;
    };

    struct ConvertedMappings {
        std::string versionId; // resolved id, never an alias
        std::string text;
        Mappings::ConversionStats stats;
    };

    // Receives the library-relative path of the file being streamed and the next chunk of it
    using LibraryChunkSink = std::function<bool(const std::string& path, std::string_view chunk)>;

    // Typed access to piston-meta. Every fetch either returns a decoded value or throws FetchError.
    class MetaClient {
    public:
        MetaClient(HttpManager& httpManager, std::string manifestUrl = kDefaultManifestUrl);

        RootManifest fetchRootManifest();
        RootManifest fetchRootManifest(const std::string& url);

        VersionManifest fetchVersionManifest(const VersionRelease& release);
        VersionManifest fetchVersionManifest(const std::string& url);

        Bytes downloadBytes(const std::string& url);
        std::string downloadText(const std::string& url);
        // sink receives the body chunk by chunk; returning false stops the transfer without an error
        void downloadStream(const std::string& url, const std::function<bool(std::string_view)>& sink);

        // std::nullopt when the library's rules exclude this host
        std::optional<LibraryFiles> downloadLibrary(const Library& library);
        // Streams the artifact, then the host native. Returns false when the rules exclude this host.
        // A sink returning false ends the whole library transfer.
        bool downloadLibraryStream(const Library& library, const LibraryChunkSink& sink);

        /**
         * @brief Fetches a version's ProGuard mappings and converts them to TSRG.
         * @param versionIdOrAlias A version id, or "latest" / "snapshot".
         * @param side Client or server mappings.
         * @return The converted text together with the id the alias resolved to.
         * @throws FetchError if any request fails or the version has no mappings of that side.
         */
        ConvertedMappings fetchMappings(const std::string& versionIdOrAlias, MappingSide side);

        // "latest" and "snapshot" resolve through RootManifest::latest, anything else by id
        static std::optional<VersionRelease> resolveRelease(const RootManifest& manifest, const std::string& versionIdOrAlias);

        // Throws FetchError NETWORK for transport errors and STATUS for anything outside 2xx
        static void checkResponse(const cpr::Response& response, const std::string& url);

        // Throw FetchError DECODE when the body is not JSON or not shaped like the document
        static RootManifest decodeRootManifest(const std::string& body, const std::string& url);
        static VersionManifest decodeVersionManifest(const std::string& body, const std::string& url);

    private:
        std::string fetchBody(const std::string& url);

        HttpManager& m_httpManager;
        std::string m_manifestUrl;
        std::shared_ptr<spdlog::logger> m_logger;
    };

} // namespace Piston

#endif // PISTON_META_CLIENT_HPP
