// include/Piston/Types/VersionManifest.hpp
#ifndef PISTON_VERSIONMANIFEST_HPP
#define PISTON_VERSIONMANIFEST_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <Piston/Types/Download.hpp>
#include <Piston/Types/Library.hpp>
#include <nlohmann/json.hpp>

namespace Piston {
    using std::string;
    using json = nlohmann::json;

    // Per-version document ("<id>.json"). Only the fields needed for downloads are decoded.
    struct VersionManifest {
        string id;
        std::map<DownloadType, DownloadInfo> downloads;
        std::vector<Library> libraries;

        std::optional<DownloadInfo> download(DownloadType type) const;

        static VersionManifest from_json(const json& j);
    };
}
#endif // PISTON_VERSIONMANIFEST_HPP
