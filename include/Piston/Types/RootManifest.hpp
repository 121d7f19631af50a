// include/Piston/Types/RootManifest.hpp
#ifndef PISTON_ROOTMANIFEST_HPP
#define PISTON_ROOTMANIFEST_HPP

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace Piston {
    using std::string;
    using json = nlohmann::json;

    enum class ReleaseKind {
        SNAPSHOT = 1,
        RELEASE = 2,
        OLD_BETA = 3,
        OLD_ALPHA = 4,
    };

    ReleaseKind string_to_release_kind(const std::string& s);
    std::string release_kind_to_string(ReleaseKind kind);

    struct LatestReleases {
        string release;
        string snapshot;

        static LatestReleases from_json(const json& j);
    };

    // One entry of "versions" in version_manifest_v2.json
    struct VersionRelease {
        string id;
        ReleaseKind type;
        string url;
        string time;        // ISO-8601, kept verbatim
        string releaseTime; // ISO-8601, kept verbatim
        string sha1;
        unsigned int complianceLevel;

        static VersionRelease from_json(const json& j);
    };

    struct RootManifest {
        LatestReleases latest;
        std::vector<VersionRelease> versions; // newest first, as published

        std::optional<VersionRelease> find(const std::string& id) const;
        std::optional<VersionRelease> latestRelease() const;
        std::optional<VersionRelease> latestSnapshot() const;

        static RootManifest from_json(const json& j);
    };
}

#endif // PISTON_ROOTMANIFEST_HPP
