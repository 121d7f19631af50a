// src/Types/RootManifest.cpp
#include <Piston/Types/RootManifest.hpp>
#include <Piston/Utils/Logger.hpp>
#include <stdexcept>

namespace Piston {

ReleaseKind string_to_release_kind(const std::string& s) {
    if (s == "snapshot") return ReleaseKind::SNAPSHOT;
    if (s == "release") return ReleaseKind::RELEASE;
    if (s == "old_beta") return ReleaseKind::OLD_BETA;
    if (s == "old_alpha") return ReleaseKind::OLD_ALPHA;
    throw std::runtime_error("Unknown release type: " + s);
}

std::string release_kind_to_string(ReleaseKind kind) {
    switch (kind) {
        case ReleaseKind::SNAPSHOT: return "snapshot";
        case ReleaseKind::RELEASE: return "release";
        case ReleaseKind::OLD_BETA: return "old_beta";
        case ReleaseKind::OLD_ALPHA: return "old_alpha";
        default: throw std::runtime_error("Unknown ReleaseKind enum");
    }
}

LatestReleases LatestReleases::from_json(const json& j) {
    LatestReleases latest;
    latest.release = j.at("release").get<std::string>();
    latest.snapshot = j.at("snapshot").get<std::string>();
    return latest;
}

VersionRelease VersionRelease::from_json(const json& j) {
    VersionRelease release;
    release.id = j.at("id").get<std::string>();
    release.type = string_to_release_kind(j.at("type").get<std::string>());
    release.url = j.at("url").get<std::string>();
    release.time = j.at("time").get<std::string>();
    release.releaseTime = j.at("releaseTime").get<std::string>();
    release.sha1 = j.at("sha1").get<std::string>();
    release.complianceLevel = j.at("complianceLevel").get<unsigned int>();
    return release;
}

std::optional<VersionRelease> RootManifest::find(const std::string& id) const {
    for (const auto& version : versions) {
        if (version.id == id) {
            return version;
        }
    }
    return std::nullopt;
}

std::optional<VersionRelease> RootManifest::latestRelease() const {
    return find(latest.release);
}

std::optional<VersionRelease> RootManifest::latestSnapshot() const {
    return find(latest.snapshot);
}

RootManifest RootManifest::from_json(const json& j) {
    RootManifest manifest;
    manifest.latest = LatestReleases::from_json(j.at("latest"));
    for (const auto& version_json : j.at("versions")) {
        manifest.versions.push_back(VersionRelease::from_json(version_json));
    }
    CORE_LOG_TRACE("[ManifestParser] Parsed root manifest with {} versions (latest release {}, snapshot {})",
        manifest.versions.size(), manifest.latest.release, manifest.latest.snapshot);
    return manifest;
}

} // namespace Piston
