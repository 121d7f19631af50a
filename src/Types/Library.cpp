// src/Types/Library.cpp
#include <Piston/Types/Library.hpp>
#include <algorithm>

namespace Piston {

LibraryArtifact LibraryArtifact::from_json(const json& j) {
    LibraryArtifact artifact;
    if (j.contains("path")) artifact.path = j.at("path").get<std::string>();
    artifact.sha1 = j.at("sha1").get<std::string>();
    artifact.size = j.at("size").get<std::size_t>();
    artifact.url = j.at("url").get<std::string>();
    return artifact;
}

LibraryDownloads LibraryDownloads::from_json(const json& j) {
    LibraryDownloads downloads;
    if (j.contains("artifact")) {
        downloads.artifact = LibraryArtifact::from_json(j.at("artifact"));
    }
    if (j.contains("classifiers")) {
        for (auto& [key, val] : j.at("classifiers").items()) {
            downloads.classifiers[key] = LibraryArtifact::from_json(val);
        }
    }
    return downloads;
}

LibraryExtractRule LibraryExtractRule::from_json(const json& j) {
    LibraryExtractRule extractRule;
    if (j.contains("exclude") && j.at("exclude").is_array()) {
        for (const auto& item : j.at("exclude")) {
            extractRule.exclude.push_back(item.get<std::string>());
        }
    }
    return extractRule;
}

bool Library::isAllowed(Utils::OperatingSystem hostOs, Utils::Architecture hostArch) const {
    return std::all_of(rules.begin(), rules.end(), [&](const Rule& rule) {
        return rule.allows(hostOs, hostArch);
    });
}

bool Library::isAllowed() const {
    return isAllowed(Utils::getCurrentOS(), Utils::getCurrentArch());
}

std::optional<LibraryArtifact> Library::native(Utils::OperatingSystem hostOs, Utils::Architecture hostArch) const {
    auto hostName = os_name_for(hostOs);
    if (!hostName) {
        return std::nullopt;
    }
    auto key = natives.find(*hostName);
    if (key == natives.end()) {
        return std::nullopt;
    }
    // Older manifests key 32/64-bit natives as "natives-windows-${arch}"
    std::string classifierKey = key->second;
    const std::string archToken = "${arch}";
    auto archPos = classifierKey.find(archToken);
    if (archPos != std::string::npos) {
        classifierKey.replace(archPos, archToken.size(), hostArch == Utils::Architecture::X86 || hostArch == Utils::Architecture::ARM32 ? "32" : "64");
    }
    auto classifier = downloads.classifiers.find(classifierKey);
    if (classifier == downloads.classifiers.end()) {
        return std::nullopt;
    }
    return classifier->second;
}

std::optional<LibraryArtifact> Library::native() const {
    return native(Utils::getCurrentOS(), Utils::getCurrentArch());
}

Library Library::from_json(const json& j) {
    Library lib;
    lib.name = j.at("name").get<std::string>();
    lib.downloads = LibraryDownloads::from_json(j.at("downloads"));

    if (j.contains("rules") && j.at("rules").is_array()) {
        for (const auto& rule_json : j.at("rules")) {
            lib.rules.push_back(Rule::from_json(rule_json));
        }
    }

    if (j.contains("natives") && j.at("natives").is_object()) {
        for (auto& [os_key, classifier_val] : j.at("natives").items()) {
            lib.natives[string_to_os_name(os_key)] = classifier_val.get<std::string>();
        }
    }

    if (j.contains("extract") && j.at("extract").is_object()) {
        lib.extract = LibraryExtractRule::from_json(j.at("extract"));
    }

    return lib;
}

} // namespace Piston
