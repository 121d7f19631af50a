// include/Piston/Types/Library.hpp
#ifndef PISTON_LIBRARY_HPP
#define PISTON_LIBRARY_HPP

#include <cstddef>
#include <string>
#include <Piston/Types/Rule.hpp>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace Piston {
    using json = nlohmann::json;

    struct LibraryArtifact {
        std::string path;
        std::string sha1;
        std::size_t size = 0;
        std::string url;

        static LibraryArtifact from_json(const json& j);
    };

    struct LibraryDownloads {
        std::optional<LibraryArtifact> artifact;
        std::map<std::string, LibraryArtifact> classifiers; // Key: e.g., "natives-linux"

        static LibraryDownloads from_json(const json& j);
    };

    struct LibraryExtractRule {
        std::vector<std::string> exclude;

        bool empty() const { return exclude.empty(); }

        static LibraryExtractRule from_json(const json& j);
    };

    struct Library {
        std::string name;
        LibraryDownloads downloads;
        std::vector<Rule> rules;
        std::map<OsName, std::string> natives; // OS to classifier key, e.g. linux -> "natives-linux"
        LibraryExtractRule extract;

        // A library is used only when every one of its rules allows the host
        bool isAllowed(Utils::OperatingSystem hostOs, Utils::Architecture hostArch) const;
        bool isAllowed() const;

        const std::optional<LibraryArtifact>& artifact() const { return downloads.artifact; }

        // Native classifier for the host, looked up through natives then downloads.classifiers
        std::optional<LibraryArtifact> native(Utils::OperatingSystem hostOs, Utils::Architecture hostArch) const;
        std::optional<LibraryArtifact> native() const;

        static Library from_json(const json& j);
    };
}

#endif // PISTON_LIBRARY_HPP
