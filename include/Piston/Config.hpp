// include/Piston/Config.hpp
#ifndef PISTON_CONFIG_HPP
#define PISTON_CONFIG_HPP
#include <cstdint>
#include <filesystem>
#include <iostream> // For create_directories logging
#include <string>

namespace Piston {
    inline constexpr const char* kDefaultManifestUrl = "https://piston-meta.mojang.com/mc/game/version_manifest_v2.json";

    struct Config {
        std::filesystem::path baseDataPath;
        std::filesystem::path logsDir;
        std::filesystem::path mappingsDir;
        std::string manifestUrl = kDefaultManifestUrl;
        std::string userAgent = "Piston/0.1";
        std::int32_t requestTimeoutMs = 30000;

        Config(const std::filesystem::path& base = "./.piston_data") : baseDataPath(base) {
            logsDir = baseDataPath / "logs";
            mappingsDir = baseDataPath / "mappings";

            // Runs before the logger exists, so report on stderr directly
            auto create_dir_if_not_exists = [](const std::filesystem::path& p, const std::string& name){
                std::error_code ec;
                if (!std::filesystem::exists(p, ec)) {
                    if (std::filesystem::create_directories(p, ec)) {
                        std::cerr << "Created " << name << " directory: " << p.string() << std::endl;
                    } else {
                        std::cerr << "Failed to create " << name << " directory: " << p.string() << " (" << ec.message() << ")" << std::endl;
                    }
                }
            };

            create_dir_if_not_exists(baseDataPath, "Base Data");
            create_dir_if_not_exists(logsDir, "Logs");
            create_dir_if_not_exists(mappingsDir, "Mappings");
        }
    };
}
#endif // PISTON_CONFIG_HPP
