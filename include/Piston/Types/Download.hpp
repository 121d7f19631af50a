// include/Piston/Types/Download.hpp
#ifndef PISTON_DOWNLOAD_HPP
#define PISTON_DOWNLOAD_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace Piston {
    using json = nlohmann::json;

    enum class DownloadType {
        CLIENT = 1,
        SERVER = 2,
        CLIENT_MAPPINGS = 3,
        SERVER_MAPPINGS = 4,
    };

    DownloadType string_to_download_type(const std::string& s);
    std::string download_type_to_string(DownloadType type);

    struct DownloadInfo {
        std::string sha1;
        std::size_t size;
        std::string url;

        static DownloadInfo from_json(const json& j);
    };
}

#endif // PISTON_DOWNLOAD_HPP
