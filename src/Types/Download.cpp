// src/Types/Download.cpp
#include <Piston/Types/Download.hpp>
#include <stdexcept>

namespace Piston {

DownloadInfo DownloadInfo::from_json(const json& j) {
    DownloadInfo dl;
    dl.sha1 = j.at("sha1").get<std::string>();
    dl.size = j.at("size").get<std::size_t>();
    dl.url = j.at("url").get<std::string>();
    return dl;
}

DownloadType string_to_download_type(const std::string& s) {
    if (s == "client") return DownloadType::CLIENT;
    if (s == "server") return DownloadType::SERVER;
    if (s == "client_mappings") return DownloadType::CLIENT_MAPPINGS;
    if (s == "server_mappings") return DownloadType::SERVER_MAPPINGS;
    throw std::runtime_error("Unknown download type string: " + s);
}

std::string download_type_to_string(DownloadType type) {
    switch (type) {
        case DownloadType::CLIENT: return "client";
        case DownloadType::SERVER: return "server";
        case DownloadType::CLIENT_MAPPINGS: return "client_mappings";
        case DownloadType::SERVER_MAPPINGS: return "server_mappings";
        default: throw std::runtime_error("Unknown DownloadType enum");
    }
}

} // namespace Piston
