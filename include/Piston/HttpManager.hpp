// include/Piston/HttpManager.hpp
#ifndef PISTON_HTTP_MANAGER_HPP
#define PISTON_HTTP_MANAGER_HPP

#include <cpr/cpr.h>
#include <Piston/Config.hpp>
#include <string>
#include <filesystem>
#include <memory>
#include <spdlog/logger.h>

namespace Piston {

    class HttpManager {
    public:
        explicit HttpManager(const Config& config);
        ~HttpManager();

        cpr::Response Get(const cpr::Url& url, const cpr::Parameters& parameters = {});

        // Streams the body through the callback; returning false from it aborts the transfer
        cpr::Response Download(const cpr::WriteCallback& write, const cpr::Url& url);
        // Download to a specified filepath. A failed transfer leaves no partial file behind.
        cpr::Response Download(const std::filesystem::path& filepath, const cpr::Url& url);

        static bool IsSuccess(const cpr::Response& response);

    private:
        std::string m_userAgent;
        std::int32_t m_timeoutMs;
        std::shared_ptr<spdlog::logger> m_logger;

        // One session per request, so the manager can be shared between threads
        cpr::Session CreateSession() const;
    };

} // namespace Piston

#endif // PISTON_HTTP_MANAGER_HPP
