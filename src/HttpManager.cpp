// src/HttpManager.cpp
#include <Piston/HttpManager.hpp>
#include <Piston/Utils/Logger.hpp>
#include <fstream>

namespace Piston {

HttpManager::HttpManager(const Config& config)
    : m_userAgent(config.userAgent), m_timeoutMs(config.requestTimeoutMs) {
    m_logger = Utils::Logger::GetOrCreateLogger("HttpManager");
    m_logger->debug("HttpManager initialized (user agent '{}', timeout {} ms).", m_userAgent, m_timeoutMs);
}

HttpManager::~HttpManager() {
    m_logger->trace("HttpManager shutting down.");
}

cpr::Session HttpManager::CreateSession() const {
    cpr::Session session;
    session.SetSslOptions(cpr::Ssl(cpr::ssl::VerifyHost{true}, cpr::ssl::VerifyPeer{true}));
    session.SetUserAgent(cpr::UserAgent{m_userAgent});
    session.SetTimeout(cpr::Timeout{m_timeoutMs});
    return session;
}

bool HttpManager::IsSuccess(const cpr::Response& response) {
    return response.error.code == cpr::ErrorCode::OK && response.status_code >= 200 && response.status_code < 300;
}

cpr::Response HttpManager::Get(const cpr::Url& url, const cpr::Parameters& parameters) {
    m_logger->trace("GET: {}", url.str());
    cpr::Session session = CreateSession();
    session.SetUrl(url);
    session.SetParameters(parameters);
    cpr::Response response = session.Get();
    if (!IsSuccess(response)) {
        m_logger->warn("GET failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
    }
    return response;
}

cpr::Response HttpManager::Download(const cpr::WriteCallback& write, const cpr::Url& url) {
    m_logger->trace("DOWNLOAD to callback: {}", url.str());
    cpr::Session session = CreateSession();
    session.SetUrl(url);

    cpr::Response response = session.Download(write);

    if (!IsSuccess(response)) {
        m_logger->warn("Download to callback failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
    } else {
        m_logger->debug("Download to callback successful for {}. Bytes: {}", url.str(), response.downloaded_bytes);
    }
    return response;
}

cpr::Response HttpManager::Download(const std::filesystem::path& filepath, const cpr::Url& url) {
    m_logger->info("DOWNLOAD to file: {} -> {}", url.str(), filepath.string());
    std::ofstream file_stream(filepath, std::ios::binary | std::ios::trunc);
    if (!file_stream) {
        cpr::Response r_fail;
        r_fail.error.code = cpr::ErrorCode::UNKNOWN_ERROR;
        r_fail.error.message = "HttpManager::Download: Failed to open file for writing: " + filepath.string();
        r_fail.status_code = 0;
        m_logger->error("{}", r_fail.error.message);
        return r_fail;
    }

    cpr::Session session = CreateSession();
    session.SetUrl(url);

    cpr::Response response = session.Download(file_stream);
    file_stream.close();

    if (!IsSuccess(response)) {
        m_logger->error("Download to file failed for {}. Status: {}, Error: \"{}\", CPR Error Code: {}",
            url.str(), response.status_code, response.error.message, static_cast<int>(response.error.code));
        std::error_code ec;
        if (std::filesystem::remove(filepath, ec)) {
            m_logger->info("Removed partially downloaded file: {}", filepath.string());
        } else if (ec) {
            m_logger->warn("Failed to remove partially downloaded file {}: {}", filepath.string(), ec.message());
        }
    } else {
        m_logger->info("Download to file successful for {} to {}. Size: {}", url.str(), filepath.string(), response.downloaded_bytes);
    }
    return response;
}

} // namespace Piston
