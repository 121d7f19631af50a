// src/FetchError.cpp
#include <Piston/FetchError.hpp>

namespace Piston {

FetchError::FetchError(Kind kind, const std::string& url, long statusCode, const std::string& message)
    : std::runtime_error(fetch_error_kind_to_string(kind) + " error for " + url + ": " + message),
      m_kind(kind), m_url(url), m_statusCode(statusCode) {}

std::string fetch_error_kind_to_string(FetchError::Kind kind) {
    switch (kind) {
        case FetchError::Kind::NETWORK: return "network";
        case FetchError::Kind::STATUS: return "status";
        case FetchError::Kind::DECODE: return "decode";
    }
    return "unknown";
}

} // namespace Piston
