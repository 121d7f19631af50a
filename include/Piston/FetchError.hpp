// include/Piston/FetchError.hpp
#ifndef PISTON_FETCH_ERROR_HPP
#define PISTON_FETCH_ERROR_HPP

#include <stdexcept>
#include <string>

namespace Piston {

    // The only error raised by MetaClient. Terminal for the call that raised it.
    class FetchError : public std::runtime_error {
    public:
        enum class Kind {
            NETWORK, // transport failure, no usable response
            STATUS,  // response outside 2xx
            DECODE,  // body is not the expected JSON document
        };

        FetchError(Kind kind, const std::string& url, long statusCode, const std::string& message);

        Kind kind() const { return m_kind; }
        const std::string& url() const { return m_url; }
        long statusCode() const { return m_statusCode; }

    private:
        Kind m_kind;
        std::string m_url;
        long m_statusCode;
    };

    std::string fetch_error_kind_to_string(FetchError::Kind kind);

} // namespace Piston

#endif // PISTON_FETCH_ERROR_HPP
