#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>

namespace ErrorCodes {

// Numbered error codes grouped by category:
//   Network (1000-1099), API (1100-1199), Configuration (1500-1599), Stream (1600-1699)
enum class Code {
    UNKNOWN_ERROR = 0,

    NETWORK_UNAVAILABLE = 1000,
    NETWORK_CONNECTION_FAILED = 1001,
    NETWORK_TIMEOUT = 1002,
    NETWORK_DNS_RESOLUTION_FAILED = 1003,
    NETWORK_SSL_HANDSHAKE_FAILED = 1004,
    NETWORK_TRANSPORT_INIT_FAILED = 1005,

    API_AUTHENTICATION_FAILED = 1100,
    API_KEY_MISSING = 1102,
    API_RATE_LIMIT_EXCEEDED = 1103,
    API_INSUFFICIENT_PERMISSIONS = 1105,
    API_INVALID_REQUEST = 1106,
    API_RESPONSE_PARSE_ERROR = 1108,
    API_SERVER_ERROR = 1109,
    API_REQUEST_FAILED = 1113,

    CONFIG_INVALID = 1500,
    CONFIG_UNKNOWN_PROVIDER = 1501,
    CONFIG_UNKNOWN_MODEL = 1502,
    CONFIG_SAVE_FAILED = 1503,

    STREAM_INTERRUPTED = 1601
};

struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string technical_details;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string technical_details = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          technical_details(std::move(technical_details)) {}

    // Message followed by the resolution hint, suitable for showing to a user.
    std::string get_user_message() const;

    // Code, message, resolution and technical details on separate lines.
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
