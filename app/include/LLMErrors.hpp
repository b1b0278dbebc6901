#ifndef LLM_ERRORS_HPP
#define LLM_ERRORS_HPP

#include "AppException.hpp"

#include <chrono>
#include <optional>
#include <string>

/**
 * @brief Unknown provider or model. Raised before any network I/O.
 */
class ConfigurationError : public ErrorCodes::AppException {
public:
    ConfigurationError(ErrorCodes::Code code, const std::string& message)
        : ErrorCodes::AppException(code, message, "") {}
};

/**
 * @brief The provider rejected (or never received) a credential. Never carries the secret.
 */
class AuthError : public ErrorCodes::AppException {
public:
    AuthError(std::string provider_id, int status_code, const std::string& message)
        : ErrorCodes::AppException(status_code == 403
                                       ? ErrorCodes::Code::API_INSUFFICIENT_PERMISSIONS
                                       : ErrorCodes::Code::API_AUTHENTICATION_FAILED,
                                   message,
                                   "provider: " + provider_id),
          provider_id_(std::move(provider_id)),
          status_code_(status_code) {}

    const std::string& provider_id() const { return provider_id_; }
    int status_code() const { return status_code_; }

private:
    std::string provider_id_;
    int status_code_{0};
};

/**
 * @brief Transport failure; no response was obtained.
 */
class NetworkError : public ErrorCodes::AppException {
public:
    NetworkError(ErrorCodes::Code code, const std::string& message)
        : ErrorCodes::AppException(code, message, "") {}
};

/**
 * @brief The deadline was exceeded and the in-flight call was aborted.
 */
class TimeoutError : public ErrorCodes::AppException {
public:
    TimeoutError(const std::string& message, std::chrono::milliseconds timeout)
        : ErrorCodes::AppException(ErrorCodes::Code::NETWORK_TIMEOUT, message,
                                   "timeout: " + std::to_string(timeout.count()) + " ms"),
          timeout_(timeout) {}

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_{0};
};

/**
 * @brief Non-2xx response. The message is the provider's own error text when it
 * could be parsed, otherwise "request failed with status N".
 */
class HttpError : public ErrorCodes::AppException {
public:
    HttpError(int status_code, const std::string& message,
              std::optional<int> retry_after_seconds = std::nullopt)
        : ErrorCodes::AppException(code_for_status(status_code), message,
                                   "HTTP " + std::to_string(status_code)),
          status_code_(status_code),
          retry_after_seconds_(retry_after_seconds) {}

    int status_code() const { return status_code_; }

    // Server-suggested delay from Retry-After, for callers that implement their own retry policy.
    std::optional<int> retry_after_seconds() const { return retry_after_seconds_; }

private:
    static ErrorCodes::Code code_for_status(int status_code) {
        if (status_code == 429) {
            return ErrorCodes::Code::API_RATE_LIMIT_EXCEEDED;
        }
        if (status_code >= 500) {
            return ErrorCodes::Code::API_SERVER_ERROR;
        }
        if (status_code >= 400) {
            return ErrorCodes::Code::API_INVALID_REQUEST;
        }
        return ErrorCodes::Code::API_REQUEST_FAILED;
    }

    int status_code_{0};
    std::optional<int> retry_after_seconds_;
};

/**
 * @brief Malformed response body or stream frame.
 */
class ParseError : public ErrorCodes::AppException {
public:
    explicit ParseError(const std::string& message,
                        ErrorCodes::Code code = ErrorCodes::Code::API_RESPONSE_PARSE_ERROR)
        : ErrorCodes::AppException(code, message, "") {}
};

#endif // LLM_ERRORS_HPP
