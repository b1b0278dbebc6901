#include "ErrorCode.hpp"

#include <fmt/format.h>

#include <unordered_map>
#include <utility>

namespace ErrorCodes {

namespace {

using CatalogEntry = std::pair<const char*, const char*>;

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::UNKNOWN_ERROR,
         {"An unexpected error occurred.",
          "Retry the request. If the problem persists, run with --development and inspect the log."}},

        {Code::NETWORK_UNAVAILABLE,
         {"The network is unavailable.",
          "Check your network connection and try again."}},
        {Code::NETWORK_CONNECTION_FAILED,
         {"Could not connect to the provider.",
          "Check your network connection, proxy and firewall settings."}},
        {Code::NETWORK_TIMEOUT,
         {"The request timed out.",
          "Try again, shorten the prompt, or raise the request timeout."}},
        {Code::NETWORK_DNS_RESOLUTION_FAILED,
         {"The provider host name could not be resolved.",
          "Check your DNS settings and network connection."}},
        {Code::NETWORK_SSL_HANDSHAKE_FAILED,
         {"A secure connection to the provider could not be established.",
          "Check the system certificate store and the system clock."}},
        {Code::NETWORK_TRANSPORT_INIT_FAILED,
         {"The HTTP transport could not be initialized.",
          "Reinstall libcurl or check the available system resources."}},

        {Code::API_AUTHENTICATION_FAILED,
         {"The provider rejected the credentials.",
          "Check your API key for this provider."}},
        {Code::API_KEY_MISSING,
         {"No API key is configured for this provider.",
          "Set an API key with --api-key or the provider's environment variable."}},
        {Code::API_RATE_LIMIT_EXCEEDED,
         {"The provider rate limit was exceeded.",
          "Wait a moment before sending another request."}},
        {Code::API_INSUFFICIENT_PERMISSIONS,
         {"The API key is not allowed to use this model.",
          "Check the key's permissions and billing status with the provider."}},
        {Code::API_INVALID_REQUEST,
         {"The provider rejected the request.",
          "Check the selected model and request options."}},
        {Code::API_RESPONSE_PARSE_ERROR,
         {"The provider response could not be parsed.",
          "Retry the request. The provider may be returning a degraded response."}},
        {Code::API_SERVER_ERROR,
         {"The provider reported an internal error.",
          "Try again later."}},
        {Code::API_REQUEST_FAILED,
         {"The provider request failed.",
          "Check the provider message for details."}},

        {Code::CONFIG_INVALID,
         {"The configuration is invalid.",
          "Check the values in config.ini."}},
        {Code::CONFIG_UNKNOWN_PROVIDER,
         {"The selected provider is not known.",
          "Run with --list to see the available providers."}},
        {Code::CONFIG_UNKNOWN_MODEL,
         {"The selected model is not offered by this provider.",
          "Run with --list to see the models of each provider."}},
        {Code::CONFIG_SAVE_FAILED,
         {"The configuration could not be saved.",
          "Check that the configuration directory is writable."}},

        {Code::STREAM_INTERRUPTED,
         {"The response stream was interrupted.",
          "Check your network connection and try again."}},
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return fmt::format("{} {}", message, resolution);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error Code: {}\n{}", static_cast<int>(code), message);
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    if (!technical_details.empty()) {
        details += fmt::format("\nDetails: {}", technical_details);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    auto it = entries.find(code);
    if (it == entries.end()) {
        it = entries.find(Code::UNKNOWN_ERROR);
    }
    return ErrorInfo(code, it->second.first, it->second.second, context);
}

} // namespace ErrorCodes
