#include "AuthHeaderBuilders.hpp"
#include "Logger.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <memory>

namespace {
constexpr const char* kAnthropicVersion = "2024-10-22";
constexpr const char* kAnthropicBeta = "context-1m-2025-08-07";

void add_content_type(HttpRequest& request)
{
    request.headers.emplace_back("Content-Type", "application/json");
}

bool has_credential(const std::string& provider_id, const std::optional<std::string>& credential)
{
    if (credential && !credential->empty()) {
        return true;
    }
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->warn("No API key set for provider: {}", provider_id);
    } else {
        std::fprintf(stderr, "No API key set for provider: %s\n", provider_id.c_str());
    }
    return false;
}

std::string url_escape(const std::string& value)
{
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size())), &curl_free);
    return escaped ? std::string(escaped.get()) : value;
}
}

void QueryKeyAuth::apply(const std::string& provider_id,
                         const std::optional<std::string>& credential,
                         HttpRequest& request) const
{
    add_content_type(request);
    if (!has_credential(provider_id, credential)) {
        return;
    }
    const char separator = request.url.find('?') == std::string::npos ? '?' : '&';
    request.url += separator;
    request.url += "key=" + url_escape(*credential);
}

void BearerAuth::apply(const std::string& provider_id,
                       const std::optional<std::string>& credential,
                       HttpRequest& request) const
{
    add_content_type(request);
    if (!has_credential(provider_id, credential)) {
        return;
    }
    request.headers.emplace_back("Authorization", "Bearer " + *credential);
}

CustomKeyAuth::CustomKeyAuth(std::string key_header, std::vector<HttpHeader> fixed_headers)
    : key_header_(std::move(key_header)),
      fixed_headers_(std::move(fixed_headers)) {}

CustomKeyAuth CustomKeyAuth::anthropic()
{
    return CustomKeyAuth("x-api-key", {{"anthropic-version", kAnthropicVersion},
                                       {"anthropic-beta", kAnthropicBeta}});
}

void CustomKeyAuth::apply(const std::string& provider_id,
                          const std::optional<std::string>& credential,
                          HttpRequest& request) const
{
    add_content_type(request);
    if (has_credential(provider_id, credential)) {
        request.headers.emplace_back(key_header_, *credential);
    }
    for (const auto& header : fixed_headers_) {
        request.headers.push_back(header);
    }
}
