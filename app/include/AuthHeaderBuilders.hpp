#pragma once
#include "ProviderAdapters.hpp"

#include <string>
#include <vector>

/**
 * @brief Credential carried as a "key" query parameter; no auth header (Google).
 */
class QueryKeyAuth : public AuthHeaderBuilder {
public:
    void apply(const std::string& provider_id,
               const std::optional<std::string>& credential,
               HttpRequest& request) const override;
};

/**
 * @brief "Authorization: Bearer <key>" (OpenAI, OpenRouter, Mistral, xAI).
 */
class BearerAuth : public AuthHeaderBuilder {
public:
    void apply(const std::string& provider_id,
               const std::optional<std::string>& credential,
               HttpRequest& request) const override;
};

/**
 * @brief Custom key header plus fixed protocol-version headers (Anthropic).
 */
class CustomKeyAuth : public AuthHeaderBuilder {
public:
    CustomKeyAuth(std::string key_header, std::vector<HttpHeader> fixed_headers);

    void apply(const std::string& provider_id,
               const std::optional<std::string>& credential,
               HttpRequest& request) const override;

    static CustomKeyAuth anthropic();

private:
    std::string key_header_;
    std::vector<HttpHeader> fixed_headers_;
};
