#include <catch2/catch_test_macros.hpp>

#include "ClientConfig.hpp"
#include "LLMErrors.hpp"

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("resolve_client_config selects the provider default when no model is given") {
    ClientConfig base;
    base.model_id = "gemini-3-pro";

    const ClientConfig resolved = resolve_client_config("mistral", std::nullopt, base);
    REQUIRE(resolved.provider_id == "mistral");
    REQUIRE(resolved.model_id == "mistral-large-latest");
}

TEST_CASE("resolve_client_config carries generation defaults from the base") {
    ClientConfig base;
    base.temperature = 1.3;
    base.max_tokens = 2048;
    base.top_p = 0.8;
    base.reasoning_effort = "low";
    base.timeout = 30000ms;

    const ClientConfig resolved = resolve_client_config("openai", std::string("o3-mini"), base);
    REQUIRE(resolved.model_id == "o3-mini");
    REQUIRE(resolved.temperature == 1.3);
    REQUIRE(resolved.max_tokens == 2048);
    REQUIRE(resolved.top_p == std::optional<double>(0.8));
    REQUIRE(resolved.reasoning_effort == std::optional<std::string>("low"));
    REQUIRE(resolved.timeout == 30000ms);
}

TEST_CASE("resolve_client_config rejects unknown providers and models") {
    REQUIRE_THROWS_AS(resolve_client_config("acme", std::nullopt), ConfigurationError);
    REQUIRE_THROWS_AS(resolve_client_config("google", std::string("gpt-5")), ConfigurationError);
}

TEST_CASE("merge_options lets per-call values win") {
    ClientConfig config;
    config.reasoning_effort = "medium";

    RequestOptions options;
    options.temperature = 0.1;
    options.max_tokens = 100;
    options.top_p = 0.5;
    options.thinking_level = "high";
    options.reasoning_effort = "xhigh";
    options.thinking = true;
    options.thinking_budget = 4096;
    options.enable_search = true;
    options.timeout = 900ms;

    const GenerationOptions merged = merge_options(config, options);
    REQUIRE(merged.temperature == 0.1);
    REQUIRE(merged.max_tokens == 100);
    REQUIRE(merged.top_p == std::optional<double>(0.5));
    REQUIRE(merged.thinking_level == std::optional<std::string>("high"));
    REQUIRE(merged.reasoning_effort == std::optional<std::string>("xhigh"));
    REQUIRE(merged.thinking);
    REQUIRE(merged.thinking_budget == 4096);
    REQUIRE(merged.enable_search);
    REQUIRE(merged.timeout == 900ms);
    REQUIRE_FALSE(merged.stream);
}

TEST_CASE("merge_options falls back to the configuration") {
    ClientConfig config;
    const GenerationOptions merged = merge_options(config, RequestOptions{});
    REQUIRE(merged.temperature == 0.7);
    REQUIRE(merged.max_tokens == 8192);
    REQUIRE_FALSE(merged.top_p.has_value());
    REQUIRE(merged.thinking_level == std::optional<std::string>("medium"));
    REQUIRE_FALSE(merged.reasoning_effort.has_value());
    REQUIRE_FALSE(merged.thinking);
    REQUIRE(merged.thinking_budget == 10000);
    REQUIRE(merged.tools.empty());
    REQUIRE(merged.timeout == 120000ms);
}

TEST_CASE("merge_options ignores empty levels and non-positive budgets") {
    ClientConfig config;
    config.thinking_level = "low";

    RequestOptions options;
    options.thinking_level = "";
    options.reasoning_effort = "";
    options.thinking_budget = 0;

    const GenerationOptions merged = merge_options(config, options);
    REQUIRE(merged.thinking_level == std::optional<std::string>("low"));
    REQUIRE_FALSE(merged.reasoning_effort.has_value());
    REQUIRE(merged.thinking_budget == 10000);
}

TEST_CASE("merge_options keeps the configured deadline for non-positive timeouts") {
    ClientConfig config;
    config.timeout = 30000ms;

    RequestOptions options;
    options.timeout = 0ms;
    REQUIRE(merge_options(config, options).timeout == 30000ms);

    options.timeout = -5ms;
    REQUIRE(merge_options(config, options).timeout == 30000ms);
}
