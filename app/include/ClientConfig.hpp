#ifndef CLIENTCONFIG_HPP
#define CLIENTCONFIG_HPP

#include "Types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Active provider/model plus generation defaults.
 *
 * model_id always names a model of provider_id; resolve_client_config() is the
 * only way a ClientConfig with a new provider or model is produced.
 */
struct ClientConfig {
    std::string provider_id{"google"};
    std::string model_id{"gemini-3-flash"};
    double temperature{0.7};
    int max_tokens{8192};
    std::optional<double> top_p;
    std::optional<std::string> thinking_level{"medium"};
    std::optional<std::string> reasoning_effort;
    std::chrono::milliseconds timeout{120000};
};

/**
 * @brief Effective values for one call: ClientConfig defaults overlaid with RequestOptions.
 */
struct GenerationOptions {
    double temperature{0.7};
    int max_tokens{8192};
    std::optional<double> top_p;
    std::optional<std::string> thinking_level;
    std::optional<std::string> reasoning_effort;
    bool thinking{false};
    int thinking_budget{10000};
    std::vector<ToolDeclaration> tools;
    bool enable_search{false};
    bool stream{false};
    std::chrono::milliseconds timeout{120000};
};

/**
 * @brief Validates provider and model and returns a config carrying base's generation defaults.
 * @param provider_id Provider id; unknown ids throw ConfigurationError (CONFIG_UNKNOWN_PROVIDER).
 * @param model_id Catalog key; unknown keys throw ConfigurationError (CONFIG_UNKNOWN_MODEL).
 *        When omitted the provider's default model is selected, never base.model_id.
 * @param base Source of temperature, token and timeout defaults.
 */
ClientConfig resolve_client_config(const std::string& provider_id,
                                   const std::optional<std::string>& model_id,
                                   const ClientConfig& base = ClientConfig{});

GenerationOptions merge_options(const ClientConfig& config, const RequestOptions& options);

#endif // CLIENTCONFIG_HPP
