#include "ClientConfig.hpp"
#include "LlmCatalog.hpp"

namespace {
constexpr int kDefaultThinkingBudget = 10000;

std::optional<std::string> non_empty_or(const std::optional<std::string>& value,
                                        const std::optional<std::string>& fallback)
{
    if (value && !value->empty()) {
        return value;
    }
    if (fallback && !fallback->empty()) {
        return fallback;
    }
    return std::nullopt;
}
}

ClientConfig resolve_client_config(const std::string& provider_id,
                                   const std::optional<std::string>& model_id,
                                   const ClientConfig& base)
{
    const ProviderDescriptor& provider = require_provider(provider_id);
    const ModelDescriptor& model = model_id ? require_model(provider, *model_id)
                                            : default_model(provider);

    ClientConfig resolved = base;
    resolved.provider_id = provider.id;
    resolved.model_id = model.id;
    return resolved;
}

GenerationOptions merge_options(const ClientConfig& config, const RequestOptions& options)
{
    GenerationOptions merged;
    merged.temperature = options.temperature.value_or(config.temperature);
    merged.max_tokens = options.max_tokens.value_or(config.max_tokens);
    merged.top_p = options.top_p ? options.top_p : config.top_p;
    merged.thinking_level = non_empty_or(options.thinking_level, config.thinking_level);
    merged.reasoning_effort = non_empty_or(options.reasoning_effort, config.reasoning_effort);
    merged.thinking = options.thinking;
    merged.thinking_budget = options.thinking_budget.value_or(kDefaultThinkingBudget);
    if (merged.thinking_budget <= 0) {
        merged.thinking_budget = kDefaultThinkingBudget;
    }
    merged.tools = options.tools;
    merged.enable_search = options.enable_search;
    merged.timeout = (options.timeout && options.timeout->count() > 0) ? *options.timeout
                                                                       : config.timeout;
    return merged;
}
