#include "LlmCatalog.hpp"
#include "LLMErrors.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace {

std::vector<ProviderDescriptor> build_catalog()
{
    std::vector<ProviderDescriptor> providers;

    providers.push_back({"google", "Google AI", "https://generativelanguage.googleapis.com/v1beta",
                         ProviderKind::Google, {
        {"gemini-3-flash", "gemini-3-flash", "Gemini 3 Flash", 1000000, 65536, 0.50, 3.00,
         {"text", "vision", "audio", "video", "thinking", "tools", "caching"},
         {"minimal", "low", "medium", "high"}, {}, {}, true},
        {"gemini-3-pro", "gemini-3-pro", "Gemini 3 Pro", 2000000, 65536, 1.25, 5.00,
         {"text", "vision", "audio", "video", "thinking", "tools", "caching"},
         {"minimal", "low", "medium", "high"}, {}, {}, false},
        {"gemini-2.5-flash", "gemini-2.5-flash", "Gemini 2.5 Flash", 1000000, 65536, 0.15, 0.60,
         {"text", "vision", "thinking", "tools"}, {}, {}, {}, false},
    }});

    providers.push_back({"openai", "OpenAI", "https://api.openai.com/v1",
                         ProviderKind::OpenAI, {
        {"gpt-5.2", "gpt-5.2", "GPT-5.2", 400000, 128000, 5.00, 15.00,
         {"text", "vision", "reasoning", "tools"},
         {}, {"none", "low", "medium", "high", "xhigh"}, {}, false},
        {"gpt-5.2-codex", "gpt-5.2-codex", "GPT-5.2 Codex", 400000, 128000, 5.00, 15.00,
         {"text", "code", "reasoning", "tools", "agentic"}, {}, {}, {}, false},
        {"gpt-5.1", "gpt-5.1", "GPT-5.1", 256000, 64000, 2.50, 10.00,
         {"text", "vision", "reasoning", "tools"}, {}, {}, {}, false},
        {"gpt-5", "gpt-5", "GPT-5", 128000, 32000, 2.00, 8.00,
         {"text", "vision", "tools"}, {}, {}, {}, false},
        {"o3-mini", "o3-mini", "o3-mini", 200000, 100000, 1.10, 4.40,
         {"text", "reasoning", "tools"}, {}, {}, {}, false},
    }});

    providers.push_back({"anthropic", "Anthropic", "https://api.anthropic.com/v1",
                         ProviderKind::Anthropic, {
        {"claude-opus-4.5", "claude-opus-4-5-20251101", "Claude Opus 4.5", 200000, 32000, 5.00, 25.00,
         {"text", "vision", "thinking", "tools", "computer-use"},
         {}, {}, {"enabled", "disabled"}, false},
        {"claude-sonnet-4.5", "claude-sonnet-4-5-20241022", "Claude Sonnet 4.5", 1000000, 64000, 3.00, 15.00,
         {"text", "vision", "thinking", "tools", "computer-use", "batch"}, {}, {}, {}, false},
        {"claude-haiku-4.5", "claude-haiku-4-5-20241022", "Claude Haiku 4.5", 200000, 8192, 1.00, 5.00,
         {"text", "vision", "tools"}, {}, {}, {}, false},
    }});

    providers.push_back({"mistral", "Mistral AI", "https://api.mistral.ai/v1",
                         ProviderKind::Mistral, {
        {"mistral-large-latest", "mistral-large-latest", "Mistral Large 3", 256000, 32000, 2.00, 6.00,
         {"text", "vision", "tools", "code"}, {}, {}, {}, false},
        {"codestral-latest", "codestral-latest", "Codestral", 256000, 32000, 0.30, 0.90,
         {"code", "fill-in-middle"}, {}, {}, {}, false},
        {"mistral-small-latest", "mistral-small-latest", "Mistral Small", 128000, 32000, 0.20, 0.60,
         {"text", "tools"}, {}, {}, {}, false},
    }});

    providers.push_back({"xai", "xAI", "https://api.x.ai/v1",
                         ProviderKind::XAI, {
        {"grok-4", "grok-4", "Grok 4", 2000000, 131072, 3.00, 15.00,
         {"text", "vision", "reasoning", "tools", "search"}, {}, {}, {}, false},
        {"grok-4-1-fast-reasoning", "grok-4-1-fast-reasoning", "Grok 4.1 Fast (Reasoning)", 2000000, 131072,
         2.00, 10.00, {"text", "reasoning", "tools", "agentic"}, {}, {}, {}, false},
        {"grok-code-fast-1", "grok-code-fast-1", "Grok Code Fast", 256000, 32000, 0.50, 2.50,
         {"code", "reasoning", "agentic"}, {}, {}, {}, false},
        {"grok-3", "grok-3", "Grok 3", 131072, 32000, 1.00, 5.00,
         {"text", "vision", "tools"}, {}, {}, {}, false},
    }});

    // Pricing varies with the routed model.
    providers.push_back({"openrouter", "OpenRouter", "https://openrouter.ai/api/v1",
                         ProviderKind::OpenRouter, {
        {"auto", "auto", "Auto (Best Match)", 128000, 32000, std::nullopt, std::nullopt,
         {"text", "routing"}, {}, {}, {}, false},
    }});

    return providers;
}

} // namespace

const std::vector<ProviderDescriptor>& provider_catalog()
{
    static const std::vector<ProviderDescriptor> providers = build_catalog();
    return providers;
}

const ProviderDescriptor* find_provider(std::string_view id)
{
    const auto& providers = provider_catalog();
    const auto it = std::find_if(providers.begin(), providers.end(),
                                 [id](const ProviderDescriptor& provider) {
                                     return provider.id == id;
                                 });
    return it == providers.end() ? nullptr : &*it;
}

const ModelDescriptor* find_model(const ProviderDescriptor& provider, std::string_view model_id)
{
    const auto it = std::find_if(provider.models.begin(), provider.models.end(),
                                 [model_id](const ModelDescriptor& model) {
                                     return model.id == model_id;
                                 });
    return it == provider.models.end() ? nullptr : &*it;
}

const ModelDescriptor& default_model(const ProviderDescriptor& provider)
{
    const auto it = std::find_if(provider.models.begin(), provider.models.end(),
                                 [](const ModelDescriptor& model) { return model.is_default; });
    if (it != provider.models.end()) {
        return *it;
    }
    return provider.models.front();
}

const ProviderDescriptor& require_provider(std::string_view id)
{
    if (const auto* provider = find_provider(id)) {
        return *provider;
    }
    throw ConfigurationError(ErrorCodes::Code::CONFIG_UNKNOWN_PROVIDER,
                             fmt::format("Unknown provider: {}", id));
}

const ModelDescriptor& require_model(const ProviderDescriptor& provider, std::string_view model_id)
{
    if (const auto* model = find_model(provider, model_id)) {
        return *model;
    }
    throw ConfigurationError(ErrorCodes::Code::CONFIG_UNKNOWN_MODEL,
                             fmt::format("Unknown model: {} for provider {}", model_id, provider.id));
}

std::optional<std::string> declared_level(const std::vector<std::string>& levels, std::string_view requested)
{
    const std::string wanted = Utils::to_lower_copy(requested);
    const auto it = std::find_if(levels.begin(), levels.end(), [&wanted](const std::string& level) {
        return Utils::to_lower_copy(level) == wanted;
    });
    if (it == levels.end()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<ProviderListing> list_providers()
{
    std::vector<ProviderListing> listing;
    listing.reserve(provider_catalog().size());
    for (const auto& provider : provider_catalog()) {
        ProviderListing entry{provider.id, provider.name, {}};
        entry.models.reserve(provider.models.size());
        for (const auto& model : provider.models) {
            entry.models.push_back({model.id, model.name, model.context_window,
                                    model.capabilities, model.is_default});
        }
        listing.push_back(std::move(entry));
    }
    return listing;
}
