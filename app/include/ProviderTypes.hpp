#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Wire-format family a provider speaks. OpenRouter reuses the OpenAI format.
 */
enum class ProviderKind {
    Google,
    OpenAI,
    OpenRouter,
    Anthropic,
    Mistral,
    XAI
};

namespace Capability {
inline constexpr const char* Text = "text";
inline constexpr const char* Vision = "vision";
inline constexpr const char* Audio = "audio";
inline constexpr const char* Video = "video";
inline constexpr const char* Thinking = "thinking";
inline constexpr const char* Reasoning = "reasoning";
inline constexpr const char* Tools = "tools";
inline constexpr const char* Caching = "caching";
inline constexpr const char* Code = "code";
inline constexpr const char* Agentic = "agentic";
inline constexpr const char* ComputerUse = "computer-use";
inline constexpr const char* Batch = "batch";
inline constexpr const char* FillInMiddle = "fill-in-middle";
inline constexpr const char* Search = "search";
inline constexpr const char* Routing = "routing";
} // namespace Capability

struct ModelDescriptor {
    std::string id;      ///< Catalog key callers select.
    std::string api_id;  ///< Identifier sent on the wire; may differ from id.
    std::string name;
    int context_window = 0;
    int max_output = 0;
    std::optional<double> input_price;  ///< USD per 1M tokens; unset when pricing varies.
    std::optional<double> output_price;
    std::vector<std::string> capabilities;
    std::vector<std::string> thinking_levels;   ///< Gemini thinkingConfig levels.
    std::vector<std::string> reasoning_efforts; ///< OpenAI reasoning effort levels.
    std::vector<std::string> thinking_modes;    ///< Anthropic extended thinking modes.
    bool is_default = false;

    bool has_capability(std::string_view tag) const {
        return std::find(capabilities.begin(), capabilities.end(), tag) != capabilities.end();
    }
};

struct ProviderDescriptor {
    std::string id;
    std::string name;
    std::string base_url;
    ProviderKind kind = ProviderKind::OpenAI;
    std::vector<ModelDescriptor> models; ///< Declaration order is significant.
};

struct ModelListing {
    std::string id;
    std::string name;
    int context_window = 0;
    std::vector<std::string> capabilities;
    bool is_default = false;
};

struct ProviderListing {
    std::string id;
    std::string name;
    std::vector<ModelListing> models;
};

/**
 * @brief Snapshot of the active provider and model returned by ChatGateway::configure().
 */
struct ProviderInfo {
    std::string provider;
    std::string provider_name;
    std::string model;
    std::string model_name;
    std::vector<std::string> capabilities;
    int context_window = 0;
    std::optional<double> input_price;
    std::optional<double> output_price;
};
