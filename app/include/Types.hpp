#ifndef TYPES_HPP
#define TYPES_HPP

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class MessageRole {System, User, Assistant};

inline std::string to_string(MessageRole role) {
    switch (role) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
        default: return "user";
    }
}

inline std::optional<MessageRole> role_from_string(std::string_view value) {
    if (value == "system") return MessageRole::System;
    if (value == "user") return MessageRole::User;
    if (value == "assistant") return MessageRole::Assistant;
    return std::nullopt;
}

struct ChatMessage {
    MessageRole role{MessageRole::User};
    std::string content;
};

/**
 * @brief Function declaration offered to the model; parameters is a JSON schema object.
 */
struct ToolDeclaration {
    std::string name;
    std::string description;
    Json::Value parameters{Json::objectValue};
};

/**
 * @brief Per-call overrides. Unset fields fall back to the active ClientConfig.
 */
struct RequestOptions {
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    std::optional<double> top_p;
    std::optional<std::string> thinking_level;   ///< Gemini thinking level.
    std::optional<std::string> reasoning_effort; ///< OpenAI reasoning effort.
    bool thinking{false};                        ///< Anthropic extended thinking.
    std::optional<int> thinking_budget;
    std::vector<ToolDeclaration> tools;
    bool enable_search{false};                   ///< xAI live search.
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * @brief Token counts as reported by the provider. A field the provider did not
 * report stays unset; it is never defaulted to zero.
 */
struct TokenUsage {
    std::optional<int> input_tokens;
    std::optional<int> output_tokens;
    std::optional<int> reasoning_tokens;
};

struct CompletionResult {
    std::string content;
    std::optional<std::string> reasoning;
    TokenUsage usage;
    std::optional<std::string> finish_reason;
};

struct StreamChunk {
    std::string content;
    std::optional<std::string> finish_reason;
};

#endif
