#include "AnthropicAdapter.hpp"
#include "WireJson.hpp"

#include <algorithm>

namespace {
using WireJson::member;

const Json::Value& first_block_of_type(const Json::Value& content, const char* type)
{
    static const Json::Value null_block;
    if (!content.isArray()) {
        return null_block;
    }
    for (const auto& block : content) {
        if (member(block, "type").isString() && member(block, "type").asString() == type) {
            return block;
        }
    }
    return null_block;
}

std::string event_type(const Json::Value& frame)
{
    return WireJson::optional_string(member(frame, "type")).value_or("");
}
}

Json::Value AnthropicRequestTranslator::build(const ModelDescriptor& model,
                                              const std::vector<ChatMessage>& messages,
                                              const GenerationOptions& options) const
{
    Json::Value body(Json::objectValue);
    body["model"] = model.api_id;
    body["max_tokens"] = options.max_tokens;

    Json::Value chat(Json::arrayValue);
    for (const auto& message : messages) {
        if (message.role == MessageRole::System) {
            continue;
        }
        Json::Value entry(Json::objectValue);
        entry["role"] = to_string(message.role);
        entry["content"] = message.content;
        chat.append(entry);
    }
    body["messages"] = chat;

    const auto system = std::find_if(messages.begin(), messages.end(), [](const ChatMessage& message) {
        return message.role == MessageRole::System;
    });
    if (system != messages.end()) {
        body["system"] = system->content;
    }

    if (!model.thinking_modes.empty() && options.thinking) {
        body["thinking"]["type"] = "enabled";
        body["thinking"]["budget_tokens"] = options.thinking_budget;
    }

    if (!options.tools.empty()) {
        Json::Value tools(Json::arrayValue);
        for (const auto& tool : options.tools) {
            Json::Value entry(Json::objectValue);
            entry["name"] = tool.name;
            entry["description"] = tool.description;
            entry["input_schema"] = tool.parameters;
            tools.append(entry);
        }
        body["tools"] = tools;
    }

    if (options.stream) {
        body["stream"] = true;
    }
    return body;
}

std::string AnthropicRequestTranslator::endpoint(const ProviderDescriptor& provider,
                                                 const ModelDescriptor& /*model*/,
                                                 bool /*streaming*/) const
{
    return provider.base_url + "/messages";
}

CompletionResult AnthropicResponseTranslator::parse(const Json::Value& root) const
{
    CompletionResult result;
    const Json::Value& content = member(root, "content");

    result.content = WireJson::optional_string(member(first_block_of_type(content, "text"), "text")).value_or("");
    result.reasoning = WireJson::optional_string(member(first_block_of_type(content, "thinking"), "thinking"));

    const Json::Value& usage = member(root, "usage");
    result.usage.input_tokens = WireJson::optional_int(member(usage, "input_tokens"));
    result.usage.output_tokens = WireJson::optional_int(member(usage, "output_tokens"));

    result.finish_reason = WireJson::optional_string(member(root, "stop_reason"));
    return result;
}

StreamChunk AnthropicStreamExtractor::extract(const Json::Value& frame) const
{
    StreamChunk chunk;
    const std::string type = event_type(frame);
    if (type == "content_block_delta") {
        chunk.content = WireJson::optional_string(member(member(frame, "delta"), "text")).value_or("");
    } else if (type == "message_delta") {
        chunk.finish_reason = WireJson::optional_string(member(member(frame, "delta"), "stop_reason"));
    }
    return chunk;
}

bool AnthropicStreamExtractor::is_end_of_stream(const Json::Value& frame) const
{
    return event_type(frame) == "message_stop";
}

// {"type":"error","error":{"type":"overloaded_error","message":"Overloaded"}}
std::optional<std::string> AnthropicStreamExtractor::error_message(const Json::Value& frame) const
{
    if (event_type(frame) != "error") {
        return std::nullopt;
    }
    const Json::Value& error = member(frame, "error");
    return WireJson::optional_string(member(error, "message"))
        .value_or(WireJson::optional_string(member(error, "type")).value_or("stream error event"));
}
