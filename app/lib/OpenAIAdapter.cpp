#include "OpenAIAdapter.hpp"
#include "LlmCatalog.hpp"
#include "WireJson.hpp"

using WireJson::element;
using WireJson::member;

Json::Value chat_completions_messages(const std::vector<ChatMessage>& messages)
{
    Json::Value list(Json::arrayValue);
    for (const auto& message : messages) {
        Json::Value entry(Json::objectValue);
        entry["role"] = to_string(message.role);
        entry["content"] = message.content;
        list.append(entry);
    }
    return list;
}

Json::Value OpenAIRequestTranslator::build(const ModelDescriptor& model,
                                           const std::vector<ChatMessage>& messages,
                                           const GenerationOptions& options) const
{
    Json::Value body(Json::objectValue);
    body["model"] = model.api_id;
    body["messages"] = chat_completions_messages(messages);
    body["temperature"] = options.temperature;
    body["max_tokens"] = options.max_tokens;

    if (options.reasoning_effort) {
        if (auto effort = declared_level(model.reasoning_efforts, *options.reasoning_effort)) {
            body["reasoning"]["effort"] = *effort;
        }
    }

    if (!options.tools.empty()) {
        Json::Value tools(Json::arrayValue);
        for (const auto& tool : options.tools) {
            Json::Value function(Json::objectValue);
            function["name"] = tool.name;
            function["description"] = tool.description;
            function["parameters"] = tool.parameters;

            Json::Value entry(Json::objectValue);
            entry["type"] = "function";
            entry["function"] = function;
            tools.append(entry);
        }
        body["tools"] = tools;
    }

    if (options.stream) {
        body["stream"] = true;
    }
    return body;
}

std::string OpenAIRequestTranslator::endpoint(const ProviderDescriptor& provider,
                                              const ModelDescriptor& /*model*/,
                                              bool /*streaming*/) const
{
    return provider.base_url + "/chat/completions";
}

CompletionResult ChatCompletionsResponseTranslator::parse(const Json::Value& root) const
{
    CompletionResult result;
    const Json::Value& choice = element(member(root, "choices"), 0);
    const Json::Value& message = member(choice, "message");

    result.content = WireJson::optional_string(member(message, "content")).value_or("");
    result.reasoning = WireJson::optional_string(member(message, "reasoning"));
    if (!result.reasoning) {
        result.reasoning = WireJson::optional_string(member(message, "reasoning_content"));
    }

    const Json::Value& usage = member(root, "usage");
    result.usage.input_tokens = WireJson::optional_int(member(usage, "prompt_tokens"));
    result.usage.output_tokens = WireJson::optional_int(member(usage, "completion_tokens"));
    result.usage.reasoning_tokens = WireJson::optional_int(
        member(member(usage, "completion_tokens_details"), "reasoning_tokens"));

    result.finish_reason = WireJson::optional_string(member(choice, "finish_reason"));
    return result;
}

StreamChunk ChatCompletionsStreamExtractor::extract(const Json::Value& frame) const
{
    const Json::Value& choice = element(member(frame, "choices"), 0);
    StreamChunk chunk;
    chunk.content = WireJson::optional_string(member(member(choice, "delta"), "content")).value_or("");
    chunk.finish_reason = WireJson::optional_string(member(choice, "finish_reason"));
    return chunk;
}

std::optional<std::string> ChatCompletionsStreamExtractor::error_message(const Json::Value& frame) const
{
    const Json::Value& error = member(frame, "error");
    if (!error.isObject()) {
        return std::nullopt;
    }
    return WireJson::optional_string(member(error, "message")).value_or("stream error event");
}
