#include "GeminiAdapter.hpp"
#include "LlmCatalog.hpp"
#include "Utils.hpp"
#include "WireJson.hpp"

namespace {
constexpr double kDefaultTopP = 0.95;

using WireJson::element;
using WireJson::member;

// Everything that is not the assistant speaks as "user"; Gemini has no system role in contents.
const char* gemini_role(MessageRole role)
{
    return role == MessageRole::Assistant ? "model" : "user";
}

Json::Value function_declaration(const ToolDeclaration& tool)
{
    Json::Value declaration(Json::objectValue);
    declaration["name"] = tool.name;
    declaration["description"] = tool.description;
    declaration["parameters"] = tool.parameters;
    return declaration;
}

const Json::Value& first_candidate_parts(const Json::Value& root)
{
    return member(member(element(member(root, "candidates"), 0), "content"), "parts");
}
}

Json::Value GeminiRequestTranslator::build(const ModelDescriptor& model,
                                           const std::vector<ChatMessage>& messages,
                                           const GenerationOptions& options) const
{
    Json::Value body(Json::objectValue);

    Json::Value contents(Json::arrayValue);
    for (const auto& message : messages) {
        Json::Value entry(Json::objectValue);
        entry["role"] = gemini_role(message.role);
        Json::Value part(Json::objectValue);
        part["text"] = message.content;
        entry["parts"].append(part);
        contents.append(entry);
    }
    body["contents"] = contents;

    Json::Value generation(Json::objectValue);
    generation["temperature"] = options.temperature;
    generation["maxOutputTokens"] = options.max_tokens;
    generation["topP"] = options.top_p.value_or(kDefaultTopP);

    if (options.thinking_level) {
        if (auto level = declared_level(model.thinking_levels, *options.thinking_level)) {
            generation["thinkingConfig"]["thinkingLevel"] = Utils::to_upper_copy(*level);
        }
    }
    body["generationConfig"] = generation;

    if (!options.tools.empty()) {
        Json::Value declarations(Json::arrayValue);
        for (const auto& tool : options.tools) {
            declarations.append(function_declaration(tool));
        }
        Json::Value tool_entry(Json::objectValue);
        tool_entry["functionDeclarations"] = declarations;
        body["tools"].append(tool_entry);
    }

    return body;
}

std::string GeminiRequestTranslator::endpoint(const ProviderDescriptor& provider,
                                              const ModelDescriptor& model,
                                              bool streaming) const
{
    if (streaming) {
        return provider.base_url + "/models/" + model.api_id + ":streamGenerateContent?alt=sse";
    }
    return provider.base_url + "/models/" + model.api_id + ":generateContent";
}

CompletionResult GeminiResponseTranslator::parse(const Json::Value& root) const
{
    CompletionResult result;
    const Json::Value& parts = first_candidate_parts(root);

    result.content = WireJson::optional_string(member(element(parts, 0), "text")).value_or("");

    if (parts.isArray()) {
        for (const auto& part : parts) {
            const Json::Value& thought = member(part, "thought");
            if (thought.isNull() || (thought.isBool() && !thought.asBool())) {
                continue;
            }
            // Newer responses flag the part with thought:true and keep the text in "text".
            result.reasoning = thought.isString() ? thought.asString()
                                                  : WireJson::optional_string(member(part, "text")).value_or("");
            break;
        }
    }

    const Json::Value& usage = member(root, "usageMetadata");
    result.usage.input_tokens = WireJson::optional_int(member(usage, "promptTokenCount"));
    result.usage.output_tokens = WireJson::optional_int(member(usage, "candidatesTokenCount"));
    result.usage.reasoning_tokens = WireJson::optional_int(member(usage, "thoughtsTokenCount"));

    result.finish_reason = WireJson::optional_string(
        member(element(member(root, "candidates"), 0), "finishReason"));
    return result;
}

StreamChunk GeminiStreamExtractor::extract(const Json::Value& frame) const
{
    StreamChunk chunk;
    chunk.content = WireJson::optional_string(
        member(element(first_candidate_parts(frame), 0), "text")).value_or("");
    chunk.finish_reason = WireJson::optional_string(
        member(element(member(frame, "candidates"), 0), "finishReason"));
    return chunk;
}
