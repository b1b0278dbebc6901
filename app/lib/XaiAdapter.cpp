#include "XaiAdapter.hpp"
#include "OpenAIAdapter.hpp"

Json::Value XaiRequestTranslator::build(const ModelDescriptor& model,
                                        const std::vector<ChatMessage>& messages,
                                        const GenerationOptions& options) const
{
    Json::Value body(Json::objectValue);
    body["model"] = model.api_id;
    body["messages"] = chat_completions_messages(messages);
    body["temperature"] = options.temperature;
    body["max_tokens"] = options.max_tokens;

    if (options.enable_search && model.has_capability(Capability::Search)) {
        Json::Value search(Json::objectValue);
        search["type"] = "live_search";
        body["tools"].append(search);
    }

    if (options.stream) {
        body["stream"] = true;
    }
    return body;
}

std::string XaiRequestTranslator::endpoint(const ProviderDescriptor& provider,
                                           const ModelDescriptor& /*model*/,
                                           bool /*streaming*/) const
{
    return provider.base_url + "/chat/completions";
}
