#include "MistralAdapter.hpp"
#include "OpenAIAdapter.hpp"

namespace {
constexpr double kDefaultTopP = 0.95;
}

Json::Value MistralRequestTranslator::build(const ModelDescriptor& model,
                                            const std::vector<ChatMessage>& messages,
                                            const GenerationOptions& options) const
{
    Json::Value body(Json::objectValue);
    body["model"] = model.api_id;
    body["messages"] = chat_completions_messages(messages);
    body["temperature"] = options.temperature;
    body["max_tokens"] = options.max_tokens;
    body["top_p"] = options.top_p.value_or(kDefaultTopP);
    if (options.stream) {
        body["stream"] = true;
    }
    return body;
}

std::string MistralRequestTranslator::endpoint(const ProviderDescriptor& provider,
                                               const ModelDescriptor& /*model*/,
                                               bool /*streaming*/) const
{
    return provider.base_url + "/chat/completions";
}
