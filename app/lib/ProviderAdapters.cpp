#include "ProviderAdapters.hpp"
#include "AnthropicAdapter.hpp"
#include "AuthHeaderBuilders.hpp"
#include "GeminiAdapter.hpp"
#include "MistralAdapter.hpp"
#include "OpenAIAdapter.hpp"
#include "XaiAdapter.hpp"

#include <map>
#include <memory>

namespace {

std::map<ProviderKind, ProviderAdapterSet> build_registry()
{
    auto bearer = std::make_shared<const BearerAuth>();
    auto chat_response = std::make_shared<const ChatCompletionsResponseTranslator>();
    auto chat_stream = std::make_shared<const ChatCompletionsStreamExtractor>();
    auto openai_request = std::make_shared<const OpenAIRequestTranslator>();

    std::map<ProviderKind, ProviderAdapterSet> registry;
    registry[ProviderKind::Google] = {
        std::make_shared<const GeminiRequestTranslator>(),
        std::make_shared<const QueryKeyAuth>(),
        std::make_shared<const GeminiResponseTranslator>(),
        std::make_shared<const GeminiStreamExtractor>()};
    registry[ProviderKind::OpenAI] = {openai_request, bearer, chat_response, chat_stream};
    registry[ProviderKind::OpenRouter] = {openai_request, bearer, chat_response, chat_stream};
    registry[ProviderKind::Anthropic] = {
        std::make_shared<const AnthropicRequestTranslator>(),
        std::make_shared<const CustomKeyAuth>(CustomKeyAuth::anthropic()),
        std::make_shared<const AnthropicResponseTranslator>(),
        std::make_shared<const AnthropicStreamExtractor>()};
    registry[ProviderKind::Mistral] = {
        std::make_shared<const MistralRequestTranslator>(), bearer, chat_response, chat_stream};
    registry[ProviderKind::XAI] = {
        std::make_shared<const XaiRequestTranslator>(), bearer, chat_response, chat_stream};
    return registry;
}

} // namespace

const ProviderAdapterSet& adapters_for(ProviderKind kind)
{
    static const std::map<ProviderKind, ProviderAdapterSet> registry = build_registry();
    return registry.at(kind);
}
