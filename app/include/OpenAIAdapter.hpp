#ifndef OPENAIADAPTER_HPP
#define OPENAIADAPTER_HPP

#include "ProviderAdapters.hpp"

/**
 * @brief {role, content} list shared by every chat-completions style provider.
 */
Json::Value chat_completions_messages(const std::vector<ChatMessage>& messages);

/**
 * @brief Chat-completions request used for OpenAI and OpenRouter.
 */
class OpenAIRequestTranslator : public RequestTranslator {
public:
    Json::Value build(const ModelDescriptor& model,
                      const std::vector<ChatMessage>& messages,
                      const GenerationOptions& options) const override;
    std::string endpoint(const ProviderDescriptor& provider,
                         const ModelDescriptor& model,
                         bool streaming) const override;
};

/**
 * @brief choices[0].message parsing shared by OpenAI, OpenRouter, Mistral and xAI.
 */
class ChatCompletionsResponseTranslator : public ResponseTranslator {
public:
    CompletionResult parse(const Json::Value& root) const override;
};

/**
 * @brief choices[0].delta parsing for chat-completions event streams ("data: [DONE]" terminated).
 */
class ChatCompletionsStreamExtractor : public StreamExtractor {
public:
    StreamChunk extract(const Json::Value& frame) const override;

    // OpenRouter reports failures after the 200 status as {"error":{"message":...}} frames.
    std::optional<std::string> error_message(const Json::Value& frame) const override;
};

#endif // OPENAIADAPTER_HPP
