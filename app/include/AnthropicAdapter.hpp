#ifndef ANTHROPICADAPTER_HPP
#define ANTHROPICADAPTER_HPP

#include "ProviderAdapters.hpp"

/**
 * @brief Messages API body. The system prompt travels in the top-level "system"
 * field, never inside "messages".
 */
class AnthropicRequestTranslator : public RequestTranslator {
public:
    Json::Value build(const ModelDescriptor& model,
                      const std::vector<ChatMessage>& messages,
                      const GenerationOptions& options) const override;
    std::string endpoint(const ProviderDescriptor& provider,
                         const ModelDescriptor& model,
                         bool streaming) const override;
};

class AnthropicResponseTranslator : public ResponseTranslator {
public:
    CompletionResult parse(const Json::Value& root) const override;
};

/**
 * @brief Typed Messages API events: text arrives in content_block_delta, the stop
 * reason in message_delta, and message_stop ends the stream.
 */
class AnthropicStreamExtractor : public StreamExtractor {
public:
    StreamChunk extract(const Json::Value& frame) const override;
    bool is_end_of_stream(const Json::Value& frame) const override;
    std::optional<std::string> error_message(const Json::Value& frame) const override;
};

#endif // ANTHROPICADAPTER_HPP
