#ifndef GEMINIADAPTER_HPP
#define GEMINIADAPTER_HPP

#include "ProviderAdapters.hpp"

/**
 * @brief generateContent request body: "contents" with user/model roles and a
 * "generationConfig" block.
 */
class GeminiRequestTranslator : public RequestTranslator {
public:
    Json::Value build(const ModelDescriptor& model,
                      const std::vector<ChatMessage>& messages,
                      const GenerationOptions& options) const override;
    std::string endpoint(const ProviderDescriptor& provider,
                         const ModelDescriptor& model,
                         bool streaming) const override;
};

class GeminiResponseTranslator : public ResponseTranslator {
public:
    CompletionResult parse(const Json::Value& root) const override;
};

/**
 * @brief streamGenerateContent (alt=sse) frames carry whole GenerateContentResponse
 * objects; there is no sentinel, the stream ends when the transfer closes.
 */
class GeminiStreamExtractor : public StreamExtractor {
public:
    StreamChunk extract(const Json::Value& frame) const override;
};

#endif // GEMINIADAPTER_HPP
