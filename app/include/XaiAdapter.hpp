#ifndef XAIADAPTER_HPP
#define XAIADAPTER_HPP

#include "ProviderAdapters.hpp"

/**
 * @brief Chat-completions body; adds the live_search tool for models that declare search.
 */
class XaiRequestTranslator : public RequestTranslator {
public:
    Json::Value build(const ModelDescriptor& model,
                      const std::vector<ChatMessage>& messages,
                      const GenerationOptions& options) const override;
    std::string endpoint(const ProviderDescriptor& provider,
                         const ModelDescriptor& model,
                         bool streaming) const override;
};

#endif // XAIADAPTER_HPP
