#ifndef MISTRALADAPTER_HPP
#define MISTRALADAPTER_HPP

#include "ProviderAdapters.hpp"

/**
 * @brief Chat-completions body with an explicit top_p; no tools or reasoning controls.
 */
class MistralRequestTranslator : public RequestTranslator {
public:
    Json::Value build(const ModelDescriptor& model,
                      const std::vector<ChatMessage>& messages,
                      const GenerationOptions& options) const override;
    std::string endpoint(const ProviderDescriptor& provider,
                         const ModelDescriptor& model,
                         bool streaming) const override;
};

#endif // MISTRALADAPTER_HPP
