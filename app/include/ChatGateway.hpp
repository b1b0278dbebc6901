#ifndef CHATGATEWAY_HPP
#define CHATGATEWAY_HPP

#include "ClientConfig.hpp"
#include "CredentialStore.hpp"
#include "Dispatcher.hpp"
#include "HttpTransport.hpp"
#include "ProviderAdapters.hpp"
#include "ProviderTypes.hpp"
#include "StreamDecoder.hpp"
#include "Types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#ifdef LLM_GATEWAY_TEST_BUILD
class ChatGatewayTestAccess;
#endif

/**
 * @brief Entry point for chat completions against the active provider and model.
 *
 * The adapter bundle for the active provider is resolved in configure(), so every
 * call goes straight to the translators chosen there. Configuration changes are
 * not synchronized; callers serialize them.
 */
class ChatGateway {
public:
    /**
     * @param transport Outbound HTTP collaborator.
     * @param credentials Credential store; an in-memory store reading the environment is used when null.
     * @param defaults Initial provider, model and generation defaults.
     * @throws ConfigurationError when defaults name an unknown provider or model.
     */
    ChatGateway(std::shared_ptr<HttpTransport> transport,
                std::shared_ptr<CredentialStore> credentials = nullptr,
                const ClientConfig& defaults = ClientConfig{});

    /**
     * @brief Switches provider and model. Validation happens first; on failure the
     * active configuration is left untouched and the credential is not stored.
     * @param provider_id Catalog provider id.
     * @param model_id Catalog model key; the provider's default model when omitted.
     * @param credential Secret to store and persist for the provider.
     * @return Snapshot of the newly active provider and model.
     * @throws ConfigurationError for an unknown provider or model.
     */
    ProviderInfo configure(const std::string& provider_id,
                           const std::optional<std::string>& model_id = std::nullopt,
                           const std::optional<std::string>& credential = std::nullopt);

    ProviderInfo provider_info() const;
    const ClientConfig& config() const { return config_; }
    std::vector<ProviderListing> list_providers() const;

    /**
     * @brief Stores and persists a secret for a provider.
     * @return False when the secret could not be persisted (it stays usable in memory).
     * @throws ConfigurationError for an unknown provider.
     */
    bool set_api_key(const std::string& provider_id, const std::string& key);

    /**
     * @brief Sends a unary request and waits for the whole completion.
     * @throws AuthError, HttpError, NetworkError or TimeoutError from the dispatcher.
     */
    CompletionResult complete(const std::vector<ChatMessage>& messages,
                              const RequestOptions& options = RequestOptions{}) const;

    /**
     * @brief Opens a streaming request. The returned stream owns the transfer.
     * @throws AuthError, HttpError or NetworkError when the response cannot be opened.
     */
    ChunkStream complete_streaming(const std::vector<ChatMessage>& messages,
                                   const RequestOptions& options = RequestOptions{}) const;

private:
    HttpRequest prepare_request(const std::vector<ChatMessage>& messages,
                                const GenerationOptions& options) const;

    Dispatcher dispatcher_;
    std::shared_ptr<CredentialStore> credentials_;
    ClientConfig config_;
    const ProviderDescriptor* provider_{nullptr};
    const ModelDescriptor* model_{nullptr};
    const ProviderAdapterSet* adapters_{nullptr};

#ifdef LLM_GATEWAY_TEST_BUILD
    friend class ChatGatewayTestAccess;
#endif
};

#endif // CHATGATEWAY_HPP
