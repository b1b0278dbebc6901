#pragma once
#include "ClientConfig.hpp"
#include "HttpTransport.hpp"
#include "ProviderTypes.hpp"
#include "Types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Turns normalized messages and merged options into one provider's wire body.
 */
class RequestTranslator {
public:
    virtual ~RequestTranslator() = default;

    virtual Json::Value build(const ModelDescriptor& model,
                              const std::vector<ChatMessage>& messages,
                              const GenerationOptions& options) const = 0;

    /**
     * @brief Request URL without credentials.
     */
    virtual std::string endpoint(const ProviderDescriptor& provider,
                                 const ModelDescriptor& model,
                                 bool streaming) const = 0;
};

/**
 * @brief Presents the credential the way the provider expects it (URL parameter or headers).
 */
class AuthHeaderBuilder {
public:
    virtual ~AuthHeaderBuilder() = default;

    /**
     * @brief Adds the content type and credential to the request. A missing credential
     * is logged as a warning and the credential field is omitted.
     */
    virtual void apply(const std::string& provider_id,
                       const std::optional<std::string>& credential,
                       HttpRequest& request) const = 0;
};

/**
 * @brief Extracts a normalized result from a complete response. Never throws on a
 * missing path; absent content becomes an empty string, absent usage stays unset.
 */
class ResponseTranslator {
public:
    virtual ~ResponseTranslator() = default;
    virtual CompletionResult parse(const Json::Value& root) const = 0;
};

/**
 * @brief Extracts the content delta carried by one streamed event frame.
 */
class StreamExtractor {
public:
    virtual ~StreamExtractor() = default;
    virtual StreamChunk extract(const Json::Value& frame) const = 0;

    /**
     * @brief True for a provider-specific end-of-stream event carried as a JSON frame.
     */
    virtual bool is_end_of_stream(const Json::Value& /*frame*/) const { return false; }

    /**
     * @brief Provider message of an error event delivered inside an otherwise successful stream.
     */
    virtual std::optional<std::string> error_message(const Json::Value& /*frame*/) const { return std::nullopt; }
};

struct ProviderAdapterSet {
    std::shared_ptr<const RequestTranslator> request;
    std::shared_ptr<const AuthHeaderBuilder> auth;
    std::shared_ptr<const ResponseTranslator> response;
    std::shared_ptr<const StreamExtractor> stream;
};

/**
 * @brief Returns the adapter bundle for a wire-format family. Bundles are created once.
 */
const ProviderAdapterSet& adapters_for(ProviderKind kind);
