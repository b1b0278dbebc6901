#include "ChatGateway.hpp"
#include "LlmCatalog.hpp"
#include "Logger.hpp"
#include "WireJson.hpp"

#ifdef LLM_GATEWAY_TEST_BUILD
#include "ChatGatewayTestAccess.hpp"
#endif

#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> core_logger()
{
    return Logger::get_logger("core_logger");
}
}

ChatGateway::ChatGateway(std::shared_ptr<HttpTransport> transport,
                         std::shared_ptr<CredentialStore> credentials,
                         const ClientConfig& defaults)
    : dispatcher_(std::move(transport)),
      credentials_(credentials ? std::move(credentials) : std::make_shared<CredentialStore>()),
      config_(resolve_client_config(defaults.provider_id, defaults.model_id, defaults))
{
    provider_ = &require_provider(config_.provider_id);
    model_ = &require_model(*provider_, config_.model_id);
    adapters_ = &adapters_for(provider_->kind);
}

ProviderInfo ChatGateway::configure(const std::string& provider_id,
                                    const std::optional<std::string>& model_id,
                                    const std::optional<std::string>& credential)
{
    ClientConfig resolved = resolve_client_config(provider_id, model_id, config_);
    const ProviderDescriptor& provider = require_provider(resolved.provider_id);
    const ModelDescriptor& model = require_model(provider, resolved.model_id);
    const ProviderAdapterSet& adapters = adapters_for(provider.kind);

    if (credential && !credential->empty()) {
        if (!credentials_->set(provider.id, *credential)) {
            if (auto logger = core_logger()) {
                logger->warn("API key for {} is active but could not be saved", provider.id);
            }
        }
    }

    config_ = std::move(resolved);
    provider_ = &provider;
    model_ = &model;
    adapters_ = &adapters;

    if (auto logger = core_logger()) {
        logger->info("Active model: {} / {}", provider_->id, model_->id);
    }
    return provider_info();
}

ProviderInfo ChatGateway::provider_info() const
{
    ProviderInfo info;
    info.provider = provider_->id;
    info.provider_name = provider_->name;
    info.model = model_->id;
    info.model_name = model_->name;
    info.capabilities = model_->capabilities;
    info.context_window = model_->context_window;
    info.input_price = model_->input_price;
    info.output_price = model_->output_price;
    return info;
}

std::vector<ProviderListing> ChatGateway::list_providers() const
{
    return ::list_providers();
}

bool ChatGateway::set_api_key(const std::string& provider_id, const std::string& key)
{
    const ProviderDescriptor& provider = require_provider(provider_id);
    return credentials_->set(provider.id, key);
}

CompletionResult ChatGateway::complete(const std::vector<ChatMessage>& messages,
                                       const RequestOptions& options) const
{
    GenerationOptions merged = merge_options(config_, options);
    merged.stream = false;

    const HttpRequest request = prepare_request(messages, merged);
    const HttpResponse response = dispatcher_.send(provider_->id, request, merged.timeout);

    const auto root = WireJson::try_parse(response.body);
    if (!root) {
        if (auto logger = core_logger()) {
            logger->warn("Unparseable response from {} ({} bytes); returning empty content",
                         provider_->id, response.body.size());
        }
        return CompletionResult{};
    }
    return adapters_->response->parse(*root);
}

ChunkStream ChatGateway::complete_streaming(const std::vector<ChatMessage>& messages,
                                            const RequestOptions& options) const
{
    GenerationOptions merged = merge_options(config_, options);
    merged.stream = true;

    const HttpRequest request = prepare_request(messages, merged);
    auto source = dispatcher_.open_stream(provider_->id, request);
    return ChunkStream(std::move(source), adapters_->stream, provider_->id);
}

HttpRequest ChatGateway::prepare_request(const std::vector<ChatMessage>& messages,
                                         const GenerationOptions& options) const
{
    const Json::Value body = adapters_->request->build(*model_, messages, options);

    HttpRequest request;
    request.url = adapters_->request->endpoint(*provider_, *model_, options.stream);
    request.body = WireJson::to_wire_string(body);
    adapters_->auth->apply(provider_->id, credentials_->get(provider_->id), request);
    return request;
}

#ifdef LLM_GATEWAY_TEST_BUILD
HttpRequest ChatGatewayTestAccess::prepare_request(const ChatGateway& gateway,
                                                   const std::vector<ChatMessage>& messages,
                                                   const RequestOptions& options,
                                                   bool streaming)
{
    GenerationOptions merged = merge_options(gateway.config_, options);
    merged.stream = streaming;
    return gateway.prepare_request(messages, merged);
}

const ProviderAdapterSet* ChatGatewayTestAccess::active_adapters(const ChatGateway& gateway)
{
    return gateway.adapters_;
}
#endif
