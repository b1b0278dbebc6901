#pragma once

#ifdef LLM_GATEWAY_TEST_BUILD

#include "ChatGateway.hpp"

class ChatGatewayTestAccess {
public:
    static HttpRequest prepare_request(const ChatGateway& gateway,
                                       const std::vector<ChatMessage>& messages,
                                       const RequestOptions& options,
                                       bool streaming);
    static const ProviderAdapterSet* active_adapters(const ChatGateway& gateway);
};

#endif // LLM_GATEWAY_TEST_BUILD
