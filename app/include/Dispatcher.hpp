#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "HttpTransport.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace spdlog { class logger; }

/**
 * @brief Sends prepared requests through the transport and maps failures to typed errors.
 *
 * 401/403 become AuthError, any other non-2xx status becomes HttpError. TimeoutError
 * and NetworkError from the transport pass through unchanged. Nothing is retried.
 */
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<HttpTransport> transport);

    HttpResponse send(const std::string& provider_id,
                      const HttpRequest& request,
                      std::chrono::milliseconds timeout) const;

    /**
     * @brief Opens a streaming response; the status is checked before the stream is returned.
     */
    std::unique_ptr<ByteStream> open_stream(const std::string& provider_id,
                                            const HttpRequest& request) const;

    /**
     * @brief Best-effort provider error text ("error.message", "error" or "message").
     * @return Extracted message, or an empty string when the body has none.
     */
    static std::string extract_error_message(const std::string& body);

private:
    [[noreturn]] void raise_for_status(const std::string& provider_id,
                                       long status,
                                       const std::string& body,
                                       const std::map<std::string, std::string>& headers) const;

    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif // DISPATCHER_HPP
