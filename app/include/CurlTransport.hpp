#ifndef CURLTRANSPORT_HPP
#define CURLTRANSPORT_HPP

#include "HttpTransport.hpp"

#include <chrono>
#include <memory>

/**
 * @brief libcurl-backed transport. Unary calls use the easy interface; streams use
 * the multi interface so the caller pulls bytes at its own pace.
 *
 * Streams have no overall deadline; a stream that delivers no bytes for
 * stream_idle_timeout is aborted, with TimeoutError before the response head
 * arrives and NetworkError (STREAM_INTERRUPTED) after it.
 *
 * curl_global_init() must have run before the first request.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::chrono::milliseconds connect_timeout = std::chrono::milliseconds(10000),
                           std::chrono::milliseconds stream_idle_timeout = std::chrono::milliseconds(60000));

    // Throws std::invalid_argument for a non-positive timeout.

    HttpResponse post(const HttpRequest& request, std::chrono::milliseconds timeout) override;
    std::unique_ptr<ByteStream> open_stream(const HttpRequest& request) override;

private:
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds stream_idle_timeout_;
};

#endif // CURLTRANSPORT_HPP
