#ifndef HTTPTRANSPORT_HPP
#define HTTPTRANSPORT_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using HttpHeader = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string url;
    std::vector<HttpHeader> headers;
    std::string body;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers; ///< Header names lower-cased.

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Incremental response body. Reading is pull-based; destroying the stream
 * (or calling close()) aborts the underlying transfer.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief HTTP status of the response; valid once the stream has been opened.
     */
    virtual long status() const = 0;

    virtual const std::map<std::string, std::string>& headers() const = 0;

    /**
     * @brief Blocks until more bytes are available.
     * @return The next byte span, or std::nullopt once the body is complete.
     * @throws NetworkError when the transfer fails mid-stream.
     */
    virtual std::optional<std::string> read_some() = 0;

    virtual void close() = 0;
};

/**
 * @brief Outbound HTTP collaborator used by the Dispatcher.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief POSTs the request and waits for the complete response.
     * @throws TimeoutError when the deadline passes (the transfer is aborted).
     * @throws NetworkError on transport failure.
     */
    virtual HttpResponse post(const HttpRequest& request, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief POSTs the request and returns once the response status is known.
     * @throws NetworkError on transport failure before the status arrives.
     */
    virtual std::unique_ptr<ByteStream> open_stream(const HttpRequest& request) = 0;
};

#endif // HTTPTRANSPORT_HPP
