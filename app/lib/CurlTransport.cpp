#include "CurlTransport.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace {

template <typename... Args>
void stream_log(spdlog::level::level_enum level, const char* fmt, Args&&... args)
{
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("net_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlMultiDeleter {
    void operator()(CURLM* handle) const { curl_multi_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlMultiPtr = std::unique_ptr<CURLM, CurlMultiDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

template <typename Value>
void set_required_option(CURL* curl, CURLoption option, Value value, const char* what)
{
    if (curl_easy_setopt(curl, option, value) != CURLE_OK) {
        throw NetworkError(ErrorCodes::Code::NETWORK_TRANSPORT_INIT_FAILED,
                           fmt::format("Failed to set {}", what));
    }
}

// Collects the status line and headers of the final response; earlier blocks
// (100 Continue, redirects) are discarded when the next status line arrives.
struct ResponseHead {
    long status = 0;
    std::map<std::string, std::string> headers;
    bool complete = false;
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response)
{
    const size_t total = size * nmemb;
    response->append(static_cast<const char*>(contents), total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, ResponseHead* head)
{
    const size_t total = size * nitems;
    const std::string line = Utils::trim_copy(std::string_view(buffer, total));

    if (line.rfind("HTTP/", 0) == 0) {
        head->headers.clear();
        head->complete = false;
        const auto space = line.find(' ');
        if (space != std::string::npos) {
            head->status = Utils::parse_int(line.substr(space + 1, 3)).value_or(0);
        }
        return total;
    }
    if (line.empty()) {
        head->complete = head->status >= 200;
        return total;
    }

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        head->headers[Utils::to_lower_copy(line.substr(0, colon))] =
            Utils::trim_copy(std::string_view(line).substr(colon + 1));
    }
    return total;
}

CurlSlistPtr make_header_list(const std::vector<HttpHeader>& headers)
{
    curl_slist* list = nullptr;
    for (const auto& [name, value] : headers) {
        const std::string line = name + ": " + value;
        curl_slist* appended = curl_slist_append(list, line.c_str());
        if (!appended) {
            curl_slist_free_all(list);
            throw NetworkError(ErrorCodes::Code::NETWORK_TRANSPORT_INIT_FAILED,
                               "Failed to allocate request headers");
        }
        list = appended;
    }
    return CurlSlistPtr(list);
}

// body is not copied by libcurl and must outlive the handle.
CurlEasyPtr make_easy_handle(const std::string& url,
                             const std::string& body,
                             curl_slist* headers,
                             std::chrono::milliseconds connect_timeout)
{
    CurlEasyPtr handle(curl_easy_init());
    if (!handle) {
        throw NetworkError(ErrorCodes::Code::NETWORK_TRANSPORT_INIT_FAILED,
                           "Failed to initialize cURL");
    }
    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    return handle;
}

// Messages use curl_easy_strerror() only; the URL may carry a credential.
[[noreturn]] void throw_transport_error(CURLcode code, std::chrono::milliseconds timeout)
{
    const std::string reason = curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            throw TimeoutError(fmt::format("Request timed out after {} ms", timeout.count()), timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            throw NetworkError(ErrorCodes::Code::NETWORK_DNS_RESOLUTION_FAILED, reason);
        case CURLE_COULDNT_CONNECT:
            throw NetworkError(ErrorCodes::Code::NETWORK_CONNECTION_FAILED, reason);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            throw NetworkError(ErrorCodes::Code::NETWORK_SSL_HANDSHAKE_FAILED, reason);
        default:
            throw NetworkError(ErrorCodes::Code::NETWORK_UNAVAILABLE, reason);
    }
}

class CurlByteStream : public ByteStream {
public:
    CurlByteStream(const HttpRequest& request,
                   std::chrono::milliseconds connect_timeout,
                   std::chrono::milliseconds idle_timeout)
        : url_(request.url),
          body_(request.body),
          connect_timeout_(connect_timeout),
          idle_timeout_(idle_timeout),
          header_list_(make_header_list(request.headers))
    {
        easy_ = make_easy_handle(url_, body_, header_list_.get(), connect_timeout);
        // libcurl checks transfer speed in whole seconds.
        const long idle_seconds = std::max<long>(1, static_cast<long>((idle_timeout.count() + 999) / 1000));
        set_required_option(easy_.get(), CURLOPT_LOW_SPEED_LIMIT, 1L, "stream idle limit");
        set_required_option(easy_.get(), CURLOPT_LOW_SPEED_TIME, idle_seconds, "stream idle time");
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, &pending_);
        curl_easy_setopt(easy_.get(), CURLOPT_HEADERDATA, &head_);

        multi_.reset(curl_multi_init());
        if (!multi_) {
            throw NetworkError(ErrorCodes::Code::NETWORK_TRANSPORT_INIT_FAILED,
                               "Failed to initialize cURL multi handle");
        }
        if (curl_multi_add_handle(multi_.get(), easy_.get()) != CURLM_OK) {
            throw NetworkError(ErrorCodes::Code::NETWORK_TRANSPORT_INIT_FAILED,
                               "Failed to start streaming transfer");
        }
        attached_ = true;

        while (!head_.complete && !finished_) {
            pump(true);
        }
    }

    ~CurlByteStream() override
    {
        close();
    }

    long status() const override { return head_.status; }

    const std::map<std::string, std::string>& headers() const override { return head_.headers; }

    std::optional<std::string> read_some() override
    {
        while (pending_.empty() && !finished_ && attached_) {
            pump(false);
        }
        if (pending_.empty()) {
            return std::nullopt;
        }
        std::string bytes;
        bytes.swap(pending_);
        return bytes;
    }

    void close() override
    {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
            attached_ = false;
        }
        easy_.reset();
        multi_.reset();
        finished_ = true;
    }

private:
    // Drives the transfer once and blocks in curl_multi_poll() only when nothing new arrived.
    void pump(bool waiting_for_head)
    {
        int running = 0;
        CURLMcode mcode = curl_multi_perform(multi_.get(), &running);
        if (mcode != CURLM_OK) {
            close();
            throw NetworkError(ErrorCodes::Code::NETWORK_UNAVAILABLE, curl_multi_strerror(mcode));
        }

        int queued = 0;
        while (CURLMsg* message = curl_multi_info_read(multi_.get(), &queued)) {
            if (message->msg != CURLMSG_DONE) {
                continue;
            }
            const CURLcode result = message->data.result;
            if (result != CURLE_OK) {
                const bool mid_stream = head_.complete;
                curl_off_t connected_at = 0;
                curl_easy_getinfo(easy_.get(), CURLINFO_CONNECT_TIME_T, &connected_at);
                close();
                if (mid_stream) {
                    stream_log(spdlog::level::warn, "Stream from {} interrupted: {}",
                               Utils::redact_url(url_), curl_easy_strerror(result));
                    throw NetworkError(ErrorCodes::Code::STREAM_INTERRUPTED, curl_easy_strerror(result));
                }
                throw_transport_error(result, connected_at > 0 ? idle_timeout_ : connect_timeout_);
            }
            long status = 0;
            curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status);
            head_.status = status;
            head_.complete = true;
            finished_ = true;
        }

        if (running == 0) {
            finished_ = true;
        }
        if (finished_ || !pending_.empty() || (waiting_for_head && head_.complete)) {
            return;
        }

        mcode = curl_multi_poll(multi_.get(), nullptr, 0, 1000, nullptr);
        if (mcode != CURLM_OK) {
            close();
            throw NetworkError(ErrorCodes::Code::NETWORK_UNAVAILABLE, curl_multi_strerror(mcode));
        }
    }

    std::string url_;
    std::string body_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::milliseconds idle_timeout_;
    CurlSlistPtr header_list_;
    CurlEasyPtr easy_;
    CurlMultiPtr multi_;
    ResponseHead head_;
    std::string pending_;
    bool attached_{false};
    bool finished_{false};
};

}

CurlTransport::CurlTransport(std::chrono::milliseconds connect_timeout,
                             std::chrono::milliseconds stream_idle_timeout)
    : connect_timeout_(connect_timeout),
      stream_idle_timeout_(stream_idle_timeout)
{
}

HttpResponse CurlTransport::post(const HttpRequest& request, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Request timeout must be positive");
    }
    CurlSlistPtr header_list = make_header_list(request.headers);
    const auto connect_timeout = std::min(connect_timeout_, timeout);
    CurlEasyPtr curl = make_easy_handle(request.url, request.body, header_list.get(), connect_timeout);

    HttpResponse response;
    ResponseHead head;
    set_required_option(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()), "request timeout");
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &head);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        if (auto logger = Logger::get_logger("net_logger")) {
            logger->warn("Request to {} failed: {}", Utils::redact_url(request.url), curl_easy_strerror(res));
        }
        throw_transport_error(res, timeout);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.headers = std::move(head.headers);
    return response;
}

std::unique_ptr<ByteStream> CurlTransport::open_stream(const HttpRequest& request)
{
    return std::make_unique<CurlByteStream>(request, connect_timeout_, stream_idle_timeout_);
}
