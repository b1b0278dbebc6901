#include <catch2/catch_test_macros.hpp>

#include "CurlTransport.hpp"
#include "LLMErrors.hpp"
#include "TestHelpers.hpp"

#ifndef _WIN32

#include <curl/curl.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

using ResponseWriter = std::function<void(int client, const std::atomic<bool>& stopping)>;

void ensure_curl_initialized()
{
    static const bool initialized = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    REQUIRE(initialized);
}

void send_all(int fd, const std::string& data)
{
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

// Keeps the connection open without sending anything until the server shuts down.
void hold_open(const std::atomic<bool>& stopping)
{
    while (!stopping) {
        std::this_thread::sleep_for(20ms);
    }
}

std::string http_response(const std::string& status_line,
                          const std::string& extra_headers,
                          const std::string& body)
{
    return status_line + "\r\n" + extra_headers + "Content-Length: " + std::to_string(body.size()) +
           "\r\nConnection: close\r\n\r\n" + body;
}

/**
 * @brief Single-connection HTTP server on 127.0.0.1. It reads one request,
 * hands the socket to the writer and closes it afterwards.
 */
class LoopbackServer {
public:
    explicit LoopbackServer(ResponseWriter writer)
        : writer_(std::move(writer))
    {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(listen_fd_ >= 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(::listen(listen_fd_, 4) == 0);

        socklen_t length = sizeof(addr);
        REQUIRE(::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &length) == 0);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer()
    {
        stopping_ = true;
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listen_fd_);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    HttpRequest request() const
    {
        return HttpRequest{"http://127.0.0.1:" + std::to_string(port_) + "/v1/chat/completions",
                           {{"Content-Type", "application/json"}},
                           R"({"model":"test-model","messages":[]})"};
    }

private:
    void serve()
    {
        pollfd listener{listen_fd_, POLLIN, 0};
        while (!stopping_) {
            if (::poll(&listener, 1, 50) <= 0) {
                continue;
            }
            const int client = ::accept(listen_fd_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }
            if (read_request(client)) {
                writer_(client, stopping_);
            }
            ::close(client);
            return;
        }
    }

    bool read_request(int client)
    {
        std::string received;
        std::optional<size_t> expected_size;
        pollfd peer{client, POLLIN, 0};
        while (!stopping_) {
            if (expected_size && received.size() >= *expected_size) {
                return true;
            }
            if (::poll(&peer, 1, 50) <= 0) {
                continue;
            }
            char buffer[4096];
            const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return false;
            }
            received.append(buffer, static_cast<size_t>(n));

            const auto head_end = received.find("\r\n\r\n");
            if (!expected_size && head_end != std::string::npos) {
                std::string head = received.substr(0, head_end);
                std::transform(head.begin(), head.end(), head.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                size_t body_size = 0;
                const auto field = head.find("content-length:");
                if (field != std::string::npos) {
                    body_size = std::stoul(head.substr(field + 15));
                }
                expected_size = head_end + 4 + body_size;
            }
        }
        return false;
    }

    ResponseWriter writer_;
    int listen_fd_{-1};
    int port_{0};
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

// Loopback requests must not be routed through a proxy from the environment.
struct DirectConnectionGuard {
    EnvVarGuard http_proxy{"http_proxy", std::nullopt};
    EnvVarGuard http_proxy_upper{"HTTP_PROXY", std::nullopt};
    EnvVarGuard all_proxy{"all_proxy", std::nullopt};
    EnvVarGuard all_proxy_upper{"ALL_PROXY", std::nullopt};
};

} // namespace

TEST_CASE("CurlTransport aborts a unary call at its deadline") {
    ensure_curl_initialized();
    DirectConnectionGuard direct;
    LoopbackServer server([](int, const std::atomic<bool>& stopping) { hold_open(stopping); });
    CurlTransport transport;

    const auto started = std::chrono::steady_clock::now();
    try {
        transport.post(server.request(), 500ms);
        FAIL("stalled request returned");
    } catch (const TimeoutError& ex) {
        REQUIRE(ex.timeout() == 500ms);
        REQUIRE(ex.get_error_code() == ErrorCodes::Code::NETWORK_TIMEOUT);
    }
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("CurlTransport rejects a non-positive unary timeout") {
    CurlTransport transport;
    const HttpRequest request{"http://127.0.0.1:9/v1/chat/completions", {}, "{}"};

    REQUIRE_THROWS_AS(transport.post(request, 0ms), std::invalid_argument);
    REQUIRE_THROWS_AS(transport.post(request, -1ms), std::invalid_argument);
}

TEST_CASE("CurlTransport times out a stream whose response head never arrives") {
    ensure_curl_initialized();
    DirectConnectionGuard direct;
    LoopbackServer server([](int, const std::atomic<bool>& stopping) { hold_open(stopping); });
    CurlTransport transport(1000ms, 1000ms);

    try {
        auto stream = transport.open_stream(server.request());
        FAIL("stream opened without a response head");
    } catch (const TimeoutError& ex) {
        REQUIRE(ex.timeout() == 1000ms);
    }
}

TEST_CASE("CurlTransport interrupts a stream that goes idle after the head") {
    ensure_curl_initialized();
    DirectConnectionGuard direct;
    LoopbackServer server([](int client, const std::atomic<bool>& stopping) {
        send_all(client,
                 "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nConnection: close\r\n\r\n"
                 "data: one\n\n");
        hold_open(stopping);
    });
    CurlTransport transport(1000ms, 1000ms);

    auto stream = transport.open_stream(server.request());
    REQUIRE(stream->status() == 200);
    REQUIRE(stream->headers().at("content-type") == "text/event-stream");
    REQUIRE(stream->read_some() == std::optional<std::string>("data: one\n\n"));

    try {
        stream->read_some();
        FAIL("idle stream kept waiting");
    } catch (const NetworkError& ex) {
        REQUIRE(ex.get_error_code() == ErrorCodes::Code::STREAM_INTERRUPTED);
    }
    REQUIRE_FALSE(stream->read_some().has_value());
}

TEST_CASE("CurlTransport returns non-2xx responses with their headers") {
    ensure_curl_initialized();
    DirectConnectionGuard direct;
    const std::string body = R"({"error":{"message":"slow down"}})";
    LoopbackServer server([&body](int client, const std::atomic<bool>&) {
        send_all(client, http_response("HTTP/1.1 429 Too Many Requests",
                                       "Retry-After: 7\r\nContent-Type: application/json\r\n", body));
    });
    CurlTransport transport;

    const HttpResponse response = transport.post(server.request(), 2000ms);
    REQUIRE(response.status == 429);
    REQUIRE_FALSE(response.ok());
    REQUIRE(response.headers.at("retry-after") == "7");
    REQUIRE(response.body == body);
}

TEST_CASE("CurlTransport reports the final status after 100 Continue") {
    ensure_curl_initialized();
    DirectConnectionGuard direct;
    LoopbackServer server([](int client, const std::atomic<bool>&) {
        send_all(client, "HTTP/1.1 100 Continue\r\nX-Interim: yes\r\n\r\n");
        send_all(client, http_response("HTTP/1.1 200 OK", "X-Final: yes\r\n", "ok"));
    });
    CurlTransport transport;

    SECTION("unary") {
        const HttpResponse response = transport.post(server.request(), 2000ms);
        REQUIRE(response.status == 200);
        REQUIRE(response.body == "ok");
        REQUIRE(response.headers.at("x-final") == "yes");
        REQUIRE(response.headers.count("x-interim") == 0);
    }

    SECTION("streaming") {
        auto stream = transport.open_stream(server.request());
        REQUIRE(stream->status() == 200);
        REQUIRE(stream->headers().count("x-interim") == 0);

        std::string received;
        while (auto bytes = stream->read_some()) {
            received += *bytes;
        }
        REQUIRE(received == "ok");
    }
}

TEST_CASE("CurlTransport exposes the status and body of a failed stream") {
    ensure_curl_initialized();
    DirectConnectionGuard direct;
    const std::string body = R"({"error":{"message":"upstream failure"}})";
    LoopbackServer server([&body](int client, const std::atomic<bool>&) {
        send_all(client, http_response("HTTP/1.1 500 Internal Server Error",
                                       "Content-Type: application/json\r\n", body));
    });
    CurlTransport transport;

    auto stream = transport.open_stream(server.request());
    REQUIRE(stream->status() == 500);

    std::string received;
    while (auto bytes = stream->read_some()) {
        received += *bytes;
    }
    REQUIRE(received == body);
}

#endif
