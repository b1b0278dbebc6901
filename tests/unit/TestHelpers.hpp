/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, scripted transports).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "CredentialStore.hpp"
#include "HttpTransport.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    static void set_env(const std::string& key, const std::string& value) {
#ifdef _WIN32
        _putenv_s(key.c_str(), value.c_str());
#else
        setenv(key.c_str(), value.c_str(), 1);
#endif
    }

    static void unset_env(const std::string& key) {
#ifdef _WIN32
        _putenv_s(key.c_str(), "");
#else
        unsetenv(key.c_str());
#endif
    }

    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            set_env(key_, *value);
        } else {
            unset_env(key_);
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("llm-gateway-test-")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Unsets every provider key variable so tests never pick up a developer's real keys.
 */
class ProviderKeyEnvGuard {
public:
    ProviderKeyEnvGuard()
        : google_("GOOGLE_API_KEY", std::nullopt),
          openai_("OPENAI_API_KEY", std::nullopt),
          openrouter_("OPENROUTER_API_KEY", std::nullopt),
          anthropic_("ANTHROPIC_API_KEY", std::nullopt),
          mistral_("MISTRAL_API_KEY", std::nullopt),
          xai_("XAI_API_KEY", std::nullopt) {}

private:
    EnvVarGuard google_;
    EnvVarGuard openai_;
    EnvVarGuard openrouter_;
    EnvVarGuard anthropic_;
    EnvVarGuard mistral_;
    EnvVarGuard xai_;
};

/**
 * @brief ByteStream that replays a fixed list of byte spans, optionally failing afterwards.
 */
class ScriptedByteStream : public ByteStream {
public:
    explicit ScriptedByteStream(std::vector<std::string> spans,
                                long status = 200,
                                std::map<std::string, std::string> headers = {})
        : spans_(spans.begin(), spans.end()),
          status_(status),
          headers_(std::move(headers)) {}

    long status() const override { return status_; }
    const std::map<std::string, std::string>& headers() const override { return headers_; }

    std::optional<std::string> read_some() override {
        ++reads_;
        if (closed_ || spans_.empty()) {
            if (!closed_ && fail_at_end_) {
                fail_at_end_();
            }
            return std::nullopt;
        }
        std::string span = std::move(spans_.front());
        spans_.pop_front();
        return span;
    }

    void close() override {
        closed_ = true;
        if (close_count_) {
            ++*close_count_;
        }
    }

    /**
     * @brief Invoked (typically to throw) once all spans were delivered.
     */
    void fail_at_end(std::function<void()> action) { fail_at_end_ = std::move(action); }

    /**
     * @brief Counter incremented on every close(); survives the stream itself.
     */
    void track_close(std::shared_ptr<int> counter) { close_count_ = std::move(counter); }

    int reads() const { return reads_; }

private:
    std::deque<std::string> spans_;
    long status_;
    std::map<std::string, std::string> headers_;
    std::function<void()> fail_at_end_;
    std::shared_ptr<int> close_count_;
    bool closed_{false};
    int reads_{0};
};

/**
 * @brief Splits text into spans of at most span_size bytes.
 */
inline std::vector<std::string> split_into_spans(const std::string& text, std::size_t span_size) {
    std::vector<std::string> spans;
    for (std::size_t offset = 0; offset < text.size(); offset += span_size) {
        spans.push_back(text.substr(offset, span_size));
    }
    return spans;
}

/**
 * @brief HttpTransport that records requests and answers from queued responses.
 */
class FakeTransport : public HttpTransport {
public:
    HttpResponse post(const HttpRequest& request, std::chrono::milliseconds timeout) override {
        requests.push_back(request);
        timeouts.push_back(timeout);
        if (post_hook) {
            post_hook(request, timeout);
        }
        if (responses.empty()) {
            return HttpResponse{200, "{}", {}};
        }
        HttpResponse response = std::move(responses.front());
        responses.pop_front();
        return response;
    }

    std::unique_ptr<ByteStream> open_stream(const HttpRequest& request) override {
        requests.push_back(request);
        if (streams.empty()) {
            return std::make_unique<ScriptedByteStream>(std::vector<std::string>{});
        }
        auto stream = std::move(streams.front());
        streams.pop_front();
        return stream;
    }

    void queue_response(long status, std::string body, std::map<std::string, std::string> headers = {}) {
        responses.push_back(HttpResponse{status, std::move(body), std::move(headers)});
    }

    void queue_stream(std::unique_ptr<ByteStream> stream) {
        streams.push_back(std::move(stream));
    }

    std::vector<HttpRequest> requests;
    std::vector<std::chrono::milliseconds> timeouts;
    std::deque<HttpResponse> responses;
    std::deque<std::unique_ptr<ByteStream>> streams;
    std::function<void(const HttpRequest&, std::chrono::milliseconds)> post_hook;
};

/**
 * @brief In-memory credential persistence that records every save.
 */
class MemoryCredentialPersistence : public CredentialPersistence {
public:
    explicit MemoryCredentialPersistence(std::map<std::string, std::string> initial = {})
        : stored(std::move(initial)) {}

    std::map<std::string, std::string> load() override { return stored; }

    bool save(const std::map<std::string, std::string>& secrets) override {
        ++save_count;
        if (fail_saves) {
            return false;
        }
        stored = secrets;
        return true;
    }

    std::map<std::string, std::string> stored;
    int save_count{0};
    bool fail_saves{false};
};

/**
 * @brief Looks up a request header by exact name.
 */
inline std::optional<std::string> find_header(const HttpRequest& request, const std::string& name) {
    for (const auto& [key, value] : request.headers) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}
