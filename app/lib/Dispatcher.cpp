#include "Dispatcher.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include "WireJson.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace {
constexpr std::size_t kMaxErrorBodyBytes = 64 * 1024;

std::optional<int> parse_retry_after(const std::map<std::string, std::string>& headers)
{
    const auto it = headers.find("retry-after");
    if (it == headers.end()) {
        return std::nullopt;
    }
    return Utils::parse_int(it->second);
}
}

Dispatcher::Dispatcher(std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport)),
      logger_(Logger::get_logger("net_logger"))
{
    if (!transport_) {
        throw std::invalid_argument("Dispatcher requires a transport");
    }
}

HttpResponse Dispatcher::send(const std::string& provider_id,
                              const HttpRequest& request,
                              std::chrono::milliseconds timeout) const
{
    if (logger_) {
        logger_->debug("POST {} ({} bytes, timeout {} ms)",
                       Utils::redact_url(request.url), request.body.size(), timeout.count());
    }

    HttpResponse response = transport_->post(request, timeout);

    if (logger_) {
        logger_->debug("{} responded with HTTP {} ({} bytes)",
                       provider_id, response.status, response.body.size());
    }

    if (!response.ok()) {
        raise_for_status(provider_id, response.status, response.body, response.headers);
    }
    return response;
}

std::unique_ptr<ByteStream> Dispatcher::open_stream(const std::string& provider_id,
                                                    const HttpRequest& request) const
{
    if (logger_) {
        logger_->debug("POST {} (streaming, {} bytes)", Utils::redact_url(request.url), request.body.size());
    }

    std::unique_ptr<ByteStream> stream = transport_->open_stream(request);
    const long status = stream->status();
    if (status >= 200 && status < 300) {
        return stream;
    }

    std::string body;
    while (body.size() < kMaxErrorBodyBytes) {
        auto bytes = stream->read_some();
        if (!bytes) {
            break;
        }
        body += *bytes;
    }
    const auto headers = stream->headers();
    stream->close();
    raise_for_status(provider_id, status, body, headers);
}

std::string Dispatcher::extract_error_message(const std::string& body)
{
    const auto root = WireJson::try_parse(body);
    if (!root) {
        return {};
    }
    const Json::Value& error = WireJson::member(*root, "error");
    if (auto message = WireJson::optional_string(WireJson::member(error, "message"))) {
        return *message;
    }
    if (auto message = WireJson::optional_string(error)) {
        return *message;
    }
    if (auto message = WireJson::optional_string(WireJson::member(*root, "message"))) {
        return *message;
    }
    return {};
}

void Dispatcher::raise_for_status(const std::string& provider_id,
                                  long status,
                                  const std::string& body,
                                  const std::map<std::string, std::string>& headers) const
{
    std::string message = extract_error_message(body);
    if (message.empty()) {
        message = fmt::format("request failed with status {}", status);
    }

    if (logger_) {
        logger_->warn("{} request failed with HTTP {}: {}", provider_id, status, message);
    }

    if (status == 401 || status == 403) {
        throw AuthError(provider_id, static_cast<int>(status), message);
    }
    throw HttpError(static_cast<int>(status), message, parse_retry_after(headers));
}
