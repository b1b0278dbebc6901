#include "StreamDecoder.hpp"
#include "LLMErrors.hpp"
#include "Logger.hpp"
#include "WireJson.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <utility>

namespace {
constexpr std::string_view kDataPrefix = "data:";
constexpr std::string_view kDoneSentinel = "[DONE]";

template <typename... Args>
void stream_log(spdlog::level::level_enum level, const char* fmt, Args&&... args)
{
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("net_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}
}

void SseLineBuffer::append(std::string_view bytes)
{
    pending_.append(bytes.data(), bytes.size());

    std::size_t start = 0;
    std::size_t newline = pending_.find('\n', start);
    while (newline != std::string::npos) {
        std::string line = pending_.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines_.push_back(std::move(line));
        start = newline + 1;
        newline = pending_.find('\n', start);
    }
    pending_.erase(0, start);
}

std::optional<std::string> SseLineBuffer::next_line()
{
    if (lines_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(lines_.front());
    lines_.pop_front();
    return line;
}

std::optional<std::string> SseLineBuffer::flush()
{
    if (pending_.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(pending_);
    pending_.clear();
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::optional<std::string> sse_data_payload(std::string_view line)
{
    if (line.substr(0, kDataPrefix.size()) != kDataPrefix) {
        return std::nullopt;
    }
    line.remove_prefix(kDataPrefix.size());
    if (!line.empty() && line.front() == ' ') {
        line.remove_prefix(1);
    }
    return std::string(line);
}

ChunkStream::ChunkStream(std::unique_ptr<ByteStream> source,
                         std::shared_ptr<const StreamExtractor> extractor,
                         std::string provider_id)
    : source_(std::move(source)),
      extractor_(std::move(extractor)),
      provider_id_(std::move(provider_id))
{
}

ChunkStream::~ChunkStream()
{
    release_source();
}

ChunkStream::ChunkStream(ChunkStream&& other) noexcept
    : source_(std::move(other.source_)),
      extractor_(std::move(other.extractor_)),
      provider_id_(std::move(other.provider_id_)),
      buffer_(std::move(other.buffer_)),
      state_(other.state_),
      source_finished_(other.source_finished_),
      dropped_frames_(other.dropped_frames_)
{
    other.state_ = State::Done;
}

ChunkStream& ChunkStream::operator=(ChunkStream&& other) noexcept
{
    if (this != &other) {
        release_source();
        source_ = std::move(other.source_);
        extractor_ = std::move(other.extractor_);
        provider_id_ = std::move(other.provider_id_);
        buffer_ = std::move(other.buffer_);
        state_ = other.state_;
        source_finished_ = other.source_finished_;
        dropped_frames_ = other.dropped_frames_;
        other.state_ = State::Done;
    }
    return *this;
}

std::optional<StreamChunk> ChunkStream::next()
{
    while (state_ == State::Reading || state_ == State::FrameReady) {
        state_ = State::Reading;

        while (auto line = buffer_.next_line()) {
            auto chunk = handle_line(*line);
            if (chunk) {
                return chunk;
            }
            if (state_ == State::Done) {
                release_source();
                return std::nullopt;
            }
        }

        if (source_finished_ || !source_) {
            if (auto line = buffer_.flush()) {
                auto chunk = handle_line(*line);
                if (chunk) {
                    return chunk;
                }
            }
            state_ = State::Done;
            release_source();
            return std::nullopt;
        }

        std::optional<std::string> bytes;
        try {
            bytes = source_->read_some();
        } catch (const NetworkError& ex) {
            state_ = State::Errored;
            stream_log(spdlog::level::warn, "{} stream interrupted: {}", provider_id_, ex.what());
            release_source();
            throw;
        }

        if (!bytes) {
            source_finished_ = true;
        } else {
            buffer_.append(*bytes);
        }
    }
    return std::nullopt;
}

void ChunkStream::close()
{
    if (state_ == State::Reading || state_ == State::FrameReady) {
        state_ = State::Done;
    }
    release_source();
}

std::optional<StreamChunk> ChunkStream::handle_line(const std::string& line)
{
    const auto payload = sse_data_payload(line);
    if (!payload) {
        return std::nullopt;
    }
    if (*payload == kDoneSentinel) {
        state_ = State::Done;
        return std::nullopt;
    }

    const auto frame = WireJson::try_parse(*payload);
    if (!frame) {
        ++dropped_frames_;
        stream_log(spdlog::level::debug, "{}: dropping malformed stream frame ({} bytes)",
                   provider_id_, payload->size());
        return std::nullopt;
    }

    if (auto error = extractor_->error_message(*frame)) {
        state_ = State::Errored;
        stream_log(spdlog::level::warn, "{} stream reported an error: {}", provider_id_, *error);
        release_source();
        throw NetworkError(ErrorCodes::Code::STREAM_INTERRUPTED, *error);
    }

    if (extractor_->is_end_of_stream(*frame)) {
        state_ = State::Done;
        return std::nullopt;
    }

    state_ = State::FrameReady;
    return extractor_->extract(*frame);
}

void ChunkStream::release_source()
{
    if (source_) {
        source_->close();
        source_.reset();
    }
}
