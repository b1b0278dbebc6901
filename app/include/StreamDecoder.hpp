#ifndef STREAMDECODER_HPP
#define STREAMDECODER_HPP

#include "HttpTransport.hpp"
#include "ProviderAdapters.hpp"
#include "Types.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Splits an incremental byte stream into lines. A trailing '\r' is stripped
 * and an incomplete last line is retained until more bytes arrive.
 */
class SseLineBuffer {
public:
    void append(std::string_view bytes);
    std::optional<std::string> next_line();

    /**
     * @brief Returns the retained partial line once the source has ended.
     */
    std::optional<std::string> flush();

private:
    std::string pending_;
    std::deque<std::string> lines_;
};

/**
 * @brief Returns the payload of a "data:" line (one optional leading space removed).
 */
std::optional<std::string> sse_data_payload(std::string_view line);

/**
 * @brief Pull-based sequence of StreamChunks decoded from a provider event stream.
 *
 * Iteration ends on the "[DONE]" sentinel, a provider end-of-stream event or transport
 * close. Frames that are not valid JSON are skipped and counted. Closing or destroying
 * the stream aborts the underlying transfer.
 */
class ChunkStream {
public:
    enum class State {
        Reading,
        FrameReady,
        Done,
        Errored
    };

    ChunkStream(std::unique_ptr<ByteStream> source,
                std::shared_ptr<const StreamExtractor> extractor,
                std::string provider_id);
    ~ChunkStream();

    ChunkStream(ChunkStream&& other) noexcept;
    ChunkStream& operator=(ChunkStream&& other) noexcept;
    ChunkStream(const ChunkStream&) = delete;
    ChunkStream& operator=(const ChunkStream&) = delete;

    /**
     * @brief Blocks until the next chunk is decoded.
     * @return The chunk, or std::nullopt once the stream is finished.
     * @throws NetworkError when the transport fails mid-stream; the stream is then Errored.
     */
    std::optional<StreamChunk> next();

    void close();

    State state() const { return state_; }
    std::size_t dropped_frames() const { return dropped_frames_; }

private:
    std::optional<StreamChunk> handle_line(const std::string& line);
    void release_source();

    std::unique_ptr<ByteStream> source_;
    std::shared_ptr<const StreamExtractor> extractor_;
    std::string provider_id_;
    SseLineBuffer buffer_;
    State state_{State::Reading};
    bool source_finished_{false};
    std::size_t dropped_frames_{0};
};

#endif // STREAMDECODER_HPP
