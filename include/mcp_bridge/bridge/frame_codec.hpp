#pragma once

#include <mcp_bridge/bridge/frame.hpp>
#include <mcp_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcp_bridge {

inline constexpr size_t kDefaultMaxLineBytes = 8u * 1024u * 1024u;

// ===========================================================================
// Pipe transport: one JSON-RPC message per '\n'-terminated UTF-8 line.
// ===========================================================================

// Serialize a frame as one line, newline included.
std::string EncodePipe(const Frame& frame);

// Decode a single line (without its terminator).
Result<Frame, Error> DecodeLine(std::string_view line);

// ---------------------------------------------------------------------------
// PipeDecoder: incremental decoder for one pipe connection.
//
// Feed() accepts arbitrary byte chunks as they come off the pipe and returns
// the frames (or per-line DecodeErrors) of every line completed by the chunk.
// A bad line never poisons the decoder: decoding resumes on the next line.
// Lines over max_line_bytes are dropped up to their newline.
// Use a fresh decoder per connection.
// ---------------------------------------------------------------------------
class PipeDecoder {
public:
    explicit PipeDecoder(size_t max_line_bytes = kDefaultMaxLineBytes);

    [[nodiscard]] std::vector<Result<Frame, Error>> Feed(std::string_view bytes);

    // At EOF: decode a trailing line that had no terminator.
    [[nodiscard]] std::vector<Result<Frame, Error>> Finish();

    [[nodiscard]] size_t BufferedBytes() const noexcept { return buffer_.size(); }

private:
    void TakeLine(std::string_view line, std::vector<Result<Frame, Error>>& out);

    size_t max_line_bytes_;
    std::string buffer_;
    bool discarding_ = false;
};

// ===========================================================================
// Streaming transport: Server-Sent Events.
//
//   event: frame       data: <JSON-RPC message>
//   event: error       data: {"error":{...}}
//   event: keepalive   data: {}
//   event: end         data: {"request_id":...,"frames":N}
// ===========================================================================

enum class StreamEventType {
    Frame,
    Error,
    KeepAlive,
    End,
};

const char* StreamEventName(StreamEventType type);

struct StreamEvent {
    StreamEventType type = StreamEventType::KeepAlive;
    nlohmann::json data = nlohmann::json::object();

    static StreamEvent ForFrame(const Frame& frame);
    static StreamEvent ForError(const Error& error);
    static StreamEvent KeepAlive();
    static StreamEvent End(nlohmann::json summary = nlohmann::json::object());

    bool operator==(const StreamEvent& other) const {
        return type == other.type && data == other.data;
    }
};

// Serialize one event, terminated by the blank line.
std::string EncodeStream(const StreamEvent& event);

// Frame carried by a Frame event.
Result<Frame, Error> DecodeStream(const StreamEvent& event);

// Error carried by an Error event (Internal if the payload is unreadable).
Error DecodeStreamError(const StreamEvent& event);

// ---------------------------------------------------------------------------
// StreamDecoder: incremental SSE parser for the client side.
//
// Comment lines (":") and "id:"/"retry:" fields are ignored. An event
// without an "event:" field is treated as a frame. Multi-line data fields
// are joined with '\n' before JSON parsing.
// ---------------------------------------------------------------------------
class StreamDecoder {
public:
    [[nodiscard]] std::vector<Result<StreamEvent, Error>> Feed(std::string_view text);

private:
    void TakeLine(std::string_view line, std::vector<Result<StreamEvent, Error>>& out);
    void Dispatch(std::vector<Result<StreamEvent, Error>>& out);

    std::string buffer_;
    std::string event_name_;
    std::string data_;
    bool has_data_ = false;
};

} // namespace mcp_bridge
