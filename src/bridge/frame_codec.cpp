#include <mcp_bridge/bridge/frame_codec.hpp>

#include <utility>

namespace mcp_bridge {

namespace {

Error MakeDecodeError(const std::string& operation, const std::string& message) {
    return Error::Make(ErrorCategory::DecodeError, operation, "", message);
}

std::string_view StripCarriageReturn(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

bool IsBlank(std::string_view line) {
    return line.find_first_not_of(" \t") == std::string_view::npos;
}

// Short excerpt of an offending line for error messages.
std::string Excerpt(std::string_view line) {
    constexpr size_t kMax = 120;
    if (line.size() <= kMax) {
        return std::string(line);
    }
    return std::string(line.substr(0, kMax)) + "...";
}

} // anonymous namespace

// ===========================================================================
// Pipe transport
// ===========================================================================

std::string EncodePipe(const Frame& frame) {
    // dump() escapes control characters, so the line holds no raw newline.
    auto line = frame.ToJson().dump(-1, ' ', false,
                                    nlohmann::json::error_handler_t::replace);
    line += '\n';
    return line;
}

Result<Frame, Error> DecodeLine(std::string_view line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        return Result<Frame, Error>::Err(MakeDecodeError(
            "DecodeLine", std::string("Malformed JSON line: ") + e.what() +
                              " | " + Excerpt(line)));
    }
    return Frame::FromJson(message);
}

PipeDecoder::PipeDecoder(size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}

std::vector<Result<Frame, Error>> PipeDecoder::Feed(std::string_view bytes) {
    std::vector<Result<Frame, Error>> out;

    while (!bytes.empty()) {
        auto newline = bytes.find('\n');
        if (newline == std::string_view::npos) {
            if (!discarding_) {
                buffer_.append(bytes.data(), bytes.size());
                if (buffer_.size() > max_line_bytes_) {
                    out.push_back(Result<Frame, Error>::Err(MakeDecodeError(
                        "PipeDecoder", "Line exceeds " + std::to_string(max_line_bytes_) +
                                           " bytes; discarded")));
                    buffer_.clear();
                    discarding_ = true;
                }
            }
            break;
        }

        auto chunk = bytes.substr(0, newline);
        bytes.remove_prefix(newline + 1);

        if (discarding_) {
            discarding_ = false;
            buffer_.clear();
            continue;
        }
        if (buffer_.empty()) {
            TakeLine(chunk, out);
        } else {
            buffer_.append(chunk.data(), chunk.size());
            std::string line;
            line.swap(buffer_);
            TakeLine(line, out);
        }
    }
    return out;
}

std::vector<Result<Frame, Error>> PipeDecoder::Finish() {
    std::vector<Result<Frame, Error>> out;
    if (!discarding_ && !buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        TakeLine(line, out);
    }
    buffer_.clear();
    discarding_ = false;
    return out;
}

void PipeDecoder::TakeLine(std::string_view line, std::vector<Result<Frame, Error>>& out) {
    line = StripCarriageReturn(line);
    if (IsBlank(line)) {
        return;
    }
    if (line.size() > max_line_bytes_) {
        out.push_back(Result<Frame, Error>::Err(MakeDecodeError(
            "PipeDecoder", "Line exceeds " + std::to_string(max_line_bytes_) +
                               " bytes; discarded")));
        return;
    }
    out.push_back(DecodeLine(line));
}

// ===========================================================================
// Streaming transport
// ===========================================================================

const char* StreamEventName(StreamEventType type) {
    switch (type) {
        case StreamEventType::Frame:     return "frame";
        case StreamEventType::Error:     return "error";
        case StreamEventType::KeepAlive: return "keepalive";
        case StreamEventType::End:       return "end";
    }
    return "frame";
}

StreamEvent StreamEvent::ForFrame(const Frame& frame) {
    return StreamEvent{StreamEventType::Frame, frame.ToJson()};
}

StreamEvent StreamEvent::ForError(const Error& error) {
    return StreamEvent{StreamEventType::Error, nlohmann::json::parse(error.ToJson())};
}

StreamEvent StreamEvent::KeepAlive() {
    return StreamEvent{StreamEventType::KeepAlive, nlohmann::json::object()};
}

StreamEvent StreamEvent::End(nlohmann::json summary) {
    return StreamEvent{StreamEventType::End, std::move(summary)};
}

std::string EncodeStream(const StreamEvent& event) {
    std::string out = "event: ";
    out += StreamEventName(event.type);
    out += "\ndata: ";
    out += event.data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out += "\n\n";
    return out;
}

Result<Frame, Error> DecodeStream(const StreamEvent& event) {
    if (event.type != StreamEventType::Frame) {
        return Result<Frame, Error>::Err(MakeDecodeError(
            "DecodeStream", std::string("Not a frame event: ") + StreamEventName(event.type)));
    }
    return Frame::FromJson(event.data);
}

Error DecodeStreamError(const StreamEvent& event) {
    const auto body = event.data.find("error");
    if (event.type != StreamEventType::Error || body == event.data.end() ||
        !body->is_object()) {
        return Error::Make(ErrorCategory::Internal, "DecodeStreamError", "",
                           "Unreadable error event: " + event.data.dump());
    }
    Error error;
    error.category = CategoryFromName(body->value("category", "internal"));
    error.operation = body->value("operation", "");
    error.backend = body->value("backend", "");
    error.message = body->value("message", "");
    if (body->contains("detail") && (*body)["detail"].is_string()) {
        error.detail = (*body)["detail"].get<std::string>();
    }
    return error;
}

std::vector<Result<StreamEvent, Error>> StreamDecoder::Feed(std::string_view text) {
    std::vector<Result<StreamEvent, Error>> out;
    buffer_.append(text.data(), text.size());

    size_t start = 0;
    while (true) {
        auto newline = buffer_.find('\n', start);
        if (newline == std::string::npos) break;
        TakeLine(std::string_view(buffer_).substr(start, newline - start), out);
        start = newline + 1;
    }
    buffer_.erase(0, start);
    return out;
}

void StreamDecoder::TakeLine(std::string_view line,
                             std::vector<Result<StreamEvent, Error>>& out) {
    line = StripCarriageReturn(line);
    if (line.empty()) {
        Dispatch(out);
        return;
    }
    if (line.front() == ':') {
        return;  // comment
    }

    auto colon = line.find(':');
    std::string_view field = line.substr(0, colon);
    std::string_view value;
    if (colon != std::string_view::npos) {
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "event") {
        event_name_ = std::string(value);
    } else if (field == "data") {
        if (has_data_) data_ += '\n';
        data_.append(value.data(), value.size());
        has_data_ = true;
    }
}

void StreamDecoder::Dispatch(std::vector<Result<StreamEvent, Error>>& out) {
    if (!has_data_ && event_name_.empty()) {
        return;
    }

    StreamEvent event;
    if (event_name_.empty() || event_name_ == "frame" || event_name_ == "message") {
        event.type = StreamEventType::Frame;
    } else if (event_name_ == "error") {
        event.type = StreamEventType::Error;
    } else if (event_name_ == "keepalive") {
        event.type = StreamEventType::KeepAlive;
    } else if (event_name_ == "end") {
        event.type = StreamEventType::End;
    } else {
        out.push_back(Result<StreamEvent, Error>::Err(MakeDecodeError(
            "StreamDecoder", "Unknown event type: " + event_name_)));
        event_name_.clear();
        data_.clear();
        has_data_ = false;
        return;
    }

    bool parsed = true;
    if (has_data_ && !IsBlank(data_)) {
        try {
            event.data = nlohmann::json::parse(data_);
        } catch (const nlohmann::json::exception& e) {
            out.push_back(Result<StreamEvent, Error>::Err(MakeDecodeError(
                "StreamDecoder", std::string("Malformed event data: ") + e.what())));
            parsed = false;
        }
    }
    if (parsed) {
        out.push_back(Result<StreamEvent, Error>::Ok(std::move(event)));
    }

    event_name_.clear();
    data_.clear();
    has_data_ = false;
}

} // namespace mcp_bridge
