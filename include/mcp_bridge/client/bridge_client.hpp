#pragma once

#include <mcp_bridge/bridge/frame.hpp>
#include <mcp_bridge/bridge/frame_codec.hpp>
#include <mcp_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcp_bridge {

struct BridgeClientOptions {
    std::string base_url = "http://127.0.0.1:8080";
    std::chrono::seconds connect_timeout{5};
    std::chrono::seconds read_timeout{300};  // longer than the keepalive interval
};

// Everything one invoke produced.
struct InvokeOutcome {
    std::string session_id;
    std::vector<Frame> frames;
    std::vector<Error> errors;    // error events of the stream
    bool ended = false;           // saw the end event
    nlohmann::json end_summary;

    // Last frame, the final answer of a completed call.
    [[nodiscard]] const Frame* Last() const {
        return frames.empty() ? nullptr : &frames.back();
    }
};

// Options of one invoke.
struct InvokeRequest {
    std::string backend;
    nlohmann::json payload;
    std::optional<std::string> session_id;
    bool keep_session = false;
};

// ---------------------------------------------------------------------------
// BridgeClient: HTTP client of a running bridge (cpp-httplib).
//
// Invoke() reads the SSE response incrementally with StreamDecoder and hands
// every event to `on_event` as it arrives; returning false from the callback
// abandons the call. HTTP errors come back as the server's Error.
// ---------------------------------------------------------------------------
class BridgeClient {
public:
    using EventCallback = std::function<bool(const StreamEvent&)>;

    explicit BridgeClient(BridgeClientOptions options = {});

    Result<InvokeOutcome, Error> Invoke(const InvokeRequest& request,
                                        const EventCallback& on_event = {});

    // GET /health or /health/{backend}.
    Result<nlohmann::json, Error> Health(const std::optional<std::string>& backend = std::nullopt,
                                         bool probe = true);

    Result<void, Error> CloseSession(const std::string& session_id);

private:
    BridgeClientOptions options_;
};

// Rebuild the Error of a JSON error body (`{"error":{...}}`); falls back to
// a category derived from the HTTP status.
Error ErrorFromResponse(int status, const std::string& body, const std::string& operation);

} // namespace mcp_bridge
