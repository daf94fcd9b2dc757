#pragma once

#include <mcp_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcp_bridge {

enum class FrameKind {
    Request,
    Response,
    Error,
    Notification,
};

const char* FrameKindName(FrameKind kind);

// JSON-RPC method used by MCP to report progress on an outstanding request.
// Its params.progressToken correlates it with the request.
inline constexpr const char* kProgressMethod = "notifications/progress";

// ---------------------------------------------------------------------------
// Frame: one decoded JSON-RPC message.
//
//   Request       {"id":..., "method":..., "params":...}
//   Response      {"id":..., "result":...}
//   Error         {"id":..., "error":{"code":..., "message":...}}
//   Notification  {"method":..., "params":...}
//
// `payload` holds params, result or the error object depending on the kind.
// `partial` marks a non-final chunk of a multi-chunk answer: either a
// response/error carrying "partial": true or a progress notification.
// Members other than those above are not preserved.
// ---------------------------------------------------------------------------
struct Frame {
    nlohmann::json id;  // string, number or null
    FrameKind kind = FrameKind::Notification;
    std::string method;
    nlohmann::json payload;
    bool partial = false;

    static Frame Request(nlohmann::json id, std::string method,
                         nlohmann::json params = nlohmann::json::object());
    static Frame Notification(std::string method,
                              nlohmann::json params = nlohmann::json::object());
    static Frame Response(nlohmann::json id, nlohmann::json result, bool partial = false);
    static Frame ErrorReply(nlohmann::json id, int code, const std::string& message);

    // Classify a parsed message. Fails with DecodeError when the value is not
    // an object or matches none of the shapes above.
    static Result<Frame, mcp_bridge::Error> FromJson(const nlohmann::json& message);

    [[nodiscard]] nlohmann::json ToJson() const;

    // Key under which a pending request waits for this frame: the id of a
    // response/error, or the progressToken of a progress notification.
    [[nodiscard]] std::optional<std::string> CorrelationKey() const;

    [[nodiscard]] bool IsFinal() const { return !partial; }

    bool operator==(const Frame& other) const {
        return id == other.id && kind == other.kind && method == other.method &&
               payload == other.payload && partial == other.partial;
    }
    bool operator!=(const Frame& other) const { return !(*this == other); }
};

// Render a JSON-RPC id as a lookup key: strings verbatim, numbers as text.
std::optional<std::string> IdKey(const nlohmann::json& id);

} // namespace mcp_bridge
