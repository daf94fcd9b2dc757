#include <mcp_bridge/bridge/frame.hpp>

#include <utility>

namespace mcp_bridge {

namespace {

Error MakeDecodeError(const std::string& message) {
    return Error::Make(ErrorCategory::DecodeError, "Frame::FromJson", "", message);
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned() ||
           id.is_null();
}

} // anonymous namespace

const char* FrameKindName(FrameKind kind) {
    switch (kind) {
        case FrameKind::Request:      return "request";
        case FrameKind::Response:     return "response";
        case FrameKind::Error:        return "error";
        case FrameKind::Notification: return "notification";
    }
    return "unknown";
}

Frame Frame::Request(nlohmann::json id, std::string method, nlohmann::json params) {
    Frame frame;
    frame.id = std::move(id);
    frame.kind = FrameKind::Request;
    frame.method = std::move(method);
    frame.payload = std::move(params);
    return frame;
}

Frame Frame::Notification(std::string method, nlohmann::json params) {
    Frame frame;
    frame.kind = FrameKind::Notification;
    frame.method = std::move(method);
    frame.payload = std::move(params);
    frame.partial = frame.method == kProgressMethod;
    return frame;
}

Frame Frame::Response(nlohmann::json id, nlohmann::json result, bool partial) {
    Frame frame;
    frame.id = std::move(id);
    frame.kind = FrameKind::Response;
    frame.payload = std::move(result);
    frame.partial = partial;
    return frame;
}

Frame Frame::ErrorReply(nlohmann::json id, int code, const std::string& message) {
    Frame frame;
    frame.id = std::move(id);
    frame.kind = FrameKind::Error;
    frame.payload = {{"code", code}, {"message", message}};
    return frame;
}

Result<Frame, Error> Frame::FromJson(const nlohmann::json& message) {
    using R = Result<Frame, mcp_bridge::Error>;

    if (!message.is_object()) {
        return R::Err(MakeDecodeError("JSON-RPC message must be an object"));
    }

    Frame frame;
    auto id_it = message.find("id");
    if (id_it != message.end()) {
        if (!IsValidId(*id_it)) {
            return R::Err(MakeDecodeError("JSON-RPC id must be a string, integer or null"));
        }
        frame.id = *id_it;
    }

    auto method_it = message.find("method");
    if (method_it != message.end()) {
        if (!method_it->is_string()) {
            return R::Err(MakeDecodeError("JSON-RPC method must be a string"));
        }
        frame.method = method_it->get<std::string>();
        frame.payload = message.value("params", nlohmann::json());
        if (id_it != message.end() && !id_it->is_null()) {
            frame.kind = FrameKind::Request;
        } else {
            frame.kind = FrameKind::Notification;
            frame.partial = frame.method == kProgressMethod;
        }
        return R::Ok(std::move(frame));
    }

    if (message.contains("result")) {
        if (id_it == message.end()) {
            return R::Err(MakeDecodeError("JSON-RPC response without id"));
        }
        frame.kind = FrameKind::Response;
        frame.payload = message["result"];
    } else if (message.contains("error")) {
        frame.kind = FrameKind::Error;
        frame.payload = message["error"];
    } else {
        return R::Err(MakeDecodeError("Not a JSON-RPC request, response or notification"));
    }

    auto partial_it = message.find("partial");
    frame.partial = partial_it != message.end() && partial_it->is_boolean() &&
                    partial_it->get<bool>();
    return R::Ok(std::move(frame));
}

nlohmann::json Frame::ToJson() const {
    nlohmann::json message = {{"jsonrpc", "2.0"}};
    switch (kind) {
        case FrameKind::Request:
            message["id"] = id;
            message["method"] = method;
            if (!payload.is_null()) message["params"] = payload;
            break;
        case FrameKind::Notification:
            message["method"] = method;
            if (!payload.is_null()) message["params"] = payload;
            break;
        case FrameKind::Response:
            message["id"] = id;
            message["result"] = payload;
            if (partial) message["partial"] = true;
            break;
        case FrameKind::Error:
            message["id"] = id;
            message["error"] = payload;
            if (partial) message["partial"] = true;
            break;
    }
    return message;
}

std::optional<std::string> Frame::CorrelationKey() const {
    if (kind == FrameKind::Notification) {
        if (method != kProgressMethod || !payload.is_object()) {
            return std::nullopt;
        }
        auto token = payload.find("progressToken");
        if (token == payload.end()) {
            return std::nullopt;
        }
        return IdKey(*token);
    }
    return IdKey(id);
}

std::optional<std::string> IdKey(const nlohmann::json& id) {
    if (id.is_string()) {
        return id.get<std::string>();
    }
    if (id.is_number_integer() || id.is_number_unsigned()) {
        return id.dump();
    }
    return std::nullopt;
}

} // namespace mcp_bridge
