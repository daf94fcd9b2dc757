#include <mcp_bridge/client/bridge_client.hpp>

#include <mcp_bridge/core/log.hpp>

#include <httplib.h>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "client";
constexpr const char* kSessionHeader = "Mcp-Session-Id";

ErrorCategory CategoryForStatus(int status) {
    switch (status) {
        case 400: return ErrorCategory::InvalidRequest;
        case 404: return ErrorCategory::SessionNotFound;
        case 503: return ErrorCategory::BackendUnavailable;
        case 504: return ErrorCategory::Timeout;
        default:  return status >= 500 ? ErrorCategory::BackendDisconnected
                                       : ErrorCategory::Internal;
    }
}

Error TransportError(const std::string& operation, httplib::Error error) {
    return Error::Make(ErrorCategory::BackendUnavailable, operation, "",
                       "HTTP request failed: " + httplib::to_string(error));
}

httplib::Client MakeClient(const BridgeClientOptions& options) {
    httplib::Client cli(options.base_url);
    cli.set_connection_timeout(options.connect_timeout);
    cli.set_read_timeout(options.read_timeout);
    return cli;
}

} // anonymous namespace

Error ErrorFromResponse(int status, const std::string& body, const std::string& operation) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error") &&
        parsed["error"].is_object()) {
        auto error = DecodeStreamError(StreamEvent{StreamEventType::Error, parsed});
        if (error.operation.empty()) {
            error.operation = operation;
        }
        return error;
    }
    return Error::Make(CategoryForStatus(status), operation, "",
                       "HTTP " + std::to_string(status) + ": " + body);
}

BridgeClient::BridgeClient(BridgeClientOptions options) : options_(std::move(options)) {}

Result<InvokeOutcome, Error> BridgeClient::Invoke(const InvokeRequest& request,
                                                  const EventCallback& on_event) {
    using R = Result<InvokeOutcome, Error>;

    auto cli = MakeClient(options_);

    httplib::Request req;
    req.method = "POST";
    req.path = "/mcp/" + request.backend + "/invoke";
    if (request.keep_session) {
        req.path += "?keep_session=true";
    }
    req.set_header("Accept", "text/event-stream");
    req.set_header("Content-Type", "application/json");
    if (request.session_id.has_value()) {
        req.set_header(kSessionHeader, *request.session_id);
    }
    req.body = request.payload.dump();

    InvokeOutcome outcome;
    StreamDecoder decoder;
    int status = 0;
    std::string error_body;
    bool abandoned = false;

    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        outcome.session_id = response.get_header_value(kSessionHeader);
        return true;
    };
    req.content_receiver = [&](const char* data, size_t length, uint64_t /*offset*/,
                               uint64_t /*total*/) {
        if (status != 200) {
            error_body.append(data, length);
            return true;
        }
        for (auto& parsed : decoder.Feed(std::string_view(data, length))) {
            if (parsed.IsErr()) {
                LogWarn(kComponent, "Skipping unreadable event: " + parsed.Error().message);
                continue;
            }
            const auto& event = parsed.Value();
            switch (event.type) {
                case StreamEventType::Frame: {
                    auto frame = DecodeStream(event);
                    if (frame.IsOk()) {
                        outcome.frames.push_back(std::move(frame).Value());
                    } else {
                        LogWarn(kComponent, frame.Error().message);
                    }
                    break;
                }
                case StreamEventType::Error:
                    outcome.errors.push_back(DecodeStreamError(event));
                    break;
                case StreamEventType::End:
                    outcome.ended = true;
                    outcome.end_summary = event.data;
                    break;
                case StreamEventType::KeepAlive:
                    break;
            }
            if (on_event && !on_event(event)) {
                abandoned = true;
                return false;
            }
        }
        return true;
    };

    auto res = cli.send(req);
    if (abandoned) {
        return R::Ok(std::move(outcome));
    }
    if (!res) {
        return R::Err(TransportError("BridgeClient::Invoke", res.error()));
    }
    if (res->status != 200) {
        auto error = ErrorFromResponse(res->status, error_body.empty() ? res->body : error_body,
                                       "BridgeClient::Invoke");
        if (error.backend.empty()) {
            error.backend = request.backend;
        }
        return R::Err(std::move(error));
    }
    if (!outcome.ended) {
        return R::Err(Error::Make(ErrorCategory::BackendDisconnected, "BridgeClient::Invoke",
                                  request.backend, "Stream closed before the end event"));
    }
    return R::Ok(std::move(outcome));
}

Result<nlohmann::json, Error> BridgeClient::Health(const std::optional<std::string>& backend,
                                                   bool probe) {
    using R = Result<nlohmann::json, Error>;

    auto cli = MakeClient(options_);
    std::string path = backend.has_value() ? "/health/" + *backend : "/health";
    if (!probe) {
        path += "?probe=false";
    }

    auto res = cli.Get(path);
    if (!res) {
        return R::Err(TransportError("BridgeClient::Health", res.error()));
    }
    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (res->status == 404 || body.is_discarded()) {
        return R::Err(ErrorFromResponse(res->status, res->body, "BridgeClient::Health"));
    }
    // 503 still carries a health document.
    return R::Ok(std::move(body));
}

Result<void, Error> BridgeClient::CloseSession(const std::string& session_id) {
    auto cli = MakeClient(options_);
    auto res = cli.Delete("/mcp/sessions/" + session_id);
    if (!res) {
        return Result<void, Error>::Err(TransportError("BridgeClient::CloseSession", res.error()));
    }
    if (res->status != 204 && res->status != 200) {
        return Result<void, Error>::Err(
            ErrorFromResponse(res->status, res->body, "BridgeClient::CloseSession"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_bridge
