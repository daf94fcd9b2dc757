#include <mcp_bridge/bridge/bridge_server.hpp>

#include <mcp_bridge/bridge/frame_codec.hpp>
#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/version.hpp>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "http";
constexpr const char* kJsonType = "application/json";

void SendError(httplib::Response& res, const Error& error, int status) {
    res.status = status;
    res.set_content(error.ToJson(), kJsonType);
}

void SendError(httplib::Response& res, const Error& error) {
    SendError(res, error, error.HttpStatus());
}

bool QueryFlag(const httplib::Request& req, const char* name, bool fallback) {
    if (!req.has_param(name)) {
        return fallback;
    }
    const auto value = req.get_param_value(name);
    return value == "1" || value == "true" || value == "yes";
}

Error UnknownBackend(const std::string& operation, const std::string& backend) {
    return Error::Make(ErrorCategory::BackendUnavailable, operation, backend,
                       "Unknown backend: " + backend);
}

nlohmann::json ErrorSummary(const Error& error) {
    nlohmann::json out = {{"category", error.CategoryName()}, {"message", error.message}};
    if (error.detail.has_value()) {
        out["detail"] = *error.detail;
    }
    return out;
}

} // anonymous namespace

BridgeServer::BridgeServer(BridgeService& service, ProcessSupervisor& supervisor,
                           ServerConfig config)
    : service_(service), supervisor_(supervisor), config_(std::move(config)) {
    const auto workers = static_cast<size_t>(config_.worker_threads);
    server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    RegisterRoutes();
}

BridgeServer::~BridgeServer() {
    Stop();
}

Result<void, Error> BridgeServer::Listen() {
    if (!server_.bind_to_port(config_.host, config_.port)) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Config, "BridgeServer::Listen", "",
            "Cannot bind " + config_.host + ":" + std::to_string(config_.port)));
    }
    LogInfo(kComponent, "Listening on http://" + config_.host + ":" +
                            std::to_string(config_.port));
    if (!server_.listen_after_bind()) {
        return Result<void, Error>::Err(Error::Make(ErrorCategory::Internal,
                                                    "BridgeServer::Listen", "",
                                                    "HTTP server stopped with an error"));
    }
    return Result<void, Error>::Ok();
}

void BridgeServer::Stop() {
    if (server_.is_running()) {
        server_.stop();
    }
}

void BridgeServer::RegisterRoutes() {
    server_.Post(R"(/mcp/([^/]+)/invoke)",
                 [this](const httplib::Request& req, httplib::Response& res) {
                     HandleInvoke(req, res);
                 });
    server_.Delete(R"(/mcp/sessions/([^/]+))",
                   [this](const httplib::Request& req, httplib::Response& res) {
                       HandleCloseSession(req, res);
                   });
    server_.Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        HandleHealth(req, res);
    });
    server_.Get(R"(/health/([^/]+))",
                [this](const httplib::Request& req, httplib::Response& res) {
                    HandleBackendHealth(req, res);
                });

    server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        LogDebug(kComponent, req.method + " " + req.path + " -> " + std::to_string(res.status));
    });
}

// ---------------------------------------------------------------------------
// POST /mcp/{backend}/invoke
// ---------------------------------------------------------------------------
void BridgeServer::HandleInvoke(const httplib::Request& req, httplib::Response& res) {
    const std::string backend = req.matches[1];
    if (!service_.HasBackend(backend)) {
        SendError(res, UnknownBackend("POST /mcp/invoke", backend), 404);
        return;
    }

    auto payload = nlohmann::json::parse(req.body, nullptr, false);
    if (payload.is_discarded()) {
        SendError(res, Error::Make(ErrorCategory::InvalidRequest, "POST /mcp/invoke", backend,
                                   "Request body is not valid JSON"));
        return;
    }

    BridgeCall call;
    call.backend = backend;
    call.payload = std::move(payload);
    call.keep_session = QueryFlag(req, "keep_session", false);
    if (req.has_header(kSessionHeader)) {
        call.session_id = req.get_header_value(kSessionHeader);
    }

    auto invoked = service_.Invoke(call);
    if (invoked.IsErr()) {
        LogInfo(kComponent, invoked.Error().ToString());
        SendError(res, invoked.Error());
        return;
    }

    std::shared_ptr<CallStream> stream = std::move(invoked).Value();
    res.set_header(kSessionHeader, stream->SessionToken());
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        "text/event-stream",
        [stream](size_t /*offset*/, httplib::DataSink& sink) {
            auto event = stream->Next();
            if (!event.has_value()) {
                sink.done();
                return true;
            }
            const auto text = EncodeStream(*event);
            if (!sink.is_writable() || !sink.write(text.data(), text.size())) {
                stream->Cancel();
                return false;
            }
            return true;
        },
        [stream](bool success) {
            if (!success) {
                stream->Cancel();
            }
        });
}

// ---------------------------------------------------------------------------
// DELETE /mcp/sessions/{id}
// ---------------------------------------------------------------------------
void BridgeServer::HandleCloseSession(const httplib::Request& req, httplib::Response& res) {
    auto closed = service_.CloseSession(req.matches[1]);
    if (closed.IsErr()) {
        SendError(res, closed.Error());
        return;
    }
    res.status = 204;
}

// ---------------------------------------------------------------------------
// GET /health, GET /health/{backend}
// ---------------------------------------------------------------------------
nlohmann::json BridgeServer::BackendHealth(const std::string& backend, bool probe) {
    nlohmann::json out = nlohmann::json::object();

    if (probe) {
        auto latency = service_.Probe(backend);
        out["reachable"] = latency.IsOk();
        if (latency.IsOk()) {
            out["latency_ms"] = latency.Value().count();
        } else {
            out["probe_error"] = ErrorSummary(latency.Error());
        }
    }

    auto status = supervisor_.Status(backend);
    if (status.IsErr()) {
        out["error"] = ErrorSummary(status.Error());
        return out;
    }
    const auto& s = status.Value();
    out["state"] = s.state;
    out["generation"] = s.generation;
    out["restarts"] = s.restarts;
    out["restarts_in_window"] = s.restarts_in_window;
    if (s.pid.has_value()) {
        out["pid"] = *s.pid;
    }
    if (s.retry_in.has_value()) {
        out["retry_in_s"] = s.retry_in->count();
    }
    if (s.last_error.has_value()) {
        out["last_error"] = ErrorSummary(*s.last_error);
    }
    if (!probe) {
        out["reachable"] = s.state == "Ready";
    }
    return out;
}

void BridgeServer::HandleHealth(const httplib::Request& req, httplib::Response& res) {
    const bool probe = QueryFlag(req, "probe", true);

    nlohmann::json backends = nlohmann::json::object();
    bool all_reachable = true;
    for (const auto& name : supervisor_.BackendNames()) {
        auto health = BackendHealth(name, probe);
        all_reachable = all_reachable && health.value("reachable", false);
        backends[name] = std::move(health);
    }

    nlohmann::json body = {
        {"status", all_reachable ? "ok" : "degraded"},
        {"version", kVersion},
        {"sessions", service_.Multiplexer().SessionCount()},
        {"backends", std::move(backends)},
    };
    res.set_content(body.dump(), kJsonType);
}

void BridgeServer::HandleBackendHealth(const httplib::Request& req, httplib::Response& res) {
    const std::string backend = req.matches[1];
    if (!service_.HasBackend(backend)) {
        SendError(res, UnknownBackend("GET /health", backend), 404);
        return;
    }

    auto health = BackendHealth(backend, QueryFlag(req, "probe", true));
    health["name"] = backend;
    res.status = health.value("reachable", false) ? 200 : 503;
    res.set_content(health.dump(), kJsonType);
}

} // namespace mcp_bridge
