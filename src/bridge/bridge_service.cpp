#include <mcp_bridge/bridge/bridge_service.hpp>

#include <mcp_bridge/core/log.hpp>

#include <algorithm>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "endpoint";

Error InvalidPayload(const std::string& message) {
    return Error::Make(ErrorCategory::InvalidRequest, "PayloadToFrame", "", message);
}

bool IsTrue(const nlohmann::json& payload, const char* key) {
    auto it = payload.find(key);
    return it != payload.end() && it->is_boolean() && it->get<bool>();
}

std::chrono::seconds JanitorInterval(std::chrono::seconds idle_timeout) {
    return std::clamp(idle_timeout / 2, std::chrono::seconds(1), std::chrono::seconds(30));
}

} // anonymous namespace

Result<Frame, Error> PayloadToFrame(const nlohmann::json& payload) {
    using R = Result<Frame, Error>;

    if (!payload.is_object()) {
        return R::Err(InvalidPayload("Request body must be a JSON object"));
    }

    if (IsTrue(payload, "ping")) {
        return R::Ok(Frame::Request(nullptr, "ping"));
    }
    if (IsTrue(payload, "list_tools")) {
        return R::Ok(Frame::Request(nullptr, "tools/list"));
    }

    auto params = nlohmann::json::object();
    if (auto it = payload.find("params"); it != payload.end() && !it->is_null()) {
        params = *it;
    }

    if (auto tool = payload.find("tool"); tool != payload.end()) {
        if (!tool->is_string() || tool->get<std::string>().empty()) {
            return R::Err(InvalidPayload("\"tool\" must be a non-empty string"));
        }
        if (!params.is_object()) {
            return R::Err(InvalidPayload("\"params\" must be an object"));
        }
        return R::Ok(Frame::Request(nullptr, "tools/call",
                                    {{"name", *tool}, {"arguments", params}}));
    }

    if (auto method = payload.find("method"); method != payload.end()) {
        if (!method->is_string() || method->get<std::string>().empty()) {
            return R::Err(InvalidPayload("\"method\" must be a non-empty string"));
        }
        const auto name = method->get<std::string>();
        auto id = payload.find("id");
        if (id == payload.end() && name.rfind("notifications/", 0) == 0) {
            return R::Ok(Frame::Notification(name, params));
        }
        nlohmann::json client_id = id == payload.end() ? nlohmann::json(nullptr) : *id;
        if (!client_id.is_null() && !client_id.is_string() && !client_id.is_number_integer()) {
            return R::Err(InvalidPayload("\"id\" must be a string or an integer"));
        }
        return R::Ok(Frame::Request(std::move(client_id), name, params));
    }

    return R::Err(InvalidPayload("Payload needs one of: method, tool, list_tools, ping"));
}

// ---------------------------------------------------------------------------
// CallStream
// ---------------------------------------------------------------------------
CallStream::CallStream(SessionMultiplexer& mux, SessionId session,
                       std::optional<PendingCall> call, bool one_shot,
                       std::chrono::milliseconds keepalive_interval,
                       std::chrono::milliseconds timeout)
    : mux_(mux),
      session_(std::move(session)),
      call_(std::move(call)),
      one_shot_(one_shot),
      keepalive_interval_(keepalive_interval),
      deadline_(Clock::now() + timeout) {
    done_ = !call_.has_value();
}

CallStream::~CallStream() {
    Release(done_);
}

std::string CallStream::RequestId() const {
    return call_ ? call_->request_id : std::string();
}

std::optional<StreamEvent> CallStream::Next() {
    if (finished_) {
        return std::nullopt;
    }

    if (done_) {
        finished_ = true;
        Release(true);
        nlohmann::json summary = {{"session_id", session_.Value()}, {"frames", frames_}};
        if (call_) {
            summary["request_id"] = call_->request_id;
        }
        return StreamEvent::End(std::move(summary));
    }

    const auto now = Clock::now();
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - now);
    const auto wait = std::max(std::chrono::milliseconds(0),
                               std::min(keepalive_interval_, remaining));

    auto item = call_->channel->Next(wait);
    if (item.has_value()) {
        if (item->IsErr()) {
            done_ = true;
            return StreamEvent::ForError(item->Error());
        }
        const Frame& frame = item->Value();
        ++frames_;
        done_ = frame.IsFinal();
        return StreamEvent::ForFrame(frame);
    }

    if (Clock::now() >= deadline_) {
        auto cancelled = mux_.Cancel(session_, call_->request_id);
        if (cancelled.IsErr()) {
            LogDebug(kComponent, cancelled.Error().ToString());
        }
        done_ = true;
        LogWarn(kComponent, "Call " + call_->request_id + " timed out");
        return StreamEvent::ForError(Error::Make(
            ErrorCategory::Timeout, "CallStream::Next", "",
            "No response to " + call_->request_id + " within the call timeout"));
    }
    return StreamEvent::KeepAlive();
}

void CallStream::Cancel() {
    Release(done_);
}

void CallStream::Release(bool completed) {
    if (released_) {
        return;
    }
    released_ = true;

    bool close = one_shot_;
    if (!completed && call_) {
        LogInfo(kComponent, "Client left; cancelling " + call_->request_id);
        auto cancelled = mux_.Cancel(session_, call_->request_id);
        if (cancelled.IsErr()) {
            LogDebug(kComponent, cancelled.Error().ToString());
        }
        auto info = mux_.Describe(session_);
        close = close || (info.IsOk() && info.Value().pending == 0);
    }

    if (close) {
        auto closed = mux_.CloseSession(session_);
        if (closed.IsErr() && closed.Error().category != ErrorCategory::SessionNotFound) {
            LogWarn(kComponent, closed.Error().ToString());
        }
    }
}

// ---------------------------------------------------------------------------
// BridgeService
// ---------------------------------------------------------------------------
BridgeService::BridgeService(IBackendPool& pool, SessionConfig config)
    : pool_(pool),
      config_(config),
      mux_(pool, config.idle_timeout),
      janitor_(&BridgeService::JanitorLoop, this) {}

BridgeService::~BridgeService() {
    {
        std::lock_guard<std::mutex> lock(janitor_mutex_);
        janitor_stop_ = true;
    }
    janitor_cv_.notify_all();
    if (janitor_.joinable()) {
        janitor_.join();
    }
}

bool BridgeService::HasBackend(const std::string& backend) const {
    return pool_.HasBackend(backend);
}

Result<std::unique_ptr<CallStream>, Error> BridgeService::Invoke(const BridgeCall& call) {
    using R = Result<std::unique_ptr<CallStream>, Error>;

    if (!pool_.HasBackend(call.backend)) {
        return R::Err(Error::Make(ErrorCategory::BackendUnavailable, "BridgeService::Invoke",
                                  call.backend, "Unknown backend: " + call.backend));
    }
    if (shutting_down_.load()) {
        return R::Err(Error::Make(ErrorCategory::BackendUnavailable, "BridgeService::Invoke",
                                  call.backend, "Bridge is shutting down"));
    }

    auto frame = PayloadToFrame(call.payload);
    if (frame.IsErr()) {
        return R::Err(std::move(frame).Error());
    }

    std::optional<SessionId> session;
    bool one_shot = false;
    if (call.session_id.has_value()) {
        auto id = SessionId::Create(*call.session_id);
        if (id.IsErr()) {
            return R::Err(Error::Make(ErrorCategory::SessionNotFound, "BridgeService::Invoke",
                                      call.backend, id.Error()));
        }
        auto owner = mux_.BackendOf(id.Value());
        if (owner.IsErr()) {
            return R::Err(std::move(owner).Error());
        }
        if (owner.Value() != call.backend) {
            return R::Err(Error::Make(ErrorCategory::InvalidRequest, "BridgeService::Invoke",
                                      call.backend,
                                      "Session " + *call.session_id + " belongs to backend " +
                                          owner.Value()));
        }
        session = std::move(id).Value();
    } else {
        auto opened = mux_.OpenSession(call.backend);
        if (opened.IsErr()) {
            return R::Err(std::move(opened).Error());
        }
        session = std::move(opened).Value();
        one_shot = !call.keep_session;
    }

    auto close_one_shot = [&] {
        if (one_shot) {
            auto closed = mux_.CloseSession(*session);
            if (closed.IsErr()) {
                LogDebug(kComponent, closed.Error().ToString());
            }
        }
    };

    const auto timeout = call.timeout.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.call_timeout));

    if (frame.Value().kind == FrameKind::Notification) {
        auto notified = mux_.Notify(*session, frame.Value());
        if (notified.IsErr()) {
            close_one_shot();
            return R::Err(std::move(notified).Error());
        }
        return R::Ok(std::make_unique<CallStream>(mux_, *session, std::nullopt, one_shot,
                                                  config_.keepalive_interval, timeout));
    }

    auto sent = mux_.Send(*session, frame.Value());
    if (sent.IsErr()) {
        close_one_shot();
        return R::Err(std::move(sent).Error());
    }
    if (shutting_down_.load()) {
        // Shutdown ran between the check above and Send.
        auto closed = mux_.CloseSession(*session);
        if (closed.IsErr()) {
            LogDebug(kComponent, closed.Error().ToString());
        }
        return R::Err(Error::Make(ErrorCategory::BackendUnavailable, "BridgeService::Invoke",
                                  call.backend, "Bridge is shutting down"));
    }

    LogDebug(kComponent, call.backend + ": " + frame.Value().method + " in session " +
                             session->Value());
    return R::Ok(std::make_unique<CallStream>(mux_, *session, std::move(sent).Value(), one_shot,
                                              config_.keepalive_interval, timeout));
}

Result<std::chrono::milliseconds, Error> BridgeService::Probe(const std::string& backend) {
    using R = Result<std::chrono::milliseconds, Error>;
    const auto started = Clock::now();

    BridgeCall call;
    call.backend = backend;
    call.payload = {{"ping", true}};
    call.timeout = config_.probe_timeout;

    auto stream = Invoke(call);
    if (stream.IsErr()) {
        return R::Err(std::move(stream).Error());
    }

    auto calls = std::move(stream).Value();
    while (auto event = calls->Next()) {
        switch (event->type) {
            case StreamEventType::Frame: {
                auto frame = DecodeStream(*event);
                if (frame.IsErr()) {
                    return R::Err(std::move(frame).Error());
                }
                if (frame.Value().kind == FrameKind::Error) {
                    return R::Err(Error::Make(ErrorCategory::ProtocolError, "BridgeService::Probe",
                                              backend, "ping answered with an error",
                                              frame.Value().payload.dump()));
                }
                if (frame.Value().IsFinal()) {
                    return R::Ok(std::chrono::duration_cast<std::chrono::milliseconds>(
                        Clock::now() - started));
                }
                break;
            }
            case StreamEventType::Error: {
                auto error = DecodeStreamError(*event);
                error.backend = backend;
                return R::Err(std::move(error));
            }
            case StreamEventType::KeepAlive:
            case StreamEventType::End:
                break;
        }
    }
    return R::Err(Error::Make(ErrorCategory::ProtocolError, "BridgeService::Probe", backend,
                              "ping ended without a response"));
}

Result<void, Error> BridgeService::CloseSession(const std::string& session_token) {
    auto id = SessionId::Create(session_token);
    if (id.IsErr()) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::SessionNotFound, "BridgeService::CloseSession", "", id.Error()));
    }
    return mux_.CloseSession(id.Value());
}

void BridgeService::Shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }
    const auto closed = mux_.CloseAll(Error::Make(ErrorCategory::BackendUnavailable,
                                                  "BridgeService::Shutdown", "",
                                                  "Bridge is shutting down"));
    LogInfo(kComponent, "Shutdown: ended " + std::to_string(closed) + " session(s)");
}

void BridgeService::JanitorLoop() {
    const auto interval = JanitorInterval(config_.idle_timeout);
    std::unique_lock<std::mutex> lock(janitor_mutex_);
    while (!janitor_cv_.wait_for(lock, interval, [this] { return janitor_stop_; })) {
        lock.unlock();
        mux_.ReapIdleSessions(Clock::now());
        lock.lock();
    }
}

} // namespace mcp_bridge
