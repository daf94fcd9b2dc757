#include <mcp_bridge/bridge/session_multiplexer.hpp>

#include <mcp_bridge/bridge/frame_codec.hpp>
#include <mcp_bridge/core/log.hpp>

#include <iterator>
#include <vector>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "mux";
constexpr int kMethodNotFound = -32601;

// Pointer to params._meta.progressToken when the request asks for progress.
nlohmann::json* ProgressToken(nlohmann::json& params) {
    if (!params.is_object()) return nullptr;
    auto meta = params.find("_meta");
    if (meta == params.end() || !meta->is_object()) return nullptr;
    auto token = meta->find("progressToken");
    if (token == meta->end() || token->is_null()) return nullptr;
    return &*token;
}

} // anonymous namespace

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Open:   return "open";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

SessionMultiplexer::SessionMultiplexer(IBackendPool& pool, std::chrono::seconds idle_timeout)
    : pool_(pool), idle_timeout_(idle_timeout) {
    pool_.SetFrameHandler([this](const std::string& backend, uint64_t generation, Frame frame) {
        Route(backend, generation, std::move(frame));
    });
    watch_ = pool_.Watch();
    lifecycle_thread_ = std::thread(&SessionMultiplexer::LifecycleLoop, this);
}

SessionMultiplexer::~SessionMultiplexer() {
    pool_.SetFrameHandler(nullptr);
    stopping_ = true;
    watch_->Close();
    if (lifecycle_thread_.joinable()) {
        lifecycle_thread_.join();
    }
}

SessionMultiplexer::BackendTable& SessionMultiplexer::Table(const std::string& backend) {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    auto& table = tables_[backend];
    if (!table) {
        table = std::make_unique<BackendTable>();
    }
    return *table;
}

std::vector<SessionMultiplexer::BackendTable*> SessionMultiplexer::AllTables() const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    std::vector<BackendTable*> tables;
    tables.reserve(tables_.size());
    for (const auto& [backend, table] : tables_) {
        tables.push_back(table.get());
    }
    return tables;
}

SessionMultiplexer::BackendTable* SessionMultiplexer::FindTable(const SessionId& session) const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    auto backend = session_backend_.find(session);
    if (backend == session_backend_.end()) {
        return nullptr;
    }
    auto table = tables_.find(backend->second);
    return table == tables_.end() ? nullptr : table->second.get();
}

Error SessionMultiplexer::NotFound(const std::string& operation, const SessionId& session) const {
    return Error::Make(ErrorCategory::SessionNotFound, operation, "",
                       "Unknown session: " + session.Value());
}

// ---------------------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------------------
Result<SessionId, Error> SessionMultiplexer::OpenSession(const std::string& backend) {
    using R = Result<SessionId, Error>;

    auto lease = pool_.Acquire(backend);
    if (lease.IsErr()) {
        return R::Err(std::move(lease).Error());
    }

    auto id = SessionId::Generate();
    auto& table = Table(backend);
    const auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(table.mutex);
        Session session{id, std::move(lease).Value(), SessionState::Open, now, now, 0, {}, {}};
        table.sessions.emplace(id, std::move(session));
    }
    {
        std::lock_guard<std::mutex> lock(tables_mutex_);
        session_backend_.emplace(id, backend);
    }
    LogDebug(kComponent, "Opened session " + id.Value() + " on " + backend);
    return R::Ok(std::move(id));
}

Result<PendingCall, Error> SessionMultiplexer::Send(const SessionId& session_id,
                                                    const Frame& request) {
    using R = Result<PendingCall, Error>;

    if (request.kind != FrameKind::Request) {
        return R::Err(Error::Make(ErrorCategory::InvalidRequest, "SessionMultiplexer::Send", "",
                                  std::string("Expected a request, got a ") +
                                      FrameKindName(request.kind)));
    }

    BackendTable* table = FindTable(session_id);
    if (table == nullptr) {
        return R::Err(NotFound("SessionMultiplexer::Send", session_id));
    }

    PendingCall call;
    BackendLease lease;
    Frame wire = request;
    {
        std::lock_guard<std::mutex> lock(table->mutex);
        auto it = table->sessions.find(session_id);
        if (it == table->sessions.end()) {
            return R::Err(NotFound("SessionMultiplexer::Send", session_id));
        }
        Session& session = it->second;
        if (session.state == SessionState::Failed) {
            return R::Err(session.failure.value_or(Error::Make(
                ErrorCategory::BackendDisconnected, "SessionMultiplexer::Send",
                session.lease.backend, "Session failed")));
        }

        call.request_id = session_id.Value() + "." + std::to_string(++session.next_request);
        call.channel = std::make_shared<ResponseChannel>();

        RouteEntry route{session_id, call.channel, request.id, nullptr};
        wire.id = call.request_id;
        if (auto* token = ProgressToken(wire.payload)) {
            route.client_progress_token = *token;
            *token = call.request_id;
        }

        table->routes.emplace(call.request_id, std::move(route));
        session.pending.insert(call.request_id);
        session.last_activity = Clock::now();
        lease = session.lease;
    }

    auto submitted = pool_.Submit(lease, EncodePipe(wire));
    if (submitted.IsErr()) {
        std::lock_guard<std::mutex> lock(table->mutex);
        table->routes.erase(call.request_id);
        auto it = table->sessions.find(session_id);
        if (it != table->sessions.end()) {
            it->second.pending.erase(call.request_id);
            if (submitted.Error().category == ErrorCategory::BackendDisconnected) {
                FailSession(*table, it->second, submitted.Error());
            }
        }
        return R::Err(std::move(submitted).Error());
    }

    LogDebug(kComponent, "Sent " + wire.method + " as " + call.request_id);
    return R::Ok(std::move(call));
}

Result<void, Error> SessionMultiplexer::Notify(const SessionId& session_id,
                                               const Frame& notification) {
    BackendTable* table = FindTable(session_id);
    if (table == nullptr) {
        return Result<void, Error>::Err(NotFound("SessionMultiplexer::Notify", session_id));
    }

    BackendLease lease;
    {
        std::lock_guard<std::mutex> lock(table->mutex);
        auto it = table->sessions.find(session_id);
        if (it == table->sessions.end()) {
            return Result<void, Error>::Err(NotFound("SessionMultiplexer::Notify", session_id));
        }
        if (it->second.state == SessionState::Failed) {
            return Result<void, Error>::Err(*it->second.failure);
        }
        it->second.last_activity = Clock::now();
        lease = it->second.lease;
    }

    Frame wire = notification;
    wire.id = nullptr;
    return pool_.Submit(lease, EncodePipe(wire));
}

Result<void, Error> SessionMultiplexer::Cancel(const SessionId& session_id,
                                               const std::string& request_id) {
    BackendTable* table = FindTable(session_id);
    if (table == nullptr) {
        return Result<void, Error>::Err(NotFound("SessionMultiplexer::Cancel", session_id));
    }

    std::lock_guard<std::mutex> lock(table->mutex);
    auto session = table->sessions.find(session_id);
    auto route = table->routes.find(request_id);
    if (session == table->sessions.end() || route == table->routes.end() ||
        route->second.session != session_id) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::InvalidRequest, "SessionMultiplexer::Cancel", "",
            "No pending request " + request_id + " in session " + session_id.Value()));
    }

    route->second.channel->Cancel();
    table->routes.erase(route);
    session->second.pending.erase(request_id);
    table->cancelled.emplace(request_id,
                             CancelledEntry{session->second.lease.generation, Clock::now()});
    LogDebug(kComponent, "Cancelled " + request_id);
    return Result<void, Error>::Ok();
}

Result<void, Error> SessionMultiplexer::CloseSession(const SessionId& session_id) {
    BackendTable* table = FindTable(session_id);
    if (table == nullptr) {
        return Result<void, Error>::Err(NotFound("SessionMultiplexer::CloseSession", session_id));
    }

    std::lock_guard<std::mutex> lock(table->mutex);
    auto it = table->sessions.find(session_id);
    if (it == table->sessions.end()) {
        return Result<void, Error>::Err(NotFound("SessionMultiplexer::CloseSession", session_id));
    }
    DropSession(*table, it->second,
                Error::Make(ErrorCategory::SessionNotFound, "SessionMultiplexer::CloseSession",
                            it->second.lease.backend, "Session closed"));
    table->sessions.erase(it);
    LogDebug(kComponent, "Closed session " + session_id.Value());
    return Result<void, Error>::Ok();
}

size_t SessionMultiplexer::ReapIdleSessions(TimePoint now) {
    size_t reaped = 0;
    for (auto* table : AllTables()) {
        std::lock_guard<std::mutex> lock(table->mutex);
        for (auto it = table->cancelled.begin(); it != table->cancelled.end();) {
            it = now - it->second.at >= idle_timeout_ ? table->cancelled.erase(it)
                                                      : std::next(it);
        }
        for (auto it = table->sessions.begin(); it != table->sessions.end();) {
            Session& session = it->second;
            if (session.pending.empty() && now - session.last_activity >= idle_timeout_) {
                LogDebug(kComponent, "Reaping idle session " + session.id.Value());
                DropSession(*table, session,
                            Error::Make(ErrorCategory::SessionNotFound,
                                        "SessionMultiplexer::ReapIdleSessions",
                                        session.lease.backend, "Session expired"));
                it = table->sessions.erase(it);
                ++reaped;
            } else {
                ++it;
            }
        }
    }
    if (reaped > 0) {
        LogInfo(kComponent, "Reaped " + std::to_string(reaped) + " idle session(s)");
    }
    return reaped;
}

size_t SessionMultiplexer::CloseAll(const Error& reason) {
    size_t closed = 0;
    for (auto* table : AllTables()) {
        std::lock_guard<std::mutex> lock(table->mutex);
        for (auto& [id, session] : table->sessions) {
            DropSession(*table, session, reason);
            ++closed;
        }
        table->sessions.clear();
    }
    if (closed > 0) {
        LogInfo(kComponent, "Closed " + std::to_string(closed) + " session(s): " + reason.message);
    }
    return closed;
}

Result<SessionInfo, Error> SessionMultiplexer::Describe(const SessionId& session_id) const {
    BackendTable* table = FindTable(session_id);
    if (table == nullptr) {
        return Result<SessionInfo, Error>::Err(NotFound("SessionMultiplexer::Describe", session_id));
    }

    std::lock_guard<std::mutex> lock(table->mutex);
    auto it = table->sessions.find(session_id);
    if (it == table->sessions.end()) {
        return Result<SessionInfo, Error>::Err(NotFound("SessionMultiplexer::Describe", session_id));
    }
    const Session& s = it->second;
    SessionInfo info;
    info.id = s.id.Value();
    info.backend = s.lease.backend;
    info.generation = s.lease.generation;
    info.state = s.state;
    info.pending = s.pending.size();
    info.created = s.created;
    info.last_activity = s.last_activity;
    info.failure = s.failure;
    return Result<SessionInfo, Error>::Ok(std::move(info));
}

Result<std::string, Error> SessionMultiplexer::BackendOf(const SessionId& session) const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    auto it = session_backend_.find(session);
    if (it == session_backend_.end()) {
        return Result<std::string, Error>::Err(NotFound("SessionMultiplexer::BackendOf", session));
    }
    return Result<std::string, Error>::Ok(it->second);
}

size_t SessionMultiplexer::SessionCount() const {
    std::lock_guard<std::mutex> lock(tables_mutex_);
    return session_backend_.size();
}

size_t SessionMultiplexer::CancelledCount() const {
    size_t count = 0;
    for (auto* table : AllTables()) {
        std::lock_guard<std::mutex> lock(table->mutex);
        count += table->cancelled.size();
    }
    return count;
}

void SessionMultiplexer::FailSession(BackendTable& table, Session& session, const Error& error) {
    if (session.state == SessionState::Failed) {
        return;
    }
    for (const auto& request_id : session.pending) {
        auto route = table.routes.find(request_id);
        if (route != table.routes.end()) {
            route->second.channel->Fail(error);
            table.routes.erase(route);
        }
    }
    if (!session.pending.empty()) {
        LogWarn(kComponent, "Session " + session.id.Value() + ": failed " +
                                std::to_string(session.pending.size()) +
                                " pending request(s): " + error.message);
    }
    session.pending.clear();
    session.state = SessionState::Failed;
    session.failure = error;
}

void SessionMultiplexer::DropSession(BackendTable& table, Session& session, const Error& reason) {
    for (const auto& request_id : session.pending) {
        auto route = table.routes.find(request_id);
        if (route != table.routes.end()) {
            route->second.channel->Fail(reason);
            table.routes.erase(route);
        }
        table.cancelled.emplace(request_id,
                                CancelledEntry{session.lease.generation, Clock::now()});
    }
    session.pending.clear();

    std::lock_guard<std::mutex> lock(tables_mutex_);
    session_backend_.erase(session.id);
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------
void SessionMultiplexer::Route(const std::string& backend, uint64_t generation, Frame frame) {
    if (frame.kind == FrameKind::Request) {
        ReplyMethodNotFound(backend, generation, frame);
        return;
    }

    const auto key = frame.CorrelationKey();
    if (!key.has_value()) {
        LogDebug(kComponent, backend + ": dropping uncorrelated " + FrameKindName(frame.kind) +
                                 (frame.method.empty() ? "" : " " + frame.method));
        return;
    }

    auto& table = Table(backend);
    std::lock_guard<std::mutex> lock(table.mutex);

    auto route = table.routes.find(*key);
    if (route == table.routes.end()) {
        auto cancelled = table.cancelled.find(*key);
        if (cancelled != table.cancelled.end()) {
            if (frame.IsFinal()) {
                table.cancelled.erase(cancelled);
            }
            return;
        }
        auto error = Error::Make(ErrorCategory::ProtocolError, "SessionMultiplexer::Route",
                                 backend, "Frame for unknown request id " + *key);
        LogWarn(kComponent, error.ToString());
        return;
    }

    auto session = table.sessions.find(route->second.session);
    if (session == table.sessions.end() || session->second.lease.generation != generation) {
        LogWarn(kComponent, backend + ": frame for " + *key + " from generation " +
                                std::to_string(generation) + " does not match its session");
        return;
    }

    if (frame.kind == FrameKind::Notification) {
        if (!route->second.client_progress_token.is_null() && frame.payload.is_object()) {
            frame.payload["progressToken"] = route->second.client_progress_token;
        }
    } else if (!route->second.client_id.is_null()) {
        frame.id = route->second.client_id;
    }

    const bool final = frame.IsFinal();
    route->second.channel->Push(std::move(frame));
    session->second.last_activity = Clock::now();
    if (final) {
        session->second.pending.erase(*key);
        table.routes.erase(route);
    }
}

void SessionMultiplexer::ReplyMethodNotFound(const std::string& backend, uint64_t generation,
                                             const Frame& request) {
    LogWarn(kComponent, backend + ": rejecting backend request " + request.method);
    if (request.id.is_null()) {
        return;
    }
    auto reply = Frame::ErrorReply(request.id, kMethodNotFound,
                                   "Method not found: " + request.method);
    auto submitted = pool_.Submit(BackendLease{backend, generation}, EncodePipe(reply));
    if (submitted.IsErr()) {
        LogWarn(kComponent, "Could not answer backend request: " + submitted.Error().message);
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
void SessionMultiplexer::OnLifecycleEvent(const LifecycleEvent& event) {
    const auto* exited = std::get_if<Exited>(&event.state);
    if (exited == nullptr) {
        return;
    }

    BackendTable* table = nullptr;
    {
        std::lock_guard<std::mutex> lock(tables_mutex_);
        auto it = tables_.find(event.backend);
        if (it == tables_.end()) {
            return;
        }
        table = it->second.get();
    }

    std::string reason = exited->reason;
    if (reason.empty()) {
        reason = "process exited";
    }
    const auto error = Error::Make(ErrorCategory::BackendDisconnected,
                                   "SessionMultiplexer::OnLifecycleEvent", event.backend,
                                   "Backend disconnected: " + reason);

    std::lock_guard<std::mutex> lock(table->mutex);
    size_t failed = 0;
    for (auto& [id, session] : table->sessions) {
        if (session.lease.generation == event.generation &&
            session.state == SessionState::Open) {
            FailSession(*table, session, error);
            ++failed;
        }
    }
    for (auto it = table->cancelled.begin(); it != table->cancelled.end();) {
        it = it->second.generation == event.generation ? table->cancelled.erase(it)
                                                       : std::next(it);
    }
    if (failed > 0) {
        LogInfo(kComponent, event.backend + " generation " + std::to_string(event.generation) +
                                " exited; " + std::to_string(failed) + " session(s) failed");
    }
}

void SessionMultiplexer::LifecycleLoop() {
    while (!stopping_.load()) {
        auto event = watch_->Next(std::chrono::milliseconds(200));
        if (event.has_value()) {
            OnLifecycleEvent(*event);
        } else if (watch_->IsClosed()) {
            return;
        }
    }
}

} // namespace mcp_bridge
