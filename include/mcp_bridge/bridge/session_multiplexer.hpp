#pragma once

#include <mcp_bridge/bridge/backend_state.hpp>
#include <mcp_bridge/bridge/frame.hpp>
#include <mcp_bridge/bridge/i_backend_pool.hpp>
#include <mcp_bridge/bridge/response_channel.hpp>
#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/core/types.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace mcp_bridge {

enum class SessionState {
    Open,
    Failed,  // bound process generation exited; never reassigned
};

const char* SessionStateName(SessionState state);

// A request in flight: the bridge-assigned id it travels under on the pipe
// and the channel its frames arrive on.
struct PendingCall {
    std::string request_id;
    std::shared_ptr<ResponseChannel> channel;
};

struct SessionInfo {
    std::string id;
    std::string backend;
    uint64_t generation = 0;
    SessionState state = SessionState::Open;
    size_t pending = 0;
    TimePoint created;
    TimePoint last_activity;
    std::optional<Error> failure;
};

// ---------------------------------------------------------------------------
// SessionMultiplexer: maps client sessions onto backend processes.
//
// Every request leaves under a wire id "<session id>.<n>", so ids never
// collide on a shared pipe. Frames coming back are routed by that id (or
// by the progressToken of a progress notification) and the client's own
// id is put back before delivery.
//
// Tables are kept per backend and guarded by that backend's mutex.
// A lifecycle thread fails every session of an exited generation.
// ---------------------------------------------------------------------------
class SessionMultiplexer {
public:
    SessionMultiplexer(IBackendPool& pool, std::chrono::seconds idle_timeout);
    ~SessionMultiplexer();

    SessionMultiplexer(const SessionMultiplexer&) = delete;
    SessionMultiplexer& operator=(const SessionMultiplexer&) = delete;

    // Bind a new session to the running generation of `backend`.
    Result<SessionId, Error> OpenSession(const std::string& backend);

    // Forward one request frame. Returns as soon as the line is queued.
    Result<PendingCall, Error> Send(const SessionId& session, const Frame& request);

    // Forward a notification; nothing comes back for it.
    Result<void, Error> Notify(const SessionId& session, const Frame& notification);

    // Stop delivering to a request. Nothing is sent to the backend; late
    // frames for the id are discarded silently.
    Result<void, Error> Cancel(const SessionId& session, const std::string& request_id);

    // Fail the session's pending requests and forget it.
    Result<void, Error> CloseSession(const SessionId& session);

    // Close sessions without pending requests idle for idle_timeout, and
    // forget cancelled ids older than idle_timeout.
    size_t ReapIdleSessions(TimePoint now);

    // Fail every pending request with `reason` and forget every session.
    size_t CloseAll(const Error& reason);

    [[nodiscard]] Result<SessionInfo, Error> Describe(const SessionId& session) const;

    // Backend of an open session, or SessionNotFound.
    [[nodiscard]] Result<std::string, Error> BackendOf(const SessionId& session) const;

    [[nodiscard]] size_t SessionCount() const;

    // Cancelled ids whose late frames are still being discarded.
    [[nodiscard]] size_t CancelledCount() const;

    // Entry points of the pool's reader threads and the lifecycle thread.
    void Route(const std::string& backend, uint64_t generation, Frame frame);
    void OnLifecycleEvent(const LifecycleEvent& event);

private:
    struct Session {
        SessionId id;
        BackendLease lease;
        SessionState state = SessionState::Open;
        TimePoint created;
        TimePoint last_activity;
        uint64_t next_request = 0;
        std::set<std::string> pending;
        std::optional<Error> failure;
    };

    struct RouteEntry {
        SessionId session;
        std::shared_ptr<ResponseChannel> channel;
        nlohmann::json client_id;              // null when the client sent none
        nlohmann::json client_progress_token;  // null unless rewritten
    };

    struct CancelledEntry {
        uint64_t generation;
        TimePoint at;
    };

    struct BackendTable {
        mutable std::mutex mutex;
        std::unordered_map<SessionId, Session> sessions;
        std::unordered_map<std::string, RouteEntry> routes;         // wire id -> route
        std::unordered_map<std::string, CancelledEntry> cancelled;  // wire id -> when
    };

    BackendTable& Table(const std::string& backend);
    BackendTable* FindTable(const SessionId& session) const;
    std::vector<BackendTable*> AllTables() const;
    Error NotFound(const std::string& operation, const SessionId& session) const;

    // Caller holds table.mutex.
    void FailSession(BackendTable& table, Session& session, const Error& error);
    void DropSession(BackendTable& table, Session& session, const Error& reason);

    void ReplyMethodNotFound(const std::string& backend, uint64_t generation,
                             const Frame& request);
    void LifecycleLoop();

    IBackendPool& pool_;
    std::chrono::seconds idle_timeout_;

    mutable std::mutex tables_mutex_;
    std::map<std::string, std::unique_ptr<BackendTable>> tables_;
    std::unordered_map<SessionId, std::string> session_backend_;

    std::shared_ptr<LifecycleWatch> watch_;
    std::atomic<bool> stopping_{false};
    std::thread lifecycle_thread_;
};

} // namespace mcp_bridge
