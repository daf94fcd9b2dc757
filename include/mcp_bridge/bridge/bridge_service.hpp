#pragma once

#include <mcp_bridge/bridge/frame.hpp>
#include <mcp_bridge/bridge/frame_codec.hpp>
#include <mcp_bridge/bridge/i_backend_pool.hpp>
#include <mcp_bridge/bridge/session_multiplexer.hpp>
#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>
#include <mcp_bridge/core/types.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcp_bridge {

// One inbound call as received by the endpoint.
struct BridgeCall {
    std::string backend;
    nlohmann::json payload;
    std::optional<std::string> session_id;  // reuse an existing session
    bool keep_session = false;              // keep a new session after the call
    std::optional<std::chrono::milliseconds> timeout;  // overrides call_timeout
};

// Map a client payload onto a JSON-RPC frame:
//   {"method":..., "params":..., "id":...}   forwarded as is
//   {"ping": true}                           -> ping
//   {"list_tools": true}                     -> tools/list
//   {"tool": name, "params": {...}}          -> tools/call
// A "notifications/..." method without an id becomes a notification.
Result<Frame, Error> PayloadToFrame(const nlohmann::json& payload);

// ---------------------------------------------------------------------------
// CallStream: the events of one call, pulled by the HTTP worker.
//
// Next() blocks for at most the keepalive interval and yields, in order:
// the backend's frames, a keepalive whenever nothing arrived in time, an
// error event (backend failure or call timeout), and always a final end
// event. After end it returns nullopt.
//
// Destroying or cancelling an unfinished stream cancels the request and
// closes its session when nothing else is pending there. A one-shot
// session is closed when the call ends.
// ---------------------------------------------------------------------------
class CallStream {
public:
    CallStream(SessionMultiplexer& mux, SessionId session, std::optional<PendingCall> call,
               bool one_shot, std::chrono::milliseconds keepalive_interval,
               std::chrono::milliseconds timeout);
    ~CallStream();

    CallStream(const CallStream&) = delete;
    CallStream& operator=(const CallStream&) = delete;

    [[nodiscard]] std::optional<StreamEvent> Next();

    // The client went away.
    void Cancel();

    [[nodiscard]] const std::string& SessionToken() const noexcept { return session_.Value(); }
    [[nodiscard]] std::string RequestId() const;
    [[nodiscard]] bool Finished() const noexcept { return finished_; }

private:
    void Release(bool completed);

    SessionMultiplexer& mux_;
    SessionId session_;
    std::optional<PendingCall> call_;
    bool one_shot_;
    std::chrono::milliseconds keepalive_interval_;
    TimePoint deadline_;

    size_t frames_ = 0;
    bool done_ = false;       // final frame or error emitted
    bool finished_ = false;   // end emitted
    bool released_ = false;
};

// ---------------------------------------------------------------------------
// BridgeService: resolves calls to sessions and owns the idle-session
// janitor. Transport independent; BridgeServer puts HTTP on top.
// ---------------------------------------------------------------------------
class BridgeService {
public:
    BridgeService(IBackendPool& pool, SessionConfig config);
    ~BridgeService();

    BridgeService(const BridgeService&) = delete;
    BridgeService& operator=(const BridgeService&) = delete;

    [[nodiscard]] bool HasBackend(const std::string& backend) const;

    Result<std::unique_ptr<CallStream>, Error> Invoke(const BridgeCall& call);

    // Round trip a ping through a one-shot session. Returns the latency.
    Result<std::chrono::milliseconds, Error> Probe(const std::string& backend);

    Result<void, Error> CloseSession(const std::string& session_token);

    // Refuse new calls and end every open one with BackendUnavailable, so
    // streaming workers finish within one Next(). Idempotent.
    void Shutdown();

    [[nodiscard]] SessionMultiplexer& Multiplexer() noexcept { return mux_; }
    [[nodiscard]] const SessionConfig& Config() const noexcept { return config_; }

private:
    void JanitorLoop();

    IBackendPool& pool_;
    SessionConfig config_;
    SessionMultiplexer mux_;
    std::atomic<bool> shutting_down_{false};

    std::mutex janitor_mutex_;
    std::condition_variable janitor_cv_;
    bool janitor_stop_ = false;
    std::thread janitor_;
};

} // namespace mcp_bridge
