#pragma once

#include <mcp_bridge/bridge/backend_state.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace mcp_bridge {

// One state change of one backend process generation.
struct LifecycleEvent {
    std::string backend;
    uint64_t generation = 0;
    BackendState state;
};

// ---------------------------------------------------------------------------
// LifecycleWatch: blocking queue of lifecycle events for one subscriber.
//
// The supervisor publishes into every open watch whose filter matches.
// Next() blocks until an event arrives, the timeout passes or the watch is
// closed. A closed watch stays closed; pending events are still drained.
// ---------------------------------------------------------------------------
class LifecycleWatch {
public:
    // Empty filter: every backend.
    explicit LifecycleWatch(std::string backend_filter = "");

    LifecycleWatch(const LifecycleWatch&) = delete;
    LifecycleWatch& operator=(const LifecycleWatch&) = delete;

    [[nodiscard]] std::optional<LifecycleEvent> Next(std::chrono::milliseconds timeout);

    // Returns false when the watch is closed or filters the event out.
    bool Publish(const LifecycleEvent& event);

    void Close();
    [[nodiscard]] bool IsClosed() const;

    [[nodiscard]] const std::string& Filter() const noexcept { return filter_; }

private:
    std::string filter_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LifecycleEvent> events_;
    bool closed_ = false;
};

} // namespace mcp_bridge
