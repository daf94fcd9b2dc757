#pragma once

#include <mcp_bridge/bridge/frame.hpp>
#include <mcp_bridge/bridge/lifecycle_watch.hpp>
#include <mcp_bridge/core/result.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mcp_bridge {

// A running backend generation a session is bound to. Holding a lease does
// not keep the process alive; Submit on a stale lease fails.
struct BackendLease {
    std::string backend;
    uint64_t generation = 0;

    bool operator==(const BackendLease& other) const {
        return backend == other.backend && generation == other.generation;
    }
};

// ---------------------------------------------------------------------------
// IBackendPool: what the session multiplexer needs from the supervisor.
// Abstracted so multiplexer tests can run without child processes.
// ---------------------------------------------------------------------------
class IBackendPool {
public:
    using FrameHandler =
        std::function<void(const std::string& backend, uint64_t generation, Frame frame)>;

    virtual ~IBackendPool() = default;

    [[nodiscard]] virtual bool HasBackend(const std::string& backend) const = 0;

    // Running generation of `backend`, starting it under the restart policy
    // if needed. BackendUnavailable while degraded, LaunchError on failure.
    virtual Result<BackendLease, Error> Acquire(const std::string& backend) = 0;

    // Queue one encoded line for the lease's process.
    virtual Result<void, Error> Submit(const BackendLease& lease, std::string line) = 0;

    // Receives every decoded frame, on the process reader thread. Set it
    // before the first Acquire. An empty handler stops delivery; the call
    // returns once no reader is still inside the previous one.
    virtual void SetFrameHandler(FrameHandler handler) = 0;

    virtual std::shared_ptr<LifecycleWatch> Watch(const std::string& backend = "") = 0;
};

} // namespace mcp_bridge
