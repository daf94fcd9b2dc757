#pragma once

#include <mcp_bridge/bridge/backend_process.hpp>
#include <mcp_bridge/bridge/backend_state.hpp>
#include <mcp_bridge/bridge/i_backend_pool.hpp>
#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace mcp_bridge {

// Snapshot reported by the health endpoint.
struct BackendStatus {
    std::string name;
    std::string state;               // StateName()
    uint64_t generation = 0;         // 0 before the first launch
    std::optional<pid_t> pid;        // set while a process is alive
    int restarts = 0;                // automatic restarts since startup
    int restarts_in_window = 0;
    std::optional<Error> last_error;
    std::optional<std::chrono::seconds> retry_in;  // while Degraded
};

// ---------------------------------------------------------------------------
// ProcessSupervisor: owns one BackendProcess slot per configured backend.
//
// Backends start lazily on Acquire (or all at once with StartAll). Process
// exits reach a monitor thread which moves the slot to Exited, publishes
// the event and restarts the backend while the restart budget allows;
// afterwards the backend stays Degraded until the window has passed.
// ---------------------------------------------------------------------------
class ProcessSupervisor : public IBackendPool {
public:
    ProcessSupervisor(std::vector<BackendDescriptor> backends, SupervisorConfig config);
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // IBackendPool
    [[nodiscard]] bool HasBackend(const std::string& backend) const override;
    Result<BackendLease, Error> Acquire(const std::string& backend) override;
    Result<void, Error> Submit(const BackendLease& lease, std::string line) override;
    void SetFrameHandler(FrameHandler handler) override;
    std::shared_ptr<LifecycleWatch> Watch(const std::string& backend = "") override;

    // Launch now unless already Ready. Clears Degraded and the restart count.
    Result<BackendLease, Error> Start(const std::string& backend);

    // Launch every backend; failures are logged and left for Acquire.
    void StartAll();

    // Graceful stop (stdin close, SIGTERM, grace, SIGKILL). No restart.
    Result<void, Error> Stop(const std::string& backend);

    [[nodiscard]] Result<BackendStatus, Error> Status(const std::string& backend) const;
    [[nodiscard]] std::vector<BackendStatus> Statuses() const;
    [[nodiscard]] std::vector<std::string> BackendNames() const;

    // Stop every backend, close every watch and join the monitor thread.
    // Acquire fails afterwards. Idempotent.
    void Shutdown();

private:
    struct Slot {
        explicit Slot(BackendDescriptor d, RestartPolicy policy)
            : descriptor(std::move(d)), tracker(policy) {}

        const BackendDescriptor descriptor;
        std::mutex launch_mutex;  // one launch/stop at a time per backend

        // Guarded by ProcessSupervisor::mutex_.
        BackendState state = NeverStarted();
        std::unique_ptr<BackendProcess> process;
        uint64_t generation = 0;
        RestartTracker tracker;
        std::optional<Error> last_error;
    };

    struct ExitNotice {
        std::string backend;
        uint64_t generation;
        ProcessExit exit;
    };

    Slot* FindSlot(const std::string& backend) const;
    Error UnknownBackend(const std::string& operation, const std::string& backend) const;
    Error DegradedError(const std::string& operation, const Slot& slot, TimePoint now) const;

    // Caller holds slot.launch_mutex, not mutex_.
    Result<BackendLease, Error> Launch(Slot& slot);

    // Caller holds mutex_.
    void Apply(Slot& slot, const BackendEvent& event);
    void Publish(const Slot& slot);
    void Degrade(Slot& slot, const std::string& reason, TimePoint now);

    void PostExit(ExitNotice notice);
    void MonitorLoop();
    void HandleExit(ExitNotice notice);

    SupervisorConfig config_;
    std::map<std::string, std::unique_ptr<Slot>> slots_;
    std::shared_mutex handler_mutex_;  // held shared while a reader runs the handler
    FrameHandler frame_handler_;

    mutable std::mutex mutex_;

    std::mutex watch_mutex_;
    std::vector<std::shared_ptr<LifecycleWatch>> watches_;

    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;
    std::deque<ExitNotice> exits_;
    bool monitor_stop_ = false;
    std::thread monitor_;

    std::atomic<bool> shutting_down_{false};
    std::once_flag shutdown_once_;
};

} // namespace mcp_bridge
