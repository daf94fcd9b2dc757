#include <mcp_bridge/bridge/process_supervisor.hpp>

#include <mcp_bridge/core/log.hpp>

#include <algorithm>

namespace mcp_bridge {

namespace {

constexpr const char* kComponent = "supervisor";

std::chrono::seconds SecondsUntil(TimePoint until, TimePoint now) {
    if (until <= now) {
        return std::chrono::seconds(0);
    }
    return std::chrono::ceil<std::chrono::seconds>(until - now);
}

} // anonymous namespace

ProcessSupervisor::ProcessSupervisor(std::vector<BackendDescriptor> backends,
                                     SupervisorConfig config)
    : config_(std::move(config)) {
    const RestartPolicy policy{config_.max_restarts, config_.restart_window};
    for (auto& descriptor : backends) {
        auto name = descriptor.name;
        slots_.emplace(name, std::make_unique<Slot>(std::move(descriptor), policy));
    }
    monitor_ = std::thread(&ProcessSupervisor::MonitorLoop, this);
}

ProcessSupervisor::~ProcessSupervisor() {
    Shutdown();
}

ProcessSupervisor::Slot* ProcessSupervisor::FindSlot(const std::string& backend) const {
    auto it = slots_.find(backend);
    return it == slots_.end() ? nullptr : it->second.get();
}

Error ProcessSupervisor::UnknownBackend(const std::string& operation,
                                        const std::string& backend) const {
    return Error::Make(ErrorCategory::BackendUnavailable, operation, backend,
                       "Unknown backend: " + backend);
}

Error ProcessSupervisor::DegradedError(const std::string& operation, const Slot& slot,
                                       TimePoint now) const {
    std::string message = "Backend is degraded after repeated exits";
    if (const auto* degraded = std::get_if<Degraded>(&slot.state)) {
        message += "; retry in " + std::to_string(SecondsUntil(degraded->until, now).count()) +
                   " s";
    }
    std::optional<std::string> detail;
    if (slot.last_error.has_value()) {
        detail = slot.last_error->message;
    }
    return Error::Make(ErrorCategory::BackendUnavailable, operation, slot.descriptor.name,
                       message, detail);
}

// ---------------------------------------------------------------------------
// IBackendPool
// ---------------------------------------------------------------------------
bool ProcessSupervisor::HasBackend(const std::string& backend) const {
    return FindSlot(backend) != nullptr;
}

Result<BackendLease, Error> ProcessSupervisor::Acquire(const std::string& backend) {
    using R = Result<BackendLease, Error>;

    Slot* slot = FindSlot(backend);
    if (slot == nullptr) {
        return R::Err(UnknownBackend("ProcessSupervisor::Acquire", backend));
    }

    std::lock_guard<std::mutex> launch(slot->launch_mutex);
    if (shutting_down_.load()) {
        return R::Err(Error::Make(ErrorCategory::BackendUnavailable,
                                  "ProcessSupervisor::Acquire", backend,
                                  "Supervisor is shutting down"));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = Clock::now();
        if (std::holds_alternative<Ready>(slot->state) && slot->process) {
            return R::Ok(BackendLease{backend, slot->generation});
        }
        if (const auto* degraded = std::get_if<Degraded>(&slot->state)) {
            if (now < degraded->until) {
                return R::Err(DegradedError("ProcessSupervisor::Acquire", *slot, now));
            }
            LogInfo(kComponent, backend + ": restart window elapsed, retrying");
            slot->tracker.Reset();
        } else if (const auto* exited = std::get_if<Exited>(&slot->state);
                   exited != nullptr && !exited->expected) {
            if (!slot->tracker.TryRecordRestart(now)) {
                Degrade(*slot, exited->reason, now);
                return R::Err(DegradedError("ProcessSupervisor::Acquire", *slot, now));
            }
            LogInfo(kComponent, backend + ": restarting on demand (" +
                                    std::to_string(slot->tracker.RestartsInWindow(now)) + "/" +
                                    std::to_string(config_.max_restarts) + ")");
        }
    }

    return Launch(*slot);
}

Result<void, Error> ProcessSupervisor::Submit(const BackendLease& lease, std::string line) {
    Slot* slot = FindSlot(lease.backend);
    if (slot == nullptr) {
        return Result<void, Error>::Err(UnknownBackend("ProcessSupervisor::Submit", lease.backend));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!slot->process || slot->generation != lease.generation ||
        !std::holds_alternative<Ready>(slot->state)) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::BackendDisconnected, "ProcessSupervisor::Submit", lease.backend,
            "Backend generation " + std::to_string(lease.generation) + " is gone"));
    }
    return slot->process->Submit(std::move(line));
}

void ProcessSupervisor::SetFrameHandler(FrameHandler handler) {
    std::unique_lock<std::shared_mutex> lock(handler_mutex_);
    frame_handler_ = std::move(handler);
}

std::shared_ptr<LifecycleWatch> ProcessSupervisor::Watch(const std::string& backend) {
    auto watch = std::make_shared<LifecycleWatch>(backend);
    if (shutting_down_.load()) {
        watch->Close();
        return watch;
    }
    std::lock_guard<std::mutex> lock(watch_mutex_);
    watches_.push_back(watch);
    return watch;
}

// ---------------------------------------------------------------------------
// Start / Stop
// ---------------------------------------------------------------------------
Result<BackendLease, Error> ProcessSupervisor::Start(const std::string& backend) {
    using R = Result<BackendLease, Error>;

    Slot* slot = FindSlot(backend);
    if (slot == nullptr) {
        return R::Err(UnknownBackend("ProcessSupervisor::Start", backend));
    }

    std::lock_guard<std::mutex> launch(slot->launch_mutex);
    if (shutting_down_.load()) {
        return R::Err(Error::Make(ErrorCategory::BackendUnavailable, "ProcessSupervisor::Start",
                                  backend, "Supervisor is shutting down"));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<Ready>(slot->state) && slot->process) {
            return R::Ok(BackendLease{backend, slot->generation});
        }
        slot->tracker.Reset();
    }
    return Launch(*slot);
}

void ProcessSupervisor::StartAll() {
    for (const auto& name : BackendNames()) {
        auto started = Start(name);
        if (started.IsErr()) {
            LogError(kComponent, "Eager start of " + name + " failed: " +
                                     started.Error().message);
        }
    }
}

Result<void, Error> ProcessSupervisor::Stop(const std::string& backend) {
    Slot* slot = FindSlot(backend);
    if (slot == nullptr) {
        return Result<void, Error>::Err(UnknownBackend("ProcessSupervisor::Stop", backend));
    }

    std::lock_guard<std::mutex> launch(slot->launch_mutex);
    std::unique_ptr<BackendProcess> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        process = std::move(slot->process);
    }
    if (!process) {
        return Result<void, Error>::Ok();
    }

    LogInfo(kComponent, "Stopping " + backend + " (pid " + std::to_string(process->Pid()) + ")");
    process->Terminate(config_.shutdown_grace);
    process.reset();

    std::lock_guard<std::mutex> lock(mutex_);
    Apply(*slot, lifecycle::Stopped{});
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------
Result<BackendStatus, Error> ProcessSupervisor::Status(const std::string& backend) const {
    Slot* slot = FindSlot(backend);
    if (slot == nullptr) {
        return Result<BackendStatus, Error>::Err(
            UnknownBackend("ProcessSupervisor::Status", backend));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    BackendStatus status;
    status.name = backend;
    status.state = StateName(slot->state);
    status.generation = slot->generation;
    if (slot->process && slot->process->IsRunning()) {
        status.pid = slot->process->Pid();
    }
    status.restarts = slot->tracker.TotalRestarts();
    status.restarts_in_window = slot->tracker.RestartsInWindow(now);
    status.last_error = slot->last_error;
    if (const auto* degraded = std::get_if<Degraded>(&slot->state)) {
        status.retry_in = SecondsUntil(degraded->until, now);
    }
    return Result<BackendStatus, Error>::Ok(std::move(status));
}

std::vector<BackendStatus> ProcessSupervisor::Statuses() const {
    std::vector<BackendStatus> out;
    for (const auto& name : BackendNames()) {
        auto status = Status(name);
        if (status.IsOk()) {
            out.push_back(std::move(status).Value());
        }
    }
    return out;
}

std::vector<std::string> ProcessSupervisor::BackendNames() const {
    std::vector<std::string> names;
    names.reserve(slots_.size());
    for (const auto& [name, slot] : slots_) {
        names.push_back(name);
    }
    return names;
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------
void ProcessSupervisor::Shutdown() {
    std::call_once(shutdown_once_, [this] {
        shutting_down_ = true;
        LogInfo(kComponent, "Shutting down " + std::to_string(slots_.size()) + " backend(s)");

        for (const auto& name : BackendNames()) {
            auto stopped = Stop(name);
            if (stopped.IsErr()) {
                LogWarn(kComponent, stopped.Error().ToString());
            }
        }

        {
            std::lock_guard<std::mutex> lock(exit_mutex_);
            monitor_stop_ = true;
        }
        exit_cv_.notify_all();
        if (monitor_.joinable()) {
            monitor_.join();
        }

        std::lock_guard<std::mutex> lock(watch_mutex_);
        for (auto& watch : watches_) {
            watch->Close();
        }
        watches_.clear();
    });
}

// ---------------------------------------------------------------------------
// Launch and state bookkeeping
// ---------------------------------------------------------------------------
Result<BackendLease, Error> ProcessSupervisor::Launch(Slot& slot) {
    using R = Result<BackendLease, Error>;
    const std::string name = slot.descriptor.name;

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++slot.generation;
        Apply(slot, lifecycle::Launch{});
    }

    BackendProcessOptions options;
    options.startup_timeout = config_.startup_timeout;
    options.max_line_bytes = config_.max_line_bytes;

    LogInfo(kComponent, "Launching " + name + " (generation " + std::to_string(generation) + ")");
    auto launched = BackendProcess::Launch(
        slot.descriptor, options,
        [this, name, generation](Frame frame) {
            std::shared_lock<std::shared_mutex> lock(handler_mutex_);
            if (frame_handler_) {
                frame_handler_(name, generation, std::move(frame));
            }
        },
        [this, name, generation](const ProcessExit& exit) {
            PostExit(ExitNotice{name, generation, exit});
        });

    std::lock_guard<std::mutex> lock(mutex_);
    if (launched.IsErr()) {
        auto error = std::move(launched).Error();
        slot.last_error = error;
        Apply(slot, lifecycle::LaunchFailed{error.message});
        return R::Err(std::move(error));
    }

    slot.process = std::move(launched).Value();
    Apply(slot, lifecycle::Launched{Clock::now()});
    LogInfo(kComponent, name + " ready (pid " + std::to_string(slot.process->Pid()) + ")");
    return R::Ok(BackendLease{name, generation});
}

void ProcessSupervisor::Apply(Slot& slot, const BackendEvent& event) {
    auto next = Transition(slot.state, event);
    if (next.IsErr()) {
        LogError(kComponent, slot.descriptor.name + ": " + next.Error());
        return;
    }
    slot.state = std::move(next).Value();
    LogDebug(kComponent, slot.descriptor.name + " -> " + StateName(slot.state));
    Publish(slot);
}

void ProcessSupervisor::Publish(const Slot& slot) {
    const LifecycleEvent event{slot.descriptor.name, slot.generation, slot.state};

    std::lock_guard<std::mutex> lock(watch_mutex_);
    watches_.erase(std::remove_if(watches_.begin(), watches_.end(),
                                  [](const auto& watch) { return watch->IsClosed(); }),
                   watches_.end());
    for (auto& watch : watches_) {
        watch->Publish(event);
    }
}

void ProcessSupervisor::Degrade(Slot& slot, const std::string& reason, TimePoint now) {
    auto until = slot.tracker.RetryAfter();
    if (until <= now) {
        until = now + slot.tracker.Policy().window;
    }
    LogWarn(kComponent, slot.descriptor.name + " degraded for " +
                            std::to_string(SecondsUntil(until, now).count()) +
                            " s: restart budget exhausted");
    Apply(slot, lifecycle::Exhausted{reason, until});
}

// ---------------------------------------------------------------------------
// Monitor
// ---------------------------------------------------------------------------
void ProcessSupervisor::PostExit(ExitNotice notice) {
    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exits_.push_back(std::move(notice));
    }
    exit_cv_.notify_one();
}

void ProcessSupervisor::MonitorLoop() {
    while (true) {
        ExitNotice notice;
        {
            std::unique_lock<std::mutex> lock(exit_mutex_);
            exit_cv_.wait(lock, [this] { return monitor_stop_ || !exits_.empty(); });
            if (monitor_stop_) {
                return;
            }
            notice = std::move(exits_.front());
            exits_.pop_front();
        }
        HandleExit(std::move(notice));
    }
}

void ProcessSupervisor::HandleExit(ExitNotice notice) {
    Slot* slot = FindSlot(notice.backend);
    if (slot == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> launch(slot->launch_mutex);
    std::unique_ptr<BackendProcess> dead;
    bool restart = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!slot->process || slot->generation != notice.generation) {
            LogDebug(kComponent, notice.backend + ": ignoring exit of generation " +
                                     std::to_string(notice.generation));
            return;
        }

        const auto now = Clock::now();
        auto ready_since = now;
        if (const auto* ready = std::get_if<Ready>(&slot->state)) {
            ready_since = ready->since;
        }
        dead = std::move(slot->process);

        const auto reason = "Process exited unexpectedly (" + notice.exit.Describe() + ")";
        LogWarn(kComponent, notice.backend + ": " + reason);
        slot->last_error = Error::Make(
            ErrorCategory::BackendDisconnected, "ProcessSupervisor::Monitor", notice.backend,
            reason,
            notice.exit.stderr_tail.empty() ? std::nullopt
                                            : std::optional<std::string>(notice.exit.stderr_tail));
        Apply(*slot, lifecycle::ProcessExited{notice.exit.exit_code, notice.exit.term_signal,
                                              reason});

        slot->tracker.NoteReadyPeriod(ready_since, now);
        if (!shutting_down_.load()) {
            restart = slot->tracker.TryRecordRestart(now);
            if (restart) {
                LogInfo(kComponent, notice.backend + ": automatic restart " +
                                        std::to_string(slot->tracker.RestartsInWindow(now)) +
                                        "/" + std::to_string(config_.max_restarts));
            } else {
                Degrade(*slot, reason, now);
            }
        }
    }

    dead.reset();

    if (restart) {
        auto relaunched = Launch(*slot);
        if (relaunched.IsErr()) {
            LogError(kComponent, notice.backend + ": automatic restart failed: " +
                                     relaunched.Error().message);
        }
    }
}

} // namespace mcp_bridge
