#include <mcp_bridge/bridge/backend_state.hpp>

#include <type_traits>

namespace mcp_bridge {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const char* EventName(const BackendEvent& event) {
    return std::visit(Overloaded{
        [](const lifecycle::Launch&) { return "Launch"; },
        [](const lifecycle::Launched&) { return "Launched"; },
        [](const lifecycle::LaunchFailed&) { return "LaunchFailed"; },
        [](const lifecycle::ProcessExited&) { return "ProcessExited"; },
        [](const lifecycle::Stopped&) { return "Stopped"; },
        [](const lifecycle::Exhausted&) { return "Exhausted"; },
    }, event);
}

} // anonymous namespace

const char* StateName(const BackendState& state) {
    return std::visit(Overloaded{
        [](const Starting&) { return "Starting"; },
        [](const Ready&) { return "Ready"; },
        [](const Degraded&) { return "Degraded"; },
        [](const Exited&) { return "Exited"; },
    }, state);
}

BackendState NeverStarted() {
    return Exited{-1, 0, true, "not started"};
}

Result<BackendState, std::string> Transition(const BackendState& from,
                                             const BackendEvent& event) {
    using R = Result<BackendState, std::string>;

    const bool starting = std::holds_alternative<Starting>(from);
    const bool ready = std::holds_alternative<Ready>(from);
    const bool degraded = std::holds_alternative<Degraded>(from);
    const bool exited = std::holds_alternative<Exited>(from);

    if (std::holds_alternative<lifecycle::Launch>(event) && (exited || degraded)) {
        return R::Ok(Starting{});
    }
    if (const auto* e = std::get_if<lifecycle::Launched>(&event); e && starting) {
        return R::Ok(Ready{e->at});
    }
    if (const auto* e = std::get_if<lifecycle::LaunchFailed>(&event); e && starting) {
        return R::Ok(Exited{-1, 0, false, e->reason});
    }
    if (const auto* e = std::get_if<lifecycle::ProcessExited>(&event); e && ready) {
        return R::Ok(Exited{e->exit_code, e->term_signal, false, e->reason});
    }
    if (std::holds_alternative<lifecycle::Stopped>(event) && (ready || starting)) {
        return R::Ok(Exited{-1, 0, true, "stopped"});
    }
    if (const auto* e = std::get_if<lifecycle::Exhausted>(&event); e && exited) {
        return R::Ok(Degraded{e->reason, e->until});
    }

    return R::Err(std::string("Illegal transition: ") + EventName(event) +
                  " in state " + StateName(from));
}

// ---------------------------------------------------------------------------
// RestartTracker
// ---------------------------------------------------------------------------
RestartTracker::RestartTracker(RestartPolicy policy) : policy_(policy) {}

bool RestartTracker::TryRecordRestart(TimePoint now) {
    Prune(now);
    if (static_cast<int>(restarts_.size()) >= policy_.max_restarts) {
        return false;
    }
    restarts_.push_back(now);
    ++total_;
    return true;
}

void RestartTracker::NoteReadyPeriod(TimePoint ready_since, TimePoint exited_at) {
    if (exited_at - ready_since >= policy_.window) {
        restarts_.clear();
    }
}

TimePoint RestartTracker::RetryAfter() const {
    if (restarts_.empty()) {
        return TimePoint::min();
    }
    return restarts_.front() + policy_.window;
}

int RestartTracker::RestartsInWindow(TimePoint now) {
    Prune(now);
    return static_cast<int>(restarts_.size());
}

void RestartTracker::Reset() {
    restarts_.clear();
}

void RestartTracker::Prune(TimePoint now) {
    while (!restarts_.empty() && now - restarts_.front() >= policy_.window) {
        restarts_.pop_front();
    }
}

} // namespace mcp_bridge
