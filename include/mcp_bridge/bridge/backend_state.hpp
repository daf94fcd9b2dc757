#pragma once

#include <mcp_bridge/core/result.hpp>

#include <chrono>
#include <deque>
#include <string>
#include <variant>

namespace mcp_bridge {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// ---------------------------------------------------------------------------
// Backend lifecycle states. Exactly one is current per backend.
// ---------------------------------------------------------------------------
struct Starting {};

struct Ready {
    TimePoint since;
};

struct Degraded {
    std::string reason;
    TimePoint until;  // requests fail fast before this instant
};

struct Exited {
    int exit_code = -1;    // -1 when killed by a signal or never started
    int term_signal = 0;
    bool expected = false; // stopped by the supervisor
    std::string reason;
};

using BackendState = std::variant<Starting, Ready, Degraded, Exited>;

const char* StateName(const BackendState& state);

// ---------------------------------------------------------------------------
// Events that move the state machine.
//
//   Exited/Degraded --Launch--> Starting --Launched--> Ready
//   Starting --LaunchFailed--> Exited
//   Ready --ProcessExited--> Exited
//   Exited --Exhausted--> Degraded
//   Ready/Starting --Stopped--> Exited(expected)
// ---------------------------------------------------------------------------
namespace lifecycle {

struct Launch {};
struct Launched { TimePoint at; };
struct LaunchFailed { std::string reason; };
struct ProcessExited { int exit_code; int term_signal; std::string reason; };
struct Stopped {};
struct Exhausted { std::string reason; TimePoint until; };

} // namespace lifecycle

using BackendEvent = std::variant<lifecycle::Launch,
                                  lifecycle::Launched,
                                  lifecycle::LaunchFailed,
                                  lifecycle::ProcessExited,
                                  lifecycle::Stopped,
                                  lifecycle::Exhausted>;

// Apply one event. Illegal transitions return an error naming both sides
// and leave the caller's state untouched.
Result<BackendState, std::string> Transition(const BackendState& from,
                                             const BackendEvent& event);

// Initial state of a configured backend that has never been started.
BackendState NeverStarted();

// ---------------------------------------------------------------------------
// RestartPolicy / RestartTracker: bounded automatic restarts.
//
// At most max_restarts restarts are allowed inside a sliding window. Once
// that budget is spent the backend is degraded until the window has passed
// since the oldest counted restart. A Ready period at least as long as the
// window clears the count.
// ---------------------------------------------------------------------------
struct RestartPolicy {
    int max_restarts = 3;
    std::chrono::seconds window{60};
};

class RestartTracker {
public:
    explicit RestartTracker(RestartPolicy policy);

    // Record a restart at `now` if the budget allows; false when exhausted.
    [[nodiscard]] bool TryRecordRestart(TimePoint now);

    // Clear the count when the process stayed Ready for a full window.
    void NoteReadyPeriod(TimePoint ready_since, TimePoint exited_at);

    // Instant at which the budget frees up again.
    [[nodiscard]] TimePoint RetryAfter() const;

    [[nodiscard]] int RestartsInWindow(TimePoint now);
    [[nodiscard]] int TotalRestarts() const noexcept { return total_; }

    void Reset();

    [[nodiscard]] const RestartPolicy& Policy() const noexcept { return policy_; }

private:
    void Prune(TimePoint now);

    RestartPolicy policy_;
    std::deque<TimePoint> restarts_;
    int total_ = 0;
};

} // namespace mcp_bridge
