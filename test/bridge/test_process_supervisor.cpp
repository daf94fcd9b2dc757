#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/bridge/frame_codec.hpp>
#include <mcp_bridge/bridge/process_supervisor.hpp>
#include <mcp_bridge/bridge/session_multiplexer.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcp_bridge;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

BackendDescriptor Echo(const std::string& name, std::vector<std::string> args = {}) {
    BackendDescriptor descriptor;
    descriptor.name = name;
    descriptor.command = MCP_BRIDGE_ECHO_PATH;
    descriptor.args = std::move(args);
    return descriptor;
}

SupervisorConfig TestConfig(int max_restarts = 3) {
    SupervisorConfig config;
    config.max_restarts = max_restarts;
    config.restart_window = std::chrono::seconds(60);
    config.shutdown_grace = 1000ms;
    config.startup_timeout = 5000ms;
    return config;
}

std::string CrashLine(int code = 3) {
    return EncodePipe(Frame::Request("boom", "tools/call",
                                     {{"name", "crash"}, {"arguments", {{"code", code}}}}));
}

// Wait for an event of `backend` in a state named `state`.
std::optional<LifecycleEvent> WaitForState(LifecycleWatch& watch, const std::string& state,
                                           std::chrono::milliseconds timeout = 5s) {
    const auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        auto event = watch.Next(100ms);
        if (event.has_value() && StateName(event->state) == state) {
            return event;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// ===========================================================================
// Lookup
// ===========================================================================

TEST_CASE("ProcessSupervisor: unknown backend", "[supervisor]") {
    ProcessSupervisor supervisor({Echo("pricing")}, TestConfig());

    CHECK(supervisor.HasBackend("pricing"));
    CHECK_FALSE(supervisor.HasBackend("nope"));

    auto lease = supervisor.Acquire("nope");
    REQUIRE(lease.IsErr());
    CHECK(lease.Error().category == ErrorCategory::BackendUnavailable);
    CHECK(supervisor.Status("nope").IsErr());
    CHECK(supervisor.Stop("nope").IsErr());
    CHECK(supervisor.Submit({"nope", 1}, "{}\n").IsErr());
}

TEST_CASE("ProcessSupervisor: backends start lazily", "[supervisor]") {
    ProcessSupervisor supervisor({Echo("pricing"), Echo("ce")}, TestConfig());

    auto statuses = supervisor.Statuses();
    REQUIRE(statuses.size() == 2);
    for (const auto& status : statuses) {
        CHECK(status.state == "Exited");
        CHECK(status.generation == 0);
        CHECK_FALSE(status.pid.has_value());
    }
    CHECK(supervisor.BackendNames() == std::vector<std::string>{"ce", "pricing"});

    auto lease = supervisor.Acquire("pricing");
    REQUIRE(lease.IsOk());
    CHECK(lease.Value().generation == 1);

    auto status = supervisor.Status("pricing").Value();
    CHECK(status.state == "Ready");
    CHECK(status.pid.has_value());
    CHECK(supervisor.Status("ce").Value().state == "Exited");

    // A second Acquire reuses the running process.
    CHECK(supervisor.Acquire("pricing").Value().generation == 1);
}

TEST_CASE("ProcessSupervisor: frames carry backend and generation", "[supervisor]") {
    std::mutex mutex;
    std::vector<std::pair<std::string, uint64_t>> seen;
    std::atomic<int> count{0};

    ProcessSupervisor supervisor({Echo("pricing")}, TestConfig());
    supervisor.SetFrameHandler([&](const std::string& backend, uint64_t generation, Frame) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.emplace_back(backend, generation);
        ++count;
    });

    auto lease = supervisor.Acquire("pricing").Value();
    REQUIRE(supervisor.Submit(lease, EncodePipe(Frame::Request(1, "ping"))).IsOk());

    for (int i = 0; i < 200 && count.load() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].first == "pricing");
    CHECK(seen[0].second == 1);
}

// ===========================================================================
// Restart policy
// ===========================================================================

TEST_CASE("ProcessSupervisor: crash triggers an automatic restart", "[supervisor][restart]") {
    ProcessSupervisor supervisor({Echo("pricing")}, TestConfig());
    auto watch = supervisor.Watch("pricing");

    auto lease = supervisor.Acquire("pricing").Value();
    REQUIRE(WaitForState(*watch, "Ready").has_value());

    REQUIRE(supervisor.Submit(lease, CrashLine(3)).IsOk());

    auto exited = WaitForState(*watch, "Exited");
    REQUIRE(exited.has_value());
    CHECK(exited->generation == 1);
    CHECK(std::get<Exited>(exited->state).exit_code == 3);

    auto ready = WaitForState(*watch, "Ready");
    REQUIRE(ready.has_value());
    CHECK(ready->generation == 2);

    auto status = supervisor.Status("pricing").Value();
    CHECK(status.restarts == 1);
    CHECK(status.restarts_in_window == 1);
    REQUIRE(status.last_error.has_value());
    CHECK(status.last_error->category == ErrorCategory::BackendDisconnected);

    // The old lease is stale.
    auto stale = supervisor.Submit(lease, EncodePipe(Frame::Request(1, "ping")));
    REQUIRE(stale.IsErr());
    CHECK(stale.Error().category == ErrorCategory::BackendDisconnected);
    CHECK(supervisor.Acquire("pricing").Value().generation == 2);
}

TEST_CASE("ProcessSupervisor: exhausted budget degrades the backend", "[supervisor][restart]") {
    ProcessSupervisor supervisor({Echo("pricing")}, TestConfig(0));
    auto watch = supervisor.Watch("pricing");

    auto lease = supervisor.Acquire("pricing").Value();
    REQUIRE(supervisor.Submit(lease, CrashLine()).IsOk());

    auto degraded = WaitForState(*watch, "Degraded");
    REQUIRE(degraded.has_value());

    auto acquire = supervisor.Acquire("pricing");
    REQUIRE(acquire.IsErr());
    CHECK(acquire.Error().category == ErrorCategory::BackendUnavailable);

    auto status = supervisor.Status("pricing").Value();
    CHECK(status.state == "Degraded");
    REQUIRE(status.retry_in.has_value());
    CHECK(status.retry_in->count() > 0);
    CHECK(status.retry_in->count() <= 60);

    // An explicit Start clears the degradation.
    auto restarted = supervisor.Start("pricing");
    REQUIRE(restarted.IsOk());
    CHECK(restarted.Value().generation == 2);
    CHECK(supervisor.Status("pricing").Value().state == "Ready");
}

TEST_CASE("ProcessSupervisor: N restarts in the window, then Degraded until it passes",
          "[supervisor][restart]") {
    auto config = TestConfig(2);
    config.restart_window = std::chrono::seconds(2);
    ProcessSupervisor supervisor({Echo("pricing")}, config);
    SessionMultiplexer mux(supervisor, std::chrono::seconds(60));
    auto watch = supervisor.Watch("pricing");

    REQUIRE(supervisor.Acquire("pricing").IsOk());
    REQUIRE(WaitForState(*watch, "Ready").has_value());

    // Two crashes are absorbed by automatic restarts.
    for (uint64_t generation = 1; generation <= 2; ++generation) {
        auto lease = supervisor.Acquire("pricing").Value();
        REQUIRE(lease.generation == generation);
        REQUIRE(supervisor.Submit(lease, CrashLine()).IsOk());
        REQUIRE(WaitForState(*watch, "Exited").has_value());
        auto ready = WaitForState(*watch, "Ready");
        REQUIRE(ready.has_value());
        CHECK(ready->generation == generation + 1);
    }
    CHECK(supervisor.Status("pricing").Value().restarts == 2);

    // The third exceeds the budget.
    auto lease = supervisor.Acquire("pricing").Value();
    REQUIRE(lease.generation == 3);
    REQUIRE(supervisor.Submit(lease, CrashLine()).IsOk());
    REQUIRE(WaitForState(*watch, "Degraded").has_value());

    auto status = supervisor.Status("pricing").Value();
    CHECK(status.state == "Degraded");
    CHECK(status.generation == 3);
    CHECK(status.restarts == 2);

    auto opened = mux.OpenSession("pricing");
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::BackendUnavailable);
    CHECK(supervisor.Acquire("pricing").IsErr());

    // Once the window has passed, Acquire brings it back.
    std::optional<BackendLease> recovered;
    const auto deadline = Clock::now() + 6s;
    while (!recovered.has_value() && Clock::now() < deadline) {
        auto acquired = supervisor.Acquire("pricing");
        if (acquired.IsOk()) {
            recovered = acquired.Value();
        } else {
            CHECK(acquired.Error().category == ErrorCategory::BackendUnavailable);
            std::this_thread::sleep_for(100ms);
        }
    }
    REQUIRE(recovered.has_value());
    CHECK(recovered->generation == 4);
    CHECK(supervisor.Status("pricing").Value().state == "Ready");
    CHECK(mux.OpenSession("pricing").IsOk());
}

TEST_CASE("ProcessSupervisor: failed launch reports LaunchError", "[supervisor]") {
    ProcessSupervisor supervisor({Echo("broken", {"--exit-code", "9"})}, TestConfig());

    auto lease = supervisor.Acquire("broken");
    REQUIRE(lease.IsErr());
    CHECK(lease.Error().category == ErrorCategory::LaunchError);

    auto status = supervisor.Status("broken").Value();
    CHECK(status.state == "Exited");
    REQUIRE(status.last_error.has_value());
    CHECK(status.last_error->category == ErrorCategory::LaunchError);
}

// ===========================================================================
// Stop / Shutdown
// ===========================================================================

TEST_CASE("ProcessSupervisor: Stop does not restart", "[supervisor]") {
    ProcessSupervisor supervisor({Echo("pricing")}, TestConfig());
    auto watch = supervisor.Watch("pricing");

    auto lease = supervisor.Acquire("pricing").Value();
    REQUIRE(supervisor.Stop("pricing").IsOk());

    auto status = supervisor.Status("pricing").Value();
    CHECK(status.state == "Exited");
    CHECK_FALSE(status.pid.has_value());
    CHECK(status.restarts == 0);
    CHECK(supervisor.Submit(lease, "{}\n").IsErr());

    auto exited = WaitForState(*watch, "Exited", 1s);
    REQUIRE(exited.has_value());
    CHECK(std::get<Exited>(exited->state).expected);

    // Nothing comes back on its own.
    CHECK_FALSE(WaitForState(*watch, "Ready", 300ms).has_value());

    // Acquire brings it back without counting a restart.
    CHECK(supervisor.Acquire("pricing").Value().generation == 2);
    CHECK(supervisor.Status("pricing").Value().restarts == 0);

    // Stopping a stopped backend is fine.
    REQUIRE(supervisor.Stop("pricing").IsOk());
    REQUIRE(supervisor.Stop("pricing").IsOk());
}

TEST_CASE("ProcessSupervisor: StartAll launches every backend", "[supervisor]") {
    ProcessSupervisor supervisor({Echo("pricing"), Echo("ce")}, TestConfig());
    supervisor.StartAll();
    for (const auto& status : supervisor.Statuses()) {
        CHECK(status.state == "Ready");
        CHECK(status.generation == 1);
    }
}

TEST_CASE("ProcessSupervisor: Shutdown closes watches and refuses Acquire", "[supervisor]") {
    ProcessSupervisor supervisor({Echo("pricing")}, TestConfig());
    auto watch = supervisor.Watch();
    REQUIRE(supervisor.Acquire("pricing").IsOk());

    supervisor.Shutdown();
    supervisor.Shutdown();

    CHECK(watch->IsClosed());
    auto lease = supervisor.Acquire("pricing");
    REQUIRE(lease.IsErr());
    CHECK(lease.Error().category == ErrorCategory::BackendUnavailable);
    CHECK(supervisor.Watch()->IsClosed());
}
