#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/bridge/process_supervisor.hpp>
#include <mcp_bridge/bridge/session_multiplexer.hpp>

#include "mocks/mock_backend_pool.hpp"

#include <thread>
#include <utility>
#include <vector>

using namespace mcp_bridge;
using namespace mcp_bridge::testing;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

Frame NextFrame(const PendingCall& call, std::chrono::milliseconds timeout = 100ms) {
    auto item = call.channel->Next(timeout);
    REQUIRE(item.has_value());
    REQUIRE(item->IsOk());
    return item->Value();
}

Frame ToolCall(const std::string& tool, json arguments = json::object()) {
    return Frame::Request("r1", "tools/call", {{"name", tool}, {"arguments", arguments}});
}

} // anonymous namespace

// ===========================================================================
// Sessions
// ===========================================================================

TEST_CASE("SessionMultiplexer: OpenSession binds the current generation", "[mux]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);

    auto session = mux.OpenSession("pricing");
    REQUIRE(session.IsOk());
    CHECK(mux.SessionCount() == 1);

    auto info = mux.Describe(session.Value());
    REQUIRE(info.IsOk());
    CHECK(info.Value().backend == "pricing");
    CHECK(info.Value().generation == 1);
    CHECK(info.Value().state == SessionState::Open);
    CHECK(info.Value().pending == 0);
    CHECK(mux.BackendOf(session.Value()).Value() == "pricing");
}

TEST_CASE("SessionMultiplexer: OpenSession surfaces Acquire errors", "[mux]") {
    MockBackendPool pool({"pricing"});
    pool.EnqueueAcquireError(Error::Make(ErrorCategory::BackendUnavailable, "Acquire",
                                         "pricing", "degraded"));
    SessionMultiplexer mux(pool, 60s);

    auto session = mux.OpenSession("pricing");
    REQUIRE(session.IsErr());
    CHECK(session.Error().category == ErrorCategory::BackendUnavailable);
    CHECK(mux.SessionCount() == 0);
}

TEST_CASE("SessionMultiplexer: unknown sessions", "[mux]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto ghost = SessionId::Generate();

    CHECK(mux.Send(ghost, Frame::Request(1, "ping")).Error().category ==
          ErrorCategory::SessionNotFound);
    CHECK(mux.CloseSession(ghost).Error().category == ErrorCategory::SessionNotFound);
    CHECK(mux.Describe(ghost).IsErr());
    CHECK(mux.BackendOf(ghost).IsErr());
}

// ===========================================================================
// Send / Route
// ===========================================================================

TEST_CASE("SessionMultiplexer: request travels under a wire id, reply gets the client id",
          "[mux][route]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();

    auto call = mux.Send(session, Frame::Request(1, "tools/call", {{"name", "get_pricing"}}));
    REQUIRE(call.IsOk());
    CHECK(call.Value().request_id == session.Value() + ".1");

    auto wire = pool.LastSubmitted();
    CHECK(wire.kind == FrameKind::Request);
    CHECK(wire.id == call.Value().request_id);
    CHECK(wire.payload["name"] == "get_pricing");
    CHECK(mux.Describe(session).Value().pending == 1);

    pool.Emit("pricing", 1, Frame::Response(wire.id, {{"content", json::array()}}));

    auto frame = NextFrame(call.Value());
    CHECK(frame.id == 1);
    CHECK(frame.kind == FrameKind::Response);
    CHECK(call.Value().channel->IsDone());
    CHECK(mux.Describe(session).Value().pending == 0);
}

TEST_CASE("SessionMultiplexer: same client id in two sessions never crosses", "[mux][route]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto a = mux.OpenSession("pricing").Value();
    auto b = mux.OpenSession("pricing").Value();

    auto call_a = mux.Send(a, Frame::Request(1, "tools/call", {{"name", "a"}})).Value();
    auto wire_a = pool.LastSubmitted();
    auto call_b = mux.Send(b, Frame::Request(1, "tools/call", {{"name", "b"}})).Value();
    auto wire_b = pool.LastSubmitted();
    CHECK(wire_a.id != wire_b.id);

    // Backend answers out of order.
    pool.Emit("pricing", 1, Frame::Response(wire_b.id, {{"from", "b"}}));
    pool.Emit("pricing", 1, Frame::Response(wire_a.id, {{"from", "a"}}));

    auto frame_a = NextFrame(call_a);
    auto frame_b = NextFrame(call_b);
    CHECK(frame_a.payload["from"] == "a");
    CHECK(frame_b.payload["from"] == "b");
    CHECK(frame_a.id == 1);
    CHECK(frame_b.id == 1);
}

TEST_CASE("SessionMultiplexer: sequential requests in one session get distinct ids",
          "[mux][route]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();

    auto first = mux.Send(session, Frame::Request(nullptr, "ping")).Value();
    auto second = mux.Send(session, Frame::Request(nullptr, "ping")).Value();
    CHECK(first.request_id == session.Value() + ".1");
    CHECK(second.request_id == session.Value() + ".2");

    // No client id: the wire id stays on the delivered frame.
    pool.Emit("pricing", 1, Frame::Response(second.request_id, json::object()));
    CHECK(NextFrame(second).id == second.request_id);
    CHECK_FALSE(first.channel->IsDone());
}

TEST_CASE("SessionMultiplexer: multi-chunk answer arrives complete and in order",
          "[mux][route]") {
    MockBackendPool pool({"ce"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("ce").Value();
    auto call = mux.Send(session, Frame::Request("c1", "tools/call")).Value();

    for (int i = 1; i <= 4; ++i) {
        pool.Emit("ce", 1, Frame::Response(call.request_id, {{"chunk", i}}, true));
    }
    pool.Emit("ce", 1, Frame::Response(call.request_id, {{"chunk", 5}}));

    for (int i = 1; i <= 5; ++i) {
        auto frame = NextFrame(call);
        CHECK(frame.payload["chunk"] == i);
        CHECK(frame.id == "c1");
        CHECK(frame.partial == (i < 5));
    }
    CHECK(call.channel->IsDone());
}

TEST_CASE("SessionMultiplexer: progress token is rewritten and restored", "[mux][route]") {
    MockBackendPool pool({"bcm"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("bcm").Value();

    auto request = Frame::Request(5, "tools/call",
                                  {{"name", "report"}, {"_meta", {{"progressToken", 99}}}});
    auto call = mux.Send(session, request).Value();

    auto wire = pool.LastSubmitted();
    CHECK(wire.payload["_meta"]["progressToken"] == call.request_id);

    pool.Emit("bcm", 1, Frame::Notification(kProgressMethod,
                                            {{"progressToken", call.request_id},
                                             {"progress", 1}, {"total", 2}}));
    pool.Emit("bcm", 1, Frame::Response(call.request_id, {{"done", true}}));

    auto progress = NextFrame(call);
    CHECK(progress.kind == FrameKind::Notification);
    CHECK(progress.payload["progressToken"] == 99);
    CHECK(progress.partial);

    auto final_frame = NextFrame(call);
    CHECK(final_frame.id == 5);
}

TEST_CASE("SessionMultiplexer: stray and uncorrelated frames are dropped", "[mux][route]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();
    auto call = mux.Send(session, Frame::Request(1, "ping")).Value();

    pool.Emit("pricing", 1, Frame::Response("s-ffffffffffffffff.9", json::object()));
    pool.Emit("pricing", 1, Frame::Notification("notifications/message", {{"level", "info"}}));
    pool.Emit("pricing", 1, Frame::Response(nullptr, json::object()));
    pool.Emit("other", 1, Frame::Response(call.request_id, json::object()));

    CHECK_FALSE(call.channel->Next(20ms).has_value());
    CHECK(mux.Describe(session).Value().state == SessionState::Open);
}

TEST_CASE("SessionMultiplexer: frame from a stale generation is not delivered",
          "[mux][route]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();
    auto call = mux.Send(session, Frame::Request(1, "ping")).Value();

    pool.Emit("pricing", 7, Frame::Response(call.request_id, json::object()));
    CHECK_FALSE(call.channel->Next(20ms).has_value());
}

TEST_CASE("SessionMultiplexer: backend-initiated requests are refused", "[mux][route]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);

    pool.Emit("pricing", 1, Frame::Request("srv-1", "sampling/createMessage"));

    REQUIRE(pool.SubmitCount() == 1);
    auto reply = pool.LastSubmitted();
    CHECK(reply.kind == FrameKind::Error);
    CHECK(reply.id == "srv-1");
    CHECK(reply.payload["code"] == -32601);
    CHECK((pool.Submitted()[0].lease == BackendLease{"pricing", 1}));
}

TEST_CASE("SessionMultiplexer: Send rejects non-requests", "[mux]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();

    auto sent = mux.Send(session, Frame::Notification("notifications/cancelled"));
    REQUIRE(sent.IsErr());
    CHECK(sent.Error().category == ErrorCategory::InvalidRequest);
    CHECK(pool.SubmitCount() == 0);
}

TEST_CASE("SessionMultiplexer: Notify forwards without an id", "[mux]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();

    REQUIRE(mux.Notify(session, Frame::Notification("notifications/roots/list_changed")).IsOk());
    auto wire = pool.LastSubmitted();
    CHECK(wire.kind == FrameKind::Notification);
    CHECK(wire.method == "notifications/roots/list_changed");
}

// ===========================================================================
// Cancel / Close / Reap
// ===========================================================================

TEST_CASE("SessionMultiplexer: Cancel discards late frames silently", "[mux][cancel]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();
    auto call = mux.Send(session, Frame::Request(1, "tools/call")).Value();
    const auto submits = pool.SubmitCount();

    REQUIRE(mux.Cancel(session, call.request_id).IsOk());
    CHECK(call.channel->IsCancelled());
    CHECK(mux.Describe(session).Value().pending == 0);
    // Nothing is sent to the backend.
    CHECK(pool.SubmitCount() == submits);

    pool.Emit("pricing", 1, Frame::Response(call.request_id, {{"n", 1}}, true));
    pool.Emit("pricing", 1, Frame::Response(call.request_id, json::object()));
    CHECK_FALSE(call.channel->Next(20ms).has_value());

    // Cancelling twice is an error.
    CHECK(mux.Cancel(session, call.request_id).IsErr());
}

TEST_CASE("SessionMultiplexer: Cancel refuses a request of another session", "[mux][cancel]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto a = mux.OpenSession("pricing").Value();
    auto b = mux.OpenSession("pricing").Value();
    auto call = mux.Send(a, Frame::Request(1, "ping")).Value();

    CHECK(mux.Cancel(b, call.request_id).IsErr());
    CHECK_FALSE(call.channel->IsCancelled());
}

TEST_CASE("SessionMultiplexer: CloseSession fails pending calls", "[mux]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();
    auto call = mux.Send(session, Frame::Request(1, "ping")).Value();

    REQUIRE(mux.CloseSession(session).IsOk());
    CHECK(mux.SessionCount() == 0);

    auto item = call.channel->Next(100ms);
    REQUIRE(item.has_value());
    REQUIRE(item->IsErr());

    // The answer arriving after close goes nowhere.
    pool.Emit("pricing", 1, Frame::Response(call.request_id, json::object()));
    CHECK(mux.Send(session, Frame::Request(2, "ping")).IsErr());
}

TEST_CASE("SessionMultiplexer: ReapIdleSessions spares busy sessions", "[mux]") {
    MockBackendPool pool({"pricing", "ce"});
    SessionMultiplexer mux(pool, 30s);
    auto idle = mux.OpenSession("pricing").Value();
    auto busy = mux.OpenSession("ce").Value();
    auto call = mux.Send(busy, Frame::Request(1, "ping")).Value();

    CHECK(mux.ReapIdleSessions(Clock::now()) == 0);
    CHECK(mux.ReapIdleSessions(Clock::now() + 31s) == 1);
    CHECK(mux.Describe(idle).IsErr());
    CHECK(mux.Describe(busy).IsOk());
    CHECK_FALSE(call.channel->IsDone());
}

TEST_CASE("SessionMultiplexer: cancelled ids of unanswered requests age out", "[mux][cancel]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 30s);
    auto session = mux.OpenSession("pricing").Value();
    auto first = mux.Send(session, Frame::Request(1, "tools/call")).Value();
    auto second = mux.Send(session, Frame::Request(2, "tools/call")).Value();

    REQUIRE(mux.Cancel(session, first.request_id).IsOk());
    REQUIRE(mux.Cancel(session, second.request_id).IsOk());
    CHECK(mux.CancelledCount() == 2);

    // A final answer releases its entry at once.
    pool.Emit("pricing", 1, Frame::Response(second.request_id, json::object()));
    CHECK(mux.CancelledCount() == 1);

    CHECK(mux.ReapIdleSessions(Clock::now()) == 0);
    CHECK(mux.CancelledCount() == 1);

    // The backend never answers the first; it is forgotten after idle_timeout.
    mux.ReapIdleSessions(Clock::now() + 31s);
    CHECK(mux.CancelledCount() == 0);
}

TEST_CASE("SessionMultiplexer: CloseAll fails every pending call", "[mux]") {
    MockBackendPool pool({"pricing", "ce"});
    SessionMultiplexer mux(pool, 60s);
    auto a = mux.OpenSession("pricing").Value();
    auto b = mux.OpenSession("ce").Value();
    auto idle = mux.OpenSession("ce").Value();
    auto call_a = mux.Send(a, Frame::Request(1, "tools/call")).Value();
    auto call_b = mux.Send(b, Frame::Request(1, "tools/call")).Value();

    const auto reason = Error::Make(ErrorCategory::BackendUnavailable, "Shutdown", "",
                                    "Bridge is shutting down");
    CHECK(mux.CloseAll(reason) == 3);
    CHECK(mux.SessionCount() == 0);

    for (const auto* call : {&call_a, &call_b}) {
        auto item = call->channel->Next(100ms);
        REQUIRE(item.has_value());
        REQUIRE(item->IsErr());
        CHECK(item->Error().category == ErrorCategory::BackendUnavailable);
    }
    CHECK(mux.Describe(idle).IsErr());
    CHECK(mux.CloseAll(reason) == 0);
}

TEST_CASE("SessionMultiplexer: destructor detaches from the pool", "[mux]") {
    MockBackendPool pool({"pricing"});
    {
        SessionMultiplexer mux(pool, 60s);
        CHECK(pool.HasFrameHandler());
        auto session = mux.OpenSession("pricing").Value();
        REQUIRE(mux.Send(session, Frame::Request(1, "ping")).IsOk());
    }
    CHECK_FALSE(pool.HasFrameHandler());

    // A reader delivering after the multiplexer is gone reaches nothing.
    pool.Emit("pricing", 1, Frame::Response(json("late"), json::object()));
}

// ===========================================================================
// Backend failure
// ===========================================================================

TEST_CASE("SessionMultiplexer: exit fails every pending request of that generation",
          "[mux][failure]") {
    MockBackendPool pool({"pricing", "ce"});
    SessionMultiplexer mux(pool, 60s);

    std::vector<SessionId> sessions;
    std::vector<PendingCall> calls;
    for (int i = 0; i < 3; ++i) {
        sessions.push_back(mux.OpenSession("pricing").Value());
        calls.push_back(mux.Send(sessions.back(), Frame::Request(i, "tools/call")).Value());
    }
    calls.push_back(mux.Send(sessions[0], Frame::Request(10, "tools/call")).Value());

    auto other = mux.OpenSession("ce").Value();
    auto other_call = mux.Send(other, Frame::Request(1, "ping")).Value();

    pool.ExitBackend("pricing", "exit code 3");

    for (const auto& call : calls) {
        auto item = call.channel->Next(2s);
        REQUIRE(item.has_value());
        REQUIRE(item->IsErr());
        CHECK(item->Error().category == ErrorCategory::BackendDisconnected);
        CHECK(item->Error().backend == "pricing");
        CHECK(item->Error().message.find("exit code 3") != std::string::npos);
    }
    for (const auto& session : sessions) {
        CHECK(mux.Describe(session).Value().state == SessionState::Failed);
    }

    // Unrelated backend is untouched.
    CHECK(mux.Describe(other).Value().state == SessionState::Open);
    CHECK_FALSE(other_call.channel->IsDone());
}

TEST_CASE("SessionMultiplexer: failed session is never reassigned", "[mux][failure]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();

    pool.ExitBackend("pricing");
    REQUIRE(WaitFor([&] {
        return mux.Describe(session).Value().state == SessionState::Failed;
    }));

    auto sent = mux.Send(session, Frame::Request(1, "ping"));
    REQUIRE(sent.IsErr());
    CHECK(sent.Error().category == ErrorCategory::BackendDisconnected);

    // A new session binds to the next generation.
    auto fresh = mux.OpenSession("pricing").Value();
    CHECK(mux.Describe(fresh).Value().generation == 2);
    CHECK(mux.Send(fresh, Frame::Request(1, "ping")).IsOk());
}

TEST_CASE("SessionMultiplexer: Submit failure fails the session", "[mux][failure]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();

    pool.FailSubmits(Error::Make(ErrorCategory::BackendDisconnected, "Submit", "pricing",
                                 "stdin closed"));
    auto sent = mux.Send(session, Frame::Request(1, "ping"));
    REQUIRE(sent.IsErr());
    CHECK(sent.Error().category == ErrorCategory::BackendDisconnected);

    auto info = mux.Describe(session).Value();
    CHECK(info.state == SessionState::Failed);
    CHECK(info.pending == 0);
}

TEST_CASE("SessionMultiplexer: exit of an older generation leaves new sessions alone",
          "[mux][failure]") {
    MockBackendPool pool({"pricing"});
    SessionMultiplexer mux(pool, 60s);
    auto session = mux.OpenSession("pricing").Value();

    mux.OnLifecycleEvent({"pricing", 0, Exited{1, 0, false, "old"}});
    CHECK(mux.Describe(session).Value().state == SessionState::Open);

    mux.OnLifecycleEvent({"pricing", 1, Ready{Clock::now()}});
    CHECK(mux.Describe(session).Value().state == SessionState::Open);
}

// ===========================================================================
// Against a real backend
// ===========================================================================

TEST_CASE("SessionMultiplexer: malformed line between replies disturbs no session",
          "[mux][route]") {
    BackendDescriptor echo;
    echo.name = "pricing";
    echo.command = MCP_BRIDGE_ECHO_PATH;
    SupervisorConfig config;
    config.shutdown_grace = 1000ms;
    config.startup_timeout = 5000ms;
    ProcessSupervisor supervisor({echo}, config);
    SessionMultiplexer mux(supervisor, 60s);

    auto a = mux.OpenSession("pricing").Value();
    auto b = mux.OpenSession("pricing").Value();
    auto c = mux.OpenSession("pricing").Value();

    // All three use the same client id. The backend answers in order and
    // writes a line that is not JSON before answering b.
    auto call_a = mux.Send(a, ToolCall("slow", {{"ms", 200}})).Value();
    auto call_b = mux.Send(b, ToolCall("garbage")).Value();
    auto call_c = mux.Send(c, ToolCall("echo", {{"text", "only for c"}})).Value();

    const std::vector<std::pair<const PendingCall*, std::string>> expected = {
        {&call_a, "slept 200 ms"}, {&call_b, "after garbage"}, {&call_c, "only for c"}};
    for (const auto& [call, text] : expected) {
        auto frame = NextFrame(*call, 5000ms);
        CHECK(frame.kind == FrameKind::Response);
        CHECK(frame.id == "r1");
        CHECK(frame.payload["content"][0]["text"] == text);
        CHECK(frame.IsFinal());
        CHECK_FALSE(call->channel->Next(50ms).has_value());
    }

    for (const auto& session : {a, b, c}) {
        auto info = mux.Describe(session);
        REQUIRE(info.IsOk());
        CHECK(info.Value().state == SessionState::Open);
        CHECK(info.Value().pending == 0);
    }
    CHECK(supervisor.Status("pricing").Value().generation == 1);

    mux.CloseAll(Error::Make(ErrorCategory::Internal, "test", "", "done"));
    supervisor.Shutdown();
}
