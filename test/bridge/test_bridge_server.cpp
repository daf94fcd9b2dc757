#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/bridge/bridge_server.hpp>
#include <mcp_bridge/bridge/frame_codec.hpp>

#include "mocks/local_bridge.hpp"

#include <httplib.h>

#include <string>
#include <thread>
#include <vector>

using namespace mcp_bridge;
using namespace mcp_bridge::testing;
using nlohmann::json;

namespace {

struct SseReply {
    int status = 0;
    std::string content_type;
    std::string session;
    std::string body;
    std::vector<StreamEvent> events;

    [[nodiscard]] std::vector<StreamEvent> OfType(StreamEventType type) const {
        std::vector<StreamEvent> out;
        for (const auto& event : events) {
            if (event.type == type) out.push_back(event);
        }
        return out;
    }
};

SseReply PostInvoke(int port, const std::string& backend, const std::string& body,
                    const httplib::Headers& headers = {}, const std::string& query = "") {
    httplib::Client cli("127.0.0.1", port);
    cli.set_read_timeout(std::chrono::seconds(15));
    auto res = cli.Post("/mcp/" + backend + "/invoke" + query, headers, body,
                        "application/json");
    REQUIRE(res);

    SseReply reply;
    reply.status = res->status;
    reply.content_type = res->get_header_value("Content-Type");
    reply.session = res->get_header_value(kSessionHeader);
    reply.body = res->body;
    if (res->status == 200) {
        StreamDecoder decoder;
        for (auto& event : decoder.Feed(res->body)) {
            REQUIRE(event.IsOk());
            reply.events.push_back(std::move(event).Value());
        }
    }
    return reply;
}

std::string TextOf(const StreamEvent& event) {
    auto frame = DecodeStream(event);
    REQUIRE(frame.IsOk());
    return frame.Value().payload["content"][0]["text"].get<std::string>();
}

json ErrorBody(const std::string& body) {
    auto parsed = json::parse(body, nullptr, false);
    REQUIRE(parsed.is_object());
    REQUIRE(parsed.contains("error"));
    return parsed["error"];
}

} // anonymous namespace

// ===========================================================================
// POST /mcp/{backend}/invoke
// ===========================================================================

TEST_CASE("BridgeServer: single-frame call streams frame then end", "[server]") {
    LocalBridge bridge({EchoBackend("pricing")});

    auto reply = PostInvoke(bridge.Port(), "pricing",
                            R"({"tool":"echo","params":{"text":"m5.large: 0.096"}})");
    REQUIRE(reply.status == 200);
    CHECK(reply.content_type.find("text/event-stream") == 0);
    CHECK(reply.session.rfind("s-", 0) == 0);

    REQUIRE(reply.events.size() == 2);
    CHECK(reply.events[0].type == StreamEventType::Frame);
    CHECK(TextOf(reply.events[0]) == "m5.large: 0.096");
    CHECK(reply.events[1].type == StreamEventType::End);
    CHECK(reply.events[1].data["session_id"] == reply.session);
    CHECK(reply.events[1].data["frames"] == 1);

    // One-shot session is gone once the stream ends.
    CHECK(bridge.Service().Multiplexer().SessionCount() == 0);
}

TEST_CASE("BridgeServer: multi-chunk answer with progress", "[server]") {
    LocalBridge bridge({EchoBackend("ce")});

    auto reply = PostInvoke(
        bridge.Port(), "ce",
        R"({"method":"tools/call","id":"c-1","params":{"name":"chunks","arguments":{"count":3},"_meta":{"progressToken":"tok-7"}}})");
    REQUIRE(reply.status == 200);

    auto frames = reply.OfType(StreamEventType::Frame);
    REQUIRE(frames.size() == 5);
    int progress = 0;
    for (const auto& event : frames) {
        auto frame = DecodeStream(event).Value();
        if (frame.kind == FrameKind::Notification) {
            CHECK(frame.payload["progressToken"] == "tok-7");
            ++progress;
        } else {
            CHECK(frame.id == "c-1");
        }
    }
    CHECK(progress == 2);
    CHECK(TextOf(frames.back()) == "chunk 3");
    CHECK(reply.events.back().type == StreamEventType::End);
}

TEST_CASE("BridgeServer: unknown backend is 404", "[server][errors]") {
    LocalBridge bridge({EchoBackend("pricing")});

    auto reply = PostInvoke(bridge.Port(), "bcm", R"({"ping":true})");
    CHECK(reply.status == 404);
    auto error = ErrorBody(reply.body);
    CHECK(error["category"] == "backend_unavailable");
    CHECK(error["backend"] == "bcm");
}

TEST_CASE("BridgeServer: malformed bodies are 400", "[server][errors]") {
    LocalBridge bridge({EchoBackend("pricing")});

    auto not_json = PostInvoke(bridge.Port(), "pricing", "{not json");
    CHECK(not_json.status == 400);
    CHECK(ErrorBody(not_json.body)["category"] == "invalid_request");

    auto wrong_shape = PostInvoke(bridge.Port(), "pricing", R"({"tool":42})");
    CHECK(wrong_shape.status == 400);

    // Nothing was started for a rejected request.
    CHECK(bridge.Supervisor().Status("pricing").Value().generation == 0);
}

TEST_CASE("BridgeServer: launch failure is 502 with stderr detail", "[server][errors]") {
    LocalBridge bridge({EchoBackend("broken", {"--exit-code", "1"})});

    auto reply = PostInvoke(bridge.Port(), "broken", R"({"ping":true})");
    CHECK(reply.status == 502);
    auto error = ErrorBody(reply.body);
    CHECK(error["category"] == "launch_error");
    CHECK(error["detail"].get<std::string>().find("exiting with code 1") != std::string::npos);
}

TEST_CASE("BridgeServer: backend crash mid-call ends in an error event", "[server][errors]") {
    LocalBridge bridge({EchoBackend("pricing")});

    auto reply = PostInvoke(bridge.Port(), "pricing",
                            R"({"tool":"crash","params":{"code":3,"partial":true}})");
    REQUIRE(reply.status == 200);
    REQUIRE(reply.events.size() == 3);
    CHECK(reply.events[0].type == StreamEventType::Frame);
    CHECK(TextOf(reply.events[0]) == "about to crash");
    REQUIRE(reply.events[1].type == StreamEventType::Error);
    auto error = DecodeStreamError(reply.events[1]);
    CHECK(error.category == ErrorCategory::BackendDisconnected);
    CHECK(error.message.find("exit code 3") != std::string::npos);
    CHECK(reply.events[2].type == StreamEventType::End);

    // The supervisor brings the backend back for the next call.
    auto again = PostInvoke(bridge.Port(), "pricing", R"({"ping":true})");
    CHECK(again.status == 200);
    CHECK(again.OfType(StreamEventType::Error).empty());
}

TEST_CASE("BridgeServer: concurrent calls on one backend stay separate", "[server]") {
    LocalBridge bridge({EchoBackend("pricing")});
    constexpr int kClients = 6;

    std::vector<std::string> texts(kClients);
    std::vector<std::thread> clients;
    for (int i = 0; i < kClients; ++i) {
        clients.emplace_back([&, i] {
            httplib::Client cli("127.0.0.1", bridge.Port());
            json body = {{"method", "tools/call"},
                         {"id", 1},
                         {"params", {{"name", "slow"}, {"arguments", {{"ms", 50 * (kClients - i)}}}}}};
            auto res = cli.Post("/mcp/pricing/invoke", body.dump(), "application/json");
            if (!res || res->status != 200) return;
            StreamDecoder decoder;
            for (auto& event : decoder.Feed(res->body)) {
                if (event.IsOk() && event.Value().type == StreamEventType::Frame) {
                    auto frame = DecodeStream(event.Value());
                    if (frame.IsOk()) {
                        texts[i] = frame.Value().payload["content"][0]["text"].get<std::string>();
                    }
                }
            }
        });
    }
    for (auto& client : clients) {
        client.join();
    }

    for (int i = 0; i < kClients; ++i) {
        CHECK(texts[i] == "slept " + std::to_string(50 * (kClients - i)) + " ms");
    }
}

// ===========================================================================
// Sessions
// ===========================================================================

TEST_CASE("BridgeServer: kept session is reused and closed", "[server][session]") {
    LocalBridge bridge({EchoBackend("pricing")});

    auto first = PostInvoke(bridge.Port(), "pricing", R"({"ping":true})", {},
                            "?keep_session=true");
    REQUIRE(first.status == 200);
    const auto session = first.session;
    CHECK(bridge.Service().Multiplexer().SessionCount() == 1);

    auto second = PostInvoke(bridge.Port(), "pricing", R"({"list_tools":true})",
                             {{kSessionHeader, session}});
    REQUIRE(second.status == 200);
    CHECK(second.session == session);
    CHECK(second.events.back().data["request_id"] == session + ".2");

    httplib::Client cli("127.0.0.1", bridge.Port());
    auto closed = cli.Delete("/mcp/sessions/" + session);
    REQUIRE(closed);
    CHECK(closed->status == 204);
    CHECK(bridge.Service().Multiplexer().SessionCount() == 0);

    auto again = cli.Delete("/mcp/sessions/" + session);
    REQUIRE(again);
    CHECK(again->status == 404);

    auto stale = PostInvoke(bridge.Port(), "pricing", R"({"ping":true})",
                            {{kSessionHeader, session}});
    CHECK(stale.status == 404);
    CHECK(ErrorBody(stale.body)["category"] == "session_not_found");
}

TEST_CASE("BridgeServer: session of another backend is rejected", "[server][session]") {
    LocalBridge bridge({EchoBackend("pricing"), EchoBackend("ce")});

    auto first = PostInvoke(bridge.Port(), "pricing", R"({"ping":true})", {},
                            "?keep_session=true");
    REQUIRE(first.status == 200);

    auto cross = PostInvoke(bridge.Port(), "ce", R"({"ping":true})",
                            {{kSessionHeader, first.session}});
    CHECK(cross.status == 400);
}

// ===========================================================================
// GET /health
// ===========================================================================

TEST_CASE("BridgeServer: health probes every backend", "[server][health]") {
    LocalBridge bridge({EchoBackend("pricing"), EchoBackend("ce")});
    httplib::Client cli("127.0.0.1", bridge.Port());

    auto res = cli.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = json::parse(res->body);
    CHECK(body["status"] == "ok");
    CHECK(body.contains("version"));
    CHECK(body["sessions"] == 0);
    CHECK(body["backends"]["pricing"]["reachable"] == true);
    CHECK(body["backends"]["pricing"]["state"] == "Ready");
    CHECK(body["backends"]["ce"].contains("latency_ms"));
}

TEST_CASE("BridgeServer: health without probe does not start backends", "[server][health]") {
    LocalBridge bridge({EchoBackend("pricing")});
    httplib::Client cli("127.0.0.1", bridge.Port());

    auto res = cli.Get("/health?probe=false");
    REQUIRE(res);
    auto body = json::parse(res->body);
    CHECK(body["status"] == "degraded");
    CHECK(body["backends"]["pricing"]["state"] == "Exited");
    CHECK(body["backends"]["pricing"]["reachable"] == false);
    CHECK(bridge.Supervisor().Status("pricing").Value().generation == 0);
}

TEST_CASE("BridgeServer: per-backend health codes", "[server][health]") {
    LocalBridge bridge({EchoBackend("pricing"), EchoBackend("broken", {"--exit-code", "2"})});
    httplib::Client cli("127.0.0.1", bridge.Port());

    auto ok = cli.Get("/health/pricing");
    REQUIRE(ok);
    CHECK(ok->status == 200);
    CHECK(json::parse(ok->body)["name"] == "pricing");

    auto broken = cli.Get("/health/broken");
    REQUIRE(broken);
    CHECK(broken->status == 503);
    auto body = json::parse(broken->body);
    CHECK(body["reachable"] == false);
    CHECK(body["probe_error"]["category"] == "launch_error");

    auto unknown = cli.Get("/health/nope");
    REQUIRE(unknown);
    CHECK(unknown->status == 404);
}
