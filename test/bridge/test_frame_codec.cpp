#include <catch2/catch_test_macros.hpp>

#include <mcp_bridge/bridge/frame_codec.hpp>

#include <string>
#include <vector>

using namespace mcp_bridge;
using nlohmann::json;

// ===========================================================================
// Pipe transport
// ===========================================================================

TEST_CASE("EncodePipe: one line, newline terminated", "[codec][pipe]") {
    auto frame = Frame::Response(1, {{"text", "line one\nline two"}});
    auto line = EncodePipe(frame);
    REQUIRE_FALSE(line.empty());
    CHECK(line.back() == '\n');
    CHECK(line.find('\n') == line.size() - 1);

    auto decoded = DecodeLine(std::string_view(line).substr(0, line.size() - 1));
    REQUIRE(decoded.IsOk());
    CHECK(decoded.Value() == frame);
}

TEST_CASE("DecodeLine: malformed JSON is a decode error", "[codec][pipe]") {
    auto r = DecodeLine("this is {not json");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::DecodeError);
    CHECK(r.Error().message.find("this is {not json") != std::string::npos);
}

TEST_CASE("PipeDecoder: frames split across chunks", "[codec][pipe]") {
    PipeDecoder decoder;
    auto first = decoder.Feed(R"({"id":1,"res)");
    CHECK(first.empty());
    CHECK(decoder.BufferedBytes() > 0);

    auto second = decoder.Feed("ult\":{}}\n{\"id\":2,\"result\":{}}\n{\"id\"");
    REQUIRE(second.size() == 2);
    CHECK(second[0].Value().id == 1);
    CHECK(second[1].Value().id == 2);

    auto third = decoder.Feed(":3,\"result\":{}}\r\n");
    REQUIRE(third.size() == 1);
    CHECK(third[0].Value().id == 3);
    CHECK(decoder.BufferedBytes() == 0);
}

TEST_CASE("PipeDecoder: a bad line does not poison its neighbours", "[codec][pipe]") {
    PipeDecoder decoder;
    auto out = decoder.Feed(
        "{\"id\":1,\"result\":{}}\n"
        "this is {not json\n"
        "\n"
        "   \n"
        "{\"id\":2,\"result\":{}}\n");
    REQUIRE(out.size() == 3);
    CHECK(out[0].IsOk());
    CHECK(out[1].IsErr());
    CHECK(out[1].Error().category == ErrorCategory::DecodeError);
    REQUIRE(out[2].IsOk());
    CHECK(out[2].Value().id == 2);
}

TEST_CASE("PipeDecoder: oversized line is dropped up to its newline", "[codec][pipe]") {
    PipeDecoder decoder(64);
    std::string big = "{\"id\":1,\"result\":\"" + std::string(200, 'x');

    auto out = decoder.Feed(big);
    REQUIRE(out.size() == 1);
    CHECK(out[0].IsErr());

    // The rest of the long line is swallowed; the next line decodes.
    out = decoder.Feed(std::string(50, 'x') + "\"}\n{\"id\":2,\"result\":{}}\n");
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].IsOk());
    CHECK(out[0].Value().id == 2);
}

TEST_CASE("PipeDecoder: Finish decodes an unterminated last line", "[codec][pipe]") {
    PipeDecoder decoder;
    CHECK(decoder.Feed(R"({"id":9,"result":{}})").empty());
    auto out = decoder.Finish();
    REQUIRE(out.size() == 1);
    CHECK(out[0].Value().id == 9);
    CHECK(decoder.Finish().empty());
}

// ===========================================================================
// Streaming transport
// ===========================================================================

TEST_CASE("EncodeStream: SSE event layout", "[codec][stream]") {
    auto text = EncodeStream(StreamEvent::ForFrame(Frame::Response(1, {{"ok", true}})));
    CHECK(text.rfind("event: frame\ndata: {", 0) == 0);
    CHECK(text.size() >= 2);
    CHECK(text.substr(text.size() - 2) == "\n\n");
    CHECK(EncodeStream(StreamEvent::KeepAlive()) == "event: keepalive\ndata: {}\n\n");
}

TEST_CASE("StreamDecoder: decodes every event type", "[codec][stream]") {
    auto error = Error::Make(ErrorCategory::BackendDisconnected, "Route", "pricing",
                             "Backend disconnected", "tail");
    std::string wire = EncodeStream(StreamEvent::ForFrame(Frame::Response(1, {{"n", 1}}, true))) +
                       EncodeStream(StreamEvent::KeepAlive()) +
                       EncodeStream(StreamEvent::ForError(error)) +
                       EncodeStream(StreamEvent::End({{"frames", 1}}));

    StreamDecoder decoder;
    auto events = decoder.Feed(wire);
    REQUIRE(events.size() == 4);
    CHECK(events[0].Value().type == StreamEventType::Frame);
    CHECK(events[1].Value().type == StreamEventType::KeepAlive);
    CHECK(events[2].Value().type == StreamEventType::Error);
    CHECK(events[3].Value().type == StreamEventType::End);
    CHECK(events[3].Value().data["frames"] == 1);

    auto frame = DecodeStream(events[0].Value());
    REQUIRE(frame.IsOk());
    CHECK(frame.Value().partial);

    auto decoded_error = DecodeStreamError(events[2].Value());
    CHECK(decoded_error == error);
}

TEST_CASE("StreamDecoder: byte-at-a-time delivery", "[codec][stream]") {
    std::string wire = EncodeStream(StreamEvent::ForFrame(Frame::Response("x", {{"a", "b"}})));
    StreamDecoder decoder;
    std::vector<Result<StreamEvent, Error>> events;
    for (char c : wire) {
        for (auto& event : decoder.Feed(std::string(1, c))) {
            events.push_back(std::move(event));
        }
    }
    REQUIRE(events.size() == 1);
    CHECK(DecodeStream(events[0].Value()).Value().id == "x");
}

TEST_CASE("StreamDecoder: comments, CRLF and unnamed events", "[codec][stream]") {
    StreamDecoder decoder;
    auto events = decoder.Feed(": ping\r\n\r\ndata: {\"id\":1,\"result\":{}}\r\n\r\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].Value().type == StreamEventType::Frame);
}

TEST_CASE("StreamDecoder: multi-line data is joined", "[codec][stream]") {
    StreamDecoder decoder;
    auto events = decoder.Feed("event: end\ndata: {\"frames\":\ndata: 2}\n\n");
    REQUIRE(events.size() == 1);
    CHECK(events[0].Value().data["frames"] == 2);
}

TEST_CASE("StreamDecoder: bad events are errors, decoding continues", "[codec][stream]") {
    StreamDecoder decoder;
    auto events = decoder.Feed("event: bogus\ndata: {}\n\n"
                               "event: frame\ndata: {broken\n\n"
                               "event: keepalive\ndata: {}\n\n");
    REQUIRE(events.size() == 3);
    CHECK(events[0].IsErr());
    CHECK(events[1].IsErr());
    CHECK(events[2].IsOk());
}

TEST_CASE("DecodeStream: refuses non-frame events", "[codec][stream]") {
    CHECK(DecodeStream(StreamEvent::KeepAlive()).IsErr());
    auto unreadable = DecodeStreamError(StreamEvent{StreamEventType::Error, json::object()});
    CHECK(unreadable.category == ErrorCategory::Internal);
}
