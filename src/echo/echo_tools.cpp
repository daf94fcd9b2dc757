#include <mcp_bridge/echo/tool_registry.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

namespace mcp_bridge::echo {

namespace {

std::string TextArgument(const nlohmann::json& params) {
    auto it = params.find("text");
    if (it != params.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return params.dump();
}

int IntArgument(const nlohmann::json& params, const char* key, int fallback) {
    auto it = params.find(key);
    if (it != params.end() && it->is_number_integer()) {
        return it->get<int>();
    }
    return fallback;
}

nlohmann::json ObjectSchema(nlohmann::json properties) {
    return {{"type", "object"}, {"properties", std::move(properties)}};
}

} // anonymous namespace

void RegisterEchoTools(ToolRegistry& registry) {
    registry.Register(
        "echo", "Return the arguments (or their \"text\") unchanged.",
        ObjectSchema({{"text", {{"type", "string"}}}}),
        [](const nlohmann::json& params, ToolContext&) {
            return ToolResult{false, TextContent(TextArgument(params))};
        });

    registry.Register(
        "chunks", "Answer in \"count\" chunks; all but the last are partial.",
        ObjectSchema({{"count", {{"type", "integer"}, {"minimum", 1}}},
                      {"delay_ms", {{"type", "integer"}, {"minimum", 0}}}}),
        [](const nlohmann::json& params, ToolContext& context) {
            const int count = std::max(1, IntArgument(params, "count", 3));
            const int delay_ms = std::max(0, IntArgument(params, "delay_ms", 0));
            for (int i = 1; i < count; ++i) {
                context.EmitProgress(i, count);
                context.EmitPartial({{"content", TextContent("chunk " + std::to_string(i))}});
                if (delay_ms > 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
                }
            }
            return ToolResult{false, TextContent("chunk " + std::to_string(count))};
        });

    registry.Register(
        "slow", "Sleep for \"ms\" milliseconds, then echo.",
        ObjectSchema({{"ms", {{"type", "integer"}, {"minimum", 0}}}}),
        [](const nlohmann::json& params, ToolContext&) {
            const int ms = std::max(0, IntArgument(params, "ms", 1000));
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            return ToolResult{false, TextContent("slept " + std::to_string(ms) + " ms")};
        });

    registry.Register(
        "garbage", "Write a line that is not JSON, then answer normally.",
        ObjectSchema(nlohmann::json::object()),
        [](const nlohmann::json&, ToolContext& context) {
            context.EmitRaw("this is {not json");
            return ToolResult{false, TextContent("after garbage")};
        });

    registry.Register(
        "crash", "Exit with \"code\" (default 3) without answering.",
        ObjectSchema({{"code", {{"type", "integer"}}},
                      {"partial", {{"type", "boolean"}}}}),
        [](const nlohmann::json& params, ToolContext& context) {
            if (params.value("partial", false)) {
                context.EmitPartial({{"content", TextContent("about to crash")}});
            }
            context.LogStderr("echo: crashing on request");
            context.RequestExit(IntArgument(params, "code", 3));
            return ToolResult{true, TextContent("unreachable")};
        });

    registry.Register(
        "stderr", "Write \"text\" to stderr, then echo it.",
        ObjectSchema({{"text", {{"type", "string"}}}}),
        [](const nlohmann::json& params, ToolContext& context) {
            const auto text = TextArgument(params);
            context.LogStderr(text);
            return ToolResult{false, TextContent(text)};
        });
}

} // namespace mcp_bridge::echo
