#pragma once

#include <mcp_bridge/echo/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_bridge::echo {

// ---------------------------------------------------------------------------
// EchoServer: reference stdio backend speaking MCP 2024-11-05 JSON-RPC.
//
// Methods: initialize, ping, tools/list, tools/call. Notifications and
// replies to our own requests get no response.
// ---------------------------------------------------------------------------
class EchoServer {
public:
    explicit EchoServer(ToolRegistry registry,
                        std::string name = "mcp-bridge-echo",
                        std::istream& in = std::cin,
                        std::ostream& out = std::cout,
                        std::ostream& err = std::cerr);

    // Serve until EOF on the input or until a tool asks to exit.
    // Returns the process exit code.
    int Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Tools may write intermediate lines to the output before it returns.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] std::optional<int> ExitRequested() const noexcept { return exit_code_; }
    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    std::optional<nlohmann::json> HandleToolsCall(const nlohmann::json& params,
                                                  const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);

    static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                    const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    std::string name_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    bool initialized_ = false;
    std::optional<int> exit_code_;
};

} // namespace mcp_bridge::echo
