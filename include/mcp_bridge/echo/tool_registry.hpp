#pragma once

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_bridge::echo {

// ---------------------------------------------------------------------------
// ToolSchema: JSON Schema for a tool's input parameters.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
};

struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
};

// ---------------------------------------------------------------------------
// ToolContext: what a running tool may do besides returning its result:
// write intermediate lines for the current request, write to stderr, or
// ask the server to exit without answering.
// ---------------------------------------------------------------------------
class ToolContext {
public:
    ToolContext(std::ostream& out, std::ostream& err, nlohmann::json request_id,
                nlohmann::json progress_token = nullptr);

    // {"id": <request>, "result": ..., "partial": true}
    void EmitPartial(const nlohmann::json& result);

    // notifications/progress for the request's progressToken, if it has one.
    void EmitProgress(double progress, double total);

    // A line written verbatim, e.g. one that is not JSON.
    void EmitRaw(const std::string& line);

    void LogStderr(const std::string& line);

    void RequestExit(int code) { exit_code_ = code; }
    [[nodiscard]] std::optional<int> ExitCode() const noexcept { return exit_code_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    nlohmann::json request_id_;
    nlohmann::json progress_token_;
    std::optional<int> exit_code_;
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& params, ToolContext& context)>;

// ---------------------------------------------------------------------------
// ToolRegistry: registry of the tools an echo server exposes.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& params,
                                     ToolContext& context) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

// Text content block list with a single entry.
nlohmann::json TextContent(const std::string& text);

// echo, chunks, slow, garbage, crash, stderr.
void RegisterEchoTools(ToolRegistry& registry);

} // namespace mcp_bridge::echo
