#include <mcp_bridge/echo/tool_registry.hpp>

namespace mcp_bridge::echo {

ToolContext::ToolContext(std::ostream& out, std::ostream& err, nlohmann::json request_id,
                         nlohmann::json progress_token)
    : out_(out),
      err_(err),
      request_id_(std::move(request_id)),
      progress_token_(std::move(progress_token)) {}

void ToolContext::EmitPartial(const nlohmann::json& result) {
    nlohmann::json line = {
        {"jsonrpc", "2.0"},
        {"id", request_id_},
        {"result", result},
        {"partial", true},
    };
    out_ << line.dump() << "\n";
    out_.flush();
}

void ToolContext::EmitProgress(double progress, double total) {
    if (progress_token_.is_null()) {
        return;
    }
    nlohmann::json line = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/progress"},
        {"params", {{"progressToken", progress_token_},
                    {"progress", progress},
                    {"total", total}}},
    };
    out_ << line.dump() << "\n";
    out_.flush();
}

void ToolContext::EmitRaw(const std::string& line) {
    out_ << line << "\n";
    out_.flush();
}

void ToolContext::LogStderr(const std::string& line) {
    err_ << line << "\n";
    err_.flush();
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params,
                                 ToolContext& context) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult{true, TextContent("Unknown tool: " + name)};
    }

    try {
        return it->second(params, context);
    } catch (const std::exception& e) {
        return ToolResult{true, TextContent(std::string("Tool error: ") + e.what())};
    }
}

nlohmann::json TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

} // namespace mcp_bridge::echo
