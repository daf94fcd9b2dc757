#include <mcp_bridge/echo/echo_server.hpp>

#include <mcp_bridge/core/version.hpp>

namespace mcp_bridge::echo {

EchoServer::EchoServer(ToolRegistry registry, std::string name, std::istream& in,
                       std::ostream& out, std::ostream& err)
    : registry_(std::move(registry)), name_(std::move(name)), in_(in), out_(out), err_(err) {}

int EchoServer::Run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        auto message = nlohmann::json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            out_ << MakeError(nullptr, -32700, "Parse error").dump() << "\n";
            out_.flush();
            continue;
        }

        auto response = HandleMessage(message);
        if (exit_code_.has_value()) {
            out_.flush();
            return *exit_code_;
        }
        if (response) {
            out_ << response->dump() << "\n";
            out_.flush();
        }
    }
    return 0;
}

std::optional<nlohmann::json> EchoServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.is_object() && message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Replies to requests we sent, e.g. the bridge refusing one.
    if (!message.contains("method")) {
        if (message.contains("error")) {
            err_ << "echo: request " << message.value("id", nlohmann::json()).dump()
                 << " refused: " << message["error"].dump() << "\n";
        }
        return std::nullopt;
    }

    auto method = message["method"].is_string() ? message["method"].get<std::string>()
                                                : std::string();
    auto params = message.value("params", nlohmann::json::object());

    // Notifications have no "id".
    if (!message.contains("id")) {
        return std::nullopt;
    }
    const auto& id = message["id"];

    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return MakeError(id, -32601, "Method not found: " + method);
}

nlohmann::json EchoServer::HandleInitialize(const nlohmann::json& id) {
    initialized_ = true;

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {{"tools", nlohmann::json::object()}};
    result["serverInfo"] = {{"name", name_}, {"version", kVersion}};
    return MakeResult(id, result);
}

nlohmann::json EchoServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema},
        });
    }
    return MakeResult(id, {{"tools", tools}});
}

std::optional<nlohmann::json> EchoServer::HandleToolsCall(const nlohmann::json& params,
                                                          const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, -32602, "Unknown tool: " + tool_name);
    }

    nlohmann::json progress_token;
    if (auto meta = params.find("_meta"); meta != params.end() && meta->is_object()) {
        progress_token = meta->value("progressToken", nlohmann::json());
    }

    ToolContext context(out_, err_, id, progress_token);
    auto result = registry_.Execute(tool_name, arguments, context);
    if (context.ExitCode().has_value()) {
        exit_code_ = context.ExitCode();
        return std::nullopt;
    }

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }
    return MakeResult(id, response_result);
}

nlohmann::json EchoServer::MakeError(const nlohmann::json& id, int code,
                                     const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

nlohmann::json EchoServer::MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result},
    };
}

} // namespace mcp_bridge::echo
