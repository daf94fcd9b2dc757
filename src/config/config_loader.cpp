#include <mcp_bridge/config/config_loader.hpp>

#include <mcp_bridge/core/command_line.hpp>
#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/types.hpp>
#include <mcp_bridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>

namespace mcp_bridge {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make(ErrorCategory::Config, "ConfigLoader", "", message);
}

Result<BackendDescriptor, Error> ParseYamlBackend(const YAML::Node& node) {
    using R = Result<BackendDescriptor, Error>;

    if (!node["name"]) {
        return R::Err(MakeConfigError("Backend entry missing 'name' field"));
    }
    if (!node["command"]) {
        return R::Err(MakeConfigError("Backend '" + node["name"].as<std::string>() +
                                      "' missing 'command' field"));
    }

    BackendDescriptor backend;
    backend.name = node["name"].as<std::string>();

    auto command = node["command"].as<std::string>();
    if (node["args"]) {
        // Explicit argument list: the command is taken verbatim.
        backend.command = command;
        for (const auto& arg : node["args"]) {
            backend.args.push_back(arg.as<std::string>());
        }
    } else {
        auto words = SplitCommandLine(command);
        if (words.IsErr()) {
            return R::Err(MakeConfigError("Backend '" + backend.name +
                                          "': " + words.Error()));
        }
        auto list = std::move(words).Value();
        if (list.empty()) {
            return R::Err(MakeConfigError("Backend '" + backend.name +
                                          "' has an empty command"));
        }
        backend.command = list.front();
        backend.args.assign(list.begin() + 1, list.end());
    }

    if (node["cwd"]) {
        backend.working_directory = node["cwd"].as<std::string>();
    }
    if (node["env"]) {
        for (const auto& entry : node["env"]) {
            backend.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
    if (node["handshake"]) {
        backend.handshake = node["handshake"].as<bool>();
    }
    return R::Ok(std::move(backend));
}

Result<BridgeConfig, Error> ParseRoot(const YAML::Node& root) {
    using R = Result<BridgeConfig, Error>;
    BridgeConfig config;

    // -- Server --
    if (const auto server = root["server"]) {
        if (server["host"]) config.server.host = server["host"].as<std::string>();
        if (server["port"]) config.server.port = server["port"].as<uint16_t>();
        if (server["worker_threads"]) {
            config.server.worker_threads = server["worker_threads"].as<int>();
        }
    }

    // -- Supervisor --
    if (const auto sup = root["supervisor"]) {
        if (sup["max_restarts"]) {
            config.supervisor.max_restarts = sup["max_restarts"].as<int>();
        }
        if (sup["restart_window_s"]) {
            config.supervisor.restart_window =
                std::chrono::seconds(sup["restart_window_s"].as<int>());
        }
        if (sup["shutdown_grace_ms"]) {
            config.supervisor.shutdown_grace =
                std::chrono::milliseconds(sup["shutdown_grace_ms"].as<int>());
        }
        if (sup["startup_timeout_ms"]) {
            config.supervisor.startup_timeout =
                std::chrono::milliseconds(sup["startup_timeout_ms"].as<int>());
        }
        if (sup["max_line_bytes"]) {
            config.supervisor.max_line_bytes = sup["max_line_bytes"].as<size_t>();
        }
        if (sup["eager_start"]) {
            config.supervisor.eager_start = sup["eager_start"].as<bool>();
        }
    }

    // -- Sessions --
    if (const auto session = root["session"]) {
        if (session["keepalive_interval_ms"]) {
            config.session.keepalive_interval =
                std::chrono::milliseconds(session["keepalive_interval_ms"].as<int>());
        }
        if (session["idle_timeout_s"]) {
            config.session.idle_timeout =
                std::chrono::seconds(session["idle_timeout_s"].as<int>());
        }
        if (session["call_timeout_s"]) {
            config.session.call_timeout =
                std::chrono::seconds(session["call_timeout_s"].as<int>());
        }
        if (session["probe_timeout_ms"]) {
            config.session.probe_timeout =
                std::chrono::milliseconds(session["probe_timeout_ms"].as<int>());
        }
    }

    // -- Logging --
    if (const auto log = root["log"]) {
        if (log["level"]) config.log.level = log["level"].as<std::string>();
        if (log["json"]) config.log.json = log["json"].as<bool>();
        if (log["file"]) config.log.file = log["file"].as<std::string>();
    }

    // -- Backends --
    if (root["backends"]) {
        for (const auto& node : root["backends"]) {
            auto backend = ParseYamlBackend(node);
            if (backend.IsErr()) {
                return R::Err(std::move(backend).Error());
            }
            config.backends.push_back(std::move(backend).Value());
        }
    } else {
        config.backends = DefaultBackends(DefaultRegion());
    }

    return R::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml / ParseYamlConfig
// ---------------------------------------------------------------------------
Result<BridgeConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        return ParseRoot(YAML::LoadFile(std::string(file_path)));
    } catch (const YAML::Exception& e) {
        return Result<BridgeConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
}

Result<BridgeConfig, Error> ParseYamlConfig(std::string_view yaml_text) {
    try {
        return ParseRoot(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        return Result<BridgeConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-bridge serve", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--host")
        .help("Listen address");
    program.add_argument("--port")
        .help("Listen port")
        .scan<'i', int>();
    program.add_argument("--keepalive-ms")
        .help("Interval between keep-alive events on a waiting stream")
        .scan<'i', int>();
    program.add_argument("--call-timeout")
        .help("Seconds to wait for a backend response")
        .scan<'i', int>();
    program.add_argument("--idle-timeout")
        .help("Seconds before an idle session is closed")
        .scan<'i', int>();
    program.add_argument("--eager-start")
        .help("Start every backend at startup")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--json-log")
        .help("Log JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("-v", "--verbose")
        .help("Shorthand for --log-level info")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;
    auto& config = options.config;

    if (auto val = program.present("--config")) {
        options.config_path = *val;
    }
    if (auto val = program.present("--host")) {
        config.server.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val <= 0 || *val > 65535) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --port: " + std::to_string(*val)));
        }
        config.server.port = static_cast<uint16_t>(*val);
    }
    if (auto val = program.present<int>("--keepalive-ms")) {
        config.session.keepalive_interval = std::chrono::milliseconds(*val);
    }
    if (auto val = program.present<int>("--call-timeout")) {
        config.session.call_timeout = std::chrono::seconds(*val);
    }
    if (auto val = program.present<int>("--idle-timeout")) {
        config.session.idle_timeout = std::chrono::seconds(*val);
    }
    if (program.get<bool>("--eager-start")) {
        config.supervisor.eager_start = true;
    }
    if (program.get<bool>("--verbose")) {
        config.log.level = "info";
    }
    if (auto val = program.present("--log-level")) {
        config.log.level = *val;
    }
    if (program.get<bool>("--json-log")) {
        config.log.json = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log.file = *val;
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
BridgeConfig MergeConfigs(const BridgeConfig& yaml_base, const BridgeConfig& cli_overrides) {
    const BridgeConfig defaults;
    BridgeConfig merged = yaml_base;

    if (cli_overrides.server.host != defaults.server.host) {
        merged.server.host = cli_overrides.server.host;
    }
    if (cli_overrides.server.port != defaults.server.port) {
        merged.server.port = cli_overrides.server.port;
    }
    if (cli_overrides.session.keepalive_interval != defaults.session.keepalive_interval) {
        merged.session.keepalive_interval = cli_overrides.session.keepalive_interval;
    }
    if (cli_overrides.session.call_timeout != defaults.session.call_timeout) {
        merged.session.call_timeout = cli_overrides.session.call_timeout;
    }
    if (cli_overrides.session.idle_timeout != defaults.session.idle_timeout) {
        merged.session.idle_timeout = cli_overrides.session.idle_timeout;
    }
    if (cli_overrides.supervisor.eager_start) {
        merged.supervisor.eager_start = true;
    }
    if (cli_overrides.log.level != defaults.log.level) {
        merged.log.level = cli_overrides.log.level;
    }
    if (cli_overrides.log.json) {
        merged.log.json = true;
    }
    if (cli_overrides.log.file.has_value()) {
        merged.log.file = cli_overrides.log.file;
    }
    if (!cli_overrides.backends.empty()) {
        merged.backends = cli_overrides.backends;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ApplyEnvOverrides
// ---------------------------------------------------------------------------
Result<BridgeConfig, Error> ApplyEnvOverrides(BridgeConfig config) {
    for (auto& backend : config.backends) {
        auto name = BackendName::Create(backend.name);
        if (name.IsErr()) {
            continue;  // reported by ValidateConfig
        }
        const auto key = name.Value().CommandEnvKey();
        const char* value = std::getenv(key.c_str());
        if (value == nullptr || value[0] == '\0') {
            continue;
        }
        auto words = SplitCommandLine(value);
        if (words.IsErr()) {
            return Result<BridgeConfig, Error>::Err(
                MakeConfigError(key + ": " + words.Error()));
        }
        auto list = std::move(words).Value();
        if (list.empty()) {
            return Result<BridgeConfig, Error>::Err(
                MakeConfigError(key + " is blank"));
        }
        backend.command = list.front();
        backend.args.assign(list.begin() + 1, list.end());
        LogInfo("config", "Backend '" + backend.name + "' command overridden by " + key +
                              ": " + JoinCommandLine(list));
    }
    return Result<BridgeConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// DefaultBackends
// ---------------------------------------------------------------------------
std::vector<BackendDescriptor> DefaultBackends(const std::string& region) {
    auto make = [&region](const std::string& name, const std::string& package) {
        BackendDescriptor backend;
        backend.name = name;
        backend.command = "uvx";
        backend.args = {package, "--stdio", "--region", region};
        return backend;
    };
    return {
        make("pricing", "awslabs.aws-pricing-mcp-server"),
        make("bcm", "awslabs.billing-cost-management-mcp-server"),
        make("ce", "awslabs.cost-explorer-mcp-server"),
    };
}

std::string DefaultRegion() {
    const char* region = std::getenv("AWS_REGION");
    if (region == nullptr || region[0] == '\0') {
        return "us-east-1";
    }
    return region;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const BridgeConfig& config) {
    if (config.server.host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.host"));
    }
    if (config.server.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.server.worker_threads <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("server.worker_threads must be positive"));
    }
    if (config.backends.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("At least one backend must be configured"));
    }

    std::set<std::string> seen;
    for (const auto& backend : config.backends) {
        auto name = BackendName::Create(backend.name);
        if (name.IsErr()) {
            return Result<void, Error>::Err(MakeConfigError(name.Error()));
        }
        if (!seen.insert(backend.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate backend name: " + backend.name));
        }
        if (backend.command.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Backend '" + backend.name + "' has an empty command"));
        }
    }

    if (config.supervisor.max_restarts < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("supervisor.max_restarts must not be negative"));
    }
    if (config.supervisor.restart_window.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("supervisor.restart_window_s must be positive"));
    }
    if (config.supervisor.startup_timeout.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("supervisor.startup_timeout_ms must be positive"));
    }
    if (config.supervisor.max_line_bytes < 1024) {
        return Result<void, Error>::Err(
            MakeConfigError("supervisor.max_line_bytes must be at least 1024"));
    }
    if (config.session.keepalive_interval.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("session.keepalive_interval_ms must be positive"));
    }
    if (config.session.call_timeout.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("session.call_timeout_s must be positive, got " +
                            std::to_string(config.session.call_timeout.count())));
    }
    if (config.session.idle_timeout.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("session.idle_timeout_s must be positive"));
    }
    if (config.session.probe_timeout.count() <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("session.probe_timeout_ms must be positive"));
    }
    if (!ParseLogLevel(config.log.level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + config.log.level));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_bridge
