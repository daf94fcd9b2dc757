#include <mcp_bridge/bridge/bridge_server.hpp>
#include <mcp_bridge/bridge/bridge_service.hpp>
#include <mcp_bridge/bridge/process_supervisor.hpp>
#include <mcp_bridge/client/bridge_client.hpp>
#include <mcp_bridge/config/config_loader.hpp>
#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage   = 2;
constexpr int kExitConfig  = 3;

using namespace mcp_bridge;

void PrintUsage(std::ostream& out) {
    out << "Usage: mcp-bridge <command> [options]\n"
           "\n"
           "Commands:\n"
           "  serve                 Run the HTTP bridge\n"
           "  invoke BACKEND        Call a backend through a running bridge\n"
           "  health [BACKEND]      Show backend health of a running bridge\n"
           "\n"
           "Run 'mcp-bridge <command> --help' for the options of a command.\n";
}

void PrintError(const Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

std::unique_ptr<ILogSink> MakeSink(const LogConfig& log) {
    if (log.file.has_value()) {
        auto sink = std::make_unique<FileSink>(*log.file, log.json);
        if (sink->IsOpen()) {
            return sink;
        }
        std::cerr << "Warning: cannot open log file " << *log.file << ", logging to stderr\n";
    }
    if (log.json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(StderrWantsColor());
}

// Client commands log to stderr at warn, or info with -v.
void InitClientLogging(bool verbose) {
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(StderrWantsColor()),
                     verbose ? LogLevel::Info : LogLevel::Warn);
}

std::string DefaultBaseUrl() {
    const char* base = std::getenv("MCP_BASE");
    return (base != nullptr && base[0] != '\0') ? base : "http://127.0.0.1:8080";
}

// ---------------------------------------------------------------------------
// serve
// ---------------------------------------------------------------------------
Result<BridgeConfig, Error> ResolveServeConfig(int argc, const char* const* argv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Result<BridgeConfig, Error>::Err(std::move(cli).Error());
    }
    auto options = std::move(cli).Value();

    BridgeConfig base;
    if (options.config_path.has_value()) {
        auto yaml = LoadFromYaml(*options.config_path);
        if (yaml.IsErr()) {
            return Result<BridgeConfig, Error>::Err(std::move(yaml).Error());
        }
        base = std::move(yaml).Value();
    } else {
        base.backends = DefaultBackends(DefaultRegion());
    }

    auto config = ApplyEnvOverrides(MergeConfigs(base, options.config));
    if (config.IsErr()) {
        return config;
    }
    auto valid = ValidateConfig(config.Value());
    if (valid.IsErr()) {
        return Result<BridgeConfig, Error>::Err(std::move(valid).Error());
    }
    return config;
}

int HandleServe(int argc, const char* const* argv) {
    auto resolved = ResolveServeConfig(argc, argv);
    if (resolved.IsErr()) {
        PrintError(resolved.Error());
        return kExitConfig;
    }
    const auto config = std::move(resolved).Value();

    InitGlobalLogger(MakeSink(config.log),
                     ParseLogLevel(config.log.level).value_or(LogLevel::Warn));

    // SIGINT/SIGTERM are taken by a dedicated thread; every other thread,
    // including the I/O threads of the backends, inherits the blocked mask.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    ProcessSupervisor supervisor(config.backends, config.supervisor);
    BridgeService service(supervisor, config.session);
    BridgeServer server(service, supervisor, config.server);

    std::atomic<bool> serving{true};
    std::thread signal_thread([&] {
        int sig = 0;
        sigwait(&stop_signals, &sig);
        if (serving.load()) {
            LogInfo("main", std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") +
                                ", shutting down");
        }
        // Listen() returns only once every open stream has ended.
        service.Shutdown();
        server.Stop();
    });

    if (config.supervisor.eager_start) {
        supervisor.StartAll();
    }

    std::string names;
    for (const auto& backend : config.backends) {
        names += (names.empty() ? "" : ", ") + backend.name;
    }
    LogInfo("main", std::string("mcp-bridge ") + kVersion + " serving backends: " + names);

    auto listened = server.Listen();
    serving = false;
    kill(getpid(), SIGTERM);  // releases the signal thread if it is still waiting
    signal_thread.join();

    supervisor.Shutdown();

    if (listened.IsErr()) {
        PrintError(listened.Error());
        return kExitFailure;
    }
    return kExitSuccess;
}

// ---------------------------------------------------------------------------
// invoke
// ---------------------------------------------------------------------------
int HandleInvoke(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-bridge invoke", kVersion);
    program.add_argument("backend")
        .help("Backend name");
    program.add_argument("--url")
        .help("Bridge base URL (default $MCP_BASE or http://127.0.0.1:8080)")
        .default_value(DefaultBaseUrl());
    program.add_argument("--tool")
        .help("Tool to call");
    program.add_argument("--params")
        .help("Tool arguments or method params as JSON")
        .default_value(std::string("{}"));
    program.add_argument("--method")
        .help("Send a raw JSON-RPC method instead of a tool call");
    program.add_argument("--list-tools")
        .help("List the backend's tools")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--ping")
        .help("Health probe")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--session")
        .help("Reuse an existing session");
    program.add_argument("--keep-session")
        .help("Keep the new session open and print its id")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--events")
        .help("Print every stream event, keepalives included")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose logging")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << program;
        return kExitUsage;
    }
    InitClientLogging(program.get<bool>("--verbose"));

    auto params = nlohmann::json::parse(program.get<std::string>("--params"), nullptr, false);
    if (params.is_discarded()) {
        std::cerr << "Error: --params is not valid JSON\n";
        return kExitUsage;
    }

    nlohmann::json payload;
    if (program.get<bool>("--ping")) {
        payload = {{"ping", true}};
    } else if (program.get<bool>("--list-tools")) {
        payload = {{"list_tools", true}};
    } else if (auto tool = program.present("--tool")) {
        payload = {{"tool", *tool}, {"params", params}};
    } else if (auto method = program.present("--method")) {
        payload = {{"method", *method}, {"params", params}, {"id", 1}};
    } else {
        std::cerr << "Error: one of --tool, --method, --list-tools or --ping is required\n";
        return kExitUsage;
    }

    InvokeRequest request;
    request.backend = program.get<std::string>("backend");
    request.payload = std::move(payload);
    request.session_id = program.present("--session");
    request.keep_session = program.get<bool>("--keep-session");

    const bool all_events = program.get<bool>("--events");
    BridgeClientOptions options;
    options.base_url = program.get<std::string>("--url");
    BridgeClient client(options);

    auto outcome = client.Invoke(request, [all_events](const StreamEvent& event) {
        if (event.type == StreamEventType::Frame || all_events) {
            std::cout << (all_events ? std::string(StreamEventName(event.type)) + " " : "")
                      << event.data.dump() << std::endl;
        }
        return true;
    });
    if (outcome.IsErr()) {
        PrintError(outcome.Error());
        return kExitFailure;
    }

    const auto& result = outcome.Value();
    if (request.keep_session && !result.session_id.empty()) {
        std::cerr << "session: " << result.session_id << "\n";
    }
    for (const auto& error : result.errors) {
        PrintError(error);
    }
    const Frame* last = result.Last();
    const bool failed = !result.errors.empty() || last == nullptr ||
                        last->kind == FrameKind::Error;
    return failed ? kExitFailure : kExitSuccess;
}

// ---------------------------------------------------------------------------
// health
// ---------------------------------------------------------------------------
int HandleHealth(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-bridge health", kVersion);
    program.add_argument("backend")
        .help("Only this backend")
        .nargs(argparse::nargs_pattern::optional);
    program.add_argument("--url")
        .help("Bridge base URL (default $MCP_BASE or http://127.0.0.1:8080)")
        .default_value(DefaultBaseUrl());
    program.add_argument("--no-probe")
        .help("Report states without pinging the backends")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose logging")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << program;
        return kExitUsage;
    }
    InitClientLogging(program.get<bool>("--verbose"));

    BridgeClientOptions options;
    options.base_url = program.get<std::string>("--url");
    BridgeClient client(options);

    auto health = client.Health(program.present("backend"), !program.get<bool>("--no-probe"));
    if (health.IsErr()) {
        PrintError(health.Error());
        return kExitFailure;
    }

    const auto& body = health.Value();
    std::cout << body.dump(2) << "\n";
    const bool healthy = body.contains("status") ? body["status"] == "ok"
                                                 : body.value("reachable", false);
    return healthy ? kExitSuccess : kExitFailure;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    std::signal(SIGPIPE, SIG_IGN);

    if (argc < 2) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    const std::string_view command{argv[1]};
    if (command == "--version") {
        std::cout << "mcp-bridge " << kVersion << "\n";
        return kExitSuccess;
    }
    if (command == "--help" || command == "-h") {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    // Subcommand parsers see the subcommand as their program name.
    if (command == "serve") {
        return HandleServe(argc - 1, argv + 1);
    }
    if (command == "invoke") {
        return HandleInvoke(argc - 1, argv + 1);
    }
    if (command == "health") {
        return HandleHealth(argc - 1, argv + 1);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    PrintUsage(std::cerr);
    return kExitUsage;
}
