#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// BackendDescriptor: how to launch one stdio tool server. Immutable after
// load; the supervisor keeps one per configured backend.
// ---------------------------------------------------------------------------
struct BackendDescriptor {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> env;  // merged over the parent env
    bool handshake = true;                   // MCP initialize after spawn

    bool operator==(const BackendDescriptor& other) const {
        return name == other.name && command == other.command &&
               args == other.args &&
               working_directory == other.working_directory &&
               env == other.env && handshake == other.handshake;
    }
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    int worker_threads = 16;
};

struct SupervisorConfig {
    int max_restarts = 3;
    std::chrono::seconds restart_window{60};
    std::chrono::milliseconds shutdown_grace{3000};
    std::chrono::milliseconds startup_timeout{30000};
    size_t max_line_bytes = 8u * 1024u * 1024u;
    bool eager_start = false;
};

struct SessionConfig {
    std::chrono::milliseconds keepalive_interval{15000};
    std::chrono::seconds idle_timeout{300};
    std::chrono::seconds call_timeout{120};
    std::chrono::milliseconds probe_timeout{10000};
};

struct LogConfig {
    std::string level = "warn";
    bool json = false;
    std::optional<std::string> file;
};

struct BridgeConfig {
    ServerConfig server;
    SupervisorConfig supervisor;
    SessionConfig session;
    LogConfig log;
    std::vector<BackendDescriptor> backends;
};

} // namespace mcp_bridge
