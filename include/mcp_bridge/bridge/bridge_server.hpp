#pragma once

#include <mcp_bridge/bridge/bridge_service.hpp>
#include <mcp_bridge/bridge/process_supervisor.hpp>
#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mcp_bridge {

// HTTP header naming the session of a call, in both directions.
inline constexpr const char* kSessionHeader = "Mcp-Session-Id";

// ---------------------------------------------------------------------------
// BridgeServer: the HTTP front door.
//
//   POST   /mcp/{backend}/invoke   SSE stream of one call
//   DELETE /mcp/sessions/{id}      close a session
//   GET    /health                 every backend (?probe=false: no ping)
//   GET    /health/{backend}       one backend
//
// Errors raised before a stream starts are JSON objects with the status of
// their category; unknown backends are 404.
// ---------------------------------------------------------------------------
class BridgeServer {
public:
    BridgeServer(BridgeService& service, ProcessSupervisor& supervisor, ServerConfig config);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    // Bind the configured address and serve until Stop(). Config error when
    // the address cannot be bound.
    Result<void, Error> Listen();

    void Stop();

    // Underlying server, for binding to an ephemeral port in tests.
    [[nodiscard]] httplib::Server& Http() noexcept { return server_; }

    // JSON health document for one backend; `probe` pings it first.
    [[nodiscard]] nlohmann::json BackendHealth(const std::string& backend, bool probe);

private:
    void RegisterRoutes();

    void HandleInvoke(const httplib::Request& req, httplib::Response& res);
    void HandleCloseSession(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);
    void HandleBackendHealth(const httplib::Request& req, httplib::Response& res);

    BridgeService& service_;
    ProcessSupervisor& supervisor_;
    ServerConfig config_;
    httplib::Server server_;
};

} // namespace mcp_bridge
