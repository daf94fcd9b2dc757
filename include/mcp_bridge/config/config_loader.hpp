#pragma once

#include <mcp_bridge/config/app_config.hpp>
#include <mcp_bridge/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_bridge {

// Flags of `mcp-bridge serve`. `config` holds only what was given on the
// command line; unset fields keep their defaults.
struct CliOptions {
    BridgeConfig config;
    std::optional<std::string> config_path;
};

// Parse a YAML config file into a BridgeConfig.
// When the file has no `backends` key, DefaultBackends() is used.
Result<BridgeConfig, Error> LoadFromYaml(std::string_view file_path);

// Same as LoadFromYaml but from an in-memory document.
Result<BridgeConfig, Error> ParseYamlConfig(std::string_view yaml_text);

// Parse `serve` flags (argv[0] is the program name).
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields of cli_overrides that differ from the defaults
// replace those in yaml_base.
BridgeConfig MergeConfigs(const BridgeConfig& yaml_base, const BridgeConfig& cli_overrides);

// Replace a backend's command line with MCP_<NAME>_CMD when that variable
// is set. The value is split shell-style into command and arguments.
Result<BridgeConfig, Error> ApplyEnvOverrides(BridgeConfig config);

// The three AWS MCP servers (pricing, bcm, ce) launched through uvx in
// stdio mode for `region`.
std::vector<BackendDescriptor> DefaultBackends(const std::string& region);

// AWS_REGION, or "us-east-1" when unset.
std::string DefaultRegion();

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const BridgeConfig& config);

} // namespace mcp_bridge
