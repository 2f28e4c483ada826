#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bridge_errors.hpp"

namespace mcpbridge::core::config {

// Everything needed to spawn the tool server and drive the handshake.
struct BridgeConfig {
    std::string command;
    std::vector<std::string> args;
    std::uint32_t request_timeout_ms = 30000;
    std::uint32_t terminate_grace_ms = 2000;
    std::size_t max_line_bytes = 16 * 1024 * 1024;
    std::string protocol_version = "2024-11-05";
    std::string client_name = "shopify-mcp-bridge";
    std::string client_version = "1.0.0";
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the real process environment.
std::optional<std::string> process_env(const std::string& name);

// Builds a config from SHOPIFY_ACCESS_TOKEN / MYSHOPIFY_DOMAIN, or from
// MCP_BRIDGE_COMMAND when set. MCP_BRIDGE_TIMEOUT_MS overrides the timeout.
core::errors::Result<BridgeConfig> load_from_environment(
    const EnvLookup& lookup = process_env);

// Parses a request timeout in milliseconds, 1..600000.
core::errors::Result<std::uint32_t> parse_timeout_ms(const std::string& text);

// Splits a command line on whitespace. No quoting rules.
std::vector<std::string> split_command_line(const std::string& text);

}  // namespace mcpbridge::core::config
