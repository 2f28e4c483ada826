#pragma once
#include "app/cli_request.hpp"
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace mcpbridge::app::cli {
    mcpbridge::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    // CLI flags win over the environment.
    mcpbridge::core::errors::Result<mcpbridge::core::config::BridgeConfig> resolve_config(
        const CliRequest& request,
        const mcpbridge::core::config::EnvLookup& lookup = mcpbridge::core::config::process_env);
}
