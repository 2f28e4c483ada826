#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpbridge::app::cli {

    enum class CliCommand {
        ListTools,
        CallTool,
        Health
    };

    // Validated command line for one bridge session
    struct CliRequest {
        CliCommand command = CliCommand::ListTools;
        std::string tool_name;
        nlohmann::json tool_arguments = nlohmann::json::object();
        std::optional<std::string> server_command;  // Falls back to the environment
        std::vector<std::string> server_args;
        std::optional<std::uint32_t> timeout_ms;
        bool verbose = false;
    };

} // namespace mcpbridge::app::cli
