#include "cli_parser.hpp"
#include <optional>
#include <vector>

namespace mcpbridge::app::cli {

    using namespace mcpbridge::core::errors;
    using mcpbridge::core::config::BridgeConfig;
    using nlohmann::json;

    constexpr const char* kUsage =
        "Usage: mcp_bridge_cli <list-tools|call <tool>|health> [--args JSON] "
        "[--server CMD] [--server-arg ARG]... [--timeout-ms N] [--verbose]";

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> tool_name;
        std::optional<std::string> args_json;
        std::optional<std::string> server;
        std::vector<std::string> server_args;
        std::optional<std::string> timeout_ms;
        bool verbose = false;
    };

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "list-tools") {
            req.command = CliCommand::ListTools;
        } else if (command == "call") {
            req.command = CliCommand::CallTool;
        } else if (command == "health") {
            req.command = CliCommand::Health;
        } else {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--args") {
                if (i + 1 < args.size()) raw.args_json = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --args", "missing_value"};
            } else if (args[i] == "--server") {
                if (i + 1 < args.size()) raw.server = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --server", "missing_value"};
            } else if (args[i] == "--server-arg") {
                if (i + 1 < args.size()) raw.server_args.push_back(args[++i]);
                else return BridgeError{ErrorCategory::Input, "Missing value for --server-arg", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (req.command == CliCommand::CallTool && !raw.tool_name.has_value() &&
                       args[i].rfind("--", 0) != 0) {
                raw.tool_name = args[i];
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;

        if (req.command == CliCommand::CallTool) {
            if (!raw.tool_name.has_value()) {
                return BridgeError{ErrorCategory::Input, "call requires a tool name", "missing_tool_name", kUsage};
            }
            req.tool_name = raw.tool_name.value();
        } else if (raw.args_json.has_value()) {
            return BridgeError{ErrorCategory::Input, "--args is only valid with call", "conflicting_flags"};
        }

        if (raw.args_json) {
            json parsed = json::parse(raw.args_json.value(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return BridgeError{ErrorCategory::Input, "--args must be a JSON object", "invalid_arguments",
                                   "Example: --args '{\"first\": 5}'"};
            }
            req.tool_arguments = std::move(parsed);
        }

        if (!raw.server && !raw.server_args.empty()) {
            return BridgeError{ErrorCategory::Input, "--server-arg requires --server", "missing_required_flag"};
        }
        if (raw.server) {
            if (raw.server->empty()) {
                return BridgeError{ErrorCategory::Input, "--server cannot be empty", "invalid_value"};
            }
            req.server_command = raw.server.value();
            req.server_args = raw.server_args;
        }

        if (raw.timeout_ms) {
            auto timeout = mcpbridge::core::config::parse_timeout_ms(raw.timeout_ms.value());
            if (is_error(timeout)) {
                return get_error(timeout);
            }
            req.timeout_ms = get_value(timeout);
        }

        return req;
    }

    Result<BridgeConfig> resolve_config(const CliRequest& request,
                                        const mcpbridge::core::config::EnvLookup& lookup) {
        BridgeConfig config;
        if (request.server_command.has_value()) {
            config.command = request.server_command.value();
            config.args = request.server_args;
        } else {
            auto from_env = mcpbridge::core::config::load_from_environment(lookup);
            if (is_error(from_env)) {
                return get_error(from_env);
            }
            config = get_value(from_env);
        }

        if (request.timeout_ms) {
            config.request_timeout_ms = request.timeout_ms.value();
        }
        return config;
    }

} // namespace mcpbridge::app::cli
