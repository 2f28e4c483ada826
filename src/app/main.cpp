#include <csignal>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"
#include "rpc/rpc_bridge.hpp"

namespace {

using mcpbridge::core::errors::BridgeError;
using mcpbridge::core::errors::ErrorCategory;

int exit_code_for(const BridgeError& err) {
    switch (err.category) {
        case ErrorCategory::Input:
            return 2;
        case ErrorCategory::ProcessSpawn:
        case ErrorCategory::ProcessTerminated:
            return 3;
        case ErrorCategory::RequestTimeout:
            return 4;
        case ErrorCategory::ToolExecution:
        case ErrorCategory::UnknownTool:
            return 5;
        default:
            return 1;
    }
}

int report(const std::string& stage, const BridgeError& err) {
    LOG_ERROR(stage + " failed [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    nlohmann::json payload;
    payload["error"] = {{"kind", mcpbridge::core::errors::to_string(err.category)},
                        {"code", err.code},
                        {"message", err.message},
                        {"httpStatus", mcpbridge::core::errors::http_status(err.category)}};
    if (err.rpc_code.has_value()) {
        payload["error"]["rpcCode"] = err.rpc_code.value();
    }
    std::cout << payload.dump(2) << std::endl;
    return exit_code_for(err);
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = mcpbridge::app::cli::parse_and_validate(argc, argv);
    if (mcpbridge::core::errors::is_error(parsed)) {
        const auto& err = mcpbridge::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = mcpbridge::core::errors::get_value(parsed);
    if (req.verbose) {
        mcpbridge::core::logging::Logger::get().set_level(
            mcpbridge::core::logging::LogLevel::DEBUG);
    }

    auto config = mcpbridge::app::cli::resolve_config(req);
    if (mcpbridge::core::errors::is_error(config)) {
        return report("Configuration", mcpbridge::core::errors::get_error(config));
    }

    // 2. Tag every log line with the server this session drives
    mcpbridge::core::logging::Logger::get().set_session_tag(
        mcpbridge::core::config::generate_session_id(
            mcpbridge::core::errors::get_value(config).command));

    // 3. Signals go to one watcher thread; block them before any other thread exists
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGUSR1);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    mcpbridge::rpc::RpcBridge bridge(mcpbridge::core::errors::get_value(config));
    std::thread signal_watcher([&bridge, signals] {
        int received = 0;
        if (sigwait(&signals, &received) == 0 && received != SIGUSR1) {
            LOG_INFO("Received signal " + std::to_string(received) + ", shutting down");
            bridge.shutdown();
        }
    });
    auto stop_watcher = [&signal_watcher] {
        pthread_kill(signal_watcher.native_handle(), SIGUSR1);
        signal_watcher.join();
    };

    LOG_INFO("Starting tool server bridge...");
    int exit_code = 0;
    auto started = bridge.start();
    if (mcpbridge::core::errors::is_error(started)) {
        exit_code = report("Start", mcpbridge::core::errors::get_error(started));
        stop_watcher();
        return exit_code;
    }

    auto handshake = bridge.initialize();
    if (mcpbridge::core::errors::is_error(handshake)) {
        exit_code = report("Initialize", mcpbridge::core::errors::get_error(handshake));
        stop_watcher();
        return exit_code;
    }

    // 4. Prefetch the tool list right after the handshake
    auto tools = bridge.list_tools();
    if (mcpbridge::core::errors::is_error(tools)) {
        exit_code = report("tools/list", mcpbridge::core::errors::get_error(tools));
        bridge.shutdown();
        stop_watcher();
        return exit_code;
    }

    switch (req.command) {
        case mcpbridge::app::cli::CliCommand::ListTools: {
            nlohmann::json payload;
            payload["tools"] = nlohmann::json::array();
            for (const auto& tool : mcpbridge::core::errors::get_value(tools)) {
                payload["tools"].push_back(mcpbridge::protocol::to_json(tool));
            }
            std::cout << payload.dump(2) << std::endl;
            break;
        }
        case mcpbridge::app::cli::CliCommand::CallTool: {
            auto result = bridge.call_tool(req.tool_name, req.tool_arguments);
            if (mcpbridge::core::errors::is_error(result)) {
                exit_code = report("tools/call " + req.tool_name,
                                   mcpbridge::core::errors::get_error(result));
                break;
            }
            std::cout << mcpbridge::core::errors::get_value(result).dump(2) << std::endl;
            break;
        }
        case mcpbridge::app::cli::CliCommand::Health:
            std::cout << mcpbridge::rpc::to_json(bridge.health()).dump(2) << std::endl;
            break;
    }

    bridge.shutdown();
    stop_watcher();
    return exit_code;
}
