#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "process/process_supervisor.hpp"
#include "protocol/tool_contract.hpp"
#include "rpc/request_correlator.hpp"
#include "transport/frame_decoder.hpp"

namespace mcpbridge::rpc {

enum class BridgeState {
    Uninitialized,
    Initializing,
    Ready,
    Terminated
};

std::string to_string(BridgeState state);

struct HealthReport {
    BridgeState bridge_state = BridgeState::Uninitialized;
    process::ProcessState process_state = process::ProcessState::Starting;
    bool tools_loaded = false;
    std::size_t tool_count = 0;
    std::size_t pending_requests = 0;
    std::size_t transport_errors = 0;
    std::string server_name;
    std::string server_version;
};

nlohmann::json to_json(const HealthReport& report);

// The tool-server bridge handed to the HTTP facade.
//
// Owns the child process, the decoder on its stdout and the correlator for
// requests in flight. start() spawns, initialize() performs the handshake;
// list_tools() and call_tool() are only accepted once the handshake is
// done and fail fast otherwise. Any number of threads may call in
// concurrently. There is no restart: after Terminated, build a new bridge.
class RpcBridge {
public:
    explicit RpcBridge(core::config::BridgeConfig config);
    ~RpcBridge();

    RpcBridge(const RpcBridge&) = delete;
    RpcBridge& operator=(const RpcBridge&) = delete;

    core::errors::Status start();
    core::errors::Result<nlohmann::json> initialize();

    core::errors::Result<std::vector<protocol::ToolDescriptor>> list_tools();
    core::errors::Result<nlohmann::json> call_tool(const std::string& name,
                                                   const nlohmann::json& args);

    // Split form of call_tool() for callers that may cancel.
    core::errors::Result<PendingCall> call_tool_async(const std::string& name,
                                                      const nlohmann::json& args);
    core::errors::Result<nlohmann::json> await_tool_result(PendingCall& call);
    bool cancel(std::int64_t id);

    void shutdown();

    BridgeState state() const;
    nlohmann::json capabilities() const;
    pid_t server_pid() const { return supervisor_.pid(); }
    HealthReport health() const;

private:
    core::errors::Status require_ready() const;
    void enter_terminated(const std::string& reason);
    core::errors::Result<nlohmann::json> fail_handshake(core::errors::BridgeError error);

    // Reader-thread callbacks from the supervisor.
    void on_chunk(std::string_view chunk);
    void on_exit(int exit_code);
    void on_server_request(const protocol::Message& message);
    void note_transport_error();

    const core::config::BridgeConfig config_;
    process::ProcessSupervisor supervisor_;
    transport::FrameDecoder decoder_;
    std::size_t seen_parse_failures_ = 0;
    RequestCorrelator correlator_;

    mutable std::mutex state_mutex_;
    BridgeState state_ = BridgeState::Uninitialized;
    bool started_ = false;
    bool shut_down_ = false;
    std::string terminal_reason_;
    nlohmann::json capabilities_ = nlohmann::json::object();
    nlohmann::json server_info_ = nlohmann::json::object();

    std::mutex tools_fetch_mutex_;
    mutable std::mutex tools_mutex_;
    std::optional<std::vector<protocol::ToolDescriptor>> tools_;

    std::atomic<std::size_t> transport_errors_{0};
};

}  // namespace mcpbridge::rpc
