#include "rpc/rpc_bridge.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/message_contract.hpp"

namespace mcpbridge::rpc {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolDescriptor;

namespace {

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

}  // namespace

std::string to_string(const BridgeState state) {
    switch (state) {
        case BridgeState::Uninitialized:
            return "uninitialized";
        case BridgeState::Initializing:
            return "initializing";
        case BridgeState::Ready:
            return "ready";
        case BridgeState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

json to_json(const HealthReport& report) {
    json payload;
    payload["state"] = to_string(report.bridge_state);
    payload["process"] = process::to_string(report.process_state);
    payload["ready"] = report.bridge_state == BridgeState::Ready;
    payload["toolsLoaded"] = report.tools_loaded;
    payload["toolCount"] = report.tool_count;
    payload["pendingRequests"] = report.pending_requests;
    payload["transportErrors"] = report.transport_errors;
    payload["serverName"] = report.server_name;
    payload["serverVersion"] = report.server_version;
    return payload;
}

RpcBridge::RpcBridge(core::config::BridgeConfig config)
    : config_(std::move(config)),
      supervisor_(config_.terminate_grace_ms),
      decoder_(config_.max_line_bytes),
      correlator_(
          [this](const std::string& line, std::chrono::steady_clock::time_point deadline) {
              return supervisor_.write(line, deadline);
          },
          std::chrono::milliseconds(config_.request_timeout_ms)) {}

RpcBridge::~RpcBridge() {
    shutdown();
}

core::errors::Status RpcBridge::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == BridgeState::Terminated) {
            return BridgeError{ErrorCategory::ProcessTerminated,
                               "Bridge is terminated: " + terminal_reason_,
                               "process_terminated"};
        }
        if (started_) {
            return BridgeError{ErrorCategory::InvalidState, "Bridge was already started.",
                               "already_started"};
        }
        started_ = true;
    }

    auto spawned = supervisor_.start(
        config_.command, config_.args,
        [this](std::string_view chunk) { on_chunk(chunk); },
        [this](const int exit_code) { on_exit(exit_code); });
    if (core::errors::is_error(spawned)) {
        const auto& err = core::errors::get_error(spawned);
        LOG_ERROR("RpcBridge: failed to start tool server [" + err.code + "]: " +
                  err.message);
        enter_terminated(err.message);
        correlator_.on_process_terminated(err.message);
        return err;
    }
    return core::errors::ok();
}

core::errors::Result<json> RpcBridge::initialize() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == BridgeState::Terminated) {
            return BridgeError{ErrorCategory::ProcessTerminated,
                               "Bridge is terminated: " + terminal_reason_,
                               "process_terminated"};
        }
        if (!started_) {
            return BridgeError{ErrorCategory::InvalidState,
                               "initialize() called before start().", "not_started"};
        }
        if (state_ != BridgeState::Uninitialized) {
            return BridgeError{ErrorCategory::InvalidState,
                               "Handshake already " + to_string(state_) + ".",
                               "invalid_state_transition"};
        }
        state_ = BridgeState::Initializing;
    }
    LOG_INFO("RpcBridge: state uninitialized -> initializing");

    json params;
    params["protocolVersion"] = config_.protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = {{"name", config_.client_name},
                            {"version", config_.client_version}};

    auto issued = correlator_.issue("initialize", params);
    if (core::errors::is_error(issued)) {
        return fail_handshake(core::errors::get_error(issued));
    }
    auto call = std::move(std::get<PendingCall>(issued));
    auto response = call.completion.get();
    if (core::errors::is_error(response)) {
        return fail_handshake(core::errors::get_error(response));
    }

    const json& result = core::errors::get_value(response);
    if (!result.is_object()) {
        return fail_handshake(BridgeError{ErrorCategory::Protocol,
                                          "initialize result must be an object.",
                                          "bad_initialize_result"});
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const auto caps = result.find("capabilities");
        capabilities_ = (caps != result.end() && caps->is_object()) ? *caps : json::object();
        const auto info = result.find("serverInfo");
        server_info_ = (info != result.end() && info->is_object()) ? *info : json::object();
    }

    auto notified = correlator_.notify("notifications/initialized");
    if (core::errors::is_error(notified)) {
        return fail_handshake(core::errors::get_error(notified));
    }

    std::string server_name;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != BridgeState::Initializing) {
            return BridgeError{ErrorCategory::ProcessTerminated,
                               "Bridge terminated during handshake: " + terminal_reason_,
                               "process_terminated"};
        }
        state_ = BridgeState::Ready;
        server_name = string_field(server_info_, "name");
    }
    LOG_INFO("RpcBridge: state initializing -> ready (server " +
             (server_name.empty() ? std::string("unknown") : server_name) + ")");
    return result;
}

core::errors::Result<json> RpcBridge::fail_handshake(BridgeError error) {
    LOG_ERROR("RpcBridge: handshake failed [" + error.code + "]: " + error.message);
    enter_terminated("handshake failed: " + error.message);
    correlator_.on_process_terminated("handshake failed");
    supervisor_.terminate();
    return error;
}

core::errors::Result<std::vector<ToolDescriptor>> RpcBridge::list_tools() {
    auto ready = require_ready();
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        if (tools_.has_value()) {
            return tools_.value();
        }
    }

    // One fetch at a time; later callers get the cache filled by the first.
    std::lock_guard<std::mutex> fetch_lock(tools_fetch_mutex_);
    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        if (tools_.has_value()) {
            return tools_.value();
        }
    }

    auto issued = correlator_.issue("tools/list", json::object());
    if (core::errors::is_error(issued)) {
        return core::errors::get_error(issued);
    }
    auto call = std::move(std::get<PendingCall>(issued));
    auto response = call.completion.get();
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }

    auto parsed = protocol::parse_tool_list(core::errors::get_value(response));
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        LOG_WARN("RpcBridge: unusable tools/list result: " + err.message);
        return err;
    }

    std::lock_guard<std::mutex> lock(tools_mutex_);
    tools_ = core::errors::get_value(parsed);
    LOG_INFO("RpcBridge: loaded " + std::to_string(tools_->size()) + " tools");
    return tools_.value();
}

core::errors::Result<PendingCall> RpcBridge::call_tool_async(const std::string& name,
                                                             const json& args) {
    auto ready = require_ready();
    if (core::errors::is_error(ready)) {
        return core::errors::get_error(ready);
    }

    if (name.empty()) {
        return BridgeError{ErrorCategory::Input, "Tool name cannot be empty.",
                           "empty_tool_name"};
    }
    if (!args.is_null() && !args.is_object()) {
        return BridgeError{ErrorCategory::Input, "Tool arguments must be a JSON object.",
                           "invalid_arguments"};
    }

    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        if (tools_.has_value()) {
            const bool known = std::any_of(
                tools_->begin(), tools_->end(),
                [&name](const ToolDescriptor& tool) { return tool.name == name; });
            if (!known) {
                return BridgeError{ErrorCategory::UnknownTool, "Unknown tool: " + name,
                                   "unknown_tool", "Call list_tools() for valid names."};
            }
        }
    }

    json params;
    params["name"] = name;
    params["arguments"] = args.is_null() ? json::object() : args;
    return correlator_.issue("tools/call", params);
}

core::errors::Result<json> RpcBridge::await_tool_result(PendingCall& call) {
    auto response = call.completion.get();
    if (!core::errors::is_error(response)) {
        return response;
    }

    auto error = core::errors::get_error(response);
    if (error.category == ErrorCategory::Rpc) {
        // A JSON-RPC error answer is the tool failing, not the transport.
        error.category = ErrorCategory::ToolExecution;
        error.code = "tool_execution_failed";
        LOG_WARN("RpcBridge: tool call " + std::to_string(call.id) + " failed (" +
                 std::to_string(error.rpc_code.value_or(0)) + "): " + error.message);
    }
    return error;
}

core::errors::Result<json> RpcBridge::call_tool(const std::string& name, const json& args) {
    auto issued = call_tool_async(name, args);
    if (core::errors::is_error(issued)) {
        return core::errors::get_error(issued);
    }
    return await_tool_result(std::get<PendingCall>(issued));
}

bool RpcBridge::cancel(const std::int64_t id) {
    return correlator_.cancel(id);
}

void RpcBridge::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
    }

    enter_terminated("bridge shut down");
    correlator_.on_process_terminated("bridge shut down");
    supervisor_.terminate();
}

BridgeState RpcBridge::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

json RpcBridge::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return capabilities_;
}

HealthReport RpcBridge::health() const {
    HealthReport report;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        report.bridge_state = state_;
        report.server_name = string_field(server_info_, "name");
        report.server_version = string_field(server_info_, "version");
    }
    report.process_state = supervisor_.state();
    {
        std::lock_guard<std::mutex> lock(tools_mutex_);
        report.tools_loaded = tools_.has_value();
        report.tool_count = tools_.has_value() ? tools_->size() : 0;
    }
    report.pending_requests = correlator_.pending_count();
    report.transport_errors = transport_errors_.load();
    return report;
}

core::errors::Status RpcBridge::require_ready() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (state_) {
        case BridgeState::Ready:
            return core::errors::ok();
        case BridgeState::Terminated:
            return BridgeError{ErrorCategory::ProcessTerminated,
                               "Bridge is terminated: " + terminal_reason_,
                               "process_terminated"};
        default:
            return BridgeError{ErrorCategory::NotReady,
                               "Bridge is " + to_string(state_) + ", handshake not complete.",
                               "not_ready", "Call initialize() first."};
    }
}

void RpcBridge::enter_terminated(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == BridgeState::Terminated) {
        return;
    }
    LOG_INFO("RpcBridge: state " + to_string(state_) + " -> terminated (" + reason + ")");
    state_ = BridgeState::Terminated;
    terminal_reason_ = reason;
}

void RpcBridge::on_chunk(std::string_view chunk) {
    auto objects = decoder_.feed(chunk);
    if (decoder_.parse_failures() != seen_parse_failures_) {
        transport_errors_ += decoder_.parse_failures() - seen_parse_failures_;
        seen_parse_failures_ = decoder_.parse_failures();
        supervisor_.mark_degraded();
    }

    for (const auto& object : objects) {
        auto parsed = protocol::parse_message(object);
        if (core::errors::is_error(parsed)) {
            LOG_WARN("RpcBridge: dropping invalid JSON-RPC message [" +
                     core::errors::get_error(parsed).code + "]: " +
                     core::errors::get_error(parsed).message);
            note_transport_error();
            continue;
        }

        const auto& message = core::errors::get_value(parsed);
        if (message.is_notification()) {
            LOG_DEBUG("RpcBridge: server notification " + message.method.value());
            continue;
        }
        if (message.method.has_value()) {
            on_server_request(message);
            continue;
        }
        correlator_.on_message(message);
    }
}

void RpcBridge::on_server_request(const protocol::Message& message) {
    const std::int64_t id = message.id.value_or(0);
    json reply;
    if (message.method.value() == "ping") {
        reply = protocol::make_result_response(id, json::object());
    } else {
        LOG_DEBUG("RpcBridge: rejecting server request " + message.method.value());
        reply = protocol::make_error_response(id, protocol::kMethodNotFound,
                                              "Method not found: " + message.method.value());
    }
    auto line = protocol::to_line(reply);
    if (core::errors::is_error(line)) {
        LOG_WARN("RpcBridge: could not encode reply to server request: " +
                 core::errors::get_error(line).message);
        return;
    }
    // Runs on the reader thread, so a stalled server must not hold it forever.
    auto written = supervisor_.write(
        core::errors::get_value(line),
        std::chrono::steady_clock::now() +
            std::chrono::milliseconds(config_.request_timeout_ms));
    if (core::errors::is_error(written)) {
        LOG_WARN("RpcBridge: could not answer server request: " +
                 core::errors::get_error(written).message);
    }
}

void RpcBridge::note_transport_error() {
    ++transport_errors_;
    supervisor_.mark_degraded();
}

void RpcBridge::on_exit(const int exit_code) {
    const std::string reason = "tool server exited with code " + std::to_string(exit_code);
    enter_terminated(reason);
    correlator_.on_process_terminated(reason);
}

}  // namespace mcpbridge::rpc
