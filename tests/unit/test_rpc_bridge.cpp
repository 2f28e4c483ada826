#include <chrono>
#include <cstdio>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/bridge_config.hpp"
#include "core/errors/bridge_errors.hpp"
#include "rpc/rpc_bridge.hpp"

#ifndef FAKE_MCP_SERVER_PATH
#error "FAKE_MCP_SERVER_PATH must point at the fake_mcp_server binary"
#endif

namespace {

using mcpbridge::core::config::BridgeConfig;
using mcpbridge::core::errors::ErrorCategory;
using mcpbridge::core::errors::get_error;
using mcpbridge::core::errors::get_value;
using mcpbridge::core::errors::is_error;
using mcpbridge::process::ProcessState;
using mcpbridge::rpc::BridgeState;
using mcpbridge::rpc::PendingCall;
using mcpbridge::rpc::RpcBridge;
using nlohmann::json;

BridgeConfig fake_server(std::vector<std::string> flags = {},
                         std::uint32_t request_timeout_ms = 5000) {
    BridgeConfig config;
    config.command = FAKE_MCP_SERVER_PATH;
    config.args = std::move(flags);
    config.request_timeout_ms = request_timeout_ms;
    config.terminate_grace_ms = 500;
    return config;
}

void start_and_initialize(RpcBridge& bridge) {
    ASSERT_FALSE(is_error(bridge.start()));
    auto handshake = bridge.initialize();
    ASSERT_FALSE(is_error(handshake)) << get_error(handshake).message;
    ASSERT_EQ(bridge.state(), BridgeState::Ready);
}

template <typename Predicate>
bool eventually(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

std::string first_text(const json& result) {
    return result.at("content").at(0).at("text").get<std::string>();
}

TEST(RpcBridgeTest, HandshakeRecordsServerInfo) {
    RpcBridge bridge(fake_server());
    ASSERT_FALSE(is_error(bridge.start()));
    EXPECT_EQ(bridge.state(), BridgeState::Uninitialized);

    auto handshake = bridge.initialize();
    ASSERT_FALSE(is_error(handshake));
    EXPECT_EQ(get_value(handshake)["serverInfo"]["name"], "fake-mcp-server");
    EXPECT_EQ(bridge.state(), BridgeState::Ready);
    EXPECT_TRUE(bridge.capabilities().contains("tools"));

    const auto health = bridge.health();
    EXPECT_EQ(health.server_name, "fake-mcp-server");
    EXPECT_EQ(health.server_version, "0.1.0");
    EXPECT_EQ(health.process_state, ProcessState::Ready);
}

TEST(RpcBridgeTest, SecondInitializeIsRejected) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto again = bridge.initialize();
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).category, ErrorCategory::InvalidState);
    EXPECT_EQ(bridge.state(), BridgeState::Ready);
}

TEST(RpcBridgeTest, InitializeBeforeStartIsRejected) {
    RpcBridge bridge(fake_server());
    auto handshake = bridge.initialize();
    ASSERT_TRUE(is_error(handshake));
    EXPECT_EQ(get_error(handshake).code, "not_started");
}

TEST(RpcBridgeTest, CallsBeforeHandshakeFailFast) {
    RpcBridge bridge(fake_server());
    ASSERT_FALSE(is_error(bridge.start()));

    auto tools = bridge.list_tools();
    ASSERT_TRUE(is_error(tools));
    EXPECT_EQ(get_error(tools).category, ErrorCategory::NotReady);

    auto call = bridge.call_tool("echo", json::object());
    ASSERT_TRUE(is_error(call));
    EXPECT_EQ(get_error(call).category, ErrorCategory::NotReady);
    EXPECT_EQ(bridge.health().pending_requests, 0u);
}

TEST(RpcBridgeTest, CallsBeforeHandshakeWriteNothing) {
    const std::string capture_path =
        "/tmp/mcp_bridge_stdin_" + std::to_string(getpid()) + ".log";
    BridgeConfig config;
    config.command = "/bin/sh";
    config.args = {"-c", "cat > " + capture_path};
    {
        RpcBridge bridge(config);
        ASSERT_FALSE(is_error(bridge.start()));
        EXPECT_TRUE(is_error(bridge.call_tool("echo", json::object())));
        EXPECT_TRUE(is_error(bridge.list_tools()));
        bridge.shutdown();
    }

    // A shell killed before it ran leaves no file, which also means no bytes.
    std::ifstream captured(capture_path);
    if (captured.is_open()) {
        std::stringstream contents;
        contents << captured.rdbuf();
        EXPECT_TRUE(contents.str().empty());
    }
    std::remove(capture_path.c_str());
}

TEST(RpcBridgeTest, ListToolsIsCachedAfterFirstFetch) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);
    EXPECT_FALSE(bridge.health().tools_loaded);

    auto first = bridge.list_tools();
    ASSERT_FALSE(is_error(first));
    ASSERT_EQ(get_value(first).size(), 7u);
    EXPECT_EQ(get_value(first)[0].name, "echo");
    EXPECT_EQ(get_value(first)[0].input_schema["type"], "object");

    auto second = bridge.list_tools();
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second).size(), 7u);

    const auto health = bridge.health();
    EXPECT_TRUE(health.tools_loaded);
    EXPECT_EQ(health.tool_count, 7u);
}

TEST(RpcBridgeTest, CallToolReturnsResult) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto echoed = bridge.call_tool("echo", json{{"query", "snowboard"}});
    ASSERT_FALSE(is_error(echoed));
    EXPECT_EQ(json::parse(first_text(get_value(echoed))), json({{"query", "snowboard"}}));

    auto sum = bridge.call_tool("add", json{{"a", 2}, {"b", 40}});
    ASSERT_FALSE(is_error(sum));
    EXPECT_EQ(first_text(get_value(sum)), "42");

    auto no_args = bridge.call_tool("echo", json());
    ASSERT_FALSE(is_error(no_args));
    EXPECT_EQ(first_text(get_value(no_args)), "{}");
}

TEST(RpcBridgeTest, ToolErrorBecomesToolExecutionError) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto result = bridge.call_tool("fail", json::object());
    ASSERT_TRUE(is_error(result));
    const auto& err = get_error(result);
    EXPECT_EQ(err.category, ErrorCategory::ToolExecution);
    EXPECT_EQ(err.message, "tool failed on purpose");
    ASSERT_TRUE(err.rpc_code.has_value());
    EXPECT_EQ(err.rpc_code.value(), -32000);
    EXPECT_EQ(mcpbridge::core::errors::http_status(err.category), 502);
    EXPECT_EQ(bridge.state(), BridgeState::Ready);
}

TEST(RpcBridgeTest, UnknownToolIsRejectedFromCache) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);
    ASSERT_FALSE(is_error(bridge.list_tools()));

    auto result = bridge.call_tool("delete-everything", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::UnknownTool);
    EXPECT_EQ(bridge.health().pending_requests, 0u);
}

TEST(RpcBridgeTest, InvalidArgumentsAreRejected) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto array_args = bridge.call_tool("echo", json::array({1, 2}));
    ASSERT_TRUE(is_error(array_args));
    EXPECT_EQ(get_error(array_args).code, "invalid_arguments");

    auto empty_name = bridge.call_tool("", json::object());
    ASSERT_TRUE(is_error(empty_name));
    EXPECT_EQ(get_error(empty_name).code, "empty_tool_name");
}

TEST(RpcBridgeTest, NonUtf8ArgumentsAreAnInputError) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto result = bridge.call_tool("echo", json{{"title", "caf\xe9"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(mcpbridge::core::errors::http_status(get_error(result).category), 400);
    EXPECT_EQ(bridge.health().pending_requests, 0u);

    auto echoed = bridge.call_tool("echo", json{{"title", "caf\xc3\xa9"}});
    ASSERT_FALSE(is_error(echoed));
    EXPECT_EQ(bridge.state(), BridgeState::Ready);
}

TEST(RpcBridgeTest, ConcurrentCallsResolveOutOfOrder) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto slowest = bridge.call_tool_async("slow", json{{"delay_ms", 300}, {"tag", "first"}});
    auto fastest = bridge.call_tool_async("slow", json{{"delay_ms", 20}, {"tag", "second"}});
    auto middle = bridge.call_tool_async("slow", json{{"delay_ms", 150}, {"tag", "third"}});
    ASSERT_FALSE(is_error(slowest));
    ASSERT_FALSE(is_error(fastest));
    ASSERT_FALSE(is_error(middle));

    auto r1 = bridge.await_tool_result(std::get<PendingCall>(slowest));
    auto r2 = bridge.await_tool_result(std::get<PendingCall>(fastest));
    auto r3 = bridge.await_tool_result(std::get<PendingCall>(middle));
    ASSERT_FALSE(is_error(r1));
    ASSERT_FALSE(is_error(r2));
    ASSERT_FALSE(is_error(r3));
    EXPECT_EQ(first_text(get_value(r1)), "first");
    EXPECT_EQ(first_text(get_value(r2)), "second");
    EXPECT_EQ(first_text(get_value(r3)), "third");
}

TEST(RpcBridgeTest, ParallelCallersShareOneServer) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    constexpr int kCallers = 6;
    std::vector<std::string> answers(kCallers);
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&bridge, &answers, i] {
            auto result = bridge.call_tool(
                "slow", json{{"delay_ms", 10 * (kCallers - i)}, {"tag", std::to_string(i)}});
            if (!is_error(result)) {
                answers[i] = first_text(get_value(result));
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    for (int i = 0; i < kCallers; ++i) {
        EXPECT_EQ(answers[i], std::to_string(i));
    }
}

TEST(RpcBridgeTest, RequestTimeoutLeavesBridgeUsable) {
    RpcBridge bridge(fake_server({}, 200));
    start_and_initialize(bridge);

    auto result = bridge.call_tool("never", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::RequestTimeout);
    EXPECT_EQ(bridge.state(), BridgeState::Ready);

    auto echoed = bridge.call_tool("echo", json::object());
    ASSERT_FALSE(is_error(echoed));
}

TEST(RpcBridgeTest, CancelRejectsOnlyThatCall) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto issued = bridge.call_tool_async("never", json::object());
    ASSERT_FALSE(is_error(issued));
    auto& call = std::get<PendingCall>(issued);
    EXPECT_TRUE(bridge.cancel(call.id));

    auto result = bridge.await_tool_result(call);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Cancelled);

    auto echoed = bridge.call_tool("echo", json::object());
    EXPECT_FALSE(is_error(echoed));
}

TEST(RpcBridgeTest, ServerDeathFailsEveryPendingCall) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    std::vector<PendingCall> calls;
    for (int i = 0; i < 3; ++i) {
        auto issued = bridge.call_tool_async("never", json::object());
        ASSERT_FALSE(is_error(issued));
        calls.push_back(std::move(std::get<PendingCall>(issued)));
    }
    EXPECT_TRUE(eventually([&] { return bridge.health().pending_requests == 3; }));

    ASSERT_EQ(kill(bridge.server_pid(), SIGKILL), 0);

    for (auto& call : calls) {
        auto result = bridge.await_tool_result(call);
        ASSERT_TRUE(is_error(result));
        EXPECT_EQ(get_error(result).category, ErrorCategory::ProcessTerminated);
    }
    EXPECT_EQ(bridge.state(), BridgeState::Terminated);
    EXPECT_EQ(bridge.health().pending_requests, 0u);

    auto after = bridge.call_tool("echo", json::object());
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).category, ErrorCategory::ProcessTerminated);
}

TEST(RpcBridgeTest, CrashDuringCallIsProcessTerminated) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    auto result = bridge.call_tool("crash", json::object());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::ProcessTerminated);
    EXPECT_EQ(bridge.state(), BridgeState::Terminated);
    EXPECT_EQ(bridge.health().process_state, ProcessState::Terminated);
}

TEST(RpcBridgeTest, SurvivesChunkedAndNoisyOutput) {
    RpcBridge bridge(fake_server({"--chunked", "--noise"}));
    start_and_initialize(bridge);

    auto tools = bridge.list_tools();
    ASSERT_FALSE(is_error(tools));
    EXPECT_EQ(get_value(tools).size(), 7u);

    auto sum = bridge.call_tool("add", json{{"a", 1}, {"b", 2}});
    ASSERT_FALSE(is_error(sum));
    EXPECT_EQ(first_text(get_value(sum)), "3");

    const auto health = bridge.health();
    EXPECT_GE(health.transport_errors, 3u);
    EXPECT_EQ(health.process_state, ProcessState::Degraded);
    EXPECT_EQ(health.bridge_state, BridgeState::Ready);
}

TEST(RpcBridgeTest, AnswersServerPing) {
    RpcBridge bridge(fake_server({"--ping-client"}));
    start_and_initialize(bridge);

    EXPECT_TRUE(eventually([&] {
        auto status = bridge.call_tool("ping_status", json::object());
        return !is_error(status) && get_value(status)["pingAnswered"] == true;
    }));
}

TEST(RpcBridgeTest, SilentHandshakeTimesOutAndTerminates) {
    RpcBridge bridge(fake_server({"--silent-initialize"}, 200));
    ASSERT_FALSE(is_error(bridge.start()));

    auto handshake = bridge.initialize();
    ASSERT_TRUE(is_error(handshake));
    EXPECT_EQ(get_error(handshake).category, ErrorCategory::RequestTimeout);
    EXPECT_EQ(bridge.state(), BridgeState::Terminated);

    auto tools = bridge.list_tools();
    ASSERT_TRUE(is_error(tools));
    EXPECT_EQ(get_error(tools).category, ErrorCategory::ProcessTerminated);
}

TEST(RpcBridgeTest, RefusedHandshakeTerminates) {
    RpcBridge bridge(fake_server({"--fail-initialize"}));
    ASSERT_FALSE(is_error(bridge.start()));

    auto handshake = bridge.initialize();
    ASSERT_TRUE(is_error(handshake));
    EXPECT_EQ(get_error(handshake).category, ErrorCategory::Rpc);
    ASSERT_TRUE(get_error(handshake).rpc_code.has_value());
    EXPECT_EQ(get_error(handshake).rpc_code.value(), -32603);
    EXPECT_EQ(bridge.state(), BridgeState::Terminated);
}

TEST(RpcBridgeTest, ServerExitAfterHandshakeTerminatesBridge) {
    RpcBridge bridge(fake_server({"--exit-after-initialize"}));
    ASSERT_FALSE(is_error(bridge.start()));
    static_cast<void>(bridge.initialize());

    EXPECT_TRUE(eventually([&] { return bridge.state() == BridgeState::Terminated; }));
    auto call = bridge.call_tool("echo", json::object());
    ASSERT_TRUE(is_error(call));
    EXPECT_EQ(get_error(call).category, ErrorCategory::ProcessTerminated);
}

TEST(RpcBridgeTest, SpawnFailureTerminatesBridge) {
    BridgeConfig config;
    config.command = "__definitely_missing_mcp_server__";
    RpcBridge bridge(config);

    auto started = bridge.start();
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).category, ErrorCategory::ProcessSpawn);
    EXPECT_EQ(bridge.state(), BridgeState::Terminated);

    auto handshake = bridge.initialize();
    ASSERT_TRUE(is_error(handshake));
    EXPECT_EQ(get_error(handshake).category, ErrorCategory::ProcessTerminated);
}

TEST(RpcBridgeTest, ShutdownIsIdempotent) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);

    bridge.shutdown();
    bridge.shutdown();
    EXPECT_EQ(bridge.state(), BridgeState::Terminated);
    EXPECT_EQ(bridge.health().process_state, ProcessState::Terminated);

    auto call = bridge.call_tool("echo", json::object());
    ASSERT_TRUE(is_error(call));
    EXPECT_EQ(get_error(call).category, ErrorCategory::ProcessTerminated);
}

TEST(RpcBridgeTest, HealthSerializesForTheFacade) {
    RpcBridge bridge(fake_server());
    start_and_initialize(bridge);
    ASSERT_FALSE(is_error(bridge.list_tools()));

    const json payload = mcpbridge::rpc::to_json(bridge.health());
    EXPECT_EQ(payload["state"], "ready");
    EXPECT_EQ(payload["process"], "ready");
    EXPECT_EQ(payload["ready"], true);
    EXPECT_EQ(payload["toolsLoaded"], true);
    EXPECT_EQ(payload["toolCount"], 7);
    EXPECT_EQ(payload["pendingRequests"], 0);
    EXPECT_EQ(payload["serverName"], "fake-mcp-server");
}

}  // namespace
