#pragma once
#include <optional>
#include <string>
#include <variant>

namespace mcpbridge::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        TransportParse,     // One malformed line on the child's stdout
        Protocol,           // Well-formed JSON that is not valid JSON-RPC 2.0
        ProcessSpawn,       // fork/exec of the tool server failed
        ProcessTerminated,  // Child exited or bridge was shut down
        RequestTimeout,     // No response within the request deadline
        ToolExecution,      // tools/call answered with a JSON-RPC error
        Rpc,                // Any other JSON-RPC error response
        NotReady,           // Handshake has not completed
        UnknownTool,        // Tool name is not in the cached tool list
        Cancelled,          // Caller cancelled its own request
        InvalidState,       // Operation not allowed in the current state
        Input,              // Bad CLI flag, config value or argument
        Internal            // pipe/poll failures and logic bugs
    };

    // The standardized error payload
    struct BridgeError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
            std::optional<int> rpc_code;          // JSON-RPC error.code when the peer sent one
            std::optional<std::string> rpc_data;  // JSON-RPC error.data, serialized
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a BridgeError.
    template <typename T>
    using Result = std::variant<T, BridgeError>;

    // Result for operations with nothing to return.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BridgeError>(result);
    }

    template <typename T>
    const BridgeError& get_error(const Result<T>& result) {
        return std::get<BridgeError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::TransportParse:    return "transport_parse";
            case ErrorCategory::Protocol:          return "protocol";
            case ErrorCategory::ProcessSpawn:      return "process_spawn";
            case ErrorCategory::ProcessTerminated: return "process_terminated";
            case ErrorCategory::RequestTimeout:    return "request_timeout";
            case ErrorCategory::ToolExecution:     return "tool_execution";
            case ErrorCategory::Rpc:               return "rpc";
            case ErrorCategory::NotReady:          return "not_ready";
            case ErrorCategory::UnknownTool:       return "unknown_tool";
            case ErrorCategory::Cancelled:         return "cancelled";
            case ErrorCategory::InvalidState:      return "invalid_state";
            case ErrorCategory::Input:             return "input";
            case ErrorCategory::Internal:          return "internal";
            default: return "unknown";
        }
    }

    // 3. HTTP status the facade answers with for each category.
    inline int http_status(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::UnknownTool:    return 404;
            case ErrorCategory::NotReady:       return 503;
            case ErrorCategory::RequestTimeout: return 504;
            case ErrorCategory::ToolExecution:  return 502;
            case ErrorCategory::Input:
            case ErrorCategory::InvalidState:   return 400;
            case ErrorCategory::Cancelled:      return 499;
            default: return 500;
        }
    }

} // namespace mcpbridge::core::errors
