#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace mcpbridge::protocol {

    inline constexpr const char* kJsonRpcVersion = "2.0";

    // The error member of a JSON-RPC response.
    struct RpcErrorObject {
        int code = 0;
        std::string message;
        std::optional<nlohmann::json> data;
    };

    // One decoded JSON-RPC 2.0 message.
    //
    // Exactly one of the two shapes is populated:
    //  - request/notification: method (+ params); id present only for requests
    //  - response: result or error, with id
    // A message without id is a notification and is never correlated.
    struct Message {
        std::optional<std::int64_t> id;
        std::optional<std::string> method;
        nlohmann::json params;
        std::optional<nlohmann::json> result;
        std::optional<RpcErrorObject> error;

        bool is_response() const { return !method.has_value(); }
        bool is_notification() const { return method.has_value() && !id.has_value(); }
    };

    // Validates a decoded JSON object as JSON-RPC 2.0. Failures are
    // ErrorCategory::Protocol and concern only this one message.
    core::errors::Result<Message> parse_message(const nlohmann::json& object);

    nlohmann::json make_request(std::int64_t id, const std::string& method,
                                const nlohmann::json& params);

    nlohmann::json make_notification(const std::string& method,
                                     const nlohmann::json& params = nlohmann::json());

    // Replies to requests the server sends us (ping, unsupported methods).
    nlohmann::json make_result_response(std::int64_t id, const nlohmann::json& result);
    nlohmann::json make_error_response(std::int64_t id, int code,
                                       const std::string& message);

    // Serializes one outbound message to a single line. Strings that are
    // not valid UTF-8 come back as an Input error instead of a json exception.
    core::errors::Result<std::string> to_line(const nlohmann::json& message);

    inline constexpr int kMethodNotFound = -32601;

} // namespace mcpbridge::protocol
