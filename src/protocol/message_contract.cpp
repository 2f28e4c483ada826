#include "protocol/message_contract.hpp"

#include <cstdint>
#include <limits>

namespace mcpbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

BridgeError protocol_error(const std::string& message, const std::string& code) {
    return BridgeError{ErrorCategory::Protocol, message, code};
}

bool fits_int64(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <=
               static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    }
    return value.is_number_integer();
}

bool fits_int(const json& value) {
    if (!fits_int64(value)) {
        return false;
    }
    const auto wide = value.get<std::int64_t>();
    return wide >= std::numeric_limits<int>::min() && wide <= std::numeric_limits<int>::max();
}

}  // namespace

core::errors::Result<Message> parse_message(const json& object) {
    if (!object.is_object()) {
        return protocol_error("JSON-RPC message must be an object.", "not_an_object");
    }

    const auto version = object.find("jsonrpc");
    if (version == object.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return protocol_error("Missing or unsupported jsonrpc version.",
                              "bad_jsonrpc_version");
    }

    Message message;

    const auto id = object.find("id");
    if (id != object.end() && !id->is_null()) {
        if (!fits_int64(*id)) {
            // We only ever issue integer ids; anything else cannot match.
            return protocol_error("Unsupported id type: " + id->dump(),
                                  "unsupported_id");
        }
        message.id = id->get<std::int64_t>();
    }

    const auto method = object.find("method");
    const auto result = object.find("result");
    const auto error = object.find("error");
    const bool has_method = method != object.end();
    const bool has_result = result != object.end();
    const bool has_error = error != object.end();

    if (has_method) {
        if (has_result || has_error) {
            return protocol_error("Message mixes method with result/error.",
                                  "ambiguous_message");
        }
        if (!method->is_string()) {
            return protocol_error("method must be a string.", "bad_method");
        }
        message.method = method->get<std::string>();
        const auto params = object.find("params");
        if (params != object.end()) {
            message.params = *params;
        }
        return message;
    }

    if (has_result == has_error) {
        return protocol_error("Response must carry exactly one of result or error.",
                              "bad_response_shape");
    }
    if (!message.id.has_value()) {
        return protocol_error("Response is missing its id.", "missing_id");
    }

    if (has_result) {
        message.result = *result;
        return message;
    }

    if (!error->is_object()) {
        return protocol_error("error must be an object.", "bad_error_object");
    }
    const auto code = error->find("code");
    const auto text = error->find("message");
    if (code == error->end() || !code->is_number_integer() || text == error->end() ||
        !text->is_string()) {
        return protocol_error("error needs an integer code and a string message.",
                              "bad_error_object");
    }
    if (!fits_int(*code)) {
        return protocol_error("error code out of range: " + code->dump(),
                              "bad_error_object");
    }

    RpcErrorObject rpc_error;
    rpc_error.code = code->get<int>();
    rpc_error.message = text->get<std::string>();
    const auto data = error->find("data");
    if (data != error->end()) {
        rpc_error.data = *data;
    }
    message.error = std::move(rpc_error);
    return message;
}

json make_request(const std::int64_t id, const std::string& method,
                  const json& params) {
    json request;
    request["jsonrpc"] = kJsonRpcVersion;
    request["id"] = id;
    request["method"] = method;
    request["params"] = params.is_null() ? json::object() : params;
    return request;
}

json make_notification(const std::string& method, const json& params) {
    json notification;
    notification["jsonrpc"] = kJsonRpcVersion;
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

json make_result_response(const std::int64_t id, const json& result) {
    json response;
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = id;
    response["result"] = result;
    return response;
}

json make_error_response(const std::int64_t id, const int code,
                         const std::string& message) {
    json response;
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = id;
    response["error"] = {{"code", code}, {"message", message}};
    return response;
}

core::errors::Result<std::string> to_line(const json& message) {
    try {
        return message.dump();
    } catch (const json::type_error& e) {
        return BridgeError{ErrorCategory::Input,
                           std::string("Message cannot be serialized: ") + e.what(),
                           "unserializable_message",
                           "String arguments must be valid UTF-8."};
    }
}

}  // namespace mcpbridge::protocol
