#include "protocol/tool_contract.hpp"

namespace mcpbridge::protocol {

using core::errors::BridgeError;
using core::errors::ErrorCategory;
using nlohmann::json;

core::errors::Result<std::vector<ToolDescriptor>> parse_tool_list(const json& result) {
    if (!result.is_object()) {
        return BridgeError{ErrorCategory::Protocol,
                           "tools/list result must be an object.",
                           "bad_tool_list"};
    }
    const auto tools = result.find("tools");
    if (tools == result.end() || !tools->is_array()) {
        return BridgeError{ErrorCategory::Protocol,
                           "tools/list result has no tools array.", "bad_tool_list"};
    }

    std::vector<ToolDescriptor> descriptors;
    descriptors.reserve(tools->size());
    for (const auto& entry : *tools) {
        if (!entry.is_object()) {
            return BridgeError{ErrorCategory::Protocol,
                               "tools/list entry must be an object.", "bad_tool_list"};
        }
        const auto name = entry.find("name");
        if (name == entry.end() || !name->is_string() ||
            name->get<std::string>().empty()) {
            return BridgeError{ErrorCategory::Protocol,
                               "tools/list entry without a name: " + entry.dump(),
                               "bad_tool_list"};
        }

        ToolDescriptor tool;
        tool.name = name->get<std::string>();
        const auto description = entry.find("description");
        if (description != entry.end() && description->is_string()) {
            tool.description = description->get<std::string>();
        }
        const auto schema = entry.find("inputSchema");
        tool.input_schema =
            (schema != entry.end() && schema->is_object()) ? *schema : json::object();
        descriptors.push_back(std::move(tool));
    }
    return descriptors;
}

json to_json(const ToolDescriptor& tool) {
    json payload;
    payload["name"] = tool.name;
    payload["description"] = tool.description;
    payload["inputSchema"] = tool.input_schema;
    return payload;
}

}  // namespace mcpbridge::protocol
