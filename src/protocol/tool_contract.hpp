#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bridge_errors.hpp"

namespace mcpbridge::protocol {

    // One entry of a tools/list result
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema;  // JSON Schema object, passed through untouched
    };

    // Reads result.tools of a tools/list response.
    core::errors::Result<std::vector<ToolDescriptor>> parse_tool_list(
        const nlohmann::json& result);

    nlohmann::json to_json(const ToolDescriptor& tool);

} // namespace mcpbridge::protocol
