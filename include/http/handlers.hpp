#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace drive_bridge {

    class ToolRegistry;

    nlohmann::json handle_initialize(const nlohmann::json &params, const std::string &protocol_version);

    nlohmann::json handle_tools_list(const ToolRegistry &registry);

    nlohmann::json handle_tool_call(const ToolRegistry &registry, const nlohmann::json &params);

}
