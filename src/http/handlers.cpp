#include "http/handlers.hpp"
#include "tools/tool_registry.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

namespace drive_bridge {

    nlohmann::json handle_initialize(const nlohmann::json &params, const std::string &protocol_version) {
        nlohmann::json response;
        response["protocolVersion"] = protocol_version;
        response["serverInfo"] = {
            {"name", kServerName},
            {"version", kServerVersion}
        };
        response["capabilities"] = {
            {"tools", nlohmann::json::object()}
        };

        if (params.is_object() && params.contains("clientInfo")) {
            spdlog::info("Initialize from client {}", params["clientInfo"].dump());
        }
        return response;
    }

    nlohmann::json handle_tools_list(const ToolRegistry &registry) {
        return registry.get_tools_list();
    }

    nlohmann::json handle_tool_call(const ToolRegistry &registry, const nlohmann::json &params) {
        if (!params.is_object() || !params.contains("name")) {
            throw InvalidArgumentsError("Missing required parameter: name");
        }

        const auto &name = params["name"];
        if (!name.is_string()) {
            throw InvalidArgumentsError("Invalid name parameter: must be a string");
        }

        std::string tool_name = name.get<std::string>();
        if (tool_name.empty()) {
            throw InvalidArgumentsError("Tool name cannot be empty");
        }

        nlohmann::json args = nlohmann::json::object();
        auto arguments = params.find("arguments");
        if (arguments != params.end() && !arguments->is_null()) {
            if (!arguments->is_object()) {
                throw InvalidArgumentsError("Invalid arguments parameter: must be an object");
            }
            args = *arguments;
        }

        nlohmann::json result;
        result["content"] = content_to_json(registry.call_tool(tool_name, args));
        return result;
    }

}
