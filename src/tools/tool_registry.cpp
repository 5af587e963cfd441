#include "tools/tool_registry.hpp"
#include "tools/generic_tool.hpp"
#include "tools/drive_tools.hpp"
#include "backend/backend_client.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace drive_bridge {

    namespace {

        using BackendToolFunction = ContentList (*)(IBackendClient &, const nlohmann::json &);

        // Tool definitions using DRY approach
        struct ToolDefinition {
            const char *name;
            std::vector<std::string> aliases;
            const char *description;
            nlohmann::json schema;
            BackendToolFunction function;
        };

        std::vector<ToolDefinition> tool_definitions() {
            return {
                {
                    "search",
                    {"drive_search"},
                    "Search files in the connected drive by name or content",
                    {
                        {"type", "object"},
                        {
                            "properties", {
                                {"q", {{"type", "string"}, {"default", ""}, {"description", "Search query"}}},
                                {
                                    "max",
                                    {
                                        {"type", "number"}, {"default", kDefaultSearchMax},
                                        {"minimum", 1}, {"maximum", kSearchMaxLimit},
                                        {"description", "Maximum number of results"}
                                    }
                                }
                            }
                        },
                        {"required", nlohmann::json::array()}
                    },
                    tools::search_files
                },
                {
                    "fetch",
                    {"drive_fetch"},
                    "Fetch the content of a file by id, optionally limited to a line range",
                    {
                        {"type", "object"},
                        {
                            "properties", {
                                {"id", {{"type", "string"}, {"description", "File id returned by search"}}},
                                {
                                    "lines",
                                    {
                                        {"type", nlohmann::json::array({"number", "string"})},
                                        {"description", "Line count or range such as \"10-40\""}
                                    }
                                }
                            }
                        },
                        {"required", nlohmann::json::array({"id"})}
                    },
                    tools::fetch_file
                }
            };
        }

    }

    ToolRegistry::ToolRegistry(IBackendClient &backend) {
        for (auto &def: tool_definitions()) {
            BackendToolFunction function = def.function;
            register_tool(std::make_unique<GenericTool>(
                def.name,
                def.description,
                std::move(def.schema),
                ToolAnnotations{true, true},
                [&backend, function](const nlohmann::json &args) { return function(backend, args); }
            ), def.aliases);
        }
    }

    void ToolRegistry::register_tool(std::unique_ptr<ITool> tool, const std::vector<std::string> &aliases) {
        ITool *ptr = tool.get();
        tool_map_[ptr->get_name()] = ptr;
        for (const auto &alias: aliases) {
            tool_map_[alias] = ptr;
        }
        descriptors_.push_back({
            ptr->get_name(), ptr->get_description(), ptr->get_input_schema(), ptr->get_annotations()
        });
        tools_.push_back(std::move(tool));
    }

    nlohmann::json ToolRegistry::get_tools_list() const {
        nlohmann::json tools = nlohmann::json::array();
        for (const auto &descriptor: descriptors_) {
            tools.push_back(descriptor.to_json());
        }

        spdlog::debug("Returning {} tools", tools.size());

        nlohmann::json result;
        result["tools"] = tools;
        return result;
    }

    bool ToolRegistry::has_tool(const std::string &name) const {
        return tool_map_.count(name) > 0;
    }

    ContentList ToolRegistry::call_tool(const std::string &name, const nlohmann::json &args) const {
        auto it = tool_map_.find(name);
        if (it == tool_map_.end()) {
            throw UnknownToolError(name);
        }

        spdlog::info("Tool call: {}", name);
        return it->second->execute(args);
    }

}
