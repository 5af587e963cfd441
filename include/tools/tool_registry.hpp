#pragma once

#include "tool_interface.hpp"
#include <memory>
#include <vector>
#include <unordered_map>

namespace drive_bridge {

    class IBackendClient;

    // Fixed name -> tool mapping. Populated once at construction, read-only afterwards.
    class ToolRegistry {
    public:
        explicit ToolRegistry(IBackendClient &backend);

        ToolRegistry(const ToolRegistry &) = delete;
        ToolRegistry &operator=(const ToolRegistry &) = delete;

        // Canonical descriptors in registration order; aliases are not listed
        const std::vector<ToolDescriptor> &list() const { return descriptors_; }

        nlohmann::json get_tools_list() const;

        bool has_tool(const std::string &name) const;

        // Throws UnknownToolError, InvalidArgumentsError, or whatever the backend throws
        ContentList call_tool(const std::string &name, const nlohmann::json &args) const;

    private:
        std::vector<std::unique_ptr<ITool>> tools_;
        std::vector<ToolDescriptor> descriptors_;
        std::unordered_map<std::string, ITool *> tool_map_;

        void register_tool(std::unique_ptr<ITool> tool, const std::vector<std::string> &aliases);
    };

}
