#include "common/types.hpp"

namespace drive_bridge {

    ContentBlock ContentBlock::make_text(std::string text) {
        ContentBlock block;
        block.kind = Kind::Text;
        block.text = std::move(text);
        return block;
    }

    ContentBlock ContentBlock::make_json(nlohmann::json data) {
        ContentBlock block;
        block.kind = Kind::Json;
        block.data = std::move(data);
        return block;
    }

    nlohmann::json ContentBlock::to_json() const {
        if (kind == Kind::Text) {
            return {{"type", "text"}, {"text", text}};
        }
        return {{"type", "json"}, {"json", data}};
    }

    nlohmann::json ToolDescriptor::to_json() const {
        nlohmann::json tool_def;
        tool_def["name"] = name;
        tool_def["description"] = description;
        tool_def["inputSchema"] = input_schema;
        tool_def["annotations"] = {
            {"readOnlyHint", annotations.read_only_hint},
            {"openWorldHint", annotations.open_world_hint}
        };
        return tool_def;
    }

    nlohmann::json content_to_json(const ContentList &content) {
        nlohmann::json items = nlohmann::json::array();
        for (const auto &block: content) {
            items.push_back(block.to_json());
        }
        return items;
    }

}
