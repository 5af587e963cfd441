#pragma once

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace drive_bridge {

    struct ContentBlock {
        enum class Kind { Text, Json };

        Kind kind = Kind::Text;
        std::string text;
        nlohmann::json data;

        static ContentBlock make_text(std::string text);
        static ContentBlock make_json(nlohmann::json data);

        nlohmann::json to_json() const;
    };

    using ContentList = std::vector<ContentBlock>;

    struct ToolAnnotations {
        bool read_only_hint = true;
        bool open_world_hint = true;
    };

    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema;
        ToolAnnotations annotations;

        nlohmann::json to_json() const;
    };

    using ToolHandler = std::function<ContentList(const nlohmann::json &)>;

    nlohmann::json content_to_json(const ContentList &content);

}
