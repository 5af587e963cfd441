#pragma once

#include "tool_interface.hpp"
#include <functional>

namespace drive_bridge {

    // Generic tool wrapper for function-based tools
    class GenericTool : public ITool {
    private:
        std::string name_;
        std::string description_;
        nlohmann::json schema_;
        ToolAnnotations annotations_;
        ToolHandler func_;

    public:
        GenericTool(
            std::string name,
            std::string description,
            nlohmann::json schema,
            ToolAnnotations annotations,
            ToolHandler func
        ) : name_(std::move(name)),
            description_(std::move(description)),
            schema_(std::move(schema)),
            annotations_(annotations),
            func_(std::move(func)) {
        }

        std::string get_name() const override { return name_; }
        std::string get_description() const override { return description_; }
        nlohmann::json get_input_schema() const override { return schema_; }
        ToolAnnotations get_annotations() const override { return annotations_; }

        ContentList execute(const nlohmann::json &args) override { return func_(args); }
    };

}
