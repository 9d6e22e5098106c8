#include "makemcp/tools/tool.hpp"

namespace makemcp::tools {

auto ToolDefinition::to_json() const -> json {
    json j;
    j["name"] = name;
    j["description"] = description;

    json schema;
    schema["type"] = "object";

    json properties = json::object();
    json required_params = json::array();

    for (const auto& param : parameters) {
        json prop;
        prop["type"] = param.type;
        prop["description"] = param.description;

        if (param.default_value.has_value()) {
            prop["default"] = *param.default_value;
        }
        if (param.minimum.has_value()) {
            prop["minimum"] = *param.minimum;
        }
        if (param.maximum.has_value()) {
            prop["maximum"] = *param.maximum;
        }

        properties[param.name] = prop;

        if (param.required) {
            required_params.push_back(param.name);
        }
    }

    schema["properties"] = properties;
    if (!required_params.empty()) {
        schema["required"] = required_params;
    }

    j["inputSchema"] = schema;
    return j;
}

} // namespace makemcp::tools
