#include "tool_descriptor.hpp"

#include <algorithm>

namespace mcp::tools {

const char* to_string(ParamType type) {
    switch (type) {
        case ParamType::String: return "string";
        case ParamType::Integer: return "integer";
    }
    return "string";
}

const ParamSpec* ToolDescriptor::find_param(const std::string& param_name) const {
    auto it = std::find_if(params.begin(), params.end(),
                           [&](const ParamSpec& spec) { return spec.name == param_name; });
    if (it == params.end()) {
        return nullptr;
    }
    return &*it;
}

bool ToolDescriptor::is_required(const std::string& param_name) const {
    return std::find(required.begin(), required.end(), param_name) != required.end();
}

nlohmann::json ToolDescriptor::to_json() const {
    nlohmann::json properties = nlohmann::json::object();
    for (const auto& spec : params) {
        nlohmann::json property = {
            {"type", to_string(spec.type)},
            {"description", spec.description},
        };
        if (spec.default_value) {
            property["default"] = *spec.default_value;
        }
        properties[spec.name] = std::move(property);
    }

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", std::move(properties)},
    };
    if (!required.empty()) {
        schema["required"] = required;
    }

    return {
        {"name", name},
        {"description", description},
        {"inputSchema", std::move(schema)},
    };
}

} // namespace mcp::tools
