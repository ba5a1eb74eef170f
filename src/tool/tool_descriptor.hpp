#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcp::tools {

enum class ParamType {
    String,
    Integer,
};

const char* to_string(ParamType type);

struct ParamSpec {
    std::string name;
    ParamType type;
    std::string description;
    std::optional<nlohmann::json> default_value;
};

/**
 * Static description of one tool: what tools/list reports and what
 * tools/call validates against.
 */
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<ParamSpec> params;
    std::vector<std::string> required;

    const ParamSpec* find_param(const std::string& param_name) const;
    bool is_required(const std::string& param_name) const;

    /// {"name", "description", "inputSchema": {"type": "object", "properties", "required"}}
    nlohmann::json to_json() const;
};

} // namespace mcp::tools
