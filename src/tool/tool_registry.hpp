#pragma once

#include "tool_base.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcp::tools {

/// Catalog of tool handlers in registration order. Filled once at startup
/// and only read afterwards.
class ToolRegistry {
public:
    void add(std::unique_ptr<ToolHandler> handler);
    const ToolHandler* find(const std::string& name) const;

    std::vector<std::string> names() const;
    nlohmann::json descriptors_json() const;
    std::size_t size() const { return handlers_.size(); }

private:
    std::vector<std::unique_ptr<ToolHandler>> handlers_;
    std::unordered_map<std::string, const ToolHandler*> index_;
};

void register_scan_tools(ToolRegistry& registry);
void register_password_tools(ToolRegistry& registry);
void register_analysis_tools(ToolRegistry& registry);
void register_wireless_tools(ToolRegistry& registry);

ToolRegistry build_default_registry();

} // namespace mcp::tools
