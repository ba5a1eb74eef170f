#include "tool_registry.hpp"

#include <stdexcept>

namespace mcp::tools {

void ToolRegistry::add(std::unique_ptr<ToolHandler> handler) {
    if (!handler) {
        return;
    }
    if (index_.count(handler->name())) {
        throw std::invalid_argument("Duplicate tool name: " + handler->name());
    }
    index_.emplace(handler->name(), handler.get());
    handlers_.push_back(std::move(handler));
}

const ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& handler : handlers_) {
        result.push_back(handler->name());
    }
    return result;
}

nlohmann::json ToolRegistry::descriptors_json() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& handler : handlers_) {
        tools.push_back(handler->descriptor().to_json());
    }
    return tools;
}

ToolRegistry build_default_registry() {
    ToolRegistry registry;
    register_scan_tools(registry);
    register_password_tools(registry);
    register_analysis_tools(registry);
    register_wireless_tools(registry);
    return registry;
}

} // namespace mcp::tools
