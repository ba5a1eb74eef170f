#pragma once

#include "tool_descriptor.hpp"
#include "../process_executor.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mcp::tools {

/// Invalid tool arguments. Reported to the caller as an invalid-params error.
class ParamError : public std::runtime_error {
public:
    ParamError(std::string field, const std::string& message);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

struct ToolContext {
    exec::CommandRunner& runner;
};

class ToolHandler {
public:
    explicit ToolHandler(ToolDescriptor descriptor);
    virtual ~ToolHandler() = default;

    const std::string& name() const { return descriptor_.name; }
    const ToolDescriptor& descriptor() const { return descriptor_; }

    /// Validates required and typed parameters against the descriptor, then runs the tool.
    nlohmann::json invoke(ToolContext& ctx, const nlohmann::json& arguments) const;

protected:
    virtual nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const = 0;

    // Argument value, or the descriptor default when the argument is absent.
    std::string get_string(const nlohmann::json& arguments, const std::string& key) const;
    int64_t get_integer(const nlohmann::json& arguments, const std::string& key) const;

    static void reject_option_like(const std::string& key, const std::string& value);
    static nlohmann::json not_installed(const std::string& program);
    static void attach_result(nlohmann::json& payload, const exec::ExecutionResult& result);

private:
    const nlohmann::json* lookup(const nlohmann::json& arguments, const std::string& key) const;

    ToolDescriptor descriptor_;
};

} // namespace mcp::tools
