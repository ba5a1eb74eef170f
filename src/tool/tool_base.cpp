#include "tool_base.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <utility>

namespace mcp::tools {

namespace {

// Integer parameters may also arrive as decimal strings ("3").
std::optional<int64_t> to_integer(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return codec::as_int64(value);
    }
    if (!value.is_string()) {
        return std::nullopt;
    }

    const std::string& text = value.get_ref<const std::string&>();
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

bool matches_type(const nlohmann::json& value, ParamType type) {
    switch (type) {
        case ParamType::String:
            return value.is_string();
        case ParamType::Integer:
            return to_integer(value).has_value();
    }
    return false;
}

bool is_present(const nlohmann::json* value) {
    return value != nullptr && !value->is_null();
}

} // namespace

ParamError::ParamError(std::string field, const std::string& message)
    : std::runtime_error(message), field_(std::move(field)) {}

ToolHandler::ToolHandler(ToolDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

nlohmann::json ToolHandler::invoke(ToolContext& ctx, const nlohmann::json& arguments) const {
    for (const auto& key : descriptor_.required) {
        if (!is_present(codec::find_key(arguments, key))) {
            LOG4CPLUS_WARN(tool_logger(), name() << ": missing required parameter " << key);
            throw ParamError(key, "Missing required parameter: " + key);
        }
    }

    for (const auto& spec : descriptor_.params) {
        const nlohmann::json* value = codec::find_key(arguments, spec.name);
        if (is_present(value) && !matches_type(*value, spec.type)) {
            LOG4CPLUS_WARN(tool_logger(), name() << ": parameter " << spec.name << " has wrong type");
            throw ParamError(spec.name, "Parameter '" + spec.name + "' must be of type " + to_string(spec.type));
        }
    }

    LOG4CPLUS_INFO(tool_logger(), "Invoking " << name());
    return handle(ctx, arguments);
}

const nlohmann::json* ToolHandler::lookup(const nlohmann::json& arguments, const std::string& key) const {
    const nlohmann::json* value = codec::find_key(arguments, key);
    if (is_present(value)) {
        return value;
    }

    const ParamSpec* spec = descriptor_.find_param(key);
    if (spec && spec->default_value) {
        return &*spec->default_value;
    }
    return nullptr;
}

std::string ToolHandler::get_string(const nlohmann::json& arguments, const std::string& key) const {
    const nlohmann::json* value = lookup(arguments, key);
    if (!value) {
        if (descriptor_.is_required(key)) {
            throw ParamError(key, "Missing required parameter: " + key);
        }
        return "";
    }
    if (!value->is_string()) {
        throw ParamError(key, "Parameter '" + key + "' must be of type string");
    }
    return value->get<std::string>();
}

int64_t ToolHandler::get_integer(const nlohmann::json& arguments, const std::string& key) const {
    const nlohmann::json* value = lookup(arguments, key);
    if (!value) {
        throw ParamError(key, "Missing required parameter: " + key);
    }
    auto parsed = to_integer(*value);
    if (!parsed) {
        throw ParamError(key, "Parameter '" + key + "' must be of type integer");
    }
    return *parsed;
}

// Positional values must not be mistaken for options by the invoked tool.
void ToolHandler::reject_option_like(const std::string& key, const std::string& value) {
    if (value.empty()) {
        throw ParamError(key, "Parameter '" + key + "' must not be empty");
    }
    if (value.front() == '-') {
        throw ParamError(key, "Parameter '" + key + "' must not start with '-'");
    }
}

nlohmann::json ToolHandler::not_installed(const std::string& program) {
    LOG4CPLUS_WARN(tool_logger(), program << " is not installed");
    return {{"error", program + " not found. Install with: just install-kali-tools"}};
}

void ToolHandler::attach_result(nlohmann::json& payload, const exec::ExecutionResult& result) {
    payload["output"] = result.output;
    if (result.success) {
        payload["error"] = nullptr;
    } else {
        payload["error"] = result.error;
    }
}

} // namespace mcp::tools
