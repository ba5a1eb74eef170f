#include "dispatcher.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>

namespace mcp {

Dispatcher::Dispatcher(const tools::ToolRegistry& registry, exec::CommandRunner& runner)
    : registry_(registry), runner_(runner) {}

Response Dispatcher::dispatch(const Request& request) {
    LOG4CPLUS_DEBUG(dispatch_logger(), "method=" << request.method << " id=" << request.id.dump());

    if (request.method == "initialize") {
        return codec::make_result(request.id, initialize_result());
    }
    if (request.method == "tools/list") {
        return codec::make_result(request.id, tools_list_result());
    }
    if (request.method == "tools/call") {
        return call_tool(request);
    }

    LOG4CPLUS_WARN(dispatch_logger(), "Unknown method: " << request.method);
    return codec::make_error(request.id, ErrorCode::MethodNotFound, "Unknown method: " + request.method);
}

nlohmann::json Dispatcher::initialize_result() const {
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {
            {"name", kServerName},
            {"version", VERSION_STRING},
        }},
    };
}

nlohmann::json Dispatcher::tools_list_result() const {
    return {{"tools", registry_.descriptors_json()}};
}

Response Dispatcher::call_tool(const Request& request) {
    if (!request.params.is_null() && !request.params.is_object()) {
        return codec::make_error(request.id, ErrorCode::InvalidParams, "Params must be an object");
    }

    const nlohmann::json* name_obj = codec::find_key(request.params, "name");
    std::string tool_name = name_obj ? codec::as_string(*name_obj) : "";
    if (tool_name.empty()) {
        return codec::make_error(request.id, ErrorCode::InvalidParams, "Tool name is required");
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (const nlohmann::json* args_obj = codec::find_key(request.params, "arguments")) {
        if (!args_obj->is_null() && !args_obj->is_object()) {
            return codec::make_error(request.id, ErrorCode::InvalidParams, "Arguments must be an object");
        }
        if (args_obj->is_object()) {
            arguments = *args_obj;
        }
    }

    const tools::ToolHandler* handler = registry_.find(tool_name);
    if (!handler) {
        LOG4CPLUS_WARN(dispatch_logger(), "Unknown tool: " << tool_name);
        return codec::make_error(request.id, ErrorCode::ToolNotFound, "Unknown tool: " + tool_name);
    }

    tools::ToolContext ctx{runner_};
    try {
        nlohmann::json payload = handler->invoke(ctx, arguments);
        nlohmann::json content = nlohmann::json::array({
            {{"type", "text"}, {"text", codec::serialize_payload(payload)}},
        });
        return codec::make_result(request.id, {{"content", content}});
    } catch (const tools::ParamError& exc) {
        return codec::make_error(request.id, ErrorCode::InvalidParams, exc.what());
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(dispatch_logger(), "Tool " << tool_name << " failed: " << exc.what());
        return codec::make_error(request.id, ErrorCode::InternalError,
                                 std::string("Internal error: ") + exc.what());
    }
}

} // namespace mcp
