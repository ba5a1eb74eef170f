#pragma once

#include "process_executor.hpp"
#include "protocol.hpp"
#include "tool/tool_registry.hpp"

#include <nlohmann/json.hpp>

namespace mcp {

/**
 * Routes one decoded request to initialize, tools/list or tools/call.
 *
 * Never throws: every failure, including exceptions raised by tool handlers,
 * comes back as an error response carrying the request id.
 */
class Dispatcher {
public:
    Dispatcher(const tools::ToolRegistry& registry, exec::CommandRunner& runner);

    Response dispatch(const Request& request);

private:
    nlohmann::json initialize_result() const;
    nlohmann::json tools_list_result() const;
    Response call_tool(const Request& request);

    const tools::ToolRegistry& registry_;
    exec::CommandRunner& runner_;
};

} // namespace mcp
