#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace mcp {

inline constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "kali-tools-mcp-server";

/// Protocol-level error codes. Values are part of the wire contract.
enum class ErrorCode : int {
    ParseError = -32700,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ToolNotFound = -32001,
};

struct ErrorPayload {
    ErrorCode code;
    std::string message;
};

struct Request {
    nlohmann::json id;      // null when the request carried no id
    std::string method;     // textual form of "method", "null" when absent
    nlohmann::json params;  // null when absent
};

struct Response {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<ErrorPayload> error;
};

} // namespace mcp
