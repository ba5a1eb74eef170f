#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mcp::codec {

/// Thrown when a line is not a JSON object envelope.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Request decode_request(const std::string& line);
std::string encode_response(const Response& response);

Response make_result(nlohmann::json id, nlohmann::json result);
Response make_error(nlohmann::json id, ErrorCode code, std::string message);

/// Indented text form of a handler payload, as embedded in tool content blocks.
std::string serialize_payload(const nlohmann::json& payload);

const nlohmann::json* find_key(const nlohmann::json& map_obj, const std::string& key);
std::string as_string(const nlohmann::json& obj, const std::string& fallback = "");
int64_t as_int64(const nlohmann::json& obj, int64_t fallback = 0);

} // namespace mcp::codec
