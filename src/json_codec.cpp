#include "json_codec.hpp"

#include <utility>

namespace mcp::codec {

namespace {

// Tool output is arbitrary bytes; invalid UTF-8 is replaced rather than
// allowed to abort serialization.
std::string dump_json(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

Request decode_request(const std::string& line) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& exc) {
        throw DecodeError(exc.what());
    }

    if (!root.is_object()) {
        throw DecodeError("request must be a JSON object");
    }

    Request req;
    if (auto id_obj = find_key(root, "id")) {
        req.id = *id_obj;
    }
    if (auto method_obj = find_key(root, "method")) {
        req.method = method_obj->is_string() ? method_obj->get<std::string>() : dump_json(*method_obj, -1);
    } else {
        req.method = "null";
    }
    if (auto params_obj = find_key(root, "params")) {
        req.params = *params_obj;
    }

    return req;
}

std::string encode_response(const Response& response) {
    nlohmann::json root = nlohmann::json::object();
    root["jsonrpc"] = kJsonRpcVersion;
    root["id"] = response.id;
    if (response.error) {
        root["error"] = {
            {"code", static_cast<int>(response.error->code)},
            {"message", response.error->message},
        };
    } else {
        root["result"] = response.result ? *response.result : nlohmann::json::object();
    }
    return dump_json(root, -1);
}

Response make_result(nlohmann::json id, nlohmann::json result) {
    Response response;
    response.id = std::move(id);
    response.result = std::move(result);
    return response;
}

Response make_error(nlohmann::json id, ErrorCode code, std::string message) {
    Response response;
    response.id = std::move(id);
    response.error = ErrorPayload{code, std::move(message)};
    return response;
}

std::string serialize_payload(const nlohmann::json& payload) {
    return dump_json(payload, 2);
}

const nlohmann::json* find_key(const nlohmann::json& map_obj, const std::string& key) {
    if (!map_obj.is_object()) {
        return nullptr;
    }

    auto it = map_obj.find(key);
    if (it == map_obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const nlohmann::json& obj, const std::string& fallback) {
    if (obj.is_string()) {
        return obj.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const nlohmann::json& obj, int64_t fallback) {
    if (obj.is_number_integer()) {
        return obj.get<int64_t>();
    }
    return fallback;
}

} // namespace mcp::codec
