#include "json_codec.hpp"

namespace mcp::codec {

namespace {

Message malformed(Message msg, std::string problem) {
    msg.kind = MessageKind::malformed;
    msg.problem = std::move(problem);
    return msg;
}

} // namespace

Message classify(const std::string& payload) {
    Message msg;

    nlohmann::json root = nlohmann::json::parse(payload, nullptr, false);
    if (root.is_discarded()) {
        return malformed(std::move(msg), "payload is not valid JSON");
    }
    if (!root.is_object()) {
        return malformed(std::move(msg), "payload is not a JSON object");
    }

    // The id is extracted first so that malformed messages can still be answered.
    bool has_id = false;
    if (auto id_obj = find_key(root, "id"); id_obj && !id_obj->is_null()) {
        msg.id = RequestId::from_json(*id_obj);
        if (!msg.id) {
            return malformed(std::move(msg), "id must be a string or an integer");
        }
        has_id = true;
    }

    auto version = find_key(root, "jsonrpc");
    if (!version || !version->is_string() || version->get<std::string>() != kJsonRpcVersion) {
        return malformed(std::move(msg), "jsonrpc must be \"2.0\"");
    }

    bool has_method = false;
    if (auto method_obj = find_key(root, "method")) {
        if (!method_obj->is_string()) {
            return malformed(std::move(msg), "method must be a string");
        }
        msg.method = method_obj->get<std::string>();
        has_method = true;
    }

    if (auto params_obj = find_key(root, "params")) {
        msg.params = *params_obj;
        msg.has_params = true;
    }

    bool has_result = false;
    if (auto result_obj = find_key(root, "result")) {
        msg.result = *result_obj;
        has_result = true;
    }

    bool has_error = false;
    if (auto error_obj = find_key(root, "error"); error_obj && !error_obj->is_null()) {
        msg.error = error_from_json(*error_obj);
        if (!msg.error) {
            return malformed(std::move(msg), "error must be an object with integer code and string message");
        }
        has_error = true;
    }

    if (has_id && has_method && !has_result && !has_error) {
        msg.kind = MessageKind::request;
        return msg;
    }
    if (!has_id && has_method && !has_result && !has_error) {
        msg.kind = MessageKind::notification;
        return msg;
    }
    if (has_id && !has_method && has_result != has_error) {
        msg.kind = has_result ? MessageKind::success_response : MessageKind::error_response;
        return msg;
    }

    return malformed(std::move(msg), "message is neither request, notification nor response");
}

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key) {
    if (!obj.is_object()) {
        return nullptr;
    }
    auto it = obj.find(key);
    if (it == obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string marshal_request(const RequestId& id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg.dump();
}

std::string marshal_notification(const std::string& method, const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg.dump();
}

std::string marshal_result(const RequestId& id, const nlohmann::json& result) {
    nlohmann::json msg = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id.to_json()},
        {"result", result},
    };
    return msg.dump();
}

std::string marshal_error(const std::optional<RequestId>& id, const RpcError& error) {
    nlohmann::json msg = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id ? id->to_json() : nlohmann::json(nullptr)},
        {"error", error_to_json(error)},
    };
    return msg.dump();
}

nlohmann::json error_to_json(const RpcError& error) {
    nlohmann::json obj = {
        {"code", error.code},
        {"message", error.message},
    };
    if (error.data) {
        obj["data"] = *error.data;
    }
    return obj;
}

std::optional<RpcError> error_from_json(const nlohmann::json& value) {
    auto code = find_key(value, "code");
    auto message = find_key(value, "message");
    if (!code || !code->is_number_integer() || !message || !message->is_string()) {
        return std::nullopt;
    }
    RpcError error;
    error.code = code->get<int>();
    error.message = message->get<std::string>();
    if (auto data = find_key(value, "data")) {
        error.data = *data;
    }
    return error;
}

} // namespace mcp::codec
