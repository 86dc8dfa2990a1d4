#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcp::codec {

/**
 * Classify one frame payload as request, notification, success response,
 * error response or malformed. Never throws; JSON syntax errors yield a
 * malformed message without an id.
 *
 * Rules, in order:
 *  1. "jsonrpc" must be "2.0".
 *  2. id + method, no result/error      -> request
 *  3. method, no id                     -> notification
 *  4. id + exactly one of result/error  -> success / error response
 *  5. anything else                     -> malformed
 */
Message classify(const std::string& payload);

const nlohmann::json* find_key(const nlohmann::json& obj, const std::string& key);

// The marshal_* functions throw nlohmann::json::exception when a value
// cannot be serialised (for example a string holding invalid UTF-8).
std::string marshal_request(const RequestId& id, const std::string& method, const nlohmann::json& params = nullptr);
std::string marshal_notification(const std::string& method, const nlohmann::json& params = nullptr);
std::string marshal_result(const RequestId& id, const nlohmann::json& result);
std::string marshal_error(const std::optional<RequestId>& id, const RpcError& error);

nlohmann::json error_to_json(const RpcError& error);
std::optional<RpcError> error_from_json(const nlohmann::json& value);

} // namespace mcp::codec
