#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcp {

inline constexpr const char* kJsonRpcVersion = "2.0";

namespace error_code {
inline constexpr int parse_error = -32700;
inline constexpr int invalid_request = -32600;
inline constexpr int method_not_found = -32601;
inline constexpr int invalid_params = -32602;
inline constexpr int internal_error = -32603;
} // namespace error_code

namespace method {
inline constexpr const char* initialize = "initialize";
inline constexpr const char* initialized = "notifications/initialized";
inline constexpr const char* initialized_legacy = "initialized";
inline constexpr const char* tools_list = "tools/list";
inline constexpr const char* tools_call = "tools/call";
inline constexpr const char* prompts_list = "prompts/list";
inline constexpr const char* prompts_get = "prompts/get";
inline constexpr const char* resources_list = "resources/list";
inline constexpr const char* resources_templates_list = "resources/templates/list";
inline constexpr const char* resources_read = "resources/read";
} // namespace method

struct RpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;
};

RpcError make_error(int code, std::string message);

/**
 * JSON-RPC request id: either an integer or a string.
 *
 * Numbers that arrive as floating point with an integral value are
 * normalised to integers, so an id sent as 7 and read back as 7.0
 * compares equal. Strings never compare equal to numbers.
 */
class RequestId {
public:
    RequestId() : value_(std::int64_t{0}) {}
    RequestId(std::int64_t value) : value_(value) {}
    RequestId(std::string value) : value_(std::move(value)) {}
    RequestId(const char* value) : value_(std::string(value)) {}

    bool is_number() const { return std::holds_alternative<std::int64_t>(value_); }
    bool is_string() const { return std::holds_alternative<std::string>(value_); }

    std::int64_t number() const { return std::get<std::int64_t>(value_); }
    const std::string& string() const { return std::get<std::string>(value_); }

    std::string to_string() const;
    nlohmann::json to_json() const;

    /// Returns nullopt for null, booleans, objects, arrays and non-integral numbers.
    static std::optional<RequestId> from_json(const nlohmann::json& value);

    friend bool operator==(const RequestId& lhs, const RequestId& rhs) { return lhs.value_ == rhs.value_; }
    friend bool operator!=(const RequestId& lhs, const RequestId& rhs) { return !(lhs == rhs); }
    friend bool operator<(const RequestId& lhs, const RequestId& rhs) { return lhs.value_ < rhs.value_; }

private:
    std::variant<std::int64_t, std::string> value_;
};

enum class MessageKind {
    request,
    notification,
    success_response,
    error_response,
    malformed,
};

const char* to_string(MessageKind kind);

/**
 * A decoded JSON-RPC envelope. params and result stay as untyped JSON
 * until the receiver knows which concrete type to decode them into.
 */
struct Message {
    MessageKind kind = MessageKind::malformed;
    std::string method;
    std::optional<RequestId> id;
    nlohmann::json params;
    bool has_params = false;
    nlohmann::json result;
    std::optional<RpcError> error;
    // Reason a malformed message was rejected.
    std::string problem;
};

} // namespace mcp
