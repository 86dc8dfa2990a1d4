#include "protocol.hpp"

#include <cmath>
#include <limits>

namespace mcp {

RpcError make_error(int code, std::string message) {
    RpcError error;
    error.code = code;
    error.message = std::move(message);
    return error;
}

std::string RequestId::to_string() const {
    if (is_number()) {
        return std::to_string(number());
    }
    return "\"" + string() + "\"";
}

nlohmann::json RequestId::to_json() const {
    if (is_number()) {
        return number();
    }
    return string();
}

std::optional<RequestId> RequestId::from_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return RequestId(value.get<std::string>());
    }
    if (value.is_number_integer() && !value.is_number_unsigned()) {
        return RequestId(value.get<std::int64_t>());
    }
    if (value.is_number_unsigned()) {
        auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return RequestId(static_cast<std::int64_t>(u));
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d) {
            return std::nullopt;
        }
        // 2^63 is exactly representable; anything at or past it overflows int64
        if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return RequestId(static_cast<std::int64_t>(d));
    }
    return std::nullopt;
}

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::request:
            return "request";
        case MessageKind::notification:
            return "notification";
        case MessageKind::success_response:
            return "response";
        case MessageKind::error_response:
            return "error";
        case MessageKind::malformed:
            return "malformed";
    }
    return "unknown";
}

} // namespace mcp
