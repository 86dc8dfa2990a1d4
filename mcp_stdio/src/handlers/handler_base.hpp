#pragma once

#include "../core_context.hpp"
#include "../protocol.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <optional>
#include <string>

namespace mcp::handlers {

struct HandlerContext {
	const std::string& method;
	const RequestId& id;
	const nlohmann::json& params;
	bool has_params;
	const ServerContext& context;
};

/**
 * What a handler produced: exactly one of result or error is set.
 */
struct HandlerOutcome {
	std::optional<nlohmann::json> result;
	std::optional<RpcError> error;

	static HandlerOutcome success(nlohmann::json result);
	static HandlerOutcome failure(int code, std::string message);
	static HandlerOutcome failure(RpcError error);
};

class MethodHandler {
public:
	virtual ~MethodHandler() = default;
	virtual const char* name() const = 0;
	virtual HandlerOutcome handle(HandlerContext& ctx) = 0;

protected:
	bool ensure_params_object(const HandlerContext& ctx, HandlerOutcome& outcome);

	// Missing params decode as an empty object.
	template <typename T>
	bool decode_params(const HandlerContext& ctx, T& out, HandlerOutcome& outcome) {
		try {
			const nlohmann::json& params =
				ctx.has_params && !ctx.params.is_null() ? ctx.params : empty_params();
			params.get_to(out);
			return true;
		} catch (const std::exception& exc) {
			outcome = invalid_params(ctx, exc.what());
			return false;
		}
	}

	HandlerOutcome invalid_params(const HandlerContext& ctx, const std::string& detail);

private:
	static const nlohmann::json& empty_params();
};

} // namespace mcp::handlers
