#include "handler_base.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace mcp::handlers {

HandlerOutcome HandlerOutcome::success(nlohmann::json result) {
	HandlerOutcome outcome;
	outcome.result = std::move(result);
	return outcome;
}

HandlerOutcome HandlerOutcome::failure(int code, std::string message) {
	return failure(make_error(code, std::move(message)));
}

HandlerOutcome HandlerOutcome::failure(RpcError error) {
	HandlerOutcome outcome;
	outcome.error = std::move(error);
	return outcome;
}

bool MethodHandler::ensure_params_object(const HandlerContext& ctx, HandlerOutcome& outcome) {
	if (!ctx.has_params || !ctx.params.is_object()) {
		LOG4CPLUS_ERROR(server_logger(), ctx.method << " missing params (id=" << ctx.id.to_string() << ")");
		outcome = HandlerOutcome::failure(error_code::invalid_params, "Missing params object");
		return false;
	}
	return true;
}

HandlerOutcome MethodHandler::invalid_params(const HandlerContext& ctx, const std::string& detail) {
	LOG4CPLUS_ERROR(server_logger(), ctx.method << " invalid params (id=" << ctx.id.to_string() << "): " << detail);
	return HandlerOutcome::failure(error_code::invalid_params, "Invalid params for " + ctx.method + ": " + detail);
}

const nlohmann::json& MethodHandler::empty_params() {
	static const nlohmann::json empty = nlohmann::json::object();
	return empty;
}

} // namespace mcp::handlers
