#include "dispatcher.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <exception>

#include <log4cplus/loggingmacros.h>

namespace mcp {

namespace {

bool is_initialized_notification(const std::string& method_name) {
    return method_name == method::initialized || method_name == method::initialized_legacy;
}

std::string describe(const Message& msg) {
    std::string text = to_string(msg.kind);
    if (!msg.method.empty()) {
        text += " method=" + msg.method;
    }
    if (msg.id) {
        text += " id=" + msg.id->to_string();
    }
    return text;
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::awaiting_initialize:
            return "awaiting_initialize";
        case SessionState::awaiting_initialized_notification:
            return "awaiting_initialized_notification";
        case SessionState::ready:
            return "ready";
    }
    return "unknown";
}

Dispatcher::Dispatcher(const ServerContext& context,
                       const handlers::HandlerRegistry& registry,
                       FrameWriter& writer,
                       WorkerPool& pool)
    : context_(context), registry_(registry), writer_(writer), pool_(pool) {}

DispatchResult Dispatcher::dispatch(Message message) {
    switch (state_) {
        case SessionState::awaiting_initialize:
            return on_awaiting_initialize(message);
        case SessionState::awaiting_initialized_notification:
            return on_awaiting_initialized(message);
        case SessionState::ready:
            return on_ready(message);
    }
    return DispatchResult::terminate;
}

DispatchResult Dispatcher::on_awaiting_initialize(Message& msg) {
    if (msg.kind == MessageKind::request && msg.method == method::initialize) {
        return handle_initialize(msg);
    }

    LOG4CPLUS_ERROR(server_logger(), "Protocol violation: expected 'initialize' request first, got " << describe(msg)
                                     << (msg.problem.empty() ? "" : " (" + msg.problem + ")"));
    if (msg.id && (msg.kind == MessageKind::request || msg.kind == MessageKind::malformed)) {
        reply_error(*msg.id, msg.method, error_code::invalid_request,
                    "Expected 'initialize' request before any other message");
    }
    return DispatchResult::terminate;
}

DispatchResult Dispatcher::on_awaiting_initialized(Message& msg) {
    switch (msg.kind) {
        case MessageKind::notification:
            if (is_initialized_notification(msg.method)) {
                state_ = SessionState::ready;
                LOG4CPLUS_INFO(server_logger(), "Received '" << msg.method << "' notification, session ready");
            } else {
                LOG4CPLUS_WARN(server_logger(), "Ignoring notification '" << msg.method
                                                << "' received before initialization completed");
            }
            return DispatchResult::proceed;
        case MessageKind::request:
            LOG4CPLUS_WARN(server_logger(), "Rejecting " << describe(msg) << ": waiting for initialized notification");
            if (!reply_error(*msg.id, msg.method, error_code::invalid_request,
                             "Server is waiting for the 'notifications/initialized' notification")) {
                return DispatchResult::terminate;
            }
            return DispatchResult::proceed;
        case MessageKind::success_response:
        case MessageKind::error_response:
            LOG4CPLUS_WARN(server_logger(), "Dropping unsolicited " << describe(msg));
            return DispatchResult::proceed;
        case MessageKind::malformed:
            return handle_malformed(msg);
    }
    return DispatchResult::proceed;
}

DispatchResult Dispatcher::on_ready(Message& msg) {
    switch (msg.kind) {
        case MessageKind::request:
            return route_request(msg);
        case MessageKind::notification:
            if (is_initialized_notification(msg.method)) {
                LOG4CPLUS_DEBUG(server_logger(), "Ignoring repeated '" << msg.method << "' notification");
            } else {
                LOG4CPLUS_INFO(server_logger(), "Received notification '" << msg.method << "', no action taken");
            }
            return DispatchResult::proceed;
        case MessageKind::success_response:
        case MessageKind::error_response:
            LOG4CPLUS_WARN(server_logger(), "Dropping unsolicited " << describe(msg));
            return DispatchResult::proceed;
        case MessageKind::malformed:
            return handle_malformed(msg);
    }
    return DispatchResult::proceed;
}

DispatchResult Dispatcher::handle_initialize(Message& msg) {
    const RequestId& id = *msg.id;

    InitializeParams params;
    std::string problem;
    if (!msg.has_params || !msg.params.is_object()) {
        problem = "initialize requires a params object";
    } else {
        try {
            msg.params.get_to(params);
        } catch (const std::exception& exc) {
            problem = std::string("invalid initialize params: ") + exc.what();
        }
    }
    if (problem.empty() && params.protocol_version.empty()) {
        problem = "initialize params missing protocolVersion";
    }
    if (!problem.empty()) {
        LOG4CPLUS_ERROR(server_logger(), "Rejecting initialize (id=" << id.to_string() << "): " << problem);
        if (!reply_error(id, msg.method, error_code::invalid_params, problem)) {
            return DispatchResult::terminate;
        }
        return DispatchResult::proceed;
    }

    LOG4CPLUS_INFO(server_logger(), "Initialize from " << params.client_info.name << " " << params.client_info.version
                                    << ", protocol " << params.protocol_version);
    if (params.protocol_version != context_.config.protocol_version) {
        LOG4CPLUS_INFO(server_logger(), "Client requested protocol " << params.protocol_version << ", answering with "
                                        << context_.config.protocol_version);
    }

    nlohmann::json result = make_initialize_result();
    if (!reply(id, msg.method, handlers::HandlerOutcome::success(std::move(result)))) {
        LOG4CPLUS_ERROR(server_logger(), "Failed to send initialize response");
        return DispatchResult::terminate;
    }

    state_ = SessionState::awaiting_initialized_notification;
    LOG4CPLUS_INFO(server_logger(), "Initialize response sent, waiting for initialized notification");
    return DispatchResult::proceed;
}

DispatchResult Dispatcher::handle_malformed(const Message& msg) {
    LOG4CPLUS_WARN(server_logger(), "Malformed message" << (msg.id ? " id=" + msg.id->to_string() : std::string())
                                    << ": " << msg.problem);
    if (!msg.id) {
        return DispatchResult::proceed;
    }
    if (!reply_error(*msg.id, msg.method, error_code::invalid_request, "Invalid Request: " + msg.problem)) {
        return DispatchResult::terminate;
    }
    return DispatchResult::proceed;
}

DispatchResult Dispatcher::route_request(Message& msg) {
    const RequestId& id = *msg.id;
    LOG4CPLUS_INFO(server_logger(), "Request id=" << id.to_string() << " method=" << msg.method);

    if (msg.method == method::initialize) {
        LOG4CPLUS_ERROR(server_logger(), "Duplicate initialize request (id=" << id.to_string() << ")");
        if (!reply_error(id, msg.method, error_code::invalid_request, "Duplicate initialize request")) {
            return DispatchResult::terminate;
        }
        return DispatchResult::proceed;
    }

    handlers::MethodHandler* handler = registry_.find(msg.method);
    if (!handler) {
        LOG4CPLUS_WARN(server_logger(), "Unsupported method '" << msg.method << "' (id=" << id.to_string() << ")");
        if (!reply_error(id, msg.method, error_code::method_not_found, "Method not found: " + msg.method)) {
            return DispatchResult::terminate;
        }
        return DispatchResult::proceed;
    }

    bool submitted = pool_.submit([this, handler, request = std::move(msg)]() {
        handlers::HandlerOutcome outcome = run_handler(*handler, request);
        reply(*request.id, request.method, outcome);
    });
    if (!submitted) {
        LOG4CPLUS_ERROR(server_logger(), "Worker pool stopped, cannot run " << handler->name());
        return DispatchResult::terminate;
    }
    return DispatchResult::proceed;
}

handlers::HandlerOutcome Dispatcher::run_handler(handlers::MethodHandler& handler, const Message& msg) const {
    handlers::HandlerContext ctx{msg.method, *msg.id, msg.params, msg.has_params, context_};
    handlers::HandlerOutcome outcome;
    try {
        outcome = handler.handle(ctx);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Handler " << handler.name() << " failed: " << exc.what());
        return handlers::HandlerOutcome::failure(error_code::internal_error,
                                                 "Internal server error processing method " + msg.method);
    }

    if (outcome.error && outcome.result) {
        LOG4CPLUS_WARN(server_logger(), "Handler " << handler.name() << " returned both result and error, sending error");
        outcome.result.reset();
    }
    if (!outcome.error && !outcome.result) {
        LOG4CPLUS_ERROR(server_logger(), "Handler " << handler.name() << " returned neither result nor error");
        return handlers::HandlerOutcome::failure(error_code::internal_error,
                                                 "Internal server error processing method " + msg.method);
    }
    return outcome;
}

InitializeResult Dispatcher::make_initialize_result() const {
    InitializeResult result;
    result.protocol_version = context_.config.protocol_version;
    result.server_info = context_.config.server_info;
    result.instructions = context_.config.instructions;
    if (registry_.contains(method::tools_list)) {
        result.capabilities.tools = nlohmann::json::object();
    }
    if (registry_.contains(method::prompts_list)) {
        result.capabilities.prompts = nlohmann::json::object();
    }
    if (registry_.contains(method::resources_list)) {
        result.capabilities.resources = nlohmann::json::object();
    }
    return result;
}

std::optional<std::string> Dispatcher::marshal_outcome(const RequestId& id,
                                                       const std::string& method,
                                                       const handlers::HandlerOutcome& outcome) {
    try {
        if (outcome.error) {
            return codec::marshal_error(id, *outcome.error);
        }
        if (outcome.result) {
            return codec::marshal_result(id, *outcome.result);
        }
        LOG4CPLUS_ERROR(server_logger(), "Empty outcome for " << method);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Failed to marshal response for " << method << ": " << exc.what());
    }

    try {
        return codec::marshal_error(
            id, make_error(error_code::internal_error, "Internal server error processing method " + method));
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(server_logger(), "Failed to marshal generic error response for " << method << ": "
                                         << exc.what());
    }
    return std::nullopt;
}

bool Dispatcher::reply(const RequestId& id, const std::string& method, const handlers::HandlerOutcome& outcome) {
    auto bytes = marshal_outcome(id, method, outcome);
    if (!bytes) {
        fail_connection("no response could be encoded for " + method);
        return false;
    }
    if (!writer_.write_frame(*bytes)) {
        fail_connection("response for " + method + " could not be written");
        return false;
    }
    return true;
}

bool Dispatcher::reply_error(const RequestId& id, const std::string& method, int code, const std::string& message) {
    return reply(id, method, handlers::HandlerOutcome::failure(code, message));
}

void Dispatcher::fail_connection(const std::string& reason) {
    if (connection_failed_.exchange(true)) {
        return;
    }
    LOG4CPLUS_ERROR(server_logger(), "Closing connection: " << reason);
    writer_.close();
    if (on_connection_failed_) {
        on_connection_failed_();
    }
}

} // namespace mcp
