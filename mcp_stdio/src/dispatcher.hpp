#pragma once

#include "core_context.hpp"
#include "frame_writer.hpp"
#include "handlers/handler_registry.hpp"
#include "protocol.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace mcp {

enum class SessionState {
    awaiting_initialize,
    awaiting_initialized_notification,
    ready,
};

const char* to_string(SessionState state);

enum class DispatchResult {
    proceed,
    terminate,
};

/**
 * Server-side protocol engine for one connection.
 *
 * dispatch() must only be called from the task that reads the connection;
 * that task exclusively owns the session state. Requests accepted in the
 * ready state run on the worker pool and write their own responses.
 */
class Dispatcher {
public:
    Dispatcher(const ServerContext& context,
               const handlers::HandlerRegistry& registry,
               FrameWriter& writer,
               WorkerPool& pool);

    DispatchResult dispatch(Message message);

    SessionState state() const { return state_; }

    /// Set once a response obligation could not be met; the connection is unusable.
    bool connection_failed() const { return connection_failed_.load(); }

    /// Called once, from whichever thread failed the connection, after the
    /// writer is closed. Must be set before the first dispatch().
    void set_connection_failed_hook(std::function<void()> hook) { on_connection_failed_ = std::move(hook); }

    /**
     * Marshal a handler outcome into response bytes, falling back to a
     * generic InternalError when the intended response cannot be encoded.
     * Returns nullopt only when neither can be encoded.
     */
    static std::optional<std::string> marshal_outcome(const RequestId& id,
                                                      const std::string& method,
                                                      const handlers::HandlerOutcome& outcome);

private:
    const ServerContext& context_;
    const handlers::HandlerRegistry& registry_;
    FrameWriter& writer_;
    WorkerPool& pool_;
    SessionState state_ = SessionState::awaiting_initialize;
    std::atomic<bool> connection_failed_{false};
    std::function<void()> on_connection_failed_;

    DispatchResult on_awaiting_initialize(Message& msg);
    DispatchResult on_awaiting_initialized(Message& msg);
    DispatchResult on_ready(Message& msg);
    DispatchResult handle_initialize(Message& msg);
    DispatchResult handle_malformed(const Message& msg);
    DispatchResult route_request(Message& msg);

    handlers::HandlerOutcome run_handler(handlers::MethodHandler& handler, const Message& msg) const;
    InitializeResult make_initialize_result() const;

    bool reply(const RequestId& id, const std::string& method, const handlers::HandlerOutcome& outcome);
    bool reply_error(const RequestId& id, const std::string& method, int code, const std::string& message);
    void fail_connection(const std::string& reason);
};

} // namespace mcp
