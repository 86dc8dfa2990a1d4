#pragma once

#include "core_context.hpp"
#include "frame_writer.hpp"
#include "framing.hpp"
#include "mcp_types.hpp"
#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace mcp {

/// Transport-level client failure: closed connection, timeout, unknown id.
class ClientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The server answered a call with a JSON-RPC error object.
class RpcCallError : public std::runtime_error {
public:
    explicit RpcCallError(RpcError error);
    const RpcError& error() const { return error_; }

private:
    RpcError error_;
};

struct Response {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;
};

/**
 * JSON-RPC client over a pair of byte-stream descriptors.
 *
 * A reader thread decodes every incoming frame and resolves the pending
 * call whose id matches, so calls may be outstanding concurrently and
 * responses may arrive in any order. Ids come from a per-client counter
 * and are never reused.
 *
 * The client owns both descriptors.
 */
class Client {
public:
    Client(int read_fd, int write_fd, ClientConfig config = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Starts the reader thread. Must be called once before send().
    void start();

    /// Registers a waiter, then writes the request. Throws ClientError if the
    /// client was not started, the connection is closed or the write fails.
    /// Every returned id must be passed to await(); a response that is never
    /// awaited stays in the pending table until the client is destroyed.
    RequestId send(const std::string& method, const nlohmann::json& params = nullptr);

    /// Blocks until the response for id arrives. A zero timeout waits forever.
    /// Throws ClientError on timeout, end of stream or an id that is not pending.
    Response await(const RequestId& id, std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /// send() + await() with the configured default timeout; throws
    /// RpcCallError when the server answers with an error object.
    nlohmann::json call(const std::string& method, const nlohmann::json& params = nullptr);

    void notify(const std::string& method, const nlohmann::json& params = nullptr);

    /// initialize request, id check, then notifications/initialized.
    InitializeResult initialize();

    ListToolsResult list_tools(const std::string& cursor = "");
    CallToolResult call_tool(const std::string& name, const nlohmann::json& arguments = nlohmann::json::object());
    ListPromptsResult list_prompts(const std::string& cursor = "");
    GetPromptResult get_prompt(const std::string& name, const std::map<std::string, std::string>& arguments = {});
    ListResourcesResult list_resources(const std::string& cursor = "");
    ListResourceTemplatesResult list_resource_templates(const std::string& cursor = "");
    ReadResourceResult read_resource(const std::string& uri);

    /// Closes the write side, which tells the server to shut down. Pending
    /// calls are still resolved by responses already in flight.
    void close();

    bool connected() const { return !closed_.load(); }
    size_t pending_count() const;

private:
    struct PendingCall {
        std::promise<Response> promise;
        std::future<Response> future;
        // promise already satisfied; the entry stays until await() takes the future
        bool resolved = false;
    };

    ClientConfig config_;
    int read_fd_;
    int wake_pipe_[2] = {-1, -1};
    FrameReader reader_;
    FrameWriter writer_;
    std::thread reader_thread_;
    std::atomic<int64_t> next_id_{0};
    std::atomic<bool> started_{false};
    std::atomic<bool> closed_{false};

    mutable std::mutex pending_mutex_;
    std::map<RequestId, PendingCall> pending_;

    void read_loop();
    void handle_message(Message& msg);
    void fail_pending(const std::string& reason);

    template <typename T>
    T call_as(const std::string& method, const nlohmann::json& params);
};

} // namespace mcp
