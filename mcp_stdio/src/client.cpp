#include "client.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>

#include <log4cplus/loggingmacros.h>

namespace mcp {

RpcCallError::RpcCallError(RpcError error)
    : std::runtime_error("RPC error " + std::to_string(error.code) + ": " + error.message), error_(std::move(error)) {}

Client::Client(int read_fd, int write_fd, ClientConfig config)
    : config_(std::move(config)),
      read_fd_(read_fd),
      reader_(read_fd, config_.framing),
      writer_(write_fd, config_.framing, true) {
    if (::pipe2(wake_pipe_, O_CLOEXEC) == 0) {
        reader_.set_wakeup_fd(wake_pipe_[0]);
    } else {
        LOG4CPLUS_WARN(client_logger(), "pipe2 failed, destruction waits for the server to exit: "
                                        << std::strerror(errno));
        wake_pipe_[0] = wake_pipe_[1] = -1;
    }
}

Client::~Client() {
    writer_.close();
    if (wake_pipe_[1] >= 0) {
        char byte = 1;
        ssize_t n = 0;
        do {
            n = ::write(wake_pipe_[1], &byte, 1);
        } while (n < 0 && errno == EINTR);
    }
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    fail_pending("client destroyed");
    if (read_fd_ >= 0) {
        ::close(read_fd_);
    }
    for (int fd : wake_pipe_) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
}

void Client::start() {
    if (reader_thread_.joinable()) {
        return;
    }
    reader_thread_ = std::thread(&Client::read_loop, this);
    started_ = true;
}

RequestId Client::send(const std::string& method, const nlohmann::json& params) {
    // without the reader thread nothing would ever resolve the call
    if (!started_) {
        throw ClientError("client not started, cannot send " + method);
    }
    RequestId id(++next_id_);

    std::string payload;
    try {
        payload = codec::marshal_request(id, method, params);
    } catch (const std::exception& exc) {
        throw ClientError("failed to marshal " + method + " request: " + exc.what());
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (closed_) {
            throw ClientError("connection closed, cannot send " + method);
        }
        PendingCall call;
        call.future = call.promise.get_future();
        pending_.emplace(id, std::move(call));
    }

    LOG4CPLUS_DEBUG(client_logger(), "Sending " << method << " request id=" << id.to_string());
    if (!writer_.write_frame(payload)) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
        throw ClientError("failed to write " + method + " request");
    }
    return id;
}

Response Client::await(const RequestId& id, std::chrono::milliseconds timeout) {
    std::future<Response> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end() || !it->second.future.valid()) {
            throw ClientError("request " + id.to_string() + " is not pending");
        }
        future = std::move(it->second.future);
        if (it->second.resolved) {
            pending_.erase(it);
        }
    }

    if (timeout.count() > 0 && future.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it != pending_.end() && !it->second.resolved) {
            LOG4CPLUS_WARN(client_logger(), "Request " << id.to_string() << " timed out after " << timeout.count()
                                            << " ms");
            it->second.promise.set_exception(std::make_exception_ptr(
                ClientError("request " + id.to_string() + " timed out after " + std::to_string(timeout.count()) +
                            " ms")));
            pending_.erase(it);
        }
    }

    return future.get();
}

nlohmann::json Client::call(const std::string& method, const nlohmann::json& params) {
    RequestId id = send(method, params);
    Response response = await(id, std::chrono::milliseconds(config_.default_timeout_ms));
    if (response.error) {
        throw RpcCallError(*response.error);
    }
    return response.result ? *response.result : nlohmann::json(nullptr);
}

void Client::notify(const std::string& method, const nlohmann::json& params) {
    std::string payload;
    try {
        payload = codec::marshal_notification(method, params);
    } catch (const std::exception& exc) {
        throw ClientError("failed to marshal " + method + " notification: " + exc.what());
    }
    if (!writer_.write_frame(payload)) {
        throw ClientError("failed to write " + method + " notification");
    }
}

template <typename T>
T Client::call_as(const std::string& method, const nlohmann::json& params) {
    nlohmann::json result = call(method, params);
    try {
        return result.get<T>();
    } catch (const std::exception& exc) {
        throw ClientError("unexpected " + method + " result: " + exc.what());
    }
}

InitializeResult Client::initialize() {
    InitializeParams params;
    params.protocol_version = config_.protocol_version;
    params.capabilities = config_.capabilities;
    params.client_info = config_.client_info;

    LOG4CPLUS_INFO(client_logger(), "Sending initialize request, protocol " << params.protocol_version);
    auto result = call_as<InitializeResult>(method::initialize, params);
    if (result.protocol_version != config_.protocol_version) {
        LOG4CPLUS_WARN(client_logger(), "Server answered with protocol " << result.protocol_version << ", requested "
                                        << config_.protocol_version);
    }
    LOG4CPLUS_INFO(client_logger(), "Connected to " << result.server_info.name << " " << result.server_info.version);

    notify(method::initialized, nlohmann::json::object());
    return result;
}

ListToolsResult Client::list_tools(const std::string& cursor) {
    return call_as<ListToolsResult>(method::tools_list, PaginatedParams{cursor});
}

CallToolResult Client::call_tool(const std::string& name, const nlohmann::json& arguments) {
    CallToolParams params;
    params.name = name;
    params.arguments = arguments;
    return call_as<CallToolResult>(method::tools_call, params);
}

ListPromptsResult Client::list_prompts(const std::string& cursor) {
    return call_as<ListPromptsResult>(method::prompts_list, PaginatedParams{cursor});
}

GetPromptResult Client::get_prompt(const std::string& name, const std::map<std::string, std::string>& arguments) {
    GetPromptParams params;
    params.name = name;
    params.arguments = arguments;
    return call_as<GetPromptResult>(method::prompts_get, params);
}

ListResourcesResult Client::list_resources(const std::string& cursor) {
    return call_as<ListResourcesResult>(method::resources_list, PaginatedParams{cursor});
}

ListResourceTemplatesResult Client::list_resource_templates(const std::string& cursor) {
    return call_as<ListResourceTemplatesResult>(method::resources_templates_list, PaginatedParams{cursor});
}

ReadResourceResult Client::read_resource(const std::string& uri) {
    return call_as<ReadResourceResult>(method::resources_read, ReadResourceParams{uri});
}

void Client::close() {
    LOG4CPLUS_INFO(client_logger(), "Closing write side");
    writer_.close();
}

size_t Client::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    size_t count = 0;
    for (const auto& entry : pending_) {
        if (!entry.second.resolved) {
            ++count;
        }
    }
    return count;
}

void Client::read_loop() {
    std::string payload;
    std::string error;

    for (;;) {
        FrameStatus status = reader_.read_frame(payload, error);
        if (status == FrameStatus::end_of_stream) {
            LOG4CPLUS_INFO(client_logger(), "Server closed the stream: " << error);
            fail_pending("connection closed before a response arrived");
            return;
        }
        if (status == FrameStatus::framing_error) {
            LOG4CPLUS_ERROR(client_logger(), "Framing error from server: " << error);
            fail_pending("framing error: " + error);
            return;
        }

        LOG4CPLUS_DEBUG(client_logger(), "Received frame (" << payload.size() << " bytes): " << payload);
        Message message = codec::classify(payload);
        handle_message(message);
    }
}

void Client::handle_message(Message& msg) {
    switch (msg.kind) {
        case MessageKind::success_response:
        case MessageKind::error_response: {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(*msg.id);
            if (it == pending_.end() || it->second.resolved) {
                LOG4CPLUS_WARN(client_logger(), "Dropping response for unknown id " << msg.id->to_string());
                return;
            }
            Response response;
            response.id = *msg.id;
            if (msg.kind == MessageKind::success_response) {
                response.result = std::move(msg.result);
            } else {
                response.error = std::move(msg.error);
            }
            it->second.promise.set_value(std::move(response));
            it->second.resolved = true;
            if (!it->second.future.valid()) {
                pending_.erase(it);
            }
            return;
        }
        case MessageKind::request: {
            LOG4CPLUS_WARN(client_logger(), "Server sent request '" << msg.method << "', answering MethodNotFound");
            try {
                std::string reply = codec::marshal_error(
                    msg.id, make_error(error_code::method_not_found, "Method not found: " + msg.method));
                if (!writer_.write_frame(reply)) {
                    LOG4CPLUS_WARN(client_logger(), "Could not answer server request " << msg.id->to_string());
                }
            } catch (const std::exception& exc) {
                LOG4CPLUS_ERROR(client_logger(), "Failed to marshal reply to server request: " << exc.what());
            }
            return;
        }
        case MessageKind::notification:
            LOG4CPLUS_INFO(client_logger(), "Server notification '" << msg.method << "'");
            return;
        case MessageKind::malformed: {
            LOG4CPLUS_WARN(client_logger(), "Malformed message from server: " << msg.problem);
            if (!msg.id) {
                return;
            }
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(*msg.id);
            if (it == pending_.end() || it->second.resolved) {
                return;
            }
            it->second.promise.set_exception(std::make_exception_ptr(
                ClientError("malformed response for request " + msg.id->to_string() + ": " + msg.problem)));
            it->second.resolved = true;
            if (!it->second.future.valid()) {
                pending_.erase(it);
            }
            return;
        }
    }
}

void Client::fail_pending(const std::string& reason) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    closed_ = true;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (!it->second.resolved) {
            it->second.promise.set_exception(std::make_exception_ptr(ClientError(reason)));
            it->second.resolved = true;
        }
        if (!it->second.future.valid()) {
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace mcp
