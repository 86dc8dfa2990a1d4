#include "stdio_server.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace mcp {

const char* to_string(ExitReason reason) {
    switch (reason) {
        case ExitReason::end_of_stream:
            return "end of stream";
        case ExitReason::stopped:
            return "stopped";
        case ExitReason::framing_error:
            return "framing error";
        case ExitReason::protocol_violation:
            return "protocol violation";
    }
    return "unknown";
}

StdioServer::StdioServer(int in_fd,
                         int out_fd,
                         const ServerContext& context,
                         const handlers::HandlerRegistry& registry,
                         bool owns_fds)
    : in_fd_(in_fd),
      owns_in_fd_(owns_fds),
      reader_(in_fd, context.config.framing),
      writer_(out_fd, context.config.framing, owns_fds),
      pool_(context.config.worker_count, context.config.max_queued_requests),
      dispatcher_(context, registry, writer_, pool_) {
    if (::pipe2(wake_pipe_, O_CLOEXEC) == 0) {
        reader_.set_wakeup_fd(wake_pipe_[0]);
    } else {
        LOG4CPLUS_WARN(transport_logger(), "pipe2 failed, stop() will not interrupt reads: " << std::strerror(errno));
        wake_pipe_[0] = wake_pipe_[1] = -1;
    }
    // A worker that fails the connection must not leave run() blocked in a read.
    dispatcher_.set_connection_failed_hook([this]() { wake_reader(); });
}

StdioServer::~StdioServer() {
    pool_.shutdown();
    writer_.close();
    if (owns_in_fd_ && in_fd_ >= 0) {
        ::close(in_fd_);
    }
    for (int fd : wake_pipe_) {
        if (fd >= 0) {
            ::close(fd);
        }
    }
}

ExitReason StdioServer::run() {
    LOG4CPLUS_INFO(transport_logger(), "Transport loop started, " << pool_.size() << " worker thread(s)");

    ExitReason reason = read_loop();

    // Queued handlers still own response obligations; let them finish before closing the output.
    pool_.shutdown();
    writer_.close();

    LOG4CPLUS_INFO(transport_logger(), "Transport loop finished: " << to_string(reason)
                                       << ", session state " << to_string(dispatcher_.state()));
    return reason;
}

void StdioServer::stop() {
    stop_requested_ = true;
    wake_reader();
}

void StdioServer::wake_reader() {
    if (wake_pipe_[1] < 0) {
        return;
    }
    char byte = 1;
    ssize_t n = 0;
    do {
        n = ::write(wake_pipe_[1], &byte, 1);
    } while (n < 0 && errno == EINTR);
}

ExitReason StdioServer::read_loop() {
    std::string payload;
    std::string error;

    while (!stop_requested_) {
        if (dispatcher_.connection_failed()) {
            return ExitReason::protocol_violation;
        }

        FrameStatus status = reader_.read_frame(payload, error);
        if (dispatcher_.connection_failed()) {
            return ExitReason::protocol_violation;
        }
        if (status == FrameStatus::end_of_stream) {
            if (stop_requested_) {
                return ExitReason::stopped;
            }
            LOG4CPLUS_INFO(transport_logger(), "Peer closed the stream: " << error);
            return ExitReason::end_of_stream;
        }
        if (status == FrameStatus::framing_error) {
            LOG4CPLUS_ERROR(transport_logger(), "Framing error, closing connection: " << error);
            return ExitReason::framing_error;
        }

        LOG4CPLUS_DEBUG(transport_logger(), "Received frame (" << payload.size() << " bytes): " << payload);

        Message message = codec::classify(payload);
        if (dispatcher_.dispatch(std::move(message)) == DispatchResult::terminate) {
            return ExitReason::protocol_violation;
        }
    }
    return ExitReason::stopped;
}

} // namespace mcp
