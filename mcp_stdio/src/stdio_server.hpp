#pragma once

#include "core_context.hpp"
#include "dispatcher.hpp"
#include "frame_writer.hpp"
#include "framing.hpp"
#include "handlers/handler_registry.hpp"
#include "worker_pool.hpp"

#include <atomic>

namespace mcp {

enum class ExitReason {
    end_of_stream,      // peer closed its side, clean shutdown
    stopped,            // stop() was called
    framing_error,      // byte stream can no longer be trusted
    protocol_violation, // handshake rules broken or a response could not be delivered
};

const char* to_string(ExitReason reason);

/**
 * Serves one JSON-RPC connection over a pair of byte-stream descriptors
 * (normally the process's own stdin and stdout).
 *
 * run() blocks on the calling thread, which becomes the read task: it
 * decodes frames, classifies them and feeds the dispatcher. Handlers run
 * on the worker pool. When the loop ends the pool is drained and the
 * output side is closed so the peer observes end of stream.
 */
class StdioServer {
public:
    StdioServer(int in_fd,
                int out_fd,
                const ServerContext& context,
                const handlers::HandlerRegistry& registry,
                bool owns_fds = false);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    ExitReason run();

    /// Thread-safe; makes a blocked run() return ExitReason::stopped.
    void stop();

    /// Session state; only meaningful after run() returned.
    SessionState state() const { return dispatcher_.state(); }

    bool connection_failed() const { return dispatcher_.connection_failed(); }

private:
    int in_fd_;
    bool owns_in_fd_;
    int wake_pipe_[2] = {-1, -1};
    std::atomic<bool> stop_requested_{false};

    FrameReader reader_;
    FrameWriter writer_;
    WorkerPool pool_;
    Dispatcher dispatcher_;

    ExitReason read_loop();
    void wake_reader();
};

} // namespace mcp
