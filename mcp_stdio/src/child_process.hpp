#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace mcp {

/**
 * A spawned program whose stdin and stdout are pipes held by this process.
 * stderr is inherited.
 *
 * The destructor closes any descriptor still held and, if the child is
 * still running, sends SIGTERM and reaps it.
 */
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// argv[0] is looked up on PATH. With parent_death_signal the child gets
    /// SIGTERM when this process dies. Returns false if the program could not
    /// be started.
    bool spawn(const std::vector<std::string>& argv, bool parent_death_signal = false);

    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }

    // Hand a descriptor over to the caller, who must close it.
    int release_stdin();
    int release_stdout();

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0; }

    /// Blocks until the child exits. Returns its exit code, 128 + signal
    /// number if it was killed, or -1 if there is no child.
    int wait();

    void terminate(int signal_number);

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
};

} // namespace mcp
