#include "child_process.hpp"

#include "logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <log4cplus/loggingmacros.h>

namespace mcp {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char* const* argv, int in_fd, int out_fd, int status_fd, bool pdeathsig, pid_t parent) {
#ifdef __linux__
    if (pdeathsig) {
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (::getppid() != parent) {
            ::_exit(1);
        }
    }
#else
    (void)pdeathsig;
    (void)parent;
#endif
    if (::dup2(in_fd, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0) {
        int err = errno;
        ssize_t ignored = ::write(status_fd, &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }
    ::execvp(argv[0], argv);
    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

} // namespace

ChildProcess::~ChildProcess() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    if (running()) {
        terminate(SIGTERM);
        wait();
    }
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, bool parent_death_signal) {
    if (running()) {
        LOG4CPLUS_ERROR(client_logger(), "spawn called while child " << pid_ << " is running");
        return false;
    }
    if (argv.empty()) {
        LOG4CPLUS_ERROR(client_logger(), "spawn called without a program");
        return false;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int status[2] = {-1, -1};
    if (::pipe2(to_child, O_CLOEXEC) != 0 || ::pipe2(from_child, O_CLOEXEC) != 0 ||
        ::pipe2(status, O_CLOEXEC) != 0) {
        LOG4CPLUS_ERROR(client_logger(), "pipe2 failed: " << std::strerror(errno));
        close_pair(to_child);
        close_pair(from_child);
        close_pair(status);
        return false;
    }

    pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) {
        LOG4CPLUS_ERROR(client_logger(), "fork failed: " << std::strerror(errno));
        close_pair(to_child);
        close_pair(from_child);
        close_pair(status);
        return false;
    }
    if (pid == 0) {
        exec_child(c_argv.data(), to_child[0], from_child[1], status[1], parent_death_signal, parent);
    }

    close_fd(to_child[0]);
    close_fd(from_child[1]);
    close_fd(status[1]);

    // The status pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        LOG4CPLUS_ERROR(client_logger(), "Cannot execute " << argv[0] << ": " << std::strerror(child_errno));
        close_fd(to_child[1]);
        close_fd(from_child[0]);
        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {
        }
        return false;
    }

    pid_ = pid;
    stdin_fd_ = to_child[1];
    stdout_fd_ = from_child[0];
    LOG4CPLUS_INFO(client_logger(), "Started " << argv[0] << " (pid " << pid_ << ")");
    return true;
}

int ChildProcess::release_stdin() {
    int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::release_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int ChildProcess::wait() {
    if (!running()) {
        return -1;
    }
    int wstatus = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid_, &wstatus, 0);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        LOG4CPLUS_ERROR(client_logger(), "waitpid(" << pid_ << ") failed: " << std::strerror(errno));
        pid_ = -1;
        return -1;
    }

    int code = -1;
    if (WIFEXITED(wstatus)) {
        code = WEXITSTATUS(wstatus);
        LOG4CPLUS_INFO(client_logger(), "Child " << pid_ << " exited with status " << code);
    } else if (WIFSIGNALED(wstatus)) {
        code = 128 + WTERMSIG(wstatus);
        LOG4CPLUS_WARN(client_logger(), "Child " << pid_ << " killed by signal " << WTERMSIG(wstatus));
    }
    pid_ = -1;
    return code;
}

void ChildProcess::terminate(int signal_number) {
    if (!running()) {
        return;
    }
    if (::kill(pid_, signal_number) != 0) {
        LOG4CPLUS_WARN(client_logger(), "kill(" << pid_ << ", " << signal_number << ") failed: "
                                        << std::strerror(errno));
    }
}

} // namespace mcp
