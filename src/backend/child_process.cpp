#include "backend/child_process.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

extern char** environ;

namespace mcproxy::backend {

using core::errors::ErrorCategory;
using core::errors::ProxyError;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// Writing to a pipe whose reader died must surface as EPIPE, not kill us.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

std::vector<std::string> build_environment(
    const std::map<std::string, std::string>& env_overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string item(*entry);
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[item.substr(0, eq)] = item.substr(eq + 1);
    }
    merged["NODE_NO_READLINE"] = "1";
    merged["PYTHONUNBUFFERED"] = "1";
    for (const auto& [key, value] : env_overrides) {
        merged[key] = value;
    }

    std::vector<std::string> flattened;
    flattened.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        flattened.push_back(key + "=" + value);
    }
    return flattened;
}

int decode_status(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

core::errors::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(
    const std::vector<std::string>& argv,
    const std::map<std::string, std::string>& env_overrides) {
    if (argv.empty() || argv.front().empty()) {
        return ProxyError{ErrorCategory::Input, "Backend command is empty.",
                          "empty_command"};
    }

    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork(); only
    // async-signal-safe calls happen between fork() and exec.
    std::vector<std::string> env_storage = build_environment(env_overrides);
    std::vector<char*> c_env;
    c_env.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        c_env.push_back(entry.data());
    }
    c_env.push_back(nullptr);

    std::vector<std::string> argv_storage = argv;
    std::vector<char*> c_argv;
    c_argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        c_argv.push_back(arg.data());
    }
    c_argv.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return ProxyError{ErrorCategory::Internal,
                          "Failed to create process pipes: " + reason,
                          "pipe_creation_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return ProxyError{ErrorCategory::BackendUnavailable,
                          "Failed to fork process: " + reason, "fork_failed"};
    }

    if (pid == 0) {
        // dup2 clears FD_CLOEXEC on the standard descriptors; every other
        // pipe end closes on exec.
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 ||
            dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            const int err = errno;
            static_cast<void>(write(status_pipe[1], &err, sizeof(err)));
            _exit(126);
        }
        execvpe(c_argv[0], c_argv.data(), c_env.data());
        const int err = errno;
        static_cast<void>(write(status_pipe[1], &err, sizeof(err)));
        _exit(127);
    }

    static_cast<void>(close(stdin_pipe[0]));
    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    static_cast<void>(close(status_pipe[1]));

    // The status pipe reaches EOF on a successful exec (close-on-exec) or
    // carries errno when exec failed.
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(close(status_pipe[0]));

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        static_cast<void>(close(stdin_pipe[1]));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stderr_pipe[0]));
        return ProxyError{ErrorCategory::BackendUnavailable,
                          "Failed to launch '" + argv.front() + "': " +
                              std::strerror(exec_errno),
                          "spawn_failed",
                          "Check that the backend command exists and is executable."};
    }

    set_nonblocking(stdin_pipe[1]);
    return std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]));
}

ChildProcess::ChildProcess(const pid_t pid, const int stdin_fd, const int stdout_fd,
                           const int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    static_cast<void>(terminate(std::chrono::milliseconds(0)));
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

core::errors::Result<std::size_t> ChildProcess::write_all(
    std::string_view data, const std::chrono::steady_clock::time_point deadline) {
    constexpr auto kPollSlice = std::chrono::milliseconds(50);

    std::lock_guard<std::mutex> lock(write_mutex_);
    std::size_t written = 0;
    while (written < data.size()) {
        if (stdin_fd_ < 0 || stdin_closing_.load()) {
            return ProxyError{ErrorCategory::BackendUnavailable,
                              "Backend stdin is closed.", "stdin_closed"};
        }

        const ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                LOG_WARN("ChildProcess: pid " + std::to_string(pid_) + " stopped reading stdin, " +
                         std::to_string(written) + " of " + std::to_string(data.size()) +
                         " bytes written");
                return ProxyError{ErrorCategory::Timeout,
                                  "Backend did not accept input before the deadline.",
                                  "write_timeout"};
            }
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            pollfd pfd{stdin_fd_, POLLOUT, 0};
            const auto slice = std::min(remaining, kPollSlice);
            static_cast<void>(poll(&pfd, 1, static_cast<int>(slice.count()) + 1));
            continue;
        }
        return ProxyError{ErrorCategory::BackendUnavailable,
                          std::string("Failed to write to backend: ") +
                              (n < 0 ? std::strerror(errno) : "short write"),
                          "write_failed"};
    }
    return written;
}

void ChildProcess::close_stdin() {
    // A writer waiting for room sees the flag within one poll slice and
    // releases the lock.
    stdin_closing_.store(true);
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
}

std::optional<int> ChildProcess::try_reap() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return reap_locked(false);
}

std::optional<int> ChildProcess::reap_locked(const bool block) {
    if (exit_code_.has_value()) {
        return exit_code_;
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid_) {
        exit_code_ = decode_status(status);
    } else if (waited < 0) {
        // ECHILD: somebody else reaped it; nothing left to wait for.
        exit_code_ = -1;
    }
    return exit_code_;
}

int ChildProcess::terminate(const std::chrono::milliseconds grace) {
    close_stdin();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (auto code = reap_locked(false)) {
        return *code;
    }

    if (grace.count() > 0) {
        static_cast<void>(kill(pid_, SIGTERM));
        const auto deadline = std::chrono::steady_clock::now() + grace;
        while (std::chrono::steady_clock::now() < deadline) {
            if (auto code = reap_locked(false)) {
                return *code;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        LOG_WARN("ChildProcess: pid " + std::to_string(pid_) +
                 " ignored SIGTERM, sending SIGKILL");
    }

    static_cast<void>(kill(pid_, SIGKILL));
    return reap_locked(true).value_or(-1);
}

}  // namespace mcproxy::backend
