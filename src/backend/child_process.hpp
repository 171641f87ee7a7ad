#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <sys/types.h>
#include "core/errors/proxy_errors.hpp"

namespace mcproxy::backend {

// A spawned child with its stdin/stdout/stderr connected to pipes.
// The destructor kills and reaps a child that is still running, so a
// process never outlives its owner.
class ChildProcess {
public:
    static core::errors::Result<std::unique_ptr<ChildProcess>> spawn(
        const std::vector<std::string>& argv,
        const std::map<std::string, std::string>& env_overrides);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Writes the whole of `data` to the non-blocking stdin pipe, waiting for
    // room until `deadline`. A write that cannot finish in time fails with
    // ErrorCategory::Timeout.
    core::errors::Result<std::size_t> write_all(
        std::string_view data, std::chrono::steady_clock::time_point deadline);

    // Never waits longer than one poll slice for an in-flight writer.
    void close_stdin();

    // Non-blocking check; returns the exit code once the child is reaped.
    std::optional<int> try_reap();

    // Closes stdin, sends SIGTERM, waits up to `grace`, then SIGKILLs.
    // Returns the exit code (128 + signal for signalled children).
    int terminate(std::chrono::milliseconds grace);

private:
    ChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

    std::optional<int> reap_locked(bool block);

    pid_t pid_;
    std::mutex write_mutex_;
    std::atomic<bool> stdin_closing_{false};
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    std::mutex state_mutex_;
    std::optional<int> exit_code_;
};

}  // namespace mcproxy::backend
