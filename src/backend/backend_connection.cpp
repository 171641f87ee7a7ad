#include "backend/backend_connection.hpp"

#include <cerrno>
#include <poll.h>
#include <string_view>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcproxy::backend {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using core::errors::Result;
using nlohmann::json;
using protocol::Message;
using protocol::MessageKind;

namespace {

constexpr int kPollIntervalMs = 50;

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

// Waits for the descriptor to become readable. Returns false on poll failure.
bool wait_readable(const int fd, bool& readable) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0) {
        readable = false;
        return errno == EINTR;
    }
    readable = ready > 0;
    return true;
}

}  // namespace

std::string to_string(const ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:
            return "idle";
        case ConnectionState::Spawning:
            return "spawning";
        case ConnectionState::Handshaking:
            return "handshaking";
        case ConnectionState::Ready:
            return "ready";
        case ConnectionState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

BackendConnection::BackendConnection(protocol::BackendDescriptor descriptor,
                                     ConnectionOptions options)
    : descriptor_(std::move(descriptor)),
      options_(options),
      framer_(options.max_message_bytes) {}

BackendConnection::BackendConnection(protocol::BackendDescriptor descriptor,
                                     BuiltinHandler handler,
                                     ConnectionOptions options)
    : descriptor_(std::move(descriptor)),
      options_(options),
      builtin_handler_(std::move(handler)),
      framer_(options.max_message_bytes) {}

BackendConnection::~BackendConnection() {
    terminate(terminal_reason_.load());
}

bool BackendConnection::transition(const ConnectionState next) {
    ConnectionState current = state_.load();
    do {
        if (current == next) {
            return false;
        }
        // Only a fresh spawn leaves Terminated.
        if (current == ConnectionState::Terminated && next != ConnectionState::Spawning) {
            return false;
        }
    } while (!state_.compare_exchange_weak(current, next));

    LOG_INFO("BackendConnection[" + descriptor_.name + "]: " + to_string(current) +
             " -> " + to_string(next));
    return true;
}

std::shared_ptr<ChildProcess> BackendConnection::current_process() const {
    std::lock_guard<std::mutex> lock(process_mutex_);
    return process_;
}

std::optional<pid_t> BackendConnection::pid() const {
    auto process = current_process();
    if (!process) {
        return std::nullopt;
    }
    return process->pid();
}

std::size_t BackendConnection::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

ProxyError BackendConnection::unavailable_error(const std::string& what) const {
    const ErrorCategory reason = terminal_reason_.load();
    if (reason == ErrorCategory::Shutdown) {
        return ProxyError{ErrorCategory::Shutdown,
                          "Backend '" + descriptor_.name + "' is shutting down: " + what,
                          "shutting_down"};
    }
    return ProxyError{ErrorCategory::BackendUnavailable,
                      "Backend '" + descriptor_.name + "' is unavailable: " + what,
                      "backend_unavailable"};
}

Result<ConnectionState> BackendConnection::spawn() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    const ConnectionState current = state_.load();
    if (current == ConnectionState::Spawning || current == ConnectionState::Handshaking ||
        current == ConnectionState::Ready) {
        return ProxyError{ErrorCategory::Input,
                          "Backend '" + descriptor_.name + "' is already running.",
                          "already_spawned"};
    }

    // Re-spawn after termination: retire the previous process first.
    if (current == ConnectionState::Terminated) {
        stopping_ = true;
        reaper_cv_.notify_all();
        if (auto previous = current_process()) {
            static_cast<void>(previous->terminate(std::chrono::milliseconds(0)));
        }
        join_threads();
    }
    stopping_ = false;
    transition(ConnectionState::Spawning);

    if (builtin_handler_) {
        transition(ConnectionState::Handshaking);
        return ConnectionState::Handshaking;
    }

    if (!descriptor_.command.has_value() || descriptor_.command->empty()) {
        terminal_reason_ = ErrorCategory::BackendUnavailable;
        transition(ConnectionState::Terminated);
        return ProxyError{ErrorCategory::BackendUnavailable,
                          "Backend '" + descriptor_.name +
                              "' has no command and no built-in handler.",
                          "missing_command"};
    }

    std::vector<std::string> argv = *descriptor_.command;
    argv.insert(argv.end(), descriptor_.args.begin(), descriptor_.args.end());

    std::string command_line;
    for (const auto& arg : argv) {
        command_line += (command_line.empty() ? "" : " ") + arg;
    }
    LOG_INFO("BackendConnection[" + descriptor_.name + "]: starting " + command_line);

    auto spawned = ChildProcess::spawn(argv, descriptor_.env);
    if (core::errors::is_error(spawned)) {
        const auto& err = core::errors::get_error(spawned);
        LOG_ERROR("BackendConnection[" + descriptor_.name + "]: " + err.message);
        terminal_reason_ = ErrorCategory::BackendUnavailable;
        transition(ConnectionState::Terminated);
        return err;
    }

    {
        std::lock_guard<std::mutex> process_lock(process_mutex_);
        process_ = std::shared_ptr<ChildProcess>(std::move(core::errors::get_value(spawned)));
    }
    framer_.reset();
    terminal_reason_ = ErrorCategory::BackendUnavailable;

    // Handshaking before the readers start, so an instant exit lands in
    // Terminated rather than being overwritten.
    transition(ConnectionState::Handshaking);
    stdout_reader_ = std::thread(&BackendConnection::read_stdout_loop, this);
    stderr_reader_ = std::thread(&BackendConnection::read_stderr_loop, this);
    reaper_ = std::thread(&BackendConnection::reap_loop, this);

    const ConnectionState after = state_.load();
    if (after == ConnectionState::Terminated) {
        return unavailable_error("process exited during startup");
    }
    return after;
}

Result<ConnectionState> BackendConnection::initialize() {
    if (state_.load() != ConnectionState::Handshaking) {
        return ProxyError{ErrorCategory::Input,
                          "Backend '" + descriptor_.name + "' is " +
                              to_string(state_.load()) + ", expected handshaking.",
                          "invalid_state_transition"};
    }

    json params;
    params["protocolVersion"] = protocol::kProtocolVersion;
    params["capabilities"] = json::object();
    params["clientInfo"] = json{{"name", protocol::kImplementationName},
                                {"version", protocol::kImplementationVersion}};

    auto response = call("initialize", params, options_.handshake_timeout);
    if (core::errors::is_error(response)) {
        const ProxyError err = core::errors::get_error(response);
        LOG_ERROR("BackendConnection[" + descriptor_.name + "]: initialize failed [" +
                  err.code + "]: " + err.message);
        terminate(ErrorCategory::BackendUnavailable);
        return err;
    }

    const Message& message = core::errors::get_value(response);
    if (message.contains("error")) {
        const std::string detail = message["error"].dump();
        LOG_ERROR("BackendConnection[" + descriptor_.name +
                  "]: initialize rejected: " + detail);
        terminate(ErrorCategory::BackendUnavailable);
        return ProxyError{ErrorCategory::BackendUnavailable,
                          "Backend '" + descriptor_.name +
                              "' rejected initialize: " + detail,
                          "handshake_rejected"};
    }

    auto notified = notify("notifications/initialized", json::object());
    if (core::errors::is_error(notified)) {
        terminate(ErrorCategory::BackendUnavailable);
        return core::errors::get_error(notified);
    }

    if (!transition(ConnectionState::Ready)) {
        return unavailable_error("terminated during handshake");
    }

    const auto& result = message["result"];
    if (result.is_object() && result.contains("serverInfo")) {
        LOG_INFO("BackendConnection[" + descriptor_.name + "]: server " +
                 result["serverInfo"].dump());
    }
    return ConnectionState::Ready;
}

Result<PendingCall> BackendConnection::send(
    const std::string& method, const json& params,
    const std::optional<std::chrono::milliseconds> timeout) {
    const ConnectionState current = state_.load();
    if (current == ConnectionState::Terminated) {
        return unavailable_error("connection terminated");
    }
    if (current == ConnectionState::Idle || current == ConnectionState::Spawning) {
        return ProxyError{ErrorCategory::BackendUnavailable,
                          "Backend '" + descriptor_.name + "' has not been started.",
                          "backend_not_started"};
    }

    const std::int64_t id = next_id_.fetch_add(1);
    if (builtin_handler_) {
        return send_builtin(id, method, params);
    }

    const auto now = std::chrono::steady_clock::now();
    PendingRequest entry;
    entry.id = id;
    entry.method = method;
    entry.created = now;
    entry.deadline = now + timeout.value_or(options_.request_timeout);
    const auto deadline = entry.deadline;
    ResponseFuture future = entry.slot.get_future();

    {
        // Checked under the table lock: fail_all_pending() marks the state
        // first, so an entry registered here is always seen by it.
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (state_.load() == ConnectionState::Terminated) {
            return unavailable_error("connection terminated");
        }
        pending_.emplace(id, std::move(entry));
    }

    auto process = current_process();
    const std::string line = protocol::make_request(id, method, params).dump() + "\n";
    Result<std::size_t> written = process
                                      ? process->write_all(line, deadline)
                                      : Result<std::size_t>(unavailable_error("no process"));
    if (core::errors::is_error(written)) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
        return core::errors::get_error(written);
    }

    LOG_DEBUG(">>> " + descriptor_.name + ": " + trim_line(line.substr(0, line.size() - 1)));
    return PendingCall{id, std::move(future)};
}

Result<PendingCall> BackendConnection::send_builtin(const std::int64_t id,
                                                    const std::string& method,
                                                    const json& params) {
    std::promise<Result<Message>> slot;
    PendingCall pending{id, slot.get_future()};

    // A built-in answers like a process would: handler failures become
    // JSON-RPC error responses.
    auto outcome = builtin_handler_(method, params);
    if (core::errors::is_error(outcome)) {
        slot.set_value(protocol::make_error_response(id, core::errors::get_error(outcome)));
    } else {
        slot.set_value(protocol::make_result_response(id, core::errors::get_value(outcome)));
    }
    return pending;
}

Result<Message> BackendConnection::call(const std::string& method, const json& params,
                                        const std::optional<std::chrono::milliseconds> timeout) {
    auto sent = send(method, params, timeout);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    // Always resolves: by response, by the reaper's deadline, or by termination.
    return core::errors::get_value(sent).future.get();
}

Result<std::size_t> BackendConnection::notify(const std::string& method, const json& params) {
    const ConnectionState current = state_.load();
    if (current == ConnectionState::Terminated || current == ConnectionState::Idle) {
        return unavailable_error("cannot deliver " + method);
    }
    if (builtin_handler_) {
        return std::size_t{0};
    }

    auto process = current_process();
    if (!process) {
        return unavailable_error("no process");
    }
    const std::string line = protocol::make_notification(method, params).dump() + "\n";
    LOG_DEBUG(">>> " + descriptor_.name + ": " + trim_line(line.substr(0, line.size() - 1)));
    return process->write_all(line, std::chrono::steady_clock::now() + options_.request_timeout);
}

void BackendConnection::add_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.push_back(std::move(handler));
}

bool BackendConnection::resolve(const std::int64_t id, Result<Message> outcome) {
    std::promise<Result<Message>> slot;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        slot = std::move(it->second.slot);
        pending_.erase(it);
    }
    slot.set_value(std::move(outcome));
    return true;
}

void BackendConnection::fail_all_pending(const ProxyError& error) {
    std::unordered_map<std::int64_t, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        drained.swap(pending_);
    }
    if (!drained.empty()) {
        LOG_WARN("BackendConnection[" + descriptor_.name + "]: failing " +
                 std::to_string(drained.size()) + " pending request(s): " + error.message);
    }
    for (auto& [id, entry] : drained) {
        entry.slot.set_value(error);
    }
}

void BackendConnection::read_stdout_loop() {
    auto process = current_process();
    if (!process) {
        return;
    }
    const int fd = process->stdout_fd();
    char buffer[4096];

    while (!stopping_.load()) {
        bool readable = false;
        if (!wait_readable(fd, readable)) {
            break;
        }
        if (!readable) {
            continue;
        }

        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            for (auto& event : framer_.feed(std::string_view(buffer, static_cast<std::size_t>(n)))) {
                if (core::errors::is_error(event)) {
                    const auto& err = core::errors::get_error(event);
                    LOG_WARN("BackendConnection[" + descriptor_.name + "]: framing error [" +
                             err.code + "]: " + err.message);
                    continue;
                }
                handle_message(core::errors::get_value(event));
            }
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        break;
    }

    if (!stopping_.load()) {
        handle_stream_closed();
    }
}

void BackendConnection::read_stderr_loop() {
    auto process = current_process();
    if (!process) {
        return;
    }
    const int fd = process->stderr_fd();
    char buffer[4096];
    std::string pending_line;

    while (!stopping_.load()) {
        bool readable = false;
        if (!wait_readable(fd, readable)) {
            break;
        }
        if (!readable) {
            continue;
        }

        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            pending_line.append(buffer, static_cast<std::size_t>(n));
            std::size_t newline = pending_line.find('\n');
            while (newline != std::string::npos) {
                const std::string line = pending_line.substr(0, newline);
                pending_line.erase(0, newline + 1);
                if (!line.empty()) {
                    LOG_WARN("BackendConnection[" + descriptor_.name + "] stderr: " +
                             trim_line(line));
                }
                newline = pending_line.find('\n');
            }
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        break;
    }

    if (!pending_line.empty()) {
        LOG_WARN("BackendConnection[" + descriptor_.name + "] stderr: " +
                 trim_line(pending_line));
    }
}

void BackendConnection::reap_loop() {
    std::unique_lock<std::mutex> lock(reaper_mutex_);
    while (!stopping_.load()) {
        reaper_cv_.wait_for(lock, options_.reap_interval,
                            [this]() { return stopping_.load(); });
        if (stopping_.load()) {
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        std::vector<PendingRequest> expired;
        {
            std::lock_guard<std::mutex> pending_lock(pending_mutex_);
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->second.deadline <= now) {
                    expired.push_back(std::move(it->second));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (auto& entry : expired) {
            const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now - entry.created)
                                    .count();
            LOG_WARN("BackendConnection[" + descriptor_.name + "]: request " +
                     std::to_string(entry.id) + " (" + entry.method + ") timed out after " +
                     std::to_string(waited) + " ms");
            entry.slot.set_value(ProxyError{
                ErrorCategory::Timeout,
                "Backend '" + descriptor_.name + "' did not answer " + entry.method +
                    " within " + std::to_string(waited) + " ms.",
                "request_timeout"});
        }
    }
}

void BackendConnection::handle_message(const Message& message) {
    if (core::logging::Logger::get().enabled(core::logging::LogLevel::DEBUG)) {
        LOG_DEBUG("<<< " + descriptor_.name + ": " + trim_line(message.dump()));
    }

    const MessageKind kind = protocol::classify(message);
    if (kind == MessageKind::Response) {
        const auto& id = message["id"];
        if (id.is_number_integer() && resolve(id.get<std::int64_t>(), message)) {
            return;
        }
        // Late answers to timed-out requests end up here as well.
        LOG_WARN("BackendConnection[" + descriptor_.name +
                 "]: correlation error, no pending request for id " + id.dump());
        return;
    }

    const std::string method = message["method"].get<std::string>();
    if (kind == MessageKind::Request) {
        // Server-initiated requests are answered here; the caller never sees
        // them, so its ids cannot collide with ours.
        if (method == "ping") {
            reply_to_backend(protocol::make_result_response(message["id"], json::object()));
        } else {
            LOG_DEBUG("BackendConnection[" + descriptor_.name +
                      "]: rejecting server request " + method);
            reply_to_backend(protocol::make_error_response(message["id"], -32601,
                                                           "Method not found: " + method));
        }
        return;
    }

    std::vector<MessageHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handlers = handlers_;
    }
    if (handlers.empty()) {
        LOG_DEBUG("BackendConnection[" + descriptor_.name + "]: unhandled " +
                  protocol::describe(message));
        return;
    }
    for (const auto& handler : handlers) {
        try {
            handler(descriptor_.name, message);
        } catch (const std::exception& e) {
            LOG_ERROR("BackendConnection[" + descriptor_.name + "]: message handler failed: " +
                      e.what());
        }
    }
}

void BackendConnection::reply_to_backend(const Message& response) {
    auto process = current_process();
    if (!process) {
        return;
    }
    const std::string line = response.dump() + "\n";
    auto written =
        process->write_all(line, std::chrono::steady_clock::now() + options_.request_timeout);
    if (core::errors::is_error(written)) {
        LOG_WARN("BackendConnection[" + descriptor_.name +
                 "]: failed to answer request: " + core::errors::get_error(written).message);
    }
}

void BackendConnection::handle_stream_closed() {
    std::string exit_text = "still running";
    if (auto process = current_process()) {
        if (auto code = process->try_reap()) {
            exit_text = "exit code " + std::to_string(*code);
        }
    }
    LOG_WARN("BackendConnection[" + descriptor_.name + "]: stdout closed (" + exit_text + ")");

    terminal_reason_ = ErrorCategory::BackendUnavailable;
    transition(ConnectionState::Terminated);
    fail_all_pending(ProxyError{ErrorCategory::BackendUnavailable,
                                "Backend '" + descriptor_.name + "' terminated (" +
                                    exit_text + ").",
                                "backend_terminated"});
}

void BackendConnection::join_threads() {
    for (std::thread* worker : {&stdout_reader_, &stderr_reader_, &reaper_}) {
        if (!worker->joinable()) {
            continue;
        }
        if (worker->get_id() == std::this_thread::get_id()) {
            worker->detach();
            continue;
        }
        worker->join();
    }
}

void BackendConnection::terminate(const ErrorCategory reason) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    const ConnectionState previous = state_.load();
    if (previous != ConnectionState::Terminated) {
        terminal_reason_ = reason;
    }

    stopping_ = true;
    {
        std::lock_guard<std::mutex> reaper_lock(reaper_mutex_);
    }
    reaper_cv_.notify_all();

    transition(ConnectionState::Terminated);
    fail_all_pending(unavailable_error("connection terminated"));

    if (auto process = current_process()) {
        const int code = process->terminate(options_.shutdown_grace);
        if (previous != ConnectionState::Terminated) {
            LOG_INFO("BackendConnection[" + descriptor_.name + "]: process " +
                     std::to_string(process->pid()) + " exited with " + std::to_string(code));
        }
    }
    join_threads();
}

}  // namespace mcproxy::backend
