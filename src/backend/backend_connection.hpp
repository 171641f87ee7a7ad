#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend/child_process.hpp"
#include "core/errors/proxy_errors.hpp"
#include "protocol/backend_descriptor.hpp"
#include "protocol/framer.hpp"
#include "protocol/jsonrpc.hpp"

namespace mcproxy::backend {

enum class ConnectionState {
    Idle,
    Spawning,
    Handshaking,
    Ready,
    Terminated
};

std::string to_string(ConnectionState state);

struct ConnectionOptions {
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds handshake_timeout{3000};
    std::chrono::milliseconds shutdown_grace{5000};
    std::chrono::milliseconds reap_interval{50};
    std::size_t max_message_bytes = protocol::Framer::kDefaultMaxMessageBytes;
};

// Resolved value is the backend's full response message (result or error
// member, relayed as-is). Proxy-level failures arrive as ProxyError.
using ResponseFuture = std::future<core::errors::Result<protocol::Message>>;

struct PendingCall {
    std::int64_t id = 0;
    ResponseFuture future;
};

// Receives the notifications of one backend.
using MessageHandler =
    std::function<void(const std::string& backend, const protocol::Message& message)>;

// In-process implementation of a built-in backend: answers (method, params)
// with the JSON-RPC result value, or a ProxyError.
using BuiltinHandler = std::function<core::errors::Result<nlohmann::json>(
    const std::string& method, const nlohmann::json& params)>;

class BackendConnection {
public:
    BackendConnection(protocol::BackendDescriptor descriptor, ConnectionOptions options);
    BackendConnection(protocol::BackendDescriptor descriptor, BuiltinHandler handler,
                      ConnectionOptions options);
    ~BackendConnection();

    BackendConnection(const BackendConnection&) = delete;
    BackendConnection& operator=(const BackendConnection&) = delete;

    core::errors::Result<ConnectionState> spawn();
    // initialize handshake plus notifications/initialized; moves to Ready.
    core::errors::Result<ConnectionState> initialize();

    core::errors::Result<PendingCall> send(
        const std::string& method, const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // send() and wait for the resolution.
    core::errors::Result<protocol::Message> call(
        const std::string& method, const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    core::errors::Result<std::size_t> notify(const std::string& method,
                                             const nlohmann::json& params);

    void add_message_handler(MessageHandler handler);

    // Stops the process and resolves every pending request with `reason`.
    // Safe to call more than once and from any thread except the
    // connection's own reader threads.
    void terminate(core::errors::ErrorCategory reason =
                       core::errors::ErrorCategory::BackendUnavailable);

    const protocol::BackendDescriptor& descriptor() const { return descriptor_; }
    const std::string& name() const { return descriptor_.name; }
    ConnectionState state() const { return state_.load(); }
    bool is_builtin() const { return static_cast<bool>(builtin_handler_); }
    std::size_t pending_count() const;
    std::optional<pid_t> pid() const;
    std::chrono::milliseconds request_timeout() const { return options_.request_timeout; }
    std::chrono::milliseconds handshake_timeout() const { return options_.handshake_timeout; }

private:
    struct PendingRequest {
        std::int64_t id;
        std::string method;
        std::chrono::steady_clock::time_point created;
        std::chrono::steady_clock::time_point deadline;
        std::promise<core::errors::Result<protocol::Message>> slot;
    };

    core::errors::Result<PendingCall> send_builtin(std::int64_t id,
                                                   const std::string& method,
                                                   const nlohmann::json& params);
    core::errors::ProxyError unavailable_error(const std::string& what) const;
    std::shared_ptr<ChildProcess> current_process() const;
    void join_threads();

    void read_stdout_loop();
    void read_stderr_loop();
    void reap_loop();
    void handle_message(const protocol::Message& message);
    void reply_to_backend(const protocol::Message& response);
    void handle_stream_closed();

    // Removes the entry and fulfils it. Returns false when another path
    // already resolved it.
    bool resolve(std::int64_t id, core::errors::Result<protocol::Message> outcome);
    void fail_all_pending(const core::errors::ProxyError& error);
    bool transition(ConnectionState next);

    protocol::BackendDescriptor descriptor_;
    ConnectionOptions options_;
    BuiltinHandler builtin_handler_;

    std::atomic<ConnectionState> state_{ConnectionState::Idle};
    std::atomic<core::errors::ErrorCategory> terminal_reason_{
        core::errors::ErrorCategory::BackendUnavailable};
    std::atomic<std::int64_t> next_id_{1};
    std::atomic_bool stopping_{false};

    mutable std::mutex process_mutex_;
    std::shared_ptr<ChildProcess> process_;
    protocol::Framer framer_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::int64_t, PendingRequest> pending_;

    std::mutex handlers_mutex_;
    std::vector<MessageHandler> handlers_;

    std::mutex lifecycle_mutex_;
    std::mutex reaper_mutex_;
    std::condition_variable reaper_cv_;
    std::thread stdout_reader_;
    std::thread stderr_reader_;
    std::thread reaper_;
};

}  // namespace mcproxy::backend
