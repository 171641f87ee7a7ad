#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "backend/backend_connection.hpp"
#include "core/errors/proxy_errors.hpp"
#include "protocol/backend_descriptor.hpp"
#include "protocol/tool_contract.hpp"
#include "registry/tool_registry.hpp"

namespace mcproxy::backend {

// Per-backend result of a catalog refresh.
struct RefreshOutcome {
    std::string backend;
    bool success = false;
    std::size_t tool_count = 0;
    std::optional<core::errors::ProxyError> error;
};

class BackendPool {
public:
    explicit BackendPool(ConnectionOptions options = {});
    ~BackendPool();

    BackendPool(const BackendPool&) = delete;
    BackendPool& operator=(const BackendPool&) = delete;

    // Spawns and initializes the backend. An existing backend with the same
    // name keeps serving until the replacement is Ready.
    core::errors::Result<ConnectionState> add_backend(
        const protocol::BackendDescriptor& descriptor);
    core::errors::Result<ConnectionState> add_builtin(
        const protocol::BackendDescriptor& descriptor, BuiltinHandler handler);
    // Once this returns, no refresh still in flight merges the backend's
    // tools into a registry.
    core::errors::Result<std::string> remove_backend(const std::string& name);

    // "<backend>::<tool>" -> connection of <backend>.
    core::errors::Result<std::shared_ptr<BackendConnection>> route(
        const std::string& namespaced_name) const;
    core::errors::Result<std::shared_ptr<BackendConnection>> find(
        const std::string& backend_name) const;

    std::vector<RefreshOutcome> broadcast_refresh(registry::ToolRegistry& registry) const;
    RefreshOutcome refresh_backend(const std::string& name,
                                   registry::ToolRegistry& registry) const;

    // Terminates every connection concurrently, each within the grace period.
    void shutdown(core::errors::ErrorCategory reason = core::errors::ErrorCategory::Shutdown);

    // Attached to every current and future connection.
    void add_message_handler(MessageHandler handler);

    std::vector<std::string> backend_names() const;
    std::size_t size() const;
    bool is_builtin(const std::string& name) const;
    core::errors::Result<ConnectionState> state_of(const std::string& name) const;

    // tools/list with nextCursor pagination.
    static core::errors::Result<std::vector<protocol::ToolDescriptor>> fetch_tools(
        BackendConnection& connection);

private:
    core::errors::Result<ConnectionState> install(std::shared_ptr<BackendConnection> connection);
    RefreshOutcome refresh_connection(const std::shared_ptr<BackendConnection>& connection,
                                      registry::ToolRegistry& registry) const;

    ConnectionOptions options_;

    // Orders registry merges against removals; taken before mutex_.
    mutable std::mutex registry_mutex_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<BackendConnection>> connections_;
    std::set<std::string> builtin_names_;
    std::vector<MessageHandler> handlers_;
    bool shut_down_ = false;
};

}  // namespace mcproxy::backend
