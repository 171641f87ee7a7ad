#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend/backend_pool.hpp"
#include "builtin/onboarding_backend.hpp"
#include "core/config/proxy_config.hpp"
#include "core/errors/proxy_errors.hpp"
#include "gateway/sparse_gateway.hpp"
#include "protocol/backend_descriptor.hpp"
#include "protocol/jsonrpc.hpp"
#include "registry/tool_registry.hpp"

namespace mcproxy::proxy {

// Receives backend notifications, tagged with the backend that sent them.
using NotificationSink =
    std::function<void(const std::string& backend, const protocol::Message& message)>;

backend::ConnectionOptions connection_options(const core::config::ProxyConfig& config);

class Proxy {
public:
    explicit Proxy(core::config::ProxyConfig config = {});
    ~Proxy();

    Proxy(const Proxy&) = delete;
    Proxy& operator=(const Proxy&) = delete;

    // Built-in backends, then configured ones, then an initial refresh.
    // A configured backend that fails to start is logged and skipped.
    std::vector<backend::RefreshOutcome> start();

    // Blocks until the request is answered. Returns the response for the
    // caller (its own id), a null message for notifications, or one error.
    core::errors::Result<protocol::Message> call(const protocol::Message& request);

    // Registry read only; never touches a backend.
    core::errors::Result<nlohmann::json> discover(const std::string& path) const;

    core::errors::Result<backend::ConnectionState> add_backend(
        const protocol::BackendDescriptor& descriptor);
    core::errors::Result<std::string> remove_backend(const std::string& name);
    std::vector<backend::RefreshOutcome> refresh();

    // Stops every backend. Calls still waiting and every later call fail
    // with a Shutdown error.
    void shutdown();
    bool is_shut_down() const { return shut_down_.load(); }

    void set_notification_sink(NotificationSink sink);

    registry::ToolRegistry& registry() { return registry_; }
    const registry::ToolRegistry& registry() const { return registry_; }
    backend::BackendPool& pool() { return pool_; }
    const core::config::ProxyConfig& config() const { return config_; }

private:
    void deliver_notification(const std::string& backend, const protocol::Message& message);

    core::config::ProxyConfig config_;
    registry::ToolRegistry registry_;
    std::unique_ptr<builtin::OnboardingBackend> onboarding_;
    backend::BackendPool pool_;
    gateway::SparseGateway gateway_;

    std::atomic_bool shut_down_{false};
    std::mutex sink_mutex_;
    NotificationSink sink_;
};

}  // namespace mcproxy::proxy
