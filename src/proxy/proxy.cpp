#include "proxy/proxy.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcproxy::proxy {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using core::errors::Result;
using nlohmann::json;
using protocol::Message;

namespace {

ProxyError shutdown_error() {
    return ProxyError{ErrorCategory::Shutdown, "Proxy is shutting down.", "proxy_shut_down"};
}

}  // namespace

backend::ConnectionOptions connection_options(const core::config::ProxyConfig& config) {
    backend::ConnectionOptions options;
    options.request_timeout = std::chrono::milliseconds(config.request_timeout_ms);
    options.handshake_timeout = std::chrono::milliseconds(config.handshake_timeout_ms);
    options.shutdown_grace = std::chrono::milliseconds(config.shutdown_grace_ms);
    options.max_message_bytes = config.max_message_bytes;
    return options;
}

Proxy::Proxy(core::config::ProxyConfig config)
    : config_(std::move(config)),
      pool_(connection_options(config_)),
      gateway_(pool_, registry_, config_.onboarding_backend) {
    pool_.add_message_handler([this](const std::string& backend, const Message& message) {
        deliver_notification(backend, message);
    });
}

Proxy::~Proxy() {
    shutdown();
}

std::vector<backend::RefreshOutcome> Proxy::start() {
    if (config_.enable_builtin_servers) {
        onboarding_ = std::make_unique<builtin::OnboardingBackend>(config_.onboarding_backend);
        auto added = pool_.add_builtin(onboarding_->descriptor(), onboarding_->handler());
        if (core::errors::is_error(added)) {
            const auto& err = core::errors::get_error(added);
            LOG_ERROR("Proxy: built-in " + config_.onboarding_backend + " failed [" + err.code +
                      "]: " + err.message);
        }
    }

    for (const auto& descriptor : config_.backends) {
        if (descriptor.is_builtin()) {
            if (descriptor.name != config_.onboarding_backend) {
                LOG_WARN("Proxy: no built-in backend named " + descriptor.name + ", skipping");
            }
            continue;
        }
        auto added = pool_.add_backend(descriptor);
        if (core::errors::is_error(added)) {
            const auto& err = core::errors::get_error(added);
            LOG_ERROR("Proxy: backend " + descriptor.name + " failed to start [" + err.code +
                      "]: " + err.message);
        }
    }

    auto outcomes = refresh();
    LOG_INFO("Proxy: started with " + std::to_string(pool_.size()) + " backend(s), " +
             std::to_string(registry_.tool_count()) + " tool(s)");
    return outcomes;
}

Result<Message> Proxy::call(const Message& request) {
    if (shut_down_.load()) {
        return shutdown_error();
    }
    auto response = gateway_.handle(request);
    if (core::errors::is_error(response) && shut_down_.load()) {
        const auto& err = core::errors::get_error(response);
        if (err.category == ErrorCategory::BackendUnavailable) {
            return shutdown_error();
        }
    }
    return response;
}

Result<json> Proxy::discover(const std::string& path) const {
    return registry_.query(path);
}

Result<backend::ConnectionState> Proxy::add_backend(
    const protocol::BackendDescriptor& descriptor) {
    if (shut_down_.load()) {
        return shutdown_error();
    }
    auto added = pool_.add_backend(descriptor);
    if (core::errors::is_error(added) || !config_.refresh_on_add) {
        return added;
    }

    const auto outcome = pool_.refresh_backend(descriptor.name, registry_);
    if (!outcome.success && outcome.error.has_value()) {
        LOG_WARN("Proxy: backend " + descriptor.name + " added but tools/list failed: " +
                 outcome.error->message);
    }
    return added;
}

Result<std::string> Proxy::remove_backend(const std::string& name) {
    if (shut_down_.load()) {
        return shutdown_error();
    }
    auto removed = pool_.remove_backend(name);
    if (!core::errors::is_error(removed)) {
        registry_.remove_backend_tools(name);
    }
    return removed;
}

std::vector<backend::RefreshOutcome> Proxy::refresh() {
    if (shut_down_.load()) {
        return {};
    }
    return pool_.broadcast_refresh(registry_);
}

void Proxy::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }
    LOG_INFO("Proxy: shutting down");
    pool_.shutdown(ErrorCategory::Shutdown);
}

void Proxy::set_notification_sink(NotificationSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void Proxy::deliver_notification(const std::string& backend, const Message& message) {
    NotificationSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (!sink) {
        LOG_DEBUG("Proxy: dropped " + protocol::describe(message) + " from " + backend);
        return;
    }
    sink(backend, message);
}

}  // namespace mcproxy::proxy
