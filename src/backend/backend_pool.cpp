#include "backend/backend_pool.hpp"

#include <future>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcproxy::backend {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using core::errors::Result;
using nlohmann::json;
using protocol::BackendDescriptor;
using protocol::ToolDescriptor;

namespace {

constexpr int kMaxToolPages = 64;

ProxyError shutdown_error() {
    return ProxyError{ErrorCategory::Shutdown, "Backend pool is shut down.",
                      "pool_shut_down"};
}

}  // namespace

BackendPool::BackendPool(ConnectionOptions options) : options_(options) {}

BackendPool::~BackendPool() {
    shutdown(ErrorCategory::Shutdown);
}

Result<ConnectionState> BackendPool::add_backend(const BackendDescriptor& descriptor) {
    if (descriptor.name.empty()) {
        return ProxyError{ErrorCategory::Input, "Backend name cannot be empty.",
                          "invalid_backend"};
    }
    if (descriptor.is_builtin()) {
        return ProxyError{ErrorCategory::Input,
                          "Backend '" + descriptor.name +
                              "' has no command; built-in backends need a handler.",
                          "builtin_requires_handler"};
    }
    if (is_builtin(descriptor.name)) {
        return ProxyError{ErrorCategory::Input,
                          "Backend name '" + descriptor.name + "' belongs to a built-in backend.",
                          "builtin_backend"};
    }
    return install(std::make_shared<BackendConnection>(descriptor, options_));
}

Result<ConnectionState> BackendPool::add_builtin(const BackendDescriptor& descriptor,
                                                 BuiltinHandler handler) {
    if (descriptor.name.empty() || !handler) {
        return ProxyError{ErrorCategory::Input,
                          "Built-in backend needs a name and a handler.",
                          "invalid_backend"};
    }
    auto installed =
        install(std::make_shared<BackendConnection>(descriptor, std::move(handler), options_));
    if (!core::errors::is_error(installed)) {
        std::lock_guard<std::mutex> lock(mutex_);
        builtin_names_.insert(descriptor.name);
    }
    return installed;
}

Result<ConnectionState> BackendPool::install(std::shared_ptr<BackendConnection> connection) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return shutdown_error();
        }
        for (const auto& handler : handlers_) {
            connection->add_message_handler(handler);
        }
    }

    const std::string name = connection->name();
    auto spawned = connection->spawn();
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    auto initialized = connection->initialize();
    if (core::errors::is_error(initialized)) {
        return core::errors::get_error(initialized);
    }

    std::shared_ptr<BackendConnection> replaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            connection->terminate(ErrorCategory::Shutdown);
            return shutdown_error();
        }
        auto& slot = connections_[name];
        replaced = std::move(slot);
        slot = connection;
    }

    if (replaced) {
        LOG_INFO("BackendPool: backend " + name + " replaced, retiring previous connection");
        replaced->terminate(ErrorCategory::BackendUnavailable);
    } else {
        LOG_INFO("BackendPool: backend " + name + " added");
    }
    return ConnectionState::Ready;
}

Result<std::string> BackendPool::remove_backend(const std::string& name) {
    std::shared_ptr<BackendConnection> removed;
    {
        std::lock_guard<std::mutex> registry_lock(registry_mutex_);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(name);
        if (it == connections_.end()) {
            return ProxyError{ErrorCategory::UnknownTool, "Backend not found: " + name,
                              "unknown_backend"};
        }
        if (builtin_names_.count(name) != 0) {
            return ProxyError{ErrorCategory::Input,
                              "Built-in backend cannot be removed: " + name,
                              "builtin_backend"};
        }
        removed = std::move(it->second);
        connections_.erase(it);
    }

    removed->terminate(ErrorCategory::BackendUnavailable);
    LOG_INFO("BackendPool: backend " + name + " removed");
    return name;
}

Result<std::shared_ptr<BackendConnection>> BackendPool::route(
    const std::string& namespaced_name) const {
    std::string backend;
    std::string tool;
    if (!protocol::split_namespaced_name(namespaced_name, backend, tool)) {
        return ProxyError{ErrorCategory::UnknownTool,
                          "Tool name is not namespaced: " + namespaced_name,
                          "unqualified_tool_name",
                          "Use <backend>::<tool> or pass a 'server' field."};
    }
    return find(backend);
}

Result<std::shared_ptr<BackendConnection>> BackendPool::find(
    const std::string& backend_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return shutdown_error();
    }
    auto it = connections_.find(backend_name);
    if (it == connections_.end()) {
        return ProxyError{ErrorCategory::UnknownTool,
                          "No backend named '" + backend_name + "'.", "unknown_backend"};
    }
    return it->second;
}

Result<std::vector<ToolDescriptor>> BackendPool::fetch_tools(BackendConnection& connection) {
    std::vector<ToolDescriptor> tools;
    std::optional<std::string> cursor;

    for (int page = 0; page < kMaxToolPages; ++page) {
        json params = json::object();
        if (cursor.has_value()) {
            params["cursor"] = *cursor;
        }

        auto response = connection.call("tools/list", params, connection.handshake_timeout());
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        const auto& message = core::errors::get_value(response);
        if (message.contains("error")) {
            return ProxyError{ErrorCategory::BackendUnavailable,
                              "Backend '" + connection.name() +
                                  "' rejected tools/list: " + message["error"].dump(),
                              "tools_list_failed"};
        }

        const auto& result = message["result"];
        if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array()) {
            return ProxyError{ErrorCategory::Internal,
                              "Backend '" + connection.name() +
                                  "' returned a tools/list result without a tools array.",
                              "invalid_tools_list"};
        }

        for (const auto& entry : result["tools"]) {
            if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
                LOG_WARN("BackendPool: skipping nameless tool from " + connection.name());
                continue;
            }
            ToolDescriptor tool;
            tool.name = entry["name"].get<std::string>();
            tool.backend = connection.name();
            tool.input_schema = entry.value("inputSchema", json::object());
            tool.description = entry.value("description", std::string());
            tools.push_back(std::move(tool));
        }

        const auto next = result.find("nextCursor");
        if (next == result.end() || !next->is_string() || next->get<std::string>().empty()) {
            return tools;
        }
        cursor = next->get<std::string>();
    }

    LOG_WARN("BackendPool: " + connection.name() + " exceeded " +
             std::to_string(kMaxToolPages) + " tools/list pages, truncating");
    return tools;
}

RefreshOutcome BackendPool::refresh_connection(
    const std::shared_ptr<BackendConnection>& connection,
    registry::ToolRegistry& registry) const {
    RefreshOutcome outcome;
    outcome.backend = connection->name();

    auto fetched = fetch_tools(*connection);
    if (core::errors::is_error(fetched)) {
        outcome.error = core::errors::get_error(fetched);
        LOG_WARN("BackendPool: refresh of " + outcome.backend + " failed [" +
                 outcome.error->code + "]: " + outcome.error->message);
        return outcome;
    }

    auto tools = core::errors::get_value(fetched);
    {
        std::lock_guard<std::mutex> registry_lock(registry_mutex_);
        {
            // Removed or replaced while tools/list was in flight.
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = connections_.find(outcome.backend);
            if (it == connections_.end() || it->second != connection) {
                outcome.error = ProxyError{ErrorCategory::BackendUnavailable,
                                           "Backend '" + outcome.backend +
                                               "' left the pool during refresh.",
                                           "backend_retired"};
                LOG_INFO("BackendPool: dropping tools of retired " + outcome.backend +
                         " connection");
                return outcome;
            }
        }
        outcome.tool_count = tools.size();
        outcome.success = true;
        registry.set_backend_info(outcome.backend, connection->descriptor().description);
        registry.update_backend_tools(outcome.backend, std::move(tools),
                                      connection->is_builtin());
    }
    LOG_INFO("BackendPool: " + outcome.backend + " reported " +
             std::to_string(outcome.tool_count) + " tool(s)");
    return outcome;
}

std::vector<RefreshOutcome> BackendPool::broadcast_refresh(
    registry::ToolRegistry& registry) const {
    std::vector<std::shared_ptr<BackendConnection>> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, connection] : connections_) {
            if (connection->state() == ConnectionState::Ready) {
                ready.push_back(connection);
            }
        }
    }

    // Each task merges its own backend into the registry as soon as it
    // answers; a slow backend only delays its own entries.
    std::vector<std::future<RefreshOutcome>> tasks;
    tasks.reserve(ready.size());
    for (const auto& connection : ready) {
        tasks.push_back(std::async(std::launch::async, [this, connection, &registry]() {
            return refresh_connection(connection, registry);
        }));
    }

    std::vector<RefreshOutcome> outcomes;
    outcomes.reserve(tasks.size());
    for (auto& task : tasks) {
        outcomes.push_back(task.get());
    }
    return outcomes;
}

RefreshOutcome BackendPool::refresh_backend(const std::string& name,
                                            registry::ToolRegistry& registry) const {
    auto found = find(name);
    if (core::errors::is_error(found)) {
        RefreshOutcome outcome;
        outcome.backend = name;
        outcome.error = core::errors::get_error(found);
        return outcome;
    }
    return refresh_connection(core::errors::get_value(found), registry);
}

void BackendPool::shutdown(const ErrorCategory reason) {
    std::map<std::string, std::shared_ptr<BackendConnection>> retiring;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        retiring.swap(connections_);
    }

    if (!retiring.empty()) {
        LOG_INFO("BackendPool: shutting down " + std::to_string(retiring.size()) +
                 " backend(s)");
    }

    std::vector<std::future<void>> stops;
    stops.reserve(retiring.size());
    for (const auto& [name, connection] : retiring) {
        stops.push_back(std::async(std::launch::async,
                                   [connection, reason]() { connection->terminate(reason); }));
    }
    for (auto& stop : stops) {
        stop.get();
    }
}

void BackendPool::add_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, connection] : connections_) {
        connection->add_message_handler(handler);
    }
    handlers_.push_back(std::move(handler));
}

std::vector<std::string> BackendPool::backend_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(connections_.size());
    for (const auto& [name, connection] : connections_) {
        names.push_back(name);
    }
    return names;
}

std::size_t BackendPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

bool BackendPool::is_builtin(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return builtin_names_.count(name) != 0;
}

Result<ConnectionState> BackendPool::state_of(const std::string& name) const {
    auto found = find(name);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    return core::errors::get_value(found)->state();
}

}  // namespace mcproxy::backend
