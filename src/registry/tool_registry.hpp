#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace mcproxy::registry {

// Immutable entry set of one backend. Replaced as a whole on every update.
struct BackendTools {
    std::vector<protocol::ToolDescriptor> tools;
    bool register_aliases = false;
};

class ToolRegistry {
public:
    // Replaces every entry of `backend` in one step. Readers see either the
    // previous set or the new one. Built-in backends pass register_aliases so
    // their tools also resolve without the "<backend>::" prefix.
    void update_backend_tools(const std::string& backend,
                              std::vector<protocol::ToolDescriptor> tools,
                              bool register_aliases = false);
    bool remove_backend_tools(const std::string& backend);
    void set_backend_info(const std::string& backend, const std::string& description);

    // Evaluates a discovery path over snapshot(). Always an array.
    core::errors::Result<nlohmann::json> query(const std::string& path) const;

    // {"tools": [...], "tool_names": [...], "servers": {...}}
    nlohmann::json snapshot() const;

    std::optional<protocol::ToolDescriptor> find_tool(const std::string& namespaced_name) const;
    // Unqualified tool name of an aliasing backend -> its namespaced name.
    std::optional<std::string> resolve_alias(const std::string& name) const;

    std::size_t tool_count() const;
    std::vector<std::string> tool_names() const;
    std::vector<std::string> backends() const;

    // The three meta-tools shown to the caller. Never depends on the catalog.
    static const nlohmann::json& sparse_view();

private:
    using Entries = std::shared_ptr<const BackendTools>;

    std::map<std::string, Entries> entries() const;

    mutable std::mutex mutex_;
    std::map<std::string, Entries> catalog_;
    std::map<std::string, std::string> descriptions_;
};

}  // namespace mcproxy::registry
