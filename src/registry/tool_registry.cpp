#include "registry/tool_registry.hpp"

#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "registry/path_query.hpp"

namespace mcproxy::registry {

using core::errors::Result;
using nlohmann::json;
using protocol::ToolDescriptor;

namespace {

json build_sparse_view() {
    json discover = {
        {"name", "mcp_discover"},
        {"description",
         "Discover available tools and servers using JSONPath. Query $.tools[*] for every "
         "tool, $.servers for the connected backends."},
        {"inputSchema",
         {{"type", "object"},
          {"properties",
           {{"jsonpath",
             {{"type", "string"},
              {"description", "JSONPath expression (e.g., '$.tools[*].name')"}}}}},
          {"required", json::array({"jsonpath"})}}}};

    json call = {
        {"name", "mcp_call"},
        {"description", "Execute any MCP tool by constructing a JSON-RPC call."},
        {"inputSchema",
         {{"type", "object"},
          {"properties",
           {{"method",
             {{"type", "string"}, {"description", "JSON-RPC method (e.g., 'tools/call')"}}},
            {"params", {{"type", "object"}, {"description", "Method parameters"}}}}},
          {"required", json::array({"method", "params"})}}}};

    json onboarding = {
        {"name", "onboarding"},
        {"description",
         "Get or set identity-specific onboarding instructions for AI contexts."},
        {"inputSchema",
         {{"type", "object"},
          {"properties",
           {{"identity",
             {{"type", "string"},
              {"description", "Identity for onboarding (e.g., 'Claude', project name)"}}},
            {"instructions",
             {{"type", "string"},
              {"description",
               "Optional: Set new instructions. If omitted, retrieves existing."}}},
            {"append",
             {{"type", "boolean"},
              {"description", "Append to existing instructions instead of replacing"},
              {"default", false}}}}},
          {"required", json::array({"identity"})}}}};

    return json::array({std::move(discover), std::move(call), std::move(onboarding)});
}

json render_tool(const ToolDescriptor& tool) {
    return json{{"name", protocol::namespaced_name(tool)},
                {"tool", tool.name},
                {"server", tool.backend},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}};
}

}  // namespace

void ToolRegistry::update_backend_tools(const std::string& backend,
                                        std::vector<ToolDescriptor> tools,
                                        const bool register_aliases) {
    auto next = std::make_shared<BackendTools>();
    next->register_aliases = register_aliases;
    next->tools.reserve(tools.size());

    std::set<std::string> seen;
    for (auto& tool : tools) {
        if (!seen.insert(tool.name).second) {
            LOG_WARN("ToolRegistry: " + backend + " reported duplicate tool " + tool.name +
                     ", keeping the first");
            continue;
        }
        tool.backend = backend;
        next->tools.push_back(std::move(tool));
    }

    const std::size_t count = next->tools.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_[backend] = std::move(next);
    }
    LOG_DEBUG("ToolRegistry: " + backend + " now has " + std::to_string(count) + " tool(s)");
}

bool ToolRegistry::remove_backend_tools(const std::string& backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    descriptions_.erase(backend);
    return catalog_.erase(backend) != 0;
}

void ToolRegistry::set_backend_info(const std::string& backend,
                                    const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    descriptions_[backend] = description;
}

std::map<std::string, ToolRegistry::Entries> ToolRegistry::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return catalog_;
}

json ToolRegistry::snapshot() const {
    std::map<std::string, Entries> catalog;
    std::map<std::string, std::string> descriptions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog = catalog_;
        descriptions = descriptions_;
    }

    json tools = json::array();
    json names = json::array();
    json servers = json::object();
    for (const auto& [backend, set] : catalog) {
        for (const auto& tool : set->tools) {
            tools.push_back(render_tool(tool));
            names.push_back(protocol::namespaced_name(tool));
        }
        servers[backend] = {{"description", ""}, {"tool_count", set->tools.size()}};
    }
    for (const auto& [backend, description] : descriptions) {
        auto& server = servers[backend];
        server["description"] = description;
        if (!server.contains("tool_count")) {
            server["tool_count"] = 0;
        }
    }

    return json{{"tools", std::move(tools)},
                {"tool_names", std::move(names)},
                {"servers", std::move(servers)}};
}

Result<json> ToolRegistry::query(const std::string& path) const {
    auto compiled = PathQuery::parse(path);
    if (core::errors::is_error(compiled)) {
        return core::errors::get_error(compiled);
    }
    return core::errors::get_value(compiled).evaluate(snapshot());
}

std::optional<ToolDescriptor> ToolRegistry::find_tool(const std::string& namespaced_name) const {
    std::string backend;
    std::string tool;
    if (!protocol::split_namespaced_name(namespaced_name, backend, tool)) {
        return std::nullopt;
    }

    Entries set;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = catalog_.find(backend);
        if (it == catalog_.end()) {
            return std::nullopt;
        }
        set = it->second;
    }
    for (const auto& candidate : set->tools) {
        if (candidate.name == tool) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ToolRegistry::resolve_alias(const std::string& name) const {
    // Aliasing backends are visited in name order; the first match wins.
    for (const auto& [backend, set] : entries()) {
        if (!set->register_aliases) {
            continue;
        }
        for (const auto& tool : set->tools) {
            if (tool.name == name) {
                return protocol::namespaced_name(tool);
            }
        }
    }
    return std::nullopt;
}

std::size_t ToolRegistry::tool_count() const {
    std::size_t count = 0;
    for (const auto& [backend, set] : entries()) {
        count += set->tools.size();
    }
    return count;
}

std::vector<std::string> ToolRegistry::tool_names() const {
    std::vector<std::string> names;
    for (const auto& [backend, set] : entries()) {
        for (const auto& tool : set->tools) {
            names.push_back(protocol::namespaced_name(tool));
        }
    }
    return names;
}

std::vector<std::string> ToolRegistry::backends() const {
    std::vector<std::string> names;
    for (const auto& [backend, set] : entries()) {
        names.push_back(backend);
    }
    return names;
}

const json& ToolRegistry::sparse_view() {
    static const json view = build_sparse_view();
    return view;
}

}  // namespace mcproxy::registry
