#include "gateway/sparse_gateway.hpp"

#include <type_traits>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcproxy::gateway {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using core::errors::Result;
using nlohmann::json;
using protocol::Message;
using protocol::MessageKind;

namespace {

constexpr const char* kDefaultDiscoveryPath = "$.tools[*]";

// Optional string member; empty when absent. Non-string values are an error.
Result<std::string> optional_string(const json& object, const char* key) {
    if (!object.is_object()) {
        return std::string();
    }
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        return ProxyError{ErrorCategory::Input,
                          std::string("'") + key + "' must be a string.",
                          "invalid_params"};
    }
    return it->get<std::string>();
}

Result<json> object_member(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return json::object();
    }
    if (!it->is_object()) {
        return ProxyError{ErrorCategory::Input,
                          std::string("'") + key + "' must be an object.",
                          "invalid_params"};
    }
    return *it;
}

}  // namespace

std::string to_string(const VirtualTool tool) {
    switch (tool) {
        case VirtualTool::Discover:
            return "mcp_discover";
        case VirtualTool::Call:
            return "mcp_call";
        case VirtualTool::Onboarding:
            return "onboarding";
        default:
            return "unknown";
    }
}

SparseGateway::SparseGateway(backend::BackendPool& pool, registry::ToolRegistry& registry,
                             std::string onboarding_backend)
    : pool_(pool), registry_(registry), onboarding_backend_(std::move(onboarding_backend)) {}

const std::map<std::string, VirtualTool>& SparseGateway::virtual_tools() {
    static const std::map<std::string, VirtualTool> table = {
        {"mcp_discover", VirtualTool::Discover},
        {"mcp_call", VirtualTool::Call},
        {"onboarding", VirtualTool::Onboarding},
    };
    return table;
}

Message SparseGateway::filter_response(Message response) {
    if (!response.is_object()) {
        return response;
    }
    auto result = response.find("result");
    if (result == response.end() || !result->is_object()) {
        return response;
    }
    auto tools = result->find("tools");
    if (tools != result->end() && tools->is_array()) {
        *tools = registry::ToolRegistry::sparse_view();
    }
    return response;
}

Result<Message> SparseGateway::handle(const Message& message) {
    switch (protocol::classify(message)) {
        case MessageKind::Request:
            return dispatch_request(message);
        case MessageKind::Notification:
            LOG_DEBUG("SparseGateway: absorbed caller notification " +
                      message["method"].get<std::string>());
            return Message();
        case MessageKind::Response:
            LOG_DEBUG("SparseGateway: absorbed caller " + protocol::describe(message));
            return Message();
        default:
            return ProxyError{ErrorCategory::Input,
                              "Message is not a JSON-RPC request, response or notification.",
                              "invalid_request"};
    }
}

Result<Message> SparseGateway::dispatch_request(const Message& request) {
    const json& id = request["id"];
    const std::string method = request["method"].get<std::string>();

    json params = json::object();
    if (request.contains("params") && !request["params"].is_null()) {
        if (!request["params"].is_object()) {
            return ProxyError{ErrorCategory::Input,
                              "params of " + method + " must be an object.",
                              "invalid_params"};
        }
        params = request["params"];
    }

    auto server = optional_string(params, "server");
    if (core::errors::is_error(server)) {
        return core::errors::get_error(server);
    }
    const std::string& backend = core::errors::get_value(server);

    if (method == "tools/call") {
        return handle_tools_call(id, params);
    }
    if (backend.empty()) {
        if (method == "initialize") {
            return initialize_result(id, params);
        }
        if (method == "ping") {
            return protocol::make_result_response(id, json::object());
        }
        if (method == "tools/list") {
            return protocol::make_result_response(
                id, json{{"tools", registry::ToolRegistry::sparse_view()}});
        }
        return ProxyError{ErrorCategory::UnknownTool, "Method not found: " + method,
                          "unknown_method",
                          "Pass a 'server' field to forward " + method + " to a backend."};
    }

    params.erase("server");
    return forward(id, backend, method, params);
}

Message SparseGateway::initialize_result(const json& id, const json& params) const {
    std::string version = protocol::kProtocolVersion;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    if (params.contains("clientInfo")) {
        LOG_INFO("SparseGateway: caller " + params["clientInfo"].dump() + " initialized");
    }

    json result;
    result["protocolVersion"] = version;
    result["capabilities"] = json{{"tools", json{{"listChanged", false}}}};
    result["serverInfo"] = json{{"name", protocol::kImplementationName},
                                {"version", protocol::kImplementationVersion}};
    return protocol::make_result_response(id, result);
}

Result<DispatchTarget> SparseGateway::resolve_target(const std::string& name,
                                                     const std::string& server) const {
    if (name.empty()) {
        return ProxyError{ErrorCategory::Input, "tools/call requires a tool name.",
                          "invalid_params"};
    }

    if (!server.empty()) {
        const std::string prefix = protocol::namespaced_name(server, "");
        std::string tool = name;
        if (tool.compare(0, prefix.size(), prefix) == 0) {
            tool = tool.substr(prefix.size());
        }
        return DispatchTarget{BackendTarget{server, tool}};
    }

    const auto& table = virtual_tools();
    const auto it = table.find(name);
    if (it != table.end()) {
        return DispatchTarget{it->second};
    }

    BackendTarget target;
    if (protocol::split_namespaced_name(name, target.backend, target.tool)) {
        return DispatchTarget{target};
    }

    const auto alias = registry_.resolve_alias(name);
    if (alias.has_value() &&
        protocol::split_namespaced_name(*alias, target.backend, target.tool)) {
        return DispatchTarget{target};
    }

    return ProxyError{ErrorCategory::UnknownTool, "Unknown tool: " + name, "unknown_tool",
                      "Use mcp_discover to list tools; names take the form <backend>::<tool>."};
}

Result<Message> SparseGateway::handle_tools_call(const json& id, const json& params) {
    auto name = optional_string(params, "name");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    auto server = optional_string(params, "server");
    if (core::errors::is_error(server)) {
        return core::errors::get_error(server);
    }

    auto resolved =
        resolve_target(core::errors::get_value(name), core::errors::get_value(server));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    return std::visit(
        [&](const auto& target) -> Result<Message> {
            using T = std::decay_t<decltype(target)>;
            if constexpr (std::is_same_v<T, VirtualTool>) {
                auto arguments = object_member(params, "arguments");
                if (core::errors::is_error(arguments)) {
                    return core::errors::get_error(arguments);
                }
                return run_virtual(target, id, core::errors::get_value(arguments));
            } else {
                return forward_tool_call(id, target, params);
            }
        },
        core::errors::get_value(resolved));
}

Result<Message> SparseGateway::run_virtual(const VirtualTool tool, const json& id,
                                           const json& arguments) {
    LOG_DEBUG("SparseGateway: virtual tool " + to_string(tool));
    switch (tool) {
        case VirtualTool::Discover:
            return discover(id, arguments);
        case VirtualTool::Call:
            return universal_call(id, arguments);
        case VirtualTool::Onboarding:
            return forward_tool_call(id, BackendTarget{onboarding_backend_, "onboarding"},
                                     json{{"name", "onboarding"}, {"arguments", arguments}});
        default:
            return ProxyError{ErrorCategory::Internal, "Unhandled virtual tool.",
                              "unhandled_virtual_tool"};
    }
}

Result<Message> SparseGateway::discover(const json& id, const json& arguments) const {
    auto path = optional_string(arguments, "jsonpath");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    std::string expression = core::errors::get_value(path);
    if (expression.empty()) {
        expression = kDefaultDiscoveryPath;
    }

    auto matches = registry_.query(expression);
    if (core::errors::is_error(matches)) {
        return core::errors::get_error(matches);
    }
    const json& found = core::errors::get_value(matches);
    const std::string text = found.empty() ? "No matches found" : found.dump(2);
    return protocol::make_result_response(id, protocol::make_text_content(text));
}

Result<Message> SparseGateway::universal_call(const json& id, const json& arguments) {
    auto method = optional_string(arguments, "method");
    if (core::errors::is_error(method)) {
        return core::errors::get_error(method);
    }
    if (core::errors::get_value(method).empty()) {
        return ProxyError{ErrorCategory::Input, "Missing 'method' parameter", "missing_method"};
    }
    auto params = object_member(arguments, "params");
    if (core::errors::is_error(params)) {
        return core::errors::get_error(params);
    }
    auto server = optional_string(arguments, "server");
    if (core::errors::is_error(server)) {
        return core::errors::get_error(server);
    }

    json inner_params = core::errors::get_value(params);
    if (!core::errors::get_value(server).empty() && !inner_params.contains("server")) {
        inner_params["server"] = core::errors::get_value(server);
    }

    Message inner;
    inner["jsonrpc"] = protocol::kJsonRpcVersion;
    inner["id"] = id;
    inner["method"] = core::errors::get_value(method);
    inner["params"] = std::move(inner_params);
    return dispatch_request(inner);
}

Result<Message> SparseGateway::forward_tool_call(const json& id, const BackendTarget& target,
                                                 json params) {
    params["name"] = target.tool;
    params.erase("server");
    return forward(id, target.backend, "tools/call", params);
}

Result<Message> SparseGateway::forward(const json& id, const std::string& backend,
                                       const std::string& method, const json& params) {
    auto connection = pool_.find(backend);
    if (core::errors::is_error(connection)) {
        return core::errors::get_error(connection);
    }

    auto response = core::errors::get_value(connection)->call(method, params);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }

    // The backend's own id is internal; the caller sees its own.
    Message relayed = std::move(core::errors::get_value(response));
    relayed["id"] = id;
    return filter_response(std::move(relayed));
}

}  // namespace mcproxy::gateway
