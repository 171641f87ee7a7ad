#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "backend/backend_pool.hpp"
#include "core/errors/proxy_errors.hpp"
#include "protocol/jsonrpc.hpp"
#include "registry/tool_registry.hpp"

namespace mcproxy::gateway {

// Tools that exist only inside the proxy.
enum class VirtualTool {
    Discover,    // mcp_discover
    Call,        // mcp_call
    Onboarding   // onboarding, served by the built-in onboarding backend
};

std::string to_string(VirtualTool tool);

// A real tool on a real backend, name already stripped of its namespace.
struct BackendTarget {
    std::string backend;
    std::string tool;
};

using DispatchTarget = std::variant<VirtualTool, BackendTarget>;

// Caller-facing side of the proxy. Answers catalog listings with the sparse
// view, runs virtual tools locally and forwards everything else to the
// owning backend, relaying its answer under the caller's id.
class SparseGateway {
public:
    SparseGateway(backend::BackendPool& pool, registry::ToolRegistry& registry,
                  std::string onboarding_backend = "onboarding");

    // The response for `message`, carrying the caller's id. Notifications and
    // caller responses are absorbed and yield a null message.
    core::errors::Result<protocol::Message> handle(const protocol::Message& message);

    // tools/call routing: virtual tool, "<backend>::<tool>", explicit server
    // or an alias registered by a built-in backend.
    core::errors::Result<DispatchTarget> resolve_target(const std::string& name,
                                                        const std::string& server) const;

    // Replaces result.tools with the sparse view when present.
    static protocol::Message filter_response(protocol::Message response);

    static const std::map<std::string, VirtualTool>& virtual_tools();

private:
    core::errors::Result<protocol::Message> dispatch_request(const protocol::Message& request);
    core::errors::Result<protocol::Message> handle_tools_call(const nlohmann::json& id,
                                                              const nlohmann::json& params);
    core::errors::Result<protocol::Message> run_virtual(VirtualTool tool,
                                                       const nlohmann::json& id,
                                                       const nlohmann::json& arguments);
    core::errors::Result<protocol::Message> discover(const nlohmann::json& id,
                                                     const nlohmann::json& arguments) const;
    core::errors::Result<protocol::Message> universal_call(const nlohmann::json& id,
                                                           const nlohmann::json& arguments);
    core::errors::Result<protocol::Message> forward_tool_call(const nlohmann::json& id,
                                                              const BackendTarget& target,
                                                              nlohmann::json params);
    core::errors::Result<protocol::Message> forward(const nlohmann::json& id,
                                                    const std::string& backend,
                                                    const std::string& method,
                                                    const nlohmann::json& params);
    protocol::Message initialize_result(const nlohmann::json& id,
                                        const nlohmann::json& params) const;

    backend::BackendPool& pool_;
    registry::ToolRegistry& registry_;
    std::string onboarding_backend_;
};

}  // namespace mcproxy::gateway
