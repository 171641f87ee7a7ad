#include "builtin/onboarding_backend.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/jsonrpc.hpp"

namespace mcproxy::builtin {

using core::errors::ErrorCategory;
using core::errors::ProxyError;
using core::errors::Result;
using nlohmann::json;

namespace {

std::string sanitize_identity(std::string identity) {
    std::replace(identity.begin(), identity.end(), '/', '_');
    std::replace(identity.begin(), identity.end(), '\\', '_');
    std::replace(identity.begin(), identity.end(), ':', '_');
    return identity;
}

Result<std::string> require_identity(const json& arguments) {
    if (!arguments.is_object() || !arguments.contains("identity") ||
        !arguments["identity"].is_string() || arguments["identity"].get<std::string>().empty()) {
        return ProxyError{ErrorCategory::Input, "Missing 'identity' argument.",
                          "missing_identity"};
    }
    return sanitize_identity(arguments["identity"].get<std::string>());
}

}  // namespace

OnboardingBackend::OnboardingBackend(std::string name) : name_(std::move(name)) {}

protocol::BackendDescriptor OnboardingBackend::descriptor() const {
    protocol::BackendDescriptor descriptor;
    descriptor.name = name_;
    descriptor.description = "Identity-specific onboarding instructions (built-in)";
    return descriptor;
}

backend::BuiltinHandler OnboardingBackend::handler() {
    return [this](const std::string& method, const json& params) {
        return handle(method, params);
    };
}

json OnboardingBackend::tool_list() {
    json identity = {{"type", "string"},
                     {"description",
                      "The identity to get/set onboarding for (e.g., 'Claude', project name)"}};
    return json::array(
        {{{"name", "onboarding"},
          {"description", "Get or set onboarding instructions for a specific identity"},
          {"inputSchema",
           {{"type", "object"},
            {"properties",
             {{"identity", identity},
              {"instructions",
               {{"type", "string"},
                {"description",
                 "Optional: New instructions to set. If not provided, retrieves existing."}}},
              {"append",
               {{"type", "boolean"},
                {"description", "Append to existing instructions instead of replacing"},
                {"default", false}}}}},
            {"required", json::array({"identity"})}}}},
         {{"name", "onboarding_list"},
          {"description", "List all available onboarding identities"},
          {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}},
         {{"name", "onboarding_delete"},
          {"description", "Delete onboarding for a specific identity"},
          {"inputSchema",
           {{"type", "object"},
            {"properties", {{"identity", identity}}},
            {"required", json::array({"identity"})}}}},
         {{"name", "onboarding_export"},
          {"description", "Export all onboarding data"},
          {"inputSchema",
           {{"type", "object"},
            {"properties",
             {{"format",
               {{"type", "string"},
                {"enum", json::array({"json", "markdown"})},
                {"default", "markdown"}}}}}}}}});
}

Result<json> OnboardingBackend::handle(const std::string& method, const json& params) {
    if (method == "initialize") {
        return json{{"protocolVersion", protocol::kProtocolVersion},
                    {"capabilities", {{"tools", json::object()}}},
                    {"serverInfo", {{"name", name_}, {"version", "1.0.0"}}}};
    }
    if (method == "ping") {
        return json::object();
    }
    if (method == "tools/list") {
        return json{{"tools", tool_list()}};
    }
    if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return ProxyError{ErrorCategory::Input, "tools/call requires a tool name.",
                              "invalid_params"};
        }
        const json arguments = params.value("arguments", json::object());
        return call_tool(params["name"].get<std::string>(), arguments);
    }
    return ProxyError{ErrorCategory::UnknownTool, "Method not found: " + method,
                      "unknown_method"};
}

Result<json> OnboardingBackend::call_tool(const std::string& tool, const json& arguments) {
    if (tool == "onboarding") {
        return get_or_set(arguments);
    }
    if (tool == "onboarding_list") {
        return list_identities();
    }
    if (tool == "onboarding_delete") {
        return delete_identity(arguments);
    }
    if (tool == "onboarding_export") {
        return export_all(arguments);
    }
    return ProxyError{ErrorCategory::UnknownTool, "Unknown tool: " + tool, "unknown_tool"};
}

Result<json> OnboardingBackend::get_or_set(const json& arguments) {
    auto identity_result = require_identity(arguments);
    if (core::errors::is_error(identity_result)) {
        return core::errors::get_error(identity_result);
    }
    const std::string identity = core::errors::get_value(identity_result);

    const auto instructions = arguments.find("instructions");
    if (instructions == arguments.end() || instructions->is_null()) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(identity);
        if (it == entries_.end()) {
            return protocol::make_text_content(
                "# Onboarding for " + identity + "\n\nNo onboarding instructions found.\n\n" +
                "To add onboarding, use:\nonboarding(identity='" + identity +
                "', instructions='Your instructions here')");
        }
        return protocol::make_text_content("# Onboarding for " + identity + "\n\n" +
                                           it->second.current);
    }
    if (!instructions->is_string()) {
        return ProxyError{ErrorCategory::Input, "'instructions' must be a string.",
                          "invalid_params"};
    }

    const std::string text = instructions->get<std::string>();
    const auto append_flag = arguments.find("append");
    const bool append = append_flag != arguments.end() && append_flag->is_boolean() &&
                        append_flag->get<bool>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_[identity];
        if (append && !entry.current.empty()) {
            entry.current += "\n\n" + text;
        } else {
            entry.current = text;
            entry.history.clear();
        }
        entry.history.push_back(text);
    }

    LOG_INFO("OnboardingBackend: " + std::string(append ? "appended" : "set") +
             " instructions for " + identity);
    return protocol::make_text_content("Onboarding " + std::string(append ? "appended" : "set") +
                                       " for " + identity + ".\n\nInstructions:\n" + text);
}

json OnboardingBackend::list_identities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return protocol::make_text_content("No onboarding identities found.");
    }
    std::string text = "# Available Onboarding Identities\n";
    for (const auto& [identity, entry] : entries_) {
        text += "\n- **" + identity + "**: " + std::to_string(entry.history.size()) +
                " revision(s)";
    }
    return protocol::make_text_content(text);
}

Result<json> OnboardingBackend::delete_identity(const json& arguments) {
    auto identity_result = require_identity(arguments);
    if (core::errors::is_error(identity_result)) {
        return core::errors::get_error(identity_result);
    }
    const std::string identity = core::errors::get_value(identity_result);

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(identity) == 0) {
        return protocol::make_text_content("No onboarding found for " + identity);
    }
    return protocol::make_text_content("Deleted onboarding for " + identity);
}

Result<json> OnboardingBackend::export_all(const json& arguments) const {
    std::string format = "markdown";
    if (arguments.is_object() && arguments.contains("format")) {
        format = arguments["format"].is_string() ? arguments["format"].get<std::string>() : "";
    }
    if (format != "json" && format != "markdown") {
        return ProxyError{ErrorCategory::Input, "Unsupported export format: " + format,
                          "invalid_params", "Use 'json' or 'markdown'."};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (format == "json") {
        json all = json::object();
        for (const auto& [identity, entry] : entries_) {
            all[identity] = {{"identity", identity},
                             {"current", entry.current},
                             {"history", entry.history}};
        }
        return protocol::make_text_content(all.dump(2));
    }

    std::string text = "# All Onboarding Data\n";
    for (const auto& [identity, entry] : entries_) {
        text += "\n## " + identity + "\n\n### Current Instructions\n\n" + entry.current + "\n";
        if (entry.history.size() > 1) {
            text += "\n### History (" + std::to_string(entry.history.size()) + " revisions)\n";
            for (std::size_t i = 0; i < entry.history.size(); ++i) {
                text += "\n#### Revision " + std::to_string(i + 1) + "\n" + entry.history[i] + "\n";
            }
        }
        text += "\n---\n";
    }
    return protocol::make_text_content(text);
}

}  // namespace mcproxy::builtin
