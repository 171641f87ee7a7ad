#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "backend/backend_connection.hpp"
#include "core/errors/proxy_errors.hpp"
#include "protocol/backend_descriptor.hpp"

namespace mcproxy::builtin {

// In-process backend keeping identity-specific onboarding instructions.
// Served through a BuiltinHandler; nothing is persisted.
class OnboardingBackend {
public:
    static constexpr const char* kDefaultName = "onboarding";

    explicit OnboardingBackend(std::string name = kDefaultName);

    protocol::BackendDescriptor descriptor() const;
    // Binds this instance; the instance must outlive the connection.
    backend::BuiltinHandler handler();

    core::errors::Result<nlohmann::json> handle(const std::string& method,
                                                const nlohmann::json& params);

    static nlohmann::json tool_list();

private:
    struct Entry {
        std::string current;
        std::vector<std::string> history;
    };

    core::errors::Result<nlohmann::json> call_tool(const std::string& tool,
                                                   const nlohmann::json& arguments);
    core::errors::Result<nlohmann::json> get_or_set(const nlohmann::json& arguments);
    nlohmann::json list_identities() const;
    core::errors::Result<nlohmann::json> delete_identity(const nlohmann::json& arguments);
    core::errors::Result<nlohmann::json> export_all(const nlohmann::json& arguments) const;

    std::string name_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

}  // namespace mcproxy::builtin
