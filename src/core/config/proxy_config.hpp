#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"
#include "protocol/backend_descriptor.hpp"

namespace mcproxy::core::config {

    struct ProxyConfig {
        std::vector<protocol::BackendDescriptor> backends;
        bool enable_builtin_servers = true;
        std::uint32_t request_timeout_ms = 30000;
        std::uint32_t handshake_timeout_ms = 3000;
        std::uint32_t shutdown_grace_ms = 5000;
        std::size_t max_message_bytes = 16 * 1024 * 1024;
        // Fetch a backend's tools as soon as it is added at runtime.
        bool refresh_on_add = true;
        std::string log_level = "info";
        std::string onboarding_backend = "onboarding";
    };

    // {name, command: [..] | "cmd" | null, args, env, description}.
    // `fallback_name` is used when the entry is keyed by name and has none.
    errors::Result<protocol::BackendDescriptor> parse_backend_descriptor(
        const nlohmann::json& entry, const std::string& fallback_name = "");

    // "servers" may be an object keyed by backend name or an array.
    errors::Result<ProxyConfig> parse_proxy_config(const nlohmann::json& document);

    errors::Result<ProxyConfig> load_proxy_config(const std::filesystem::path& path);

} // namespace mcproxy::core::config
