#include "core/config/proxy_config.hpp"

#include <cmath>
#include <fstream>
#include <optional>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"

namespace mcproxy::core::config {

using errors::ErrorCategory;
using errors::ProxyError;
using errors::Result;
using nlohmann::json;

namespace {

ProxyError invalid_backend(const std::string& name, const std::string& reason) {
    return ProxyError{ErrorCategory::Input,
                      "Invalid backend '" + name + "': " + reason, "invalid_backend"};
}

ProxyError invalid_config(const std::string& reason) {
    return ProxyError{ErrorCategory::Input, "Invalid configuration: " + reason,
                      "invalid_config"};
}

Result<std::vector<std::string>> string_list(const json& value, const std::string& name,
                                             const char* field) {
    std::vector<std::string> items;
    if (!value.is_array()) {
        return invalid_backend(name, std::string("'") + field + "' must be a list of strings");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return invalid_backend(name,
                                   std::string("'") + field + "' must be a list of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

Result<std::uint32_t> positive_ms(const json& document, const char* key,
                                  const std::uint32_t fallback) {
    if (!document.contains(key)) {
        return fallback;
    }
    const auto& value = document[key];
    if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0 ||
        value.get<std::uint64_t>() > 24ULL * 60 * 60 * 1000) {
        return invalid_config(std::string("'") + key +
                              "' must be a positive number of milliseconds");
    }
    return static_cast<std::uint32_t>(value.get<std::uint64_t>());
}

Result<bool> optional_bool(const json& document, const char* key, const bool fallback) {
    if (!document.contains(key)) {
        return fallback;
    }
    if (!document[key].is_boolean()) {
        return invalid_config(std::string("'") + key + "' must be true or false");
    }
    return document[key].get<bool>();
}

}  // namespace

Result<protocol::BackendDescriptor> parse_backend_descriptor(const json& entry,
                                                             const std::string& fallback_name) {
    if (!entry.is_object()) {
        return invalid_backend(fallback_name, "entry must be an object");
    }

    protocol::BackendDescriptor descriptor;
    descriptor.name = fallback_name;
    if (entry.contains("name")) {
        if (!entry["name"].is_string()) {
            return invalid_backend(fallback_name, "'name' must be a string");
        }
        descriptor.name = entry["name"].get<std::string>();
    }
    if (descriptor.name.empty()) {
        return invalid_backend(descriptor.name, "a name is required");
    }
    if (descriptor.name.find(protocol::kNamespaceSeparator) != std::string::npos) {
        return invalid_backend(descriptor.name, "name cannot contain '::'");
    }

    const auto command = entry.find("command");
    if (command == entry.end()) {
        return invalid_backend(descriptor.name,
                               "'command' is required (null for a built-in backend)");
    }
    if (command->is_string()) {
        if (command->get<std::string>().empty()) {
            return invalid_backend(descriptor.name, "'command' cannot be empty");
        }
        descriptor.command = std::vector<std::string>{command->get<std::string>()};
    } else if (command->is_array()) {
        auto parts = string_list(*command, descriptor.name, "command");
        if (errors::is_error(parts)) {
            return errors::get_error(parts);
        }
        if (errors::get_value(parts).empty()) {
            return invalid_backend(descriptor.name, "'command' cannot be empty");
        }
        descriptor.command = std::move(errors::get_value(parts));
    } else if (!command->is_null()) {
        return invalid_backend(descriptor.name, "'command' must be a list, a string or null");
    }

    if (entry.contains("args") && !entry["args"].is_null()) {
        auto args = string_list(entry["args"], descriptor.name, "args");
        if (errors::is_error(args)) {
            return errors::get_error(args);
        }
        descriptor.args = std::move(errors::get_value(args));
    }

    if (entry.contains("env") && !entry["env"].is_null()) {
        if (!entry["env"].is_object()) {
            return invalid_backend(descriptor.name, "'env' must be a mapping of strings");
        }
        for (const auto& [key, value] : entry["env"].items()) {
            if (!value.is_string()) {
                return invalid_backend(descriptor.name, "env value of " + key +
                                                            " must be a string");
            }
            descriptor.env[key] = value.get<std::string>();
        }
    }

    if (entry.contains("description") && !entry["description"].is_null()) {
        if (!entry["description"].is_string()) {
            return invalid_backend(descriptor.name, "'description' must be a string");
        }
        descriptor.description = entry["description"].get<std::string>();
    }
    return descriptor;
}

Result<ProxyConfig> parse_proxy_config(const json& document) {
    if (!document.is_object()) {
        return invalid_config("top level must be an object");
    }

    ProxyConfig config;
    std::set<std::string> names;
    auto add = [&](const json& entry, const std::string& key) -> std::optional<ProxyError> {
        auto parsed = parse_backend_descriptor(entry, key);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        auto& descriptor = errors::get_value(parsed);
        if (!names.insert(descriptor.name).second) {
            return ProxyError{ErrorCategory::Input,
                              "Backend '" + descriptor.name + "' is configured twice.",
                              "duplicate_backend"};
        }
        config.backends.push_back(std::move(descriptor));
        return std::nullopt;
    };

    if (document.contains("servers") && !document["servers"].is_null()) {
        const auto& servers = document["servers"];
        if (servers.is_object()) {
            for (const auto& [key, entry] : servers.items()) {
                if (auto err = add(entry, key)) {
                    return *err;
                }
            }
        } else if (servers.is_array()) {
            for (const auto& entry : servers) {
                if (auto err = add(entry, "")) {
                    return *err;
                }
            }
        } else {
            return invalid_config("'servers' must be an object or a list");
        }
    }

    auto builtins = optional_bool(document, "enable_builtin_servers", true);
    if (errors::is_error(builtins)) return errors::get_error(builtins);
    config.enable_builtin_servers = errors::get_value(builtins);

    auto refresh = optional_bool(document, "refresh_on_add", true);
    if (errors::is_error(refresh)) return errors::get_error(refresh);
    config.refresh_on_add = errors::get_value(refresh);

    // Legacy "timeout" in seconds; request_timeout_ms wins when both are set.
    if (document.contains("timeout")) {
        const auto& timeout = document["timeout"];
        if (!timeout.is_number() || timeout.get<double>() <= 0.0) {
            return invalid_config("'timeout' must be a positive number of seconds");
        }
        config.request_timeout_ms =
            static_cast<std::uint32_t>(std::llround(timeout.get<double>() * 1000.0));
    }

    auto request_timeout =
        positive_ms(document, "request_timeout_ms", config.request_timeout_ms);
    if (errors::is_error(request_timeout)) return errors::get_error(request_timeout);
    config.request_timeout_ms = errors::get_value(request_timeout);

    auto handshake_timeout =
        positive_ms(document, "handshake_timeout_ms", config.handshake_timeout_ms);
    if (errors::is_error(handshake_timeout)) return errors::get_error(handshake_timeout);
    config.handshake_timeout_ms = errors::get_value(handshake_timeout);

    auto grace = positive_ms(document, "shutdown_grace_ms", config.shutdown_grace_ms);
    if (errors::is_error(grace)) return errors::get_error(grace);
    config.shutdown_grace_ms = errors::get_value(grace);

    if (document.contains("max_message_bytes")) {
        const auto& limit = document["max_message_bytes"];
        if (!limit.is_number_unsigned() || limit.get<std::uint64_t>() < 1024) {
            return invalid_config("'max_message_bytes' must be an integer of at least 1024");
        }
        config.max_message_bytes = static_cast<std::size_t>(limit.get<std::uint64_t>());
    }

    auto debug = optional_bool(document, "debug", false);
    if (errors::is_error(debug)) return errors::get_error(debug);
    if (errors::get_value(debug)) {
        config.log_level = "debug";
    }
    if (document.contains("log_level")) {
        if (!document["log_level"].is_string() ||
            !logging::Logger::parse_level(document["log_level"].get<std::string>())) {
            return invalid_config("'log_level' must be one of debug, info, warn, error");
        }
        config.log_level = document["log_level"].get<std::string>();
    }

    if (document.contains("onboarding_backend")) {
        if (!document["onboarding_backend"].is_string() ||
            document["onboarding_backend"].get<std::string>().empty()) {
            return invalid_config("'onboarding_backend' must be a non-empty string");
        }
        config.onboarding_backend = document["onboarding_backend"].get<std::string>();
    }

    return config;
}

Result<ProxyConfig> load_proxy_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return ProxyError{ErrorCategory::Input,
                          "Configuration file not found: " + path.string(),
                          "config_not_found"};
    }

    std::ifstream input(path);
    if (!input) {
        return ProxyError{ErrorCategory::Input,
                          "Unable to open configuration file: " + path.string(),
                          "config_unreadable"};
    }

    const json document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return ProxyError{ErrorCategory::Input,
                          "Configuration file is not valid JSON: " + path.string(),
                          "invalid_config"};
    }

    auto parsed = parse_proxy_config(document);
    if (!errors::is_error(parsed)) {
        LOG_INFO("Config: loaded " + std::to_string(errors::get_value(parsed).backends.size()) +
                 " backend(s) from " + path.string());
    }
    return parsed;
}

}  // namespace mcproxy::core::config
