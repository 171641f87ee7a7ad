#pragma once
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcproxy::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,              // E.g., a caller request or config entry is malformed
        Framing,            // A backend wrote a line that is not a JSON-RPC message
        Correlation,        // A response arrived for an id nobody is waiting on
        Timeout,            // The call deadline expired before the backend answered
        BackendUnavailable, // Process not running, failed to spawn, or died mid-call
        UnknownTool,        // No backend or tool matches the requested name
        QuerySyntax,        // Malformed discovery path
        Shutdown,           // The proxy is shutting down
        Internal            // pipe/fork failures and other local bugs
    };

    // The standardized error payload
    struct ProxyError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a ProxyError.
    template <typename T>
    using Result = std::variant<T, ProxyError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ProxyError>(result);
    }

    template <typename T>
    const ProxyError& get_error(const Result<T>& result) {
        return std::get<ProxyError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    // Mutable access, for move-only values such as futures.
    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Framing: return "framing";
            case ErrorCategory::Correlation: return "correlation";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::BackendUnavailable: return "backend_unavailable";
            case ErrorCategory::UnknownTool: return "unknown_tool";
            case ErrorCategory::QuerySyntax: return "query_syntax";
            case ErrorCategory::Shutdown: return "shutdown";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    inline int jsonrpc_code(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return -32602;
            case ErrorCategory::UnknownTool: return -32601;
            case ErrorCategory::BackendUnavailable: return -32000;
            case ErrorCategory::Timeout: return -32001;
            case ErrorCategory::Shutdown: return -32002;
            case ErrorCategory::QuerySyntax: return -32003;
            default: return -32603;
        }
    }

    // JSON-RPC "error" member for a ProxyError surfaced to the caller.
    inline nlohmann::json to_jsonrpc_error(const ProxyError& error) {
        nlohmann::json data;
        data["kind"] = to_string(error.category);
        data["code"] = error.code;
        if (!error.hint.empty()) {
            data["hint"] = error.hint;
        }
        return nlohmann::json{{"code", jsonrpc_code(error.category)},
                              {"message", error.message},
                              {"data", data}};
    }

} // namespace mcproxy::core::errors
