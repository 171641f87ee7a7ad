#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/proxy_errors.hpp"

namespace mcproxy::protocol {

using Message = nlohmann::json;

enum class MessageKind {
    Request,       // has id and method
    Notification,  // has method, no id
    Response,      // has id and result or error
    Invalid
};

inline constexpr const char* kJsonRpcVersion = "2.0";
inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kImplementationName = "mcproxy";
inline constexpr const char* kImplementationVersion = "0.1.0";

MessageKind classify(const Message& message);
std::string to_string(MessageKind kind);

Message make_request(std::int64_t id, const std::string& method,
                     const nlohmann::json& params);
Message make_notification(const std::string& method,
                          const nlohmann::json& params = nlohmann::json::object());
Message make_result_response(const nlohmann::json& id, const nlohmann::json& result);
Message make_error_response(const nlohmann::json& id, int code,
                            const std::string& message);
Message make_error_response(const nlohmann::json& id,
                            const core::errors::ProxyError& error);

// MCP tool result carrying a single text block.
nlohmann::json make_text_content(const std::string& text, bool is_error = false);

// Short form for log lines, e.g. "request tools/call id=7".
std::string describe(const Message& message);

}  // namespace mcproxy::protocol
