#include "protocol/jsonrpc.hpp"

namespace mcproxy::protocol {

using nlohmann::json;

namespace {

bool has_valid_id(const Message& message) {
    const auto it = message.find("id");
    if (it == message.end()) {
        return false;
    }
    return it->is_string() || it->is_number_integer() || it->is_number_unsigned();
}

}  // namespace

MessageKind classify(const Message& message) {
    if (!message.is_object()) {
        return MessageKind::Invalid;
    }

    const auto method = message.find("method");
    const bool has_method = method != message.end() && method->is_string();
    const bool has_id = has_valid_id(message);

    if (has_method) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }
    if (has_id && (message.contains("result") || message.contains("error"))) {
        return MessageKind::Response;
    }
    // Error responses to unparsable requests carry "id": null.
    if (message.contains("error") && message.contains("id") && message["id"].is_null()) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

std::string to_string(const MessageKind kind) {
    switch (kind) {
        case MessageKind::Request:
            return "request";
        case MessageKind::Notification:
            return "notification";
        case MessageKind::Response:
            return "response";
        case MessageKind::Invalid:
            return "invalid";
        default:
            return "unknown";
    }
}

Message make_request(const std::int64_t id, const std::string& method,
                     const json& params) {
    Message request;
    request["jsonrpc"] = kJsonRpcVersion;
    request["id"] = id;
    request["method"] = method;
    request["params"] = params.is_null() ? json::object() : params;
    return request;
}

Message make_notification(const std::string& method, const json& params) {
    Message notification;
    notification["jsonrpc"] = kJsonRpcVersion;
    notification["method"] = method;
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

Message make_result_response(const json& id, const json& result) {
    Message response;
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = id;
    response["result"] = result;
    return response;
}

Message make_error_response(const json& id, const int code,
                            const std::string& message) {
    Message response;
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = id;
    response["error"] = json{{"code", code}, {"message", message}};
    return response;
}

Message make_error_response(const json& id, const core::errors::ProxyError& error) {
    Message response;
    response["jsonrpc"] = kJsonRpcVersion;
    response["id"] = id;
    response["error"] = core::errors::to_jsonrpc_error(error);
    return response;
}

json make_text_content(const std::string& text, const bool is_error) {
    json result;
    result["content"] = json::array({json{{"type", "text"}, {"text", text}}});
    if (is_error) {
        result["isError"] = true;
    }
    return result;
}

std::string describe(const Message& message) {
    const MessageKind kind = classify(message);
    std::string text = to_string(kind);
    if (kind == MessageKind::Request || kind == MessageKind::Notification) {
        text += " " + message["method"].get<std::string>();
    }
    if (message.is_object() && message.contains("id")) {
        text += " id=" + message["id"].dump();
    }
    return text;
}

}  // namespace mcproxy::protocol
