#include "protocol/json_rpc.hpp"

#include <charconv>
#include <system_error>

namespace toolhub::protocol::json_rpc {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;

json build_request(const std::int64_t id, const std::string& method, const json& params) {
    json request;
    request["jsonrpc"] = kVersion;
    request["method"] = method;
    request["params"] = params.is_null() ? json::object() : params;
    request["id"] = id;
    return request;
}

json build_notification(const std::string& method, const json& params) {
    json notification;
    notification["jsonrpc"] = kVersion;
    notification["method"] = method;
    notification["params"] = params.is_null() ? json::object() : params;
    return notification;
}

bool is_response(const json& message) {
    if (!message.is_object() || !message.contains("id") || message["id"].is_null()) {
        return false;
    }
    return message.contains("result") || message.contains("error");
}

bool is_notification(const json& message) {
    return message.is_object() && !message.contains("id") && message.contains("method");
}

std::string get_method(const json& message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

std::optional<std::int64_t> get_numeric_id(const json& message) {
    if (!message.is_object() || !message.contains("id")) {
        return std::nullopt;
    }
    const json& id = message["id"];
    if (id.is_number_integer()) {
        return id.get<std::int64_t>();
    }
    if (id.is_string()) {
        const std::string& text = id.get_ref<const std::string&>();
        std::int64_t value = 0;
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec == std::errc() && ptr == end && !text.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

core::errors::Result<json> parse_frame(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return ToolhubError{ErrorCategory::Transport, "Frame is not valid JSON: " + text,
                            "malformed_frame"};
    }
    if (!parsed.is_object()) {
        return ToolhubError{ErrorCategory::Transport, "Frame is not a JSON object: " + text,
                            "malformed_frame"};
    }
    return parsed;
}

ToolhubError to_protocol_error(const json& error_object, const std::string& method) {
    ToolhubError error{ErrorCategory::Protocol, "", "remote_error"};
    if (error_object.is_object()) {
        if (error_object.contains("code") && error_object["code"].is_number_integer()) {
            error.remote_code = error_object["code"].get<int>();
        }
        if (error_object.contains("message") && error_object["message"].is_string()) {
            error.message = error_object["message"].get<std::string>();
        }
    } else if (error_object.is_string()) {
        error.message = error_object.get<std::string>();
    }
    if (error.message.empty()) {
        error.message = error_object.dump();
    }
    error.hint = "Remote rejected " + method;
    return error;
}

core::errors::Result<json> extract_result(const json& response, const std::string& method) {
    if (!response.is_object()) {
        return ToolhubError{ErrorCategory::Transport,
                            "Response to " + method + " is not an object",
                            "malformed_frame"};
    }
    if (response.contains("error") && !response["error"].is_null()) {
        return to_protocol_error(response["error"], method);
    }
    if (!response.contains("result")) {
        return ToolhubError{ErrorCategory::Transport,
                            "Response to " + method + " is missing result",
                            "missing_result"};
    }
    return response["result"];
}

}  // namespace toolhub::protocol::json_rpc
