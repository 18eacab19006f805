#include "transport/transport.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/json_rpc.hpp"

namespace toolhub::transport {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;
using core::errors::Unit;
using nlohmann::json;
namespace rpc = protocol::json_rpc;

namespace {

constexpr const char* kClientName = "toolhub";
constexpr const char* kClientVersion = "1.0.0";

std::string string_field(const json& object, const char* key, const std::string& fallback) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

}  // namespace

Transport::Transport(RequestTimeouts timeouts) : timeouts_(timeouts) {}

core::errors::Result<json> Transport::request(const std::string& method, const json& params,
                                              const std::chrono::milliseconds timeout) {
    if (!is_connected()) {
        return ToolhubError{ErrorCategory::Transport,
                            kind_name() + " transport is not connected",
                            "transport_closed"};
    }

    const std::int64_t id = correlator_.next_id();
    auto registered = correlator_.register_request(id, timeout);
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto sent = send_message(rpc::build_request(id, method, params), timeout);
    if (core::errors::is_error(sent)) {
        // Fail fast; the reply channel would never see this request.
        correlator_.fail(id, core::errors::get_error(sent));
    } else if (core::errors::get_value(sent).has_value()) {
        json reply = std::move(*core::errors::get_value(sent));
        if (rpc::get_numeric_id(reply) != std::optional<std::int64_t>{id}) {
            dispatch_incoming(reply);
        } else if (std::chrono::steady_clock::now() >= deadline) {
            correlator_.fail(id, ToolhubError{ErrorCategory::RequestTimeout,
                                              "reply arrived after the deadline",
                                              "request_timeout"});
        } else {
            correlator_.resolve(id, std::move(reply));
        }
    }

    auto response = correlator_.wait(id);
    if (core::errors::is_error(response)) {
        auto error = core::errors::get_error(response);
        if (error.category == ErrorCategory::RequestTimeout) {
            error.message = method + " timed out after " + std::to_string(timeout.count()) +
                            " ms";
        }
        return error;
    }
    return rpc::extract_result(core::errors::get_value(response), method);
}

core::errors::Result<Unit> Transport::notify(const std::string& method, const json& params) {
    if (!is_connected()) {
        return ToolhubError{ErrorCategory::Transport,
                            kind_name() + " transport is not connected",
                            "transport_closed"};
    }
    auto sent = send_message(rpc::build_notification(method, params), timeouts_.shutdown);
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return Unit{};
}

void Transport::dispatch_incoming(const json& message) {
    if (rpc::is_response(message)) {
        const auto id = rpc::get_numeric_id(message);
        if (!id.has_value() || !correlator_.resolve(*id, message)) {
            LOG_DEBUG(kind_name() + ": dropping response with unknown id " +
                      message["id"].dump());
        }
        return;
    }
    if (rpc::is_notification(message)) {
        LOG_DEBUG(kind_name() + ": provider notification " + rpc::get_method(message));
        return;
    }
    LOG_DEBUG(kind_name() + ": ignoring unrecognized message " + message.dump());
}

core::errors::Result<protocol::ServerInfo> Transport::initialize() {
    json params;
    params["protocolVersion"] = rpc::kProtocolVersion;
    params["capabilities"] = json{{"tools", json::object()}};
    params["clientInfo"] = json{{"name", kClientName}, {"version", kClientVersion}};

    auto result = request(rpc::kMethodInitialize, params, timeouts_.handshake);
    if (core::errors::is_error(result)) {
        auto error = core::errors::get_error(result);
        if (error.category == ErrorCategory::Protocol ||
            error.code == "malformed_frame" || error.code == "missing_result") {
            error.category = ErrorCategory::Handshake;
            error.code = "handshake_failed";
        }
        return error;
    }

    const json& payload = core::errors::get_value(result);
    if (!payload.is_object()) {
        return ToolhubError{ErrorCategory::Handshake,
                            "initialize result is not an object: " + payload.dump(),
                            "handshake_failed"};
    }

    protocol::ServerInfo info;
    const json server = payload.contains("serverInfo") ? payload["serverInfo"] : json::object();
    info.name = string_field(server, "name", info.name);
    info.version = string_field(server, "version", info.version);
    info.protocol_version = string_field(payload, "protocolVersion", info.protocol_version);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server_info_ = info;
        capabilities_ = payload.contains("capabilities") && payload["capabilities"].is_object()
                            ? payload["capabilities"]
                            : json::object();
        initialized_ = true;
    }

    LOG_INFO(kind_name() + ": connected to " + info.name + " " + info.version +
             " (protocol " + info.protocol_version + ")");
    return info;
}

core::errors::Result<std::vector<protocol::ToolDescriptor>> Transport::list_tools() {
    if (!is_initialized()) {
        return ToolhubError{ErrorCategory::Transport, "Cannot list tools before initialize",
                            "not_initialized"};
    }
    if (!capabilities().contains("tools")) {
        return ToolhubError{ErrorCategory::Protocol,
                            "Provider does not declare the tools capability",
                            "tools_unsupported"};
    }

    auto result = request(rpc::kMethodListTools, json::object(), timeouts_.discovery);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }

    const json& payload = core::errors::get_value(result);
    if (!payload.is_object() || !payload.contains("tools") || !payload["tools"].is_array()) {
        return ToolhubError{ErrorCategory::Protocol, "listTools result is missing tools",
                            "missing_tools"};
    }

    std::vector<protocol::ToolDescriptor> tools;
    for (const auto& raw : payload["tools"]) {
        if (!raw.is_object() || !raw.contains("name") || !raw["name"].is_string()) {
            LOG_WARN(kind_name() + ": skipping tool without a name: " + raw.dump());
            continue;
        }
        protocol::ToolDescriptor tool;
        tool.name = raw["name"].get<std::string>();
        tool.description = string_field(raw, "description", "");
        if (raw.contains("inputSchema")) {
            tool.input_schema = raw["inputSchema"];
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

core::errors::Result<json> Transport::call_tool(const std::string& name,
                                                const json& arguments) {
    if (!is_initialized()) {
        return ToolhubError{ErrorCategory::Transport, "Cannot call tools before initialize",
                            "not_initialized"};
    }
    json params;
    params["name"] = name;
    params["arguments"] = arguments.is_null() ? json::object() : arguments;
    return request(rpc::kMethodCallTool, params, timeouts_.tool_call);
}

core::errors::Result<Unit> Transport::shutdown() {
    if (!is_initialized()) {
        return Unit{};
    }

    auto response = request(rpc::kMethodShutdown, json::object(), timeouts_.shutdown);
    if (core::errors::is_error(response)) {
        LOG_WARN(kind_name() + ": shutdown request failed: " +
                 core::errors::get_error(response).message);
    }
    auto exited = notify(rpc::kMethodExit, json::object());

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        initialized_ = false;
    }

    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    if (core::errors::is_error(exited)) {
        return core::errors::get_error(exited);
    }
    return Unit{};
}

bool Transport::is_initialized() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return initialized_;
}

protocol::ServerInfo Transport::server_info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

json Transport::capabilities() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return capabilities_;
}

}  // namespace toolhub::transport
