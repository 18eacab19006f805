#include "tools/tool_bridge.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace toolhub::tools {

using core::errors::ErrorCategory;
using core::errors::ToolhubError;
using nlohmann::json;
using protocol::FunctionDescriptor;
using protocol::ToolCallResult;
using protocol::ToolDescriptor;

namespace {

ToolCallResult failure(const ToolhubError& error) {
    ToolCallResult result;
    result.success = false;
    result.error_code = error.code;
    result.error_message = error.message;
    result.remote_code = error.remote_code;
    return result;
}

bool has_tool(const std::vector<ToolDescriptor>& tools, const std::string& name) {
    return std::any_of(tools.begin(), tools.end(),
                       [&name](const ToolDescriptor& tool) { return tool.name == name; });
}

}  // namespace

ToolBridge::ToolBridge(runtime::LifecycleController& controller) : controller_(controller) {}

json ToolBridge::normalize_schema(const json& schema) {
    if (!schema.is_object()) {
        return json{{"type", "object"}, {"properties", json::object()}};
    }
    json normalized = schema;
    if (!normalized.contains("type")) {
        normalized["type"] = "object";
    }
    if (!normalized.contains("properties") || !normalized["properties"].is_object()) {
        normalized["properties"] = json::object();
    }
    return normalized;
}

FunctionDescriptor ToolBridge::to_function(const ToolDescriptor& tool) {
    return FunctionDescriptor{tool.name, tool.description, normalize_schema(tool.input_schema)};
}

core::errors::Result<std::vector<FunctionDescriptor>> ToolBridge::discover_tools(
    const std::string& provider_id, const bool auto_start) {
    if (auto_start) {
        auto started = controller_.start(provider_id);
        if (core::errors::is_error(started)) {
            return core::errors::get_error(started);
        }
    }

    core::errors::Result<std::vector<ToolDescriptor>> listed =
        ToolhubError{ErrorCategory::Internal, "Tool discovery did not run", "discovery_skipped"};
    std::chrono::system_clock::time_point started_at;
    auto ran = controller_.with_transport(
        provider_id, [&](transport::Transport& transport, const runtime::InstanceView& view) {
            started_at = view.started_at;
            listed = transport.list_tools();
        });
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }
    if (core::errors::is_error(listed)) {
        LOG_WARN("tool discovery on " + provider_id + " failed: " +
                 core::errors::get_error(listed).message);
        return core::errors::get_error(listed);
    }

    auto& tools = core::errors::get_value(listed);
    if (tools.empty()) {
        return ToolhubError{ErrorCategory::Protocol,
                            "Provider " + provider_id + " declares no tools",
                            "empty_tool_catalog"};
    }

    std::vector<FunctionDescriptor> functions;
    functions.reserve(tools.size());
    for (const auto& tool : tools) {
        functions.push_back(to_function(tool));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        catalogs_[provider_id] = Catalog{started_at, std::move(tools)};
    }
    LOG_INFO("discovered " + std::to_string(functions.size()) + " tools on " + provider_id);
    return functions;
}

std::optional<std::vector<ToolDescriptor>> ToolBridge::cached_tools(
    const std::string& provider_id) const {
    std::optional<std::vector<ToolDescriptor>> out;
    auto ran = controller_.with_transport(
        provider_id, [&](transport::Transport&, const runtime::InstanceView& view) {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = catalogs_.find(provider_id);
            if (it != catalogs_.end() && it->second.instance_started_at == view.started_at) {
                out = it->second.tools;
            }
        });
    if (core::errors::is_error(ran)) {
        return std::nullopt;
    }
    return out;
}

ToolCallResult ToolBridge::execute(const std::string& provider_id,
                                   const protocol::ToolCall& call) {
    return execute_tool(provider_id, call.name, call.arguments);
}

ToolCallResult ToolBridge::execute_tool(const std::string& provider_id,
                                        const std::string& tool_name, const json& arguments) {
    const auto started = std::chrono::steady_clock::now();
    auto finish = [&started](ToolCallResult result) {
        result.duration_ms = std::chrono::duration<double, std::milli>(
                                 std::chrono::steady_clock::now() - started)
                                 .count();
        return result;
    };

    if (tool_name.empty()) {
        return finish(failure(
            ToolhubError{ErrorCategory::Input, "Tool name cannot be empty", "invalid_tool_call"}));
    }
    const json args = arguments.is_null() ? json::object() : arguments;
    if (!args.is_object()) {
        return finish(failure(ToolhubError{ErrorCategory::Input,
                                           "Tool arguments must be a JSON object",
                                           "invalid_arguments"}));
    }

    try {
        core::errors::Result<json> outcome =
            ToolhubError{ErrorCategory::Internal, "Tool call did not run", "call_skipped"};
        auto ran = controller_.with_transport(
            provider_id, [&](transport::Transport& transport, const runtime::InstanceView& view) {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    const auto it = catalogs_.find(provider_id);
                    if (it != catalogs_.end()) {
                        if (it->second.instance_started_at != view.started_at) {
                            // Discovered against an earlier instance.
                            catalogs_.erase(it);
                        } else if (!has_tool(it->second.tools, tool_name)) {
                            outcome = ToolhubError{ErrorCategory::Input,
                                                   "Provider " + provider_id +
                                                       " has no tool named " + tool_name,
                                                   "tool_not_found"};
                            return;
                        }
                    }
                }
                outcome = transport.call_tool(tool_name, args);
            });
        if (core::errors::is_error(ran)) {
            return finish(failure(core::errors::get_error(ran)));
        }
        if (core::errors::is_error(outcome)) {
            const auto& error = core::errors::get_error(outcome);
            LOG_WARN("tool " + tool_name + " on " + provider_id + " failed: " + error.message);
            return finish(failure(error));
        }

        ToolCallResult result;
        result.success = true;
        result.payload = std::move(core::errors::get_value(outcome));
        result = finish(std::move(result));
        LOG_DEBUG("tool " + tool_name + " on " + provider_id + " took " +
                  std::to_string(static_cast<long long>(result.duration_ms)) + " ms");
        return result;
    } catch (const std::exception& e) {
        return finish(failure(ToolhubError{ErrorCategory::Internal,
                                           std::string("Tool call raised: ") + e.what(),
                                           "internal_error"}));
    }
}

}  // namespace toolhub::tools
