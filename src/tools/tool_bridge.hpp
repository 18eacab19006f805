#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/toolhub_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/lifecycle_controller.hpp"

namespace toolhub::tools {

// Discovers and executes a provider's tools through the controller. The
// bridge never touches processes; it only borrows the live transport.
class ToolBridge {
public:
    explicit ToolBridge(runtime::LifecycleController& controller);

    // Requires Running (or starts the provider first when auto_start is set).
    // An empty catalog is an error.
    core::errors::Result<std::vector<protocol::FunctionDescriptor>> discover_tools(
        const std::string& provider_id, bool auto_start = false);

    // Never fails as a Result: every error is reported inside the returned
    // ToolCallResult.
    protocol::ToolCallResult execute_tool(const std::string& provider_id,
                                          const std::string& tool_name,
                                          const nlohmann::json& arguments);

    protocol::ToolCallResult execute(const std::string& provider_id,
                                     const protocol::ToolCall& call);

    // Catalog of the current instance, if one was discovered.
    std::optional<std::vector<protocol::ToolDescriptor>> cached_tools(
        const std::string& provider_id) const;

    // type defaults to "object", properties to {}; non-objects become the
    // empty object schema.
    static nlohmann::json normalize_schema(const nlohmann::json& schema);

    static protocol::FunctionDescriptor to_function(const protocol::ToolDescriptor& tool);

private:
    struct Catalog {
        std::chrono::system_clock::time_point instance_started_at;
        std::vector<protocol::ToolDescriptor> tools;
    };

    runtime::LifecycleController& controller_;
    mutable std::mutex mutex_;
    std::map<std::string, Catalog> catalogs_;
};

}  // namespace toolhub::tools
