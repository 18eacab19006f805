#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace toolhub::protocol {

    // A tool as the provider declares it in listTools
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    // The shape handed to a calling model:
    // {"type":"function","function":{"name","description","parameters"}}
    struct FunctionDescriptor {
        std::string name;
        std::string description;
        nlohmann::json parameters = nlohmann::json::object();
    };

    // How a caller (or the extractor) asks for a tool
    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    // How the bridge replies back
    struct ToolCallResult {
        bool success = false;
        nlohmann::json payload;         // opaque result on success
        std::string error_code;         // e.g. "provider_not_running"
        std::string error_message;
        std::optional<int> remote_code; // JSON-RPC code when the provider refused
        double duration_ms = 0.0;
    };

    inline nlohmann::json to_json(const FunctionDescriptor& descriptor) {
        return nlohmann::json{{"type", "function"},
                              {"function",
                               {{"name", descriptor.name},
                                {"description", descriptor.description},
                                {"parameters", descriptor.parameters}}}};
    }

    inline nlohmann::json to_json(const ToolCall& call) {
        return nlohmann::json{{"name", call.name}, {"arguments", call.arguments}};
    }

} // namespace toolhub::protocol
