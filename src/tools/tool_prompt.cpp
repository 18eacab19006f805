#include "tools/tool_prompt.hpp"

#include "core/config/id_gen.hpp"

namespace toolhub::tools {

using nlohmann::json;

namespace {

constexpr const char* kInvocationConvention = R"PROMPT(
When you need to use a tool, respond with a JSON object in this format inside a code block:

```json
{
  "action": "tool_name",
  "params": {
    "param1": "value1",
    "param2": "value2"
  }
}
```

Always wrap the JSON in a code block with ```json and ``` markers.
Use tools directly when they're appropriate for the task.
Wait for tool results before continuing.
)PROMPT";

}  // namespace

std::string build_tool_prompt(const std::vector<protocol::FunctionDescriptor>& tools) {
    std::string prompt = "You have access to the following tools:\n\n";
    for (const auto& tool : tools) {
        prompt += "- " + tool.name + ": " + tool.description + "\n";
    }
    prompt += kInvocationConvention;
    return prompt;
}

std::string format_system_prompt_with_tools(
    const std::string& system_prompt, const std::vector<protocol::FunctionDescriptor>& tools) {
    if (tools.empty()) {
        return system_prompt;
    }
    const std::string instructions = build_tool_prompt(tools);
    if (system_prompt.empty()) {
        return instructions;
    }
    return system_prompt + "\n\n" + instructions;
}

json tool_result_to_message(const protocol::ToolCallResult& result, const std::string& call_id) {
    json message{{"role", "tool"}};
    if (!call_id.empty()) {
        message["tool_call_id"] = call_id;
    }

    if (!result.success) {
        message["content"] = "Error: " + result.error_message;
    } else if (result.payload.is_object() || result.payload.is_array()) {
        message["content"] = result.payload.dump(2);
    } else if (result.payload.is_string()) {
        message["content"] = result.payload.get<std::string>();
    } else if (result.payload.is_null()) {
        message["content"] = "No result returned from tool";
    } else {
        message["content"] = result.payload.dump();
    }
    return message;
}

std::string generate_tool_call_id() {
    return "call-" + core::config::generate_client_id();
}

}  // namespace toolhub::tools
