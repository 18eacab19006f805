#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace toolhub::tools {

// Lists "- name: description" per tool followed by the fenced-JSON
// invocation convention that extract_tool_call() understands.
std::string build_tool_prompt(const std::vector<protocol::FunctionDescriptor>& tools);

// Appends the tool prompt to an existing system prompt. With no tools the
// prompt is returned unchanged.
std::string format_system_prompt_with_tools(const std::string& system_prompt,
                                            const std::vector<protocol::FunctionDescriptor>& tools);

// {"role":"tool","content":...,"tool_call_id":...}; call_id may be empty.
nlohmann::json tool_result_to_message(const protocol::ToolCallResult& result,
                                      const std::string& call_id);

// "call-" followed by a random uuid-like suffix.
std::string generate_tool_call_id();

}  // namespace toolhub::tools
