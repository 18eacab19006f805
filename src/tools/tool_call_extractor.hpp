#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace toolhub::tools {

// Recognizes {action, params|parameters}, {tool, tool_input} and
// {name, arguments}. Anything else is not a tool call.
std::optional<protocol::ToolCall> recognize_tool_call(const nlohmann::json& candidate);

// [open, close] offsets of every balanced {...} object in `text`, ordered by
// the opening brace so outer objects come before nested ones. One pass;
// braces inside strings are ignored.
std::vector<std::pair<std::size_t, std::size_t>> find_object_spans(const std::string& text);

// Fenced ```json blocks first, then raw objects in span order. The first
// candidate that parses and is recognized wins.
std::optional<protocol::ToolCall> extract_tool_call(const std::string& text);

// Chat message form: a structured tool_calls[0].function entry first,
// then the text in `content`.
std::optional<protocol::ToolCall> extract_tool_call_from_message(const nlohmann::json& message);

}  // namespace toolhub::tools
