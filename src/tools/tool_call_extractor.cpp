#include "tools/tool_call_extractor.hpp"

#include <algorithm>
#include <cstddef>

namespace toolhub::tools {

using nlohmann::json;
using nlohmann::ordered_json;
using protocol::ToolCall;

namespace {

constexpr const char* kFenceOpen = "```json";
constexpr const char* kFence = "```";

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

json normalize_arguments(const json& arguments) {
    if (arguments.is_null()) {
        return json::object();
    }
    if (arguments.is_string()) {
        json decoded = json::parse(arguments.get<std::string>(), nullptr, false);
        if (!decoded.is_discarded()) {
            return decoded;
        }
    }
    return arguments;
}

template <typename Json>
bool has_string(const Json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string() && !it->template get<std::string>().empty();
}

// Works on json and ordered_json alike; only the arguments are copied.
template <typename Json>
std::optional<ToolCall> recognize(const Json& candidate) {
    if (!candidate.is_object()) {
        return std::nullopt;
    }

    if (has_string(candidate, "action") &&
        (candidate.contains("params") || candidate.contains("parameters"))) {
        const auto params = candidate.find("params");
        const auto parameters = candidate.find("parameters");
        const bool params_empty = params == candidate.end() || params->is_null() ||
                                  (params->is_object() && params->empty());
        json chosen;
        if (!params_empty) {
            chosen = json(*params);
        } else if (parameters != candidate.end()) {
            chosen = json(*parameters);
        } else {
            chosen = json::object();
        }
        return ToolCall{candidate.find("action")->template get<std::string>(),
                        normalize_arguments(chosen)};
    }

    if (has_string(candidate, "tool") && candidate.contains("tool_input")) {
        return ToolCall{candidate.find("tool")->template get<std::string>(),
                        normalize_arguments(json(*candidate.find("tool_input")))};
    }

    if (has_string(candidate, "name") && candidate.contains("arguments")) {
        return ToolCall{candidate.find("name")->template get<std::string>(),
                        normalize_arguments(json(*candidate.find("arguments")))};
    }

    return std::nullopt;
}

// Pre-order walk; ordered_json keeps members in text order, so this visits
// nested objects in the order their braces open.
std::optional<ToolCall> first_recognized(const ordered_json& root) {
    std::vector<const ordered_json*> pending{&root};
    while (!pending.empty()) {
        const ordered_json* node = pending.back();
        pending.pop_back();
        if (node->is_object()) {
            if (auto call = recognize(*node)) {
                return call;
            }
        }
        if (node->is_structured()) {
            const std::size_t mark = pending.size();
            for (const auto& child : *node) {
                if (child.is_structured()) {
                    pending.push_back(&child);
                }
            }
            std::reverse(pending.begin() + static_cast<std::ptrdiff_t>(mark), pending.end());
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<ToolCall> recognize_tool_call(const json& candidate) {
    return recognize(candidate);
}

std::vector<std::pair<std::size_t, std::size_t>> find_object_spans(const std::string& text) {
    std::vector<std::pair<std::size_t, std::size_t>> spans;
    std::vector<std::size_t> opens;
    bool in_string = false;
    bool escaped = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '{') {
            opens.push_back(i);
        } else if (opens.empty()) {
            // Quotes in prose outside any object are not strings.
            continue;
        } else if (c == '"') {
            in_string = true;
        } else if (c == '}') {
            spans.emplace_back(opens.back(), i);
            opens.pop_back();
        }
    }
    // Unclosed braces yield nothing; objects closed inside them still count.
    std::sort(spans.begin(), spans.end());
    return spans;
}

std::optional<ToolCall> extract_tool_call(const std::string& text) {
    std::size_t pos = 0;
    while ((pos = text.find(kFenceOpen, pos)) != std::string::npos) {
        const std::size_t body = pos + std::char_traits<char>::length(kFenceOpen);
        const std::size_t close = text.find(kFence, body);
        if (close == std::string::npos) {
            break;
        }
        const json parsed = json::parse(trim(text.substr(body, close - body)), nullptr, false);
        if (!parsed.is_discarded()) {
            if (auto call = recognize(parsed)) {
                return call;
            }
        }
        pos = close + std::char_traits<char>::length(kFence);
    }

    // An object that parses is searched as a tree, so the spans nested in it
    // are never parsed again.
    std::size_t covered_until = 0;
    bool covered = false;
    for (const auto& span : find_object_spans(text)) {
        if (covered && span.first <= covered_until) {
            continue;
        }
        const ordered_json parsed = ordered_json::parse(
            text.begin() + static_cast<std::ptrdiff_t>(span.first),
            text.begin() + static_cast<std::ptrdiff_t>(span.second + 1), nullptr, false);
        if (parsed.is_discarded()) {
            continue;
        }
        if (auto call = first_recognized(parsed)) {
            return call;
        }
        covered = true;
        covered_until = span.second;
    }
    return std::nullopt;
}

std::optional<ToolCall> extract_tool_call_from_message(const json& message) {
    if (!message.is_object()) {
        return std::nullopt;
    }

    const auto calls = message.find("tool_calls");
    if (calls != message.end() && calls->is_array() && !calls->empty()) {
        const json& first = calls->front();
        if (first.is_object() && first.contains("function") && first["function"].is_object()) {
            const json& function = first["function"];
            if (has_string(function, "name")) {
                return ToolCall{function["name"].get<std::string>(),
                                normalize_arguments(function.value("arguments", json::object()))};
            }
        }
    }

    const auto content = message.find("content");
    if (content != message.end() && content->is_string()) {
        return extract_tool_call(content->get<std::string>());
    }
    return std::nullopt;
}

}  // namespace toolhub::tools
