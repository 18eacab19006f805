#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/toolhub_errors.hpp"

namespace toolhub::protocol::json_rpc {

using json = nlohmann::json;

constexpr const char* kVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

constexpr const char* kMethodInitialize = "initialize";
constexpr const char* kMethodListTools = "listTools";
constexpr const char* kMethodCallTool = "callTool";
constexpr const char* kMethodShutdown = "shutdown";
constexpr const char* kMethodExit = "exit";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

json build_request(std::int64_t id, const std::string& method, const json& params);

// Notifications carry no id and expect no reply.
json build_notification(const std::string& method, const json& params);

// A response carries an id and exactly one of result/error.
bool is_response(const json& message);

bool is_notification(const json& message);

std::string get_method(const json& message);

// Numeric ids are returned as-is; numeric strings ("7") are accepted too.
std::optional<std::int64_t> get_numeric_id(const json& message);

// Parses one frame. Errors are Transport errors with code "malformed_frame".
core::errors::Result<json> parse_frame(const std::string& text);

// Converts an `error` member into a Protocol error with the remote code intact.
core::errors::ToolhubError to_protocol_error(const json& error_object,
                                             const std::string& method);

// Returns `result` or the error a caller should see for this response.
core::errors::Result<json> extract_result(const json& response, const std::string& method);

}  // namespace toolhub::protocol::json_rpc
