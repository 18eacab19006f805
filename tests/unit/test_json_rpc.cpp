#include <string>
#include <gtest/gtest.h>
#include "core/errors/toolhub_errors.hpp"
#include "protocol/json_rpc.hpp"

namespace {

using namespace toolhub::protocol::json_rpc;
using toolhub::core::errors::ErrorCategory;
using toolhub::core::errors::get_error;
using toolhub::core::errors::get_value;
using toolhub::core::errors::is_error;

TEST(JsonRpcTest, BuildsRequestWithVersionAndId) {
    const json request = build_request(7, kMethodCallTool, json{{"name", "echo"}});
    EXPECT_EQ(request["jsonrpc"], "2.0");
    EXPECT_EQ(request["id"], 7);
    EXPECT_EQ(request["method"], "callTool");
    EXPECT_EQ(request["params"]["name"], "echo");
}

TEST(JsonRpcTest, NullParamsBecomeEmptyObject) {
    const json request = build_request(1, kMethodListTools, nullptr);
    EXPECT_TRUE(request["params"].is_object());
    EXPECT_TRUE(request["params"].empty());
}

TEST(JsonRpcTest, NotificationHasNoId) {
    const json notification = build_notification(kMethodExit, json::object());
    EXPECT_FALSE(notification.contains("id"));
    EXPECT_TRUE(is_notification(notification));
    EXPECT_FALSE(is_response(notification));
}

TEST(JsonRpcTest, ClassifiesResponses) {
    EXPECT_TRUE(is_response(json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}}));
    EXPECT_TRUE(is_response(json{{"id", 2}, {"error", {{"code", -1}}}}));
    EXPECT_FALSE(is_response(json{{"id", nullptr}, {"result", 1}}));
    EXPECT_FALSE(is_response(json{{"id", 3}, {"method", "ping"}}));
}

TEST(JsonRpcTest, AcceptsNumericStringIds) {
    EXPECT_EQ(get_numeric_id(json{{"id", 12}}).value_or(-1), 12);
    EXPECT_EQ(get_numeric_id(json{{"id", "42"}}).value_or(-1), 42);
    EXPECT_FALSE(get_numeric_id(json{{"id", "abc"}}).has_value());
    EXPECT_FALSE(get_numeric_id(json{{"id", "4x"}}).has_value());
    EXPECT_FALSE(get_numeric_id(json{{"result", 1}}).has_value());
}

TEST(JsonRpcTest, RejectsMalformedFrames) {
    auto garbage = parse_frame("npm WARN something");
    ASSERT_TRUE(is_error(garbage));
    EXPECT_EQ(get_error(garbage).category, ErrorCategory::Transport);
    EXPECT_EQ(get_error(garbage).code, "malformed_frame");

    auto scalar = parse_frame("42");
    ASSERT_TRUE(is_error(scalar));
    EXPECT_EQ(get_error(scalar).code, "malformed_frame");

    auto ok = parse_frame(R"({"jsonrpc":"2.0","id":1,"result":{}})");
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok)["id"], 1);
}

TEST(JsonRpcTest, ErrorObjectKeepsRemoteCode) {
    const json response{{"jsonrpc", "2.0"},
                        {"id", 5},
                        {"error", {{"code", METHOD_NOT_FOUND}, {"message", "no such tool"}}}};
    auto result = extract_result(response, kMethodCallTool);
    ASSERT_TRUE(is_error(result));
    const auto& error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Protocol);
    EXPECT_EQ(error.message, "no such tool");
    ASSERT_TRUE(error.remote_code.has_value());
    EXPECT_EQ(*error.remote_code, -32601);
}

TEST(JsonRpcTest, ResponseWithoutResultIsRejected) {
    auto result = extract_result(json{{"jsonrpc", "2.0"}, {"id", 5}}, kMethodListTools);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_result");
}

TEST(JsonRpcTest, ExtractsResult) {
    auto result = extract_result(json{{"id", 1}, {"result", {{"tools", json::array()}}}},
                                 kMethodListTools);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result)["tools"].is_array());
}

}  // namespace
