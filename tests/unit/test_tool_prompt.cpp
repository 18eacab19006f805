#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "tools/tool_call_extractor.hpp"
#include "tools/tool_prompt.hpp"

namespace {

using nlohmann::json;
using toolhub::protocol::FunctionDescriptor;
using toolhub::protocol::ToolCallResult;
using toolhub::tools::build_tool_prompt;
using toolhub::tools::format_system_prompt_with_tools;
using toolhub::tools::generate_tool_call_id;
using toolhub::tools::tool_result_to_message;

std::vector<FunctionDescriptor> sample_tools() {
    return {{"read_file", "Read a file from disk", json::object()},
            {"search", "Search the web", json::object()}};
}

TEST(ToolPromptTest, ListsEveryTool) {
    const std::string prompt = build_tool_prompt(sample_tools());
    EXPECT_EQ(prompt.rfind("You have access to the following tools:", 0), 0u);
    EXPECT_NE(prompt.find("- read_file: Read a file from disk\n"), std::string::npos);
    EXPECT_NE(prompt.find("- search: Search the web\n"), std::string::npos);
    EXPECT_NE(prompt.find("```json"), std::string::npos);
}

// The example in the prompt must be something the extractor accepts.
TEST(ToolPromptTest, ExampleIsExtractable) {
    auto call = toolhub::tools::extract_tool_call(build_tool_prompt(sample_tools()));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->name, "tool_name");
    EXPECT_EQ(call->arguments["param1"], "value1");
}

TEST(ToolPromptTest, SystemPromptComposition) {
    EXPECT_EQ(format_system_prompt_with_tools("Be brief.", {}), "Be brief.");
    EXPECT_EQ(format_system_prompt_with_tools("", sample_tools()), build_tool_prompt(sample_tools()));
    EXPECT_EQ(format_system_prompt_with_tools("Be brief.", sample_tools()),
              "Be brief.\n\n" + build_tool_prompt(sample_tools()));
}

TEST(ToolPromptTest, ResultMessages) {
    ToolCallResult ok;
    ok.success = true;
    ok.payload = json{{"content", "hi"}};
    const json message = tool_result_to_message(ok, "call-1");
    EXPECT_EQ(message["role"], "tool");
    EXPECT_EQ(message["tool_call_id"], "call-1");
    EXPECT_EQ(message["content"], ok.payload.dump(2));

    ToolCallResult text;
    text.success = true;
    text.payload = "plain";
    EXPECT_EQ(tool_result_to_message(text, "")["content"], "plain");
    EXPECT_FALSE(tool_result_to_message(text, "").contains("tool_call_id"));

    ToolCallResult empty;
    empty.success = true;
    EXPECT_EQ(tool_result_to_message(empty, "")["content"], "No result returned from tool");

    ToolCallResult failed;
    failed.error_message = "Provider fake is not running";
    EXPECT_EQ(tool_result_to_message(failed, "")["content"], "Error: Provider fake is not running");
}

TEST(ToolPromptTest, CallIdsAreUnique) {
    const std::string first = generate_tool_call_id();
    const std::string second = generate_tool_call_id();
    EXPECT_EQ(first.rfind("call-", 0), 0u);
    EXPECT_NE(first, second);
}

}  // namespace
