/**
 * prompt_builder_test.cpp - Prompt rendering for both request protocols
 */

#include "protocol/prompt_builder.hpp"

#include <gtest/gtest.h>

using namespace agentgate::protocol;

namespace {
bool ends_with(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ChatMessage message(const std::string &role, const std::string &content) {
    ChatMessage m;
    m.role = role;
    m.content = content;
    return m;
}
}  // namespace

TEST(PromptBuilderTest, ChatConversationWithoutTools) {
    ChatCompletionRequest request;
    request.messages = {message("system", "Be brief."), message("user", "Hi"), message("assistant", "Hello"),
                        message("user", "Bye")};

    std::string prompt = build_chat_prompt(request);

    EXPECT_EQ(prompt, "System: Be brief.\n\nUser: Hi\n\nAssistant: Hello\n\nUser: Bye\n\nAssistant: ");
}

TEST(PromptBuilderTest, ChatToolsComeFirst) {
    ChatCompletionRequest request;
    ToolDefinition tool;
    tool.name = "read_file";
    tool.description = "Read a file";
    tool.parameters = nlohmann::json::parse(
        R"({"type":"object","properties":{"path":{"type":"string","description":"File path"},"limit":{"type":"integer"}},"required":["path"]})");
    request.tools = {tool};
    request.messages = {message("user", "Show main.cpp")};

    std::string prompt = build_chat_prompt(request);

    EXPECT_EQ(prompt.find("## CRITICAL RESTRICTIONS"), 0u);
    EXPECT_NE(prompt.find("### TOOL: read_file (AVAILABLE)"), std::string::npos);
    EXPECT_NE(prompt.find("  - path: File path (REQUIRED)"), std::string::npos);
    EXPECT_NE(prompt.find("  - limit: integer (optional)"), std::string::npos);
    EXPECT_NE(prompt.find("{\"tool_call\": {\"name\": \"read_file\", \"arguments\": {...}}}"), std::string::npos);
    EXPECT_LT(prompt.find("ONLY ONE TOOL MAX"), prompt.find("User: Show main.cpp"));
    EXPECT_TRUE(ends_with(prompt, "User: Show main.cpp\n\nAssistant: "));
}

TEST(PromptBuilderTest, ChatReplaysToolCallsAndOutputs) {
    ChatCompletionRequest request;
    ChatMessage assistant;
    assistant.role = "assistant";
    assistant.tool_calls = {ToolCall{"ls", {{"dir", "/"}}}};
    ChatMessage tool = message("tool", "a.txt b.txt");
    tool.tool_call_id = "call_7";
    request.messages = {message("user", "List"), assistant, tool};

    std::string prompt = build_chat_prompt(request);

    EXPECT_NE(prompt.find("Assistant: {\"tool_call\": {\"name\": \"ls\", \"arguments\": {\"dir\":\"/\"}}}"),
              std::string::npos);
    EXPECT_NE(prompt.find("Tool Output (call_7): a.txt b.txt"), std::string::npos);
}

TEST(PromptBuilderTest, ResponsesWithoutTools) {
    ResponsesRequest request;
    ResponseItem item;
    item.role = "user";
    item.text = "Hello";
    request.items = {item};

    EXPECT_EQ(build_responses_prompt(request), "User: Hello\n\nAssistant: ");
}

TEST(PromptBuilderTest, ResponsesReminderDependsOnLastItem) {
    ResponsesRequest request;
    request.tools = nlohmann::json::parse(R"([{"type":"function","name":"get_weather"}])");

    ResponseItem user;
    user.role = "user";
    user.text = "Weather in Oslo?";
    request.items = {user};

    std::string before_call = build_responses_prompt(request);
    EXPECT_EQ(before_call.find("SYSTEM: You have access to the following tools:"), 0u);
    EXPECT_NE(before_call.find("\"get_weather\""), std::string::npos);
    EXPECT_NE(before_call.find("You MUST use them"), std::string::npos);
    EXPECT_TRUE(ends_with(before_call, "Assistant: "));

    ResponseItem call;
    call.type = ItemType::FUNCTION_CALL;
    call.name = "get_weather";
    call.call_id = "c1";
    call.arguments = "{\"location\":\"Oslo\"}";
    ResponseItem output;
    output.type = ItemType::FUNCTION_CALL_OUTPUT;
    output.call_id = "c1";
    output.text = "Sunny";
    request.items = {user, call, output};

    std::string after_output = build_responses_prompt(request);
    EXPECT_NE(after_output.find("Assistant: {\"tool_call\": {\"name\": \"get_weather\", \"arguments\": "
                                "{\"location\":\"Oslo\"}}}"),
              std::string::npos);
    EXPECT_NE(after_output.find("Tool Output (c1): Sunny"), std::string::npos);
    EXPECT_NE(after_output.find("The tool output has been provided above"), std::string::npos);
    EXPECT_EQ(after_output.find("You MUST use them"), std::string::npos);
}
