/**
 * chat_completions_test.cpp - Chat completions request decoding and response encoding
 */

#include "protocol/chat_completions.hpp"

#include <gtest/gtest.h>

using namespace agentgate::protocol;

namespace {
const std::string kModel = "grok-code-fast-1";

bool decode(const std::string &body, ChatCompletionRequest &request, std::string &error) {
    return decode_chat_request(nlohmann::json::parse(body), kModel, request, error);
}
}  // namespace

TEST(ChatCompletionsTest, DecodesFullRequest) {
    ChatCompletionRequest request;
    std::string error;
    ASSERT_TRUE(decode(R"({
        "model": "grok-code-fast-1",
        "stream": true,
        "messages": [
            {"role": "system", "content": "Be brief."},
            {"role": "user", "content": [{"type": "text", "text": "Hi "}, {"type": "text", "text": "there"}]},
            {"role": "assistant", "content": null,
             "tool_calls": [{"id": "call_1", "type": "function",
                             "function": {"name": "ls", "arguments": "{\"dir\":\"/\"}"}}]},
            {"role": "tool", "tool_call_id": "call_1", "content": "a.txt"}
        ],
        "tools": [{"type": "function", "function": {"name": "ls", "description": "List files",
                   "parameters": {"type": "object", "properties": {"dir": {"type": "string"}}}}}]
    })",
                       request, error))
        << error;

    EXPECT_TRUE(request.stream);
    ASSERT_EQ(request.messages.size(), 4u);
    EXPECT_EQ(request.messages[1].content.value_or(""), "Hi there");
    EXPECT_FALSE(request.messages[2].content.has_value());
    ASSERT_EQ(request.messages[2].tool_calls.size(), 1u);
    EXPECT_EQ(request.messages[2].tool_calls[0].arguments["dir"], "/");
    EXPECT_EQ(request.messages[3].tool_call_id, "call_1");
    ASSERT_EQ(request.tools.size(), 1u);
    EXPECT_EQ(request.tools[0].name, "ls");
    EXPECT_EQ(request.tools[0].description, "List files");
}

TEST(ChatCompletionsTest, RejectsMissingMessages) {
    ChatCompletionRequest request;
    std::string error;

    EXPECT_FALSE(decode(R"({"model": "grok-code-fast-1"})", request, error));
    EXPECT_EQ(error, "Missing required field: messages must be a non-empty array");

    EXPECT_FALSE(decode(R"({"model": "grok-code-fast-1", "messages": []})", request, error));
    EXPECT_EQ(error, "Missing required field: messages must be a non-empty array");
}

TEST(ChatCompletionsTest, RejectsUnsupportedModel) {
    ChatCompletionRequest request;
    std::string error;

    EXPECT_FALSE(decode(R"({"model": "gpt-4", "messages": [{"role": "user", "content": "x"}]})", request, error));
    EXPECT_EQ(error, "Model 'gpt-4' not supported. Only 'grok-code-fast-1' is available.");
}

TEST(ChatCompletionsTest, RejectsBadRoleAndBadTypes) {
    ChatCompletionRequest request;
    std::string error;

    EXPECT_FALSE(decode(R"({"model": "grok-code-fast-1", "messages": [{"role": "wizard", "content": "x"}]})",
                        request, error));
    EXPECT_NE(error.find("wizard"), std::string::npos);

    ChatCompletionRequest request2;
    EXPECT_FALSE(decode(R"({"model": "grok-code-fast-1", "messages": [{"role": "user", "content": 5}]})",
                        request2, error));

    ChatCompletionRequest request3;
    EXPECT_FALSE(decode(R"({"model": "grok-code-fast-1", "stream": "yes", "messages": [{"role": "user"}]})",
                        request3, error));
    EXPECT_EQ(error, "stream must be a boolean");

    ChatCompletionRequest request4;
    EXPECT_FALSE(decode(R"({"model": "grok-code-fast-1", "tools": {}, "messages": [{"role": "user"}]})", request4,
                        error));
    EXPECT_EQ(error, "tools must be an array");
}

TEST(ChatCompletionsTest, NonFunctionToolsAreSkipped) {
    std::vector<ToolDefinition> tools;
    std::string error;

    ASSERT_TRUE(decode_tool_definitions(
        nlohmann::json::parse(R"([{"type": "retrieval"}, {"type": "function", "function": {"name": "f"}}])"), tools,
        error));
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "f");
}

TEST(ChatCompletionsTest, EncodesPlainTextAsStop) {
    ToolCallExtraction none;
    auto response = encode_chat_completion(kModel, "Hello!", none);

    EXPECT_EQ(response["object"], "chat.completion");
    EXPECT_EQ(response["model"], kModel);
    EXPECT_EQ(response["choices"][0]["message"]["role"], "assistant");
    EXPECT_EQ(response["choices"][0]["message"]["content"], "Hello!");
    EXPECT_FALSE(response["choices"][0]["message"].contains("tool_calls"));
    EXPECT_EQ(response["choices"][0]["finish_reason"], "stop");
    EXPECT_EQ(response["usage"]["total_tokens"], 0);
    EXPECT_EQ(response["id"].get<std::string>().rfind("chatcmpl-", 0), 0u);
}

TEST(ChatCompletionsTest, EncodesToolCall) {
    ToolCallExtraction extraction;
    extraction.tool_call = ToolCall{"read_file", {{"path", "a.txt"}}};

    auto response = encode_chat_completion(kModel, "ignored", extraction);
    const auto &message = response["choices"][0]["message"];

    EXPECT_TRUE(message["content"].is_null());
    ASSERT_EQ(message["tool_calls"].size(), 1u);
    EXPECT_EQ(message["tool_calls"][0]["type"], "function");
    EXPECT_EQ(message["tool_calls"][0]["function"]["name"], "read_file");
    EXPECT_EQ(nlohmann::json::parse(message["tool_calls"][0]["function"]["arguments"].get<std::string>())["path"],
              "a.txt");
    EXPECT_EQ(response["choices"][0]["finish_reason"], "tool_calls");
}

TEST(ChatCompletionsTest, ModelListHasSingleModel) {
    auto list = encode_model_list(kModel, "cursor-agent");

    EXPECT_EQ(list["object"], "list");
    ASSERT_EQ(list["data"].size(), 1u);
    EXPECT_EQ(list["data"][0]["id"], kModel);
    EXPECT_EQ(list["data"][0]["owned_by"], "cursor-agent");
}
