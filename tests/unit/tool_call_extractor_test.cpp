/**
 * tool_call_extractor_test.cpp - Tool-call extraction from agent text
 *
 * Tests:
 * - Markdown cleanup (fences, trailing markup)
 * - Whole-text forms: tool_call object, tool_calls array, bare array
 * - Embedded calls inside prose, first-match policy with warning
 * - Plain text yields no call
 */

#include "protocol/tool_call_extractor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "logging/logger.hpp"

using namespace agentgate::protocol;
using agentgate::logging::Level;
using agentgate::logging::Logger;

class ToolCallExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_sink([this](Level level, const std::string &message) {
            if (level == Level::LVL_WARN) {
                warnings_.push_back(message);
            }
        });
    }

    void TearDown() override { Logger::reset_sink(); }

    std::vector<std::string> warnings_;
};

TEST_F(ToolCallExtractorTest, CleanRemovesFenceLines) {
    std::string text = "```json\n{\"a\":1}\n```";
    EXPECT_EQ(clean_markdown_artifacts(text), "{\"a\":1}");
}

TEST_F(ToolCallExtractorTest, CleanStripsGluedFences) {
    EXPECT_EQ(clean_markdown_artifacts("```json{\"a\":1}```"), "{\"a\":1}");
}

TEST_F(ToolCallExtractorTest, CleanCutsTrailingMarkup) {
    std::string text = "{\"tool_call\":{\"name\":\"x\"}}\n</parameter>\n</xai:function_call>";
    EXPECT_EQ(clean_markdown_artifacts(text), "{\"tool_call\":{\"name\":\"x\"}}");
}

TEST_F(ToolCallExtractorTest, CleanTrimsBlankEdgeLines) {
    EXPECT_EQ(clean_markdown_artifacts("\n\n  \nhello\nworld\n\n"), "hello\nworld");
}

TEST_F(ToolCallExtractorTest, FencedToolCallIsExtracted) {
    std::string text = "```json\n{\"tool_call\": {\"name\": \"read_file\", \"arguments\": {\"path\": \"src/main.cpp\"}}}\n```";

    auto extraction = extract_tool_call(text);

    ASSERT_TRUE(extraction.found());
    EXPECT_EQ(extraction.tool_call->name, "read_file");
    EXPECT_EQ(extraction.tool_call->arguments["path"], "src/main.cpp");
    EXPECT_EQ(extraction.discarded, 0u);
    EXPECT_TRUE(warnings_.empty());
}

TEST_F(ToolCallExtractorTest, TwoEmbeddedCallsYieldFirstWithWarning) {
    std::string text =
        "I'll run both.\n"
        "{\"tool_call\": {\"name\": \"first\", \"arguments\": {\"n\": 1}}}\n"
        "and then\n"
        "{\"tool_call\": {\"name\": \"second\", \"arguments\": {\"n\": 2}}}\n";

    auto extraction = extract_tool_call(text);

    ASSERT_TRUE(extraction.found());
    EXPECT_EQ(extraction.tool_call->name, "first");
    EXPECT_EQ(extraction.tool_call->arguments["n"], 1);
    EXPECT_EQ(extraction.discarded, 1u);
    ASSERT_EQ(warnings_.size(), 1u);
    EXPECT_NE(warnings_[0].find("Multiple tool calls detected (2)"), std::string::npos);
}

TEST_F(ToolCallExtractorTest, EmbeddedCallWithNestedArguments) {
    std::string text =
        "Sure: {\"tool_call\": {\"name\": \"write\", \"arguments\": {\"file\": {\"path\": \"a\", \"body\": \"} {\"}}}} done";

    auto extraction = extract_tool_call(text);

    ASSERT_TRUE(extraction.found());
    EXPECT_EQ(extraction.tool_call->name, "write");
    EXPECT_EQ(extraction.tool_call->arguments["file"]["body"], "} {");
}

TEST_F(ToolCallExtractorTest, ToolCallsArrayUsesFirstElement) {
    std::string text = R"({"tool_calls": [
        {"function": {"name": "a", "arguments": "{\"x\":1}"}},
        {"function": {"name": "b", "arguments": "{}"}}
    ]})";

    auto extraction = extract_tool_call(text);

    ASSERT_TRUE(extraction.found());
    EXPECT_EQ(extraction.tool_call->name, "a");
    EXPECT_EQ(extraction.tool_call->arguments["x"], 1);
    EXPECT_EQ(extraction.discarded, 1u);
    EXPECT_EQ(warnings_.size(), 1u);
}

TEST_F(ToolCallExtractorTest, BareArrayOfCalls) {
    auto extraction = extract_tool_call(R"([{"name": "only", "arguments": {}}])");

    ASSERT_TRUE(extraction.found());
    EXPECT_EQ(extraction.tool_call->name, "only");
    EXPECT_EQ(extraction.discarded, 0u);
}

TEST_F(ToolCallExtractorTest, PlainTextYieldsNone) {
    auto extraction = extract_tool_call("The answer is 42. Use {curly} braces wisely.");

    EXPECT_FALSE(extraction.found());
    EXPECT_EQ(extraction.discarded, 0u);
}

TEST_F(ToolCallExtractorTest, EmptyTextYieldsNone) {
    EXPECT_FALSE(extract_tool_call("").found());
    EXPECT_FALSE(extract_tool_call("```\n```").found());
}

TEST_F(ToolCallExtractorTest, MalformedCandidateIsSkipped) {
    std::string text =
        "{\"tool_call\": {\"arguments\": {}}} then {\"tool_call\": {\"name\": \"valid\", \"arguments\": {}}}";

    auto extraction = extract_tool_call(text);

    ASSERT_TRUE(extraction.found());
    EXPECT_EQ(extraction.tool_call->name, "valid");
    EXPECT_EQ(extraction.discarded, 0u);
}

TEST_F(ToolCallExtractorTest, JsonWithoutToolCallIsNotACall) {
    EXPECT_FALSE(extract_tool_call(R"({"result": "ok"})").found());
}
