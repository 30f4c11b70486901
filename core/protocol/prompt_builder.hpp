#pragma once

#include <string>
#include <vector>

#include "chat_completions.hpp"
#include "responses_api.hpp"

namespace agentgate {
namespace protocol {

/**
 * @brief Prompt rendering
 *
 * The agent has no structured tool channel, so tool definitions become plain
 * instructions in the prompt and the agent is told to answer a tool request
 * with exactly one {"tool_call": {...}} object. The conversation is flattened
 * to "Role: text" blocks and always ends with "Assistant: ".
 */

// Natural-language tool listing with the one-call-per-response directive
std::string build_tool_instructions(const std::vector<ToolDefinition> &tools);

// Tool instructions (if any) first, then the conversation
std::string build_chat_prompt(const ChatCompletionRequest &request);

// Tool JSON listing (if any), items, closing reminder, "Assistant: "
std::string build_responses_prompt(const ResponsesRequest &request);

}  // namespace protocol
}  // namespace agentgate
