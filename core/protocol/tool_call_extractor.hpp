#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "agent_event.hpp"

namespace agentgate {
namespace protocol {

/**
 * @brief Outcome of scanning agent text for a tool call
 *
 * At most one call is surfaced per turn. When the text holds several, the
 * first one wins and `discarded` counts the rest.
 */
struct ToolCallExtraction {
    std::optional<ToolCall> tool_call;
    size_t discarded = 0;

    bool found() const { return tool_call.has_value(); }
};

/**
 * @brief Remove markdown/markup noise the agent wraps around JSON
 *
 * - Lines consisting only of ``` or ```json are dropped
 * - A fence glued to the start or end of a line is stripped
 * - Everything from </parameter> or </xai:function_call> onwards is cut
 * - Leading and trailing blank lines are trimmed
 */
std::string clean_markdown_artifacts(const std::string &text);

/**
 * @brief Extract the tool call embedded in agent text
 *
 * Order (first success wins), all on the cleaned text:
 * 1. Whole text as JSON: {"tool_call":{...}}, {"tool_calls":[...]} or [...]
 * 2. Scan for {"tool_call":{ ... }} objects (nested braces allowed)
 * 3. Otherwise none: the text is plain content
 */
ToolCallExtraction extract_tool_call(const std::string &text);

}  // namespace protocol
}  // namespace agentgate
