#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace agentgate {
namespace protocol {

/**
 * @brief Agent event model
 *
 * The agent prints one JSON object per line (--output-format stream-json).
 * Only two discriminators matter to the gateway:
 *
 *   {"type":"assistant","message":{"content":[{"type":"text","text":"..."}]}}
 *   {"type":"result","result":"..."}
 *
 * Everything else decodes to UnclassifiedEvent and is ignored downstream.
 */

struct ToolCall {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct AssistantText {
    std::string text;
};

struct AssistantToolCall {
    ToolCall call;
};

struct ResultEvent {
    std::string text;
};

struct UnclassifiedEvent {
    std::string type;  // Discriminator as seen (empty if absent)
};

using AgentEvent = std::variant<AssistantText, AssistantToolCall, ResultEvent, UnclassifiedEvent>;

// Decode one stdout line. std::nullopt for malformed JSON or a non-object value.
std::optional<AgentEvent> parse_agent_event(const std::string &line);

// Buffered path: pick the final answer from raw agent output.
// First result text wins, else the first assistant text (a tool call is
// re-serialized as {"tool_call":{...}}). std::nullopt if neither exists.
std::optional<std::string> final_text_from_output(const std::string &raw_output);

// Span from the first '{' to the last '}' if it parses as JSON
std::optional<std::string> extract_outermost_json(const std::string &text);

// {"tool_call":{"name":...,"arguments":...}}
nlohmann::json tool_call_to_json(const ToolCall &call);

// Accepts {"name": string, "arguments"?: object|string}. A string holding JSON is decoded.
bool decode_tool_call(const nlohmann::json &json, ToolCall &call);

}  // namespace protocol
}  // namespace agentgate
