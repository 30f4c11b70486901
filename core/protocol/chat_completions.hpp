#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "agent_event.hpp"
#include "tool_call_extractor.hpp"

namespace agentgate {
namespace protocol {

/**
 * @brief Chat completions wire types (POST /v1/chat/completions)
 *
 * Request:
 *   {"model": "...", "messages": [{"role": "...", "content": ...}], "stream": bool, "tools": [...]}
 *
 * Message content may be a string, null, or an array of {"type":"text","text":...}
 * parts. Assistant messages may carry tool_calls; tool messages carry tool_call_id.
 */

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();  // JSON schema ("properties", "required")
};

struct ChatMessage {
    std::string role;  // system | user | assistant | tool
    std::optional<std::string> content;
    std::vector<ToolCall> tool_calls;  // assistant only
    std::string tool_call_id;          // tool only
};

struct ChatCompletionRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    bool stream = false;
    std::vector<ToolDefinition> tools;
};

// Decode and validate a request body. Returns false with a client-facing message.
bool decode_chat_request(const nlohmann::json &body, const std::string &supported_model,
                         ChatCompletionRequest &request, std::string &error);

// Decode {"type":"function","function":{...}} entries; other tool types are skipped
bool decode_tool_definitions(const nlohmann::json &tools, std::vector<ToolDefinition> &out, std::string &error);

/**
 * @brief Buffered chat.completion object
 *
 * With a tool call: content null, tool_calls[0] set, finish_reason "tool_calls".
 * Otherwise: content = text, finish_reason "stop". Usage is always zero.
 */
nlohmann::json encode_chat_completion(const std::string &model, const std::string &text,
                                      const ToolCallExtraction &extraction);

// {"object":"list","data":[{"id": model, ...}]}
nlohmann::json encode_model_list(const std::string &model, const std::string &owned_by);

}  // namespace protocol
}  // namespace agentgate
