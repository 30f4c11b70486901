#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "tool_call_extractor.hpp"

namespace agentgate {
namespace protocol {

/**
 * @brief Response-item wire types (POST /v1/responses)
 *
 * Request:
 *   {"input": [item, ...], "stream": bool, "tools": [...]}
 *
 * Items:
 *   {"type":"message","role":"user","content": "..." | [{"type":"input_text","text":"..."}]}
 *   {"type":"function_call","name":"...","call_id":"...","arguments":"{...}"}
 *   {"type":"function_call_output","call_id":"...","output":"..."}
 */

enum class ItemType { MESSAGE, FUNCTION_CALL, FUNCTION_CALL_OUTPUT };

struct ResponseItem {
    ItemType type = ItemType::MESSAGE;
    std::string role;       // message
    std::string text;       // message text, or function_call_output payload
    std::string name;       // function_call
    std::string call_id;    // function_call, function_call_output
    std::string arguments;  // function_call, JSON text as received
};

struct ResponsesRequest {
    std::vector<ResponseItem> items;
    bool stream = false;
    nlohmann::json tools = nlohmann::json::array();  // Rendered verbatim into the prompt
};

// Decode and validate a request body. Unknown item types are skipped with a warning.
bool decode_responses_request(const nlohmann::json &body, ResponsesRequest &request, std::string &error);

/**
 * @brief Buffered "response" object with a single output item
 *
 * function_call item when a tool call was extracted, otherwise a message item
 * whose content is one output_text part. Usage is always zero.
 */
nlohmann::json encode_response(const std::string &model, const std::string &text, const ToolCallExtraction &extraction);

// {"type":"function_call", ...} output item
nlohmann::json encode_function_call_item(const ToolCall &call);

}  // namespace protocol
}  // namespace agentgate
