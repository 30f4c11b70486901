#include "responses_api.hpp"

#include "ids.hpp"
#include "logging/logger.hpp"

namespace agentgate {
namespace protocol {

namespace {

std::string string_field(const nlohmann::json &json, const char *key) {
    if (json.contains(key) && json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return "";
}

// Plain string, or the concatenated input_text/output_text parts
std::string message_text(const nlohmann::json &content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }

    std::string text;
    if (content.is_array()) {
        for (const auto &part : content) {
            if (!part.is_object()) {
                continue;
            }
            std::string type = string_field(part, "type");
            if (type == "input_text" || type == "output_text") {
                text += string_field(part, "text");
            }
        }
    }
    return text;
}

// The output of a function call may arrive under several keys; fall back to the whole item
std::string function_output_text(const nlohmann::json &item) {
    for (const char *key : {"content", "output", "text", "response"}) {
        if (!item.contains(key) || item[key].is_null()) {
            continue;
        }
        const auto &value = item[key];
        if (value.is_string()) {
            if (!value.get<std::string>().empty()) {
                return value.get<std::string>();
            }
            continue;
        }
        return value.dump();
    }

    std::string keys;
    for (auto it = item.begin(); it != item.end(); ++it) {
        keys += (keys.empty() ? "" : ", ") + it.key();
    }
    LOG_WARN("[Protocol] function_call_output item missing standard content fields. Keys: " << keys);
    return item.dump();
}

}  // namespace

bool decode_responses_request(const nlohmann::json &body, ResponsesRequest &request, std::string &error) {
    if (!body.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (!body.contains("input") || !body["input"].is_array() || body["input"].empty()) {
        error = "Missing required field: input must be a non-empty array";
        return false;
    }

    for (const auto &json : body["input"]) {
        if (!json.is_object()) {
            error = "input items must be objects";
            return false;
        }

        // Items without a type are treated as messages
        std::string type = json.contains("type") ? string_field(json, "type") : "message";
        ResponseItem item;

        if (type == "message") {
            item.type = ItemType::MESSAGE;
            item.role = string_field(json, "role");
            if (item.role.empty()) {
                error = "message items require a role";
                return false;
            }
            item.text = json.contains("content") ? message_text(json["content"]) : "";
        } else if (type == "function_call") {
            item.type = ItemType::FUNCTION_CALL;
            item.name = string_field(json, "name");
            item.call_id = string_field(json, "call_id");
            if (json.contains("arguments")) {
                item.arguments = json["arguments"].is_string() ? json["arguments"].get<std::string>()
                                                               : json["arguments"].dump();
            } else {
                item.arguments = "{}";
            }
        } else if (type == "function_call_output") {
            item.type = ItemType::FUNCTION_CALL_OUTPUT;
            item.call_id = string_field(json, "call_id");
            item.text = function_output_text(json);
        } else {
            LOG_WARN("[Protocol] Skipping unsupported input item type '" << type << "'");
            continue;
        }

        request.items.push_back(std::move(item));
    }

    if (request.items.empty()) {
        error = "input contains no supported items";
        return false;
    }

    if (body.contains("stream") && !body["stream"].is_null()) {
        if (!body["stream"].is_boolean()) {
            error = "stream must be a boolean";
            return false;
        }
        request.stream = body["stream"].get<bool>();
    }

    if (body.contains("tools") && !body["tools"].is_null()) {
        if (!body["tools"].is_array()) {
            error = "tools must be an array";
            return false;
        }
        request.tools = body["tools"];
    }
    return true;
}

nlohmann::json encode_function_call_item(const ToolCall &call) {
    return {
        {"type", "function_call"},
        {"id", generate_id("fc_")},
        {"call_id", generate_id("call_")},
        {"name", call.name},
        {"arguments", call.arguments.dump()},
        {"status", "completed"},
    };
}

nlohmann::json encode_response(const std::string &model, const std::string &text, const ToolCallExtraction &extraction) {
    nlohmann::json item;
    if (extraction.tool_call) {
        item = encode_function_call_item(*extraction.tool_call);
    } else {
        item = {
            {"type", "message"},
            {"id", generate_id("msg_")},
            {"role", "assistant"},
            {"status", "completed"},
            {"content", nlohmann::json::array({{{"type", "output_text"}, {"text", text}, {"annotations", nlohmann::json::array()}}})},
        };
    }

    int64_t now = unix_seconds();
    return {
        {"id", generate_id("resp_")},
        {"object", "response"},
        {"created_at", now},
        {"completed_at", now},
        {"status", "completed"},
        {"incomplete_details", nullptr},
        {"model", model},
        {"output", nlohmann::json::array({item})},
        {"parallel_tool_calls", false},
        {"tool_choice", "auto"},
        {"usage",
         {{"input_tokens", 0},
          {"output_tokens", 0},
          {"total_tokens", 0},
          {"input_tokens_details", {{"cached_tokens", 0}}},
          {"output_tokens_details", {{"reasoning_tokens", 0}}}}},
    };
}

}  // namespace protocol
}  // namespace agentgate
