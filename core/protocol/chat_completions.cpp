#include "chat_completions.hpp"

#include "ids.hpp"

namespace agentgate {
namespace protocol {

namespace {

bool is_valid_role(const std::string &role) {
    return role == "system" || role == "user" || role == "assistant" || role == "tool";
}

// string | null | [{"type":"text","text":...}, ...]
bool decode_content(const nlohmann::json &content, std::optional<std::string> &out, std::string &error) {
    if (content.is_null()) {
        out = std::nullopt;
        return true;
    }
    if (content.is_string()) {
        out = content.get<std::string>();
        return true;
    }
    if (content.is_array()) {
        std::string text;
        for (const auto &part : content) {
            if (!part.is_object()) {
                error = "Message content parts must be objects";
                return false;
            }
            if (part.contains("text") && part["text"].is_string()) {
                text += part["text"].get<std::string>();
            }
        }
        out = text;
        return true;
    }
    error = "Message content must be a string, null, or an array of content parts";
    return false;
}

bool decode_message(const nlohmann::json &json, size_t index, ChatMessage &message, std::string &error) {
    const std::string where = "messages[" + std::to_string(index) + "]";
    if (!json.is_object()) {
        error = where + " must be an object";
        return false;
    }
    if (!json.contains("role") || !json["role"].is_string()) {
        error = where + ".role is required";
        return false;
    }

    message.role = json["role"].get<std::string>();
    if (!is_valid_role(message.role)) {
        error = where + ".role '" + message.role + "' is not supported";
        return false;
    }

    if (json.contains("content") && !decode_content(json["content"], message.content, error)) {
        error = where + ": " + error;
        return false;
    }

    if (message.role == "assistant" && json.contains("tool_calls") && json["tool_calls"].is_array()) {
        for (const auto &entry : json["tool_calls"]) {
            ToolCall call;
            const auto &fn = entry.is_object() && entry.contains("function") ? entry["function"] : entry;
            if (decode_tool_call(fn, call)) {
                message.tool_calls.push_back(std::move(call));
            }
        }
    }

    if (message.role == "tool" && json.contains("tool_call_id") && json["tool_call_id"].is_string()) {
        message.tool_call_id = json["tool_call_id"].get<std::string>();
    }
    return true;
}

}  // namespace

bool decode_tool_definitions(const nlohmann::json &tools, std::vector<ToolDefinition> &out, std::string &error) {
    if (!tools.is_array()) {
        error = "tools must be an array";
        return false;
    }

    for (const auto &tool : tools) {
        if (!tool.is_object() || !tool.contains("type") || tool["type"] != "function") {
            continue;
        }
        if (!tool.contains("function") || !tool["function"].is_object()) {
            error = "Function tool is missing its 'function' definition";
            return false;
        }

        const auto &fn = tool["function"];
        if (!fn.contains("name") || !fn["name"].is_string()) {
            error = "Function tool is missing a name";
            return false;
        }

        ToolDefinition def;
        def.name = fn["name"].get<std::string>();
        if (fn.contains("description") && fn["description"].is_string()) {
            def.description = fn["description"].get<std::string>();
        }
        if (fn.contains("parameters") && fn["parameters"].is_object()) {
            def.parameters = fn["parameters"];
        }
        out.push_back(std::move(def));
    }
    return true;
}

bool decode_chat_request(const nlohmann::json &body, const std::string &supported_model,
                         ChatCompletionRequest &request, std::string &error) {
    if (!body.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (!body.contains("messages") || !body["messages"].is_array() || body["messages"].empty()) {
        error = "Missing required field: messages must be a non-empty array";
        return false;
    }

    request.model = body.contains("model") && body["model"].is_string() ? body["model"].get<std::string>() : "";
    if (request.model != supported_model) {
        error = "Model '" + request.model + "' not supported. Only '" + supported_model + "' is available.";
        return false;
    }

    const auto &messages = body["messages"];
    for (size_t i = 0; i < messages.size(); ++i) {
        ChatMessage message;
        if (!decode_message(messages[i], i, message, error)) {
            return false;
        }
        request.messages.push_back(std::move(message));
    }

    if (body.contains("stream") && !body["stream"].is_null()) {
        if (!body["stream"].is_boolean()) {
            error = "stream must be a boolean";
            return false;
        }
        request.stream = body["stream"].get<bool>();
    }

    if (body.contains("tools") && !body["tools"].is_null()) {
        if (!decode_tool_definitions(body["tools"], request.tools, error)) {
            return false;
        }
    }
    return true;
}

nlohmann::json encode_chat_completion(const std::string &model, const std::string &text,
                                      const ToolCallExtraction &extraction) {
    nlohmann::json message = {{"role", "assistant"}};
    std::string finish_reason = "stop";

    if (extraction.tool_call) {
        message["content"] = nullptr;
        message["tool_calls"] = nlohmann::json::array({{
            {"id", generate_id("call_")},
            {"type", "function"},
            {"function", {{"name", extraction.tool_call->name}, {"arguments", extraction.tool_call->arguments.dump()}}},
        }});
        finish_reason = "tool_calls";
    } else {
        message["content"] = text;
    }

    return {
        {"id", generate_id("chatcmpl-")},
        {"object", "chat.completion"},
        {"created", unix_seconds()},
        {"model", model},
        {"choices", nlohmann::json::array({{{"index", 0}, {"message", message}, {"finish_reason", finish_reason}}})},
        {"usage", {{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}}},
    };
}

nlohmann::json encode_model_list(const std::string &model, const std::string &owned_by) {
    return {
        {"object", "list"},
        {"data",
         nlohmann::json::array({{{"id", model}, {"object", "model"}, {"created", unix_seconds()}, {"owned_by", owned_by}}})},
    };
}

}  // namespace protocol
}  // namespace agentgate
