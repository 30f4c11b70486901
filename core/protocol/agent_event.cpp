#include "agent_event.hpp"

#include <sstream>

#include "logging/logger.hpp"

namespace agentgate {
namespace protocol {

namespace {

std::optional<nlohmann::json> try_parse(const std::string &text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

// First content part of type "text" carrying a string
std::optional<std::string> first_text_part(const nlohmann::json &message) {
    if (!message.is_object() || !message.contains("content") || !message["content"].is_array()) {
        return std::nullopt;
    }
    for (const auto &part : message["content"]) {
        if (!part.is_object() || !part.contains("type") || part["type"] != "text") {
            continue;
        }
        if (part.contains("text") && part["text"].is_string()) {
            return part["text"].get<std::string>();
        }
    }
    return std::nullopt;
}

}  // namespace

bool decode_tool_call(const nlohmann::json &json, ToolCall &call) {
    if (!json.is_object() || !json.contains("name") || !json["name"].is_string()) {
        return false;
    }

    call.name = json["name"].get<std::string>();
    call.arguments = nlohmann::json::object();

    if (json.contains("arguments")) {
        const auto &args = json["arguments"];
        if (args.is_string()) {
            auto decoded = try_parse(args.get<std::string>());
            call.arguments = decoded ? *decoded : args;
        } else if (!args.is_null()) {
            call.arguments = args;
        }
    }
    return true;
}

nlohmann::json tool_call_to_json(const ToolCall &call) {
    return {{"tool_call", {{"name", call.name}, {"arguments", call.arguments}}}};
}

std::optional<std::string> extract_outermost_json(const std::string &text) {
    auto first = text.find('{');
    auto last = text.rfind('}');
    if (first == std::string::npos || last == std::string::npos || last < first) {
        return std::nullopt;
    }

    std::string span = text.substr(first, last - first + 1);
    if (!try_parse(span)) {
        return std::nullopt;
    }
    return span;
}

std::optional<AgentEvent> parse_agent_event(const std::string &line) {
    auto parsed = try_parse(line);
    if (!parsed || !parsed->is_object()) {
        LOG_DEBUG("[Protocol] Discarding non-JSON line (" << line.size() << " bytes)");
        return std::nullopt;
    }

    const auto &json = *parsed;
    std::string type = json.contains("type") && json["type"].is_string() ? json["type"].get<std::string>() : "";

    if (type == "result" && json.contains("result") && json["result"].is_string()) {
        std::string text = json["result"].get<std::string>();
        if (auto embedded = extract_outermost_json(text)) {
            return AgentEvent{ResultEvent{*embedded}};
        }
        return AgentEvent{ResultEvent{text}};
    }

    if (type == "assistant" && json.contains("message")) {
        auto text = first_text_part(json["message"]);
        if (!text) {
            return AgentEvent{UnclassifiedEvent{type}};
        }

        // Only the whole text counts here; embedded calls are the extractor's job
        auto whole = try_parse(*text);
        if (whole && whole->is_object() && whole->contains("tool_call") && (*whole)["tool_call"].is_object()) {
            ToolCall call;
            if (decode_tool_call((*whole)["tool_call"], call)) {
                return AgentEvent{AssistantToolCall{std::move(call)}};
            }
        }
        return AgentEvent{AssistantText{*text}};
    }

    return AgentEvent{UnclassifiedEvent{type}};
}

std::optional<std::string> final_text_from_output(const std::string &raw_output) {
    std::optional<std::string> first_assistant;

    std::istringstream stream(raw_output);
    std::string line;
    while (std::getline(stream, line)) {
        auto event = parse_agent_event(line);
        if (!event) {
            continue;
        }

        if (auto *result = std::get_if<ResultEvent>(&*event)) {
            return result->text;
        }
        if (first_assistant) {
            continue;
        }
        if (auto *text = std::get_if<AssistantText>(&*event)) {
            first_assistant = text->text;
        } else if (auto *call = std::get_if<AssistantToolCall>(&*event)) {
            first_assistant = tool_call_to_json(call->call).dump();
        }
    }
    return first_assistant;
}

}  // namespace protocol
}  // namespace agentgate
