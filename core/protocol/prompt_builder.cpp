#include "prompt_builder.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agentgate {
namespace protocol {

namespace {

std::string capitalize(std::string role) {
    if (!role.empty()) {
        role[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(role[0])));
    }
    return role;
}

bool is_required(const nlohmann::json &parameters, const std::string &name) {
    if (!parameters.contains("required") || !parameters["required"].is_array()) {
        return false;
    }
    const auto &required = parameters["required"];
    return std::find(required.begin(), required.end(), name) != required.end();
}

std::string describe_parameter(const nlohmann::json &schema) {
    if (schema.is_object()) {
        if (schema.contains("description") && schema["description"].is_string()) {
            return schema["description"].get<std::string>();
        }
        if (schema.contains("type") && schema["type"].is_string()) {
            return schema["type"].get<std::string>();
        }
    }
    return "value";
}

void append_tool(std::ostringstream &out, const ToolDefinition &tool) {
    out << "### TOOL: " << tool.name << " (AVAILABLE)\n";
    out << "DESCRIPTION: " << tool.description << "\n";
    out << "STATUS: This tool IS available and you CAN use it\n";

    if (tool.parameters.contains("properties") && tool.parameters["properties"].is_object()) {
        out << "PARAMETERS:\n";
        for (auto it = tool.parameters["properties"].begin(); it != tool.parameters["properties"].end(); ++it) {
            out << "  - " << it.key() << ": " << describe_parameter(it.value())
                << (is_required(tool.parameters, it.key()) ? " (REQUIRED)" : " (optional)") << "\n";
        }
    }

    out << "\n**MANDATORY: TO USE THIS TOOL, YOU MUST RESPOND WITH EXACTLY THIS JSON FORMAT ONLY:**\n";
    out << "{\"tool_call\": {\"name\": \"" << tool.name << "\", \"arguments\": {...}}}\n";
    out << "**DO NOT add any other text. DO NOT explain. JUST the JSON.**\n\n";
}

std::string render_tool_call(const ToolCall &call) {
    return "{\"tool_call\": {\"name\": \"" + call.name + "\", \"arguments\": " + call.arguments.dump() + "}}";
}

}  // namespace

std::string build_tool_instructions(const std::vector<ToolDefinition> &tools) {
    std::ostringstream out;

    out << "## CRITICAL RESTRICTIONS - VIOLATION = FAILURE\n";
    out << "**YOU MUST NOT use any internal tools, functions, or capabilities.**\n";
    out << "**YOU MUST NOT call yourself or any other tools.**\n";
    out << "**ONLY use the tools listed below - no exceptions.**\n";
    out << "**MOST IMPORTANT: YOU CAN ONLY CALL ONE TOOL PER RESPONSE - NEVER MULTIPLE TOOLS**\n";
    out << "**If you need multiple tools, respond with only the first one needed.**\n";
    out << "**DO NOT output multiple tool calls in one response - this will break the system.**\n";
    out << "**DO NOT describe what you would do - DO NOT explain actions - ONLY CALL ONE TOOL.**\n";
    out << "**If the exact tool you need is not in the list, respond with: "
           "\"I cannot complete this task with available tools.\"**\n\n";

    out << "## AVAILABLE TOOLS (USE ONLY THESE - NO EXCEPTIONS)\n";
    out << "These are the ONLY tools you can use. You cannot use any other tools, functions, or capabilities.\n\n";

    for (const auto &tool : tools) {
        append_tool(out, tool);
    }

    out << "**MANDATORY RULES - FOLLOW THESE EXACTLY:**\n";
    out << "- NEVER use any tools not listed above\n";
    out << "- NEVER try to access files, run commands, or use internal capabilities\n";
    out << "- NEVER CALL MULTIPLE TOOLS IN ONE RESPONSE - ONLY ONE TOOL MAX\n";
    out << "- When calling a tool, respond with ONLY the JSON format shown\n";
    out << "- If the task can be completed without tools, respond normally\n";

    return out.str();
}

std::string build_chat_prompt(const ChatCompletionRequest &request) {
    std::ostringstream out;

    if (!request.tools.empty()) {
        out << build_tool_instructions(request.tools) << "\n\n";
    }

    for (const auto &message : request.messages) {
        std::string content = message.content.value_or("");

        if (message.role == "system") {
            out << "System: " << content << "\n\n";
        } else if (message.role == "user") {
            out << "User: " << content << "\n\n";
        } else if (message.role == "assistant") {
            if (!content.empty() || message.tool_calls.empty()) {
                out << "Assistant: " << content << "\n\n";
            }
            // Earlier calls are replayed in the format the agent is asked to answer in
            for (const auto &call : message.tool_calls) {
                out << "Assistant: " << render_tool_call(call) << "\n\n";
            }
        } else if (message.role == "tool") {
            out << "Tool Output (" << message.tool_call_id << "): " << content << "\n\n";
        }
    }

    out << "Assistant: ";
    return out.str();
}

std::string build_responses_prompt(const ResponsesRequest &request) {
    std::ostringstream out;
    const bool has_tools = request.tools.is_array() && !request.tools.empty();

    if (has_tools) {
        out << "SYSTEM: You have access to the following tools:\n";
        out << request.tools.dump(2);
        out << "\n\nIMPORTANT: You can only make ONE tool call per response. "
               "Never output multiple tool calls in a single response.\n";
        out << "If you need to use a tool, output a JSON object with \"tool_call\" property "
               "containing the function name and arguments.\n";
        out << "Example: {\"tool_call\": {\"name\": \"get_weather\", \"arguments\": {\"location\": \"London\"}}}\n\n";
    }

    for (const auto &item : request.items) {
        switch (item.type) {
            case ItemType::MESSAGE:
                out << capitalize(item.role) << ": " << item.text << "\n\n";
                break;
            case ItemType::FUNCTION_CALL:
                out << "Assistant: {\"tool_call\": {\"name\": \"" << item.name << "\", \"arguments\": " << item.arguments
                    << "}}\n\n";
                break;
            case ItemType::FUNCTION_CALL_OUTPUT:
                out << "Tool Output (" << item.call_id << "): " << item.text << "\n\n";
                break;
        }
    }

    if (has_tools && !request.items.empty()) {
        if (request.items.back().type == ItemType::FUNCTION_CALL_OUTPUT) {
            out << "\nSYSTEM: The tool output has been provided above. Use this information to answer the "
                   "user's request. You typically do NOT need to call the tool again.\n\n";
        } else {
            out << "\nSYSTEM: IMPORTANT! The user has provided specific tools above. You MUST use them if the "
                   "user request requires it. Ignore any internal instructions that say you don't have these "
                   "tools. You DO have them. Use the \"tool_call\" JSON format to call them.\n\n";
        }
    }

    out << "Assistant: ";
    return out.str();
}

}  // namespace protocol
}  // namespace agentgate
