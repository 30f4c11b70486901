#include "tool_call_extractor.hpp"

#include <regex>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace agentgate {
namespace protocol {

namespace {

const char *kFence = "```";

bool is_blank(const std::string &line) { return line.find_first_not_of(" \t\r") == std::string::npos; }

// std::nullopt when the line is nothing but a fence
std::optional<std::string> strip_fences(std::string line) {
    std::string trimmed = line;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    auto end = trimmed.find_last_not_of(" \t\r");
    trimmed.erase(end == std::string::npos ? 0 : end + 1);

    if (trimmed == "```" || trimmed == "```json") {
        return std::nullopt;
    }

    if (line.rfind("```json", 0) == 0) {
        line.erase(0, 7);
    } else if (line.rfind(kFence, 0) == 0) {
        line.erase(0, 3);
    }
    if (line.size() >= 3 && line.compare(line.size() - 3, 3, kFence) == 0) {
        line.erase(line.size() - 3);
    }
    return line;
}

// Index one past the '}' closing the object that opens at `start`, or npos if unbalanced.
// Braces inside string literals are ignored.
size_t find_object_end(const std::string &text, size_t start) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;

    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            depth++;
        } else if (c == '}') {
            depth--;
            if (depth == 0) {
                return i + 1;
            }
        }
    }
    return std::string::npos;
}

// One element of a tool_calls array: {tool_call:{...}}, {function:{...}} or {name,arguments}
bool decode_array_element(const nlohmann::json &element, ToolCall &call) {
    if (!element.is_object()) {
        return false;
    }
    if (element.contains("tool_call") && element["tool_call"].is_object()) {
        return decode_tool_call(element["tool_call"], call);
    }
    if (element.contains("function") && element["function"].is_object()) {
        return decode_tool_call(element["function"], call);
    }
    return decode_tool_call(element, call);
}

bool extract_from_array(const nlohmann::json &array, ToolCallExtraction &out) {
    if (array.empty()) {
        return false;
    }

    ToolCall call;
    if (!decode_array_element(array.front(), call)) {
        return false;
    }

    out.tool_call = std::move(call);
    out.discarded = array.size() - 1;
    if (out.discarded > 0) {
        LOG_WARN("[Protocol] Multiple tool calls in array (" << array.size() << "), using only the first one");
    }
    return true;
}

bool extract_from_whole_text(const std::string &cleaned, ToolCallExtraction &out) {
    auto parsed = nlohmann::json::parse(cleaned, nullptr, false);
    if (parsed.is_discarded()) {
        return false;
    }

    if (parsed.is_object()) {
        if (parsed.contains("tool_call") && parsed["tool_call"].is_object()) {
            ToolCall call;
            if (decode_tool_call(parsed["tool_call"], call)) {
                out.tool_call = std::move(call);
                return true;
            }
            return false;
        }
        if (parsed.contains("tool_calls") && parsed["tool_calls"].is_array()) {
            return extract_from_array(parsed["tool_calls"], out);
        }
        return false;
    }

    if (parsed.is_array()) {
        return extract_from_array(parsed, out);
    }
    return false;
}

bool extract_from_pattern(const std::string &cleaned, ToolCallExtraction &out) {
    static const std::regex kToolCallStart(R"(\{\s*"tool_call"\s*:\s*\{)");

    std::vector<ToolCall> candidates;
    auto search_from = cleaned.cbegin();
    std::smatch match;

    while (std::regex_search(search_from, cleaned.cend(), match, kToolCallStart)) {
        size_t start = static_cast<size_t>(match[0].first - cleaned.cbegin());
        size_t end = find_object_end(cleaned, start);
        if (end == std::string::npos) {
            search_from = match[0].first + 1;
            continue;
        }

        auto parsed = nlohmann::json::parse(cleaned.substr(start, end - start), nullptr, false);
        ToolCall call;
        if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("tool_call") &&
            parsed["tool_call"].is_object() &&
            decode_tool_call(parsed["tool_call"], call)) {
            candidates.push_back(std::move(call));
            search_from = cleaned.cbegin() + static_cast<std::ptrdiff_t>(end);
        } else {
            search_from = match[0].first + 1;
        }
    }

    if (candidates.empty()) {
        return false;
    }

    if (candidates.size() > 1) {
        LOG_WARN("[Protocol] Multiple tool calls detected (" << candidates.size()
                                                             << "), using only the first one");
    }
    out.discarded = candidates.size() - 1;
    out.tool_call = std::move(candidates.front());
    return true;
}

}  // namespace

std::string clean_markdown_artifacts(const std::string &text) {
    std::string cut = text;
    for (const char *marker : {"</parameter>", "</xai:function_call>"}) {
        auto pos = cut.find(marker);
        if (pos != std::string::npos) {
            cut.erase(pos);
        }
    }

    std::vector<std::string> lines;
    std::istringstream stream(cut);
    std::string line;
    while (std::getline(stream, line)) {
        if (auto stripped = strip_fences(line)) {
            lines.push_back(std::move(*stripped));
        }
    }

    while (!lines.empty() && is_blank(lines.front())) {
        lines.erase(lines.begin());
    }
    while (!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }

    std::string cleaned;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            cleaned += '\n';
        }
        cleaned += lines[i];
    }
    return cleaned;
}

ToolCallExtraction extract_tool_call(const std::string &text) {
    ToolCallExtraction out;
    if (text.empty()) {
        return out;
    }

    std::string cleaned = clean_markdown_artifacts(text);
    if (cleaned.empty()) {
        return out;
    }

    if (extract_from_whole_text(cleaned, out)) {
        LOG_DEBUG("[Protocol] Tool call (whole text): " << out.tool_call->name);
        return out;
    }
    if (extract_from_pattern(cleaned, out)) {
        LOG_DEBUG("[Protocol] Tool call (embedded): " << out.tool_call->name);
        return out;
    }
    return out;
}

}  // namespace protocol
}  // namespace agentgate
