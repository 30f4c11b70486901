#include "stream_encoder.hpp"

#include "ids.hpp"
#include "logging/logger.hpp"
#include "responses_api.hpp"
#include "tool_call_extractor.hpp"

namespace agentgate {
namespace protocol {

namespace {

// Agent text is not guaranteed to be valid UTF-8
std::string serialize(const nlohmann::json &payload) {
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string data_frame(const nlohmann::json &payload) { return "data: " + serialize(payload) + "\n\n"; }

std::string event_frame(const std::string &type, const nlohmann::json &payload) {
    return "event: " + type + "\ndata: " + serialize(payload) + "\n\n";
}

}  // namespace

// ---------------------------------------------------------------------------
// ChatCompletionEnvelope
// ---------------------------------------------------------------------------

ChatCompletionEnvelope::ChatCompletionEnvelope(std::string model)
    : model_(std::move(model)), id_(generate_id("chatcmpl-")), created_(unix_seconds()) {}

std::string ChatCompletionEnvelope::chunk(const nlohmann::json &delta, const nlohmann::json &finish_reason) const {
    nlohmann::json payload = {
        {"id", id_},
        {"object", "chat.completion.chunk"},
        {"created", created_},
        {"model", model_},
        {"choices", nlohmann::json::array({{{"index", 0}, {"delta", delta}, {"finish_reason", finish_reason}}})},
    };
    return data_frame(payload);
}

std::vector<std::string> ChatCompletionEnvelope::text_frames(const std::string &text, bool first) {
    nlohmann::json delta = {{"content", text}};
    if (first) {
        delta["role"] = "assistant";
    }
    return {chunk(delta, nullptr)};
}

std::vector<std::string> ChatCompletionEnvelope::tool_call_frames(const ToolCall &call, size_t index) {
    nlohmann::json tool_call = {
        {"index", index},
        {"id", generate_id("call_")},
        {"type", "function"},
        {"function", {{"name", call.name}, {"arguments", call.arguments.dump()}}},
    };
    nlohmann::json delta = {{"tool_calls", nlohmann::json::array({tool_call})}};
    return {chunk(delta, nullptr)};
}

std::vector<std::string> ChatCompletionEnvelope::finish_frames(const std::string &finish_reason) {
    return {chunk(nlohmann::json::object(), finish_reason)};
}

std::string ChatCompletionEnvelope::error_frame(const std::string &message) {
    return data_frame({{"error", {{"message", message}, {"type", "server_error"}}}});
}

// ---------------------------------------------------------------------------
// ResponsesEnvelope
// ---------------------------------------------------------------------------

ResponsesEnvelope::ResponsesEnvelope(std::string model)
    : model_(std::move(model)),
      response_id_(generate_id("resp_")),
      message_id_(generate_id("msg_")),
      created_(unix_seconds()) {}

std::vector<std::string> ResponsesEnvelope::text_frames(const std::string &text, bool first) {
    std::vector<std::string> frames;

    if (first || message_output_index_ < 0) {
        message_output_index_ = next_output_index_++;
        nlohmann::json item = {
            {"type", "message"},
            {"id", message_id_},
            {"role", "assistant"},
            {"status", "in_progress"},
            {"content", nlohmann::json::array()},
        };
        frames.push_back(event_frame("response.output_item.added", {{"type", "response.output_item.added"},
                                                                    {"output_index", message_output_index_},
                                                                    {"item", item}}));
    }

    frames.push_back(event_frame("response.output_text.delta", {{"type", "response.output_text.delta"},
                                                                {"item_id", message_id_},
                                                                {"output_index", message_output_index_},
                                                                {"content_index", 0},
                                                                {"delta", text}}));
    return frames;
}

std::vector<std::string> ResponsesEnvelope::tool_call_frames(const ToolCall &call, size_t) {
    int output_index = next_output_index_++;
    return {event_frame("response.output_item.done", {{"type", "response.output_item.done"},
                                                      {"output_index", output_index},
                                                      {"item", encode_function_call_item(call)}})};
}

std::vector<std::string> ResponsesEnvelope::finish_frames(const std::string &finish_reason) {
    nlohmann::json response = {
        {"id", response_id_},
        {"object", "response"},
        {"created_at", created_},
        {"completed_at", unix_seconds()},
        {"status", "completed"},
        {"model", model_},
        {"finish_reason", finish_reason},
    };
    return {event_frame("response.completed", {{"type", "response.completed"}, {"response", response}})};
}

std::string ResponsesEnvelope::error_frame(const std::string &message) {
    return event_frame("error", {{"type", "error"}, {"message", message}});
}

// ---------------------------------------------------------------------------
// StreamEncoder
// ---------------------------------------------------------------------------

StreamEncoder::StreamEncoder(std::unique_ptr<IStreamEnvelope> envelope) : envelope_(std::move(envelope)) {}

std::vector<std::string> StreamEncoder::on_line(const std::string &line) {
    auto event = parse_agent_event(line);
    if (!event) {
        return {};
    }
    return on_event(*event);
}

std::vector<std::string> StreamEncoder::emit_tool_call(const ToolCall &call) {
    LOG_DEBUG("[Stream] Tool call frame: " << call.name);
    return envelope_->tool_call_frames(call, tool_calls_++);
}

std::vector<std::string> StreamEncoder::on_event(const AgentEvent &event) {
    if (finished_) {
        return {};
    }

    if (const auto *text = std::get_if<AssistantText>(&event)) {
        if (text->text.empty()) {
            return {};
        }

        // Each fragment is inspected on its own; the stream has no final text
        auto extraction = extract_tool_call(text->text);
        if (extraction.tool_call) {
            discarded_ += extraction.discarded;
            return emit_tool_call(*extraction.tool_call);
        }

        bool first = !role_sent_;
        role_sent_ = true;
        return envelope_->text_frames(text->text, first);
    }

    if (const auto *call = std::get_if<AssistantToolCall>(&event)) {
        return emit_tool_call(call->call);
    }

    if (std::holds_alternative<ResultEvent>(event)) {
        return finish();
    }

    return {};
}

std::vector<std::string> StreamEncoder::finish() {
    if (finished_) {
        return {};
    }
    finished_ = true;

    auto frames = envelope_->finish_frames(tool_calls_ > 0 ? "tool_calls" : "stop");
    frames.push_back(kStreamSentinel);
    return frames;
}

std::vector<std::string> StreamEncoder::fail(const std::string &message) {
    if (finished_) {
        return {};
    }
    finished_ = true;

    return {envelope_->error_frame(message), kStreamSentinel};
}

}  // namespace protocol
}  // namespace agentgate
