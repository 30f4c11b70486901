#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "agent_event.hpp"

namespace agentgate {
namespace protocol {

// Frame terminating every stream
constexpr const char *kStreamSentinel = "data: [DONE]\n\n";

/**
 * @brief Wire framing of one streaming protocol
 *
 * Envelopes only format frames; what to emit and when is decided by
 * StreamEncoder. Each method returns complete SSE frames ("...\n\n").
 */
class IStreamEnvelope {
public:
    virtual ~IStreamEnvelope() = default;

    // first == true for the first text of the stream (carries the role)
    virtual std::vector<std::string> text_frames(const std::string &text, bool first) = 0;
    virtual std::vector<std::string> tool_call_frames(const ToolCall &call, size_t index) = 0;
    virtual std::vector<std::string> finish_frames(const std::string &finish_reason) = 0;
    virtual std::string error_frame(const std::string &message) = 0;
};

// data: {chat.completion.chunk}
class ChatCompletionEnvelope : public IStreamEnvelope {
public:
    explicit ChatCompletionEnvelope(std::string model);

    std::vector<std::string> text_frames(const std::string &text, bool first) override;
    std::vector<std::string> tool_call_frames(const ToolCall &call, size_t index) override;
    std::vector<std::string> finish_frames(const std::string &finish_reason) override;
    std::string error_frame(const std::string &message) override;

private:
    std::string chunk(const nlohmann::json &delta, const nlohmann::json &finish_reason) const;

    std::string model_;
    std::string id_;
    int64_t created_;
};

// event: response.* / data: {...}
class ResponsesEnvelope : public IStreamEnvelope {
public:
    explicit ResponsesEnvelope(std::string model);

    std::vector<std::string> text_frames(const std::string &text, bool first) override;
    std::vector<std::string> tool_call_frames(const ToolCall &call, size_t index) override;
    std::vector<std::string> finish_frames(const std::string &finish_reason) override;
    std::string error_frame(const std::string &message) override;

private:
    std::string model_;
    std::string response_id_;
    std::string message_id_;
    int64_t created_;
    int message_output_index_ = -1;  // Assigned when the message item is opened
    int next_output_index_ = 0;
};

/**
 * @brief Turns agent events into SSE frames for one stream
 *
 * - AssistantText: checked for an embedded tool call; otherwise a text frame
 *   (the first one carries the role)
 * - AssistantToolCall: tool-call frame with an incrementing index
 * - ResultEvent: finish frame ("tool_calls" if any call was seen, else "stop")
 *   and the sentinel; later events are ignored
 * - UnclassifiedEvent: nothing
 *
 * Not thread-safe; owned by the single consumer of a stream.
 */
class StreamEncoder {
public:
    explicit StreamEncoder(std::unique_ptr<IStreamEnvelope> envelope);

    // Parse one raw agent line and encode it. Malformed lines produce no frames.
    std::vector<std::string> on_line(const std::string &line);

    std::vector<std::string> on_event(const AgentEvent &event);

    // Normal end of stream without a result event
    std::vector<std::string> finish();

    // Stream failed: error frame + sentinel
    std::vector<std::string> fail(const std::string &message);

    bool finished() const { return finished_; }
    size_t tool_call_count() const { return tool_calls_; }
    size_t discarded_tool_calls() const { return discarded_; }

private:
    std::vector<std::string> emit_tool_call(const ToolCall &call);

    std::unique_ptr<IStreamEnvelope> envelope_;
    bool role_sent_ = false;
    bool finished_ = false;
    size_t tool_calls_ = 0;
    size_t discarded_ = 0;
};

}  // namespace protocol
}  // namespace agentgate
