#include <memory>
#include <string>
#include <vector>

#include "../server.hpp"
#include "logging/logger.hpp"
#include "protocol/stream_encoder.hpp"
#include "utils.hpp"
#include "workspace/temp_workspace.hpp"

namespace agentgate {
namespace http {

namespace {
constexpr int kStreamPollMs = 1000;
constexpr int kKeepaliveIntervalPolls = 15;

// Everything one SSE response owns. Members are destroyed in reverse order:
// the line stream (agent reaped) goes before its working directory.
struct StreamState {
    std::unique_ptr<workspace::TempWorkspace> workspace;
    std::unique_ptr<agent::ILineStream> stream;
    protocol::StreamEncoder encoder;
    int idle_polls = 0;

    StreamState(std::unique_ptr<workspace::TempWorkspace> ws, std::unique_ptr<agent::ILineStream> s,
                std::unique_ptr<protocol::IStreamEnvelope> envelope)
        : workspace(std::move(ws)), stream(std::move(s)), encoder(std::move(envelope)) {}
};

bool write_frames(httplib::DataSink &sink, const std::vector<std::string> &frames) {
    for (const auto &frame : frames) {
        if (!sink.write(frame.data(), frame.size())) {
            return false;
        }
    }
    return true;
}
}  // namespace

void HttpServer::stream_response(httplib::Response &res, agent::AgentExecutionRequest request,
                                 std::unique_ptr<workspace::TempWorkspace> workspace,
                                 std::unique_ptr<protocol::IStreamEnvelope> envelope) {
    // Claim a slot first so concurrent requests cannot all pass the limit
    int stream_number = stream_count_.fetch_add(1) + 1;
    if (stream_number > config_.http.max_streams) {
        --stream_count_;
        LOG_WARN("[Stream] Request rejected: max streams (" << config_.http.max_streams << ") reached");
        send_error(res, StatusCode::UNAVAILABLE, "Too many concurrent streams");
        return;
    }

    std::shared_ptr<StreamState> state;
    try {
        state = std::make_shared<StreamState>(std::move(workspace), runner_.execute_streaming(request),
                                              std::move(envelope));
    } catch (...) {
        --stream_count_;
        throw;
    }
    LOG_DEBUG("[Stream] Opened (" << stream_number << " active)");

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");  // Disable nginx buffering

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, state](size_t /*offset*/, httplib::DataSink &sink) {
            if (!running_.load()) {
                LOG_WARN("[Stream] Server stopping, cancelling agent");
                state->stream->cancel();
                return false;
            }

            std::string line;
            std::vector<std::string> frames;
            switch (state->stream->next(line, kStreamPollMs)) {
                case agent::ILineStream::Status::LINE:
                    frames = state->encoder.on_line(line);
                    break;
                case agent::ILineStream::Status::PENDING:
                    // No output yet - send keep-alive comment every ~15 seconds
                    if (++state->idle_polls >= kKeepaliveIntervalPolls) {
                        state->idle_polls = 0;
                        frames.push_back(": keepalive\n\n");
                    }
                    break;
                case agent::ILineStream::Status::END:
                    frames = state->encoder.finish();
                    break;
                case agent::ILineStream::Status::FAILED:
                    LOG_ERROR("[Stream] " << state->stream->error());
                    frames = state->encoder.fail(state->stream->error());
                    break;
            }

            if (!frames.empty()) {
                state->idle_polls = 0;
            }
            if (!write_frames(sink, frames)) {
                LOG_WARN("[Stream] Client went away, cancelling agent");
                state->stream->cancel();
                return false;
            }

            if (state->encoder.finished()) {
                if (state->encoder.discarded_tool_calls() > 0) {
                    LOG_WARN("[Stream] Discarded " << state->encoder.discarded_tool_calls() << " extra tool call(s)");
                }
                sink.done();
            }
            return true;
        },
        [this, state](bool success) {
            // Cleanup callback when the response is released
            state->stream->cancel();
            int remaining = --stream_count_;
            LOG_DEBUG("[Stream] Closed (" << (success ? "complete" : "aborted") << ", " << remaining << " active)");
        });
}

}  // namespace http
}  // namespace agentgate
