#include "../server.hpp"
#include "logging/logger.hpp"
#include "protocol/agent_event.hpp"
#include "protocol/prompt_builder.hpp"
#include "protocol/responses_api.hpp"
#include "protocol/stream_encoder.hpp"
#include "protocol/tool_call_extractor.hpp"
#include "utils.hpp"
#include "workspace/temp_workspace.hpp"

namespace agentgate {
namespace http {

//=============================================================================
// POST /v1/responses
//=============================================================================
void HttpServer::handle_post_responses(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    protocol::ResponsesRequest request;
    std::string error;
    if (!protocol::decode_responses_request(body, request, error)) {
        LOG_WARN("[HTTP] Rejected response request: " << error);
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    LOG_INFO("[HTTP] Response request: items=" << request.items.size() << " tools=" << request.tools.size()
                                               << " stream=" << (request.stream ? "true" : "false"));

    auto workspace = workspace::TempWorkspace::create(config_.workspace, error);
    if (!workspace) {
        send_error(res, StatusCode::INTERNAL, error);
        return;
    }

    const std::string &model = runner_.settings().model;
    agent::AgentExecutionRequest execution =
        make_execution_request(protocol::build_responses_prompt(request), workspace->path());
    execution.use_mcps = false;

    if (request.stream) {
        stream_response(res, std::move(execution), std::move(workspace),
                        std::make_unique<protocol::ResponsesEnvelope>(model));
        return;
    }

    agent::AgentExecutionResult result = runner_.execute(execution);
    if (!result.success) {
        LOG_ERROR("[HTTP] Response request failed: " << result.error.value_or(""));
        send_execution_failure(res, result);
        return;
    }

    std::string text = protocol::final_text_from_output(result.raw_output).value_or(result.raw_output);
    protocol::ToolCallExtraction extraction = protocol::extract_tool_call(text);
    send_json(res, StatusCode::OK, protocol::encode_response(model, text, extraction));
}

}  // namespace http
}  // namespace agentgate
