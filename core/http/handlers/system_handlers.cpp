#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "../server.hpp"
#include "logging/logger.hpp"
#include "protocol/chat_completions.hpp"
#include "utils.hpp"

namespace agentgate {
namespace http {

namespace {
// 2026-01-31T12:00:00.000Z
std::string iso8601_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count()
        << "Z";
    return oss.str();
}
}  // namespace

//=============================================================================
// GET /v1/models
//=============================================================================
void HttpServer::handle_get_models(const httplib::Request & /*req*/, httplib::Response &res) {
    const agent::AgentSettings &settings = runner_.settings();
    send_json(res, StatusCode::OK, protocol::encode_model_list(settings.model, settings.name));
}

//=============================================================================
// GET /api/health
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request & /*req*/, httplib::Response &res) {
    LOG_DEBUG("[HTTP] Health check requested");

    nlohmann::json response = {{"status", "healthy"},
                               {"agentAuthenticated", runner_.settings().api_key.has_value()},
                               {"timestamp", iso8601_now()}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /api/prompt
//=============================================================================
void HttpServer::handle_post_prompt(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    if (!body.is_object() || !body.contains("prompt") || !body["prompt"].is_string() ||
        body["prompt"].get<std::string>().empty()) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Missing required field: prompt must be a non-empty string");
        return;
    }

    std::string working_directory = config_.workspace.root;
    if (body.contains("workspaceRoot") && !body["workspaceRoot"].is_null()) {
        if (!body["workspaceRoot"].is_string()) {
            send_error(res, StatusCode::INVALID_ARGUMENT, "workspaceRoot must be a string");
            return;
        }
        std::string root = body["workspaceRoot"].get<std::string>();
        if (!root.empty()) {
            working_directory = root;
        }
    }

    agent::AgentExecutionRequest execution =
        make_execution_request(body["prompt"].get<std::string>(), working_directory);

    if (body.contains("timeout") && !body["timeout"].is_null()) {
        const auto &timeout = body["timeout"];
        if (!timeout.is_number() || timeout.get<double>() <= 0) {
            send_error(res, StatusCode::INVALID_ARGUMENT, "timeout must be a positive number of milliseconds");
            return;
        }
        execution.timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout.get<double>()));
    }

    LOG_INFO("[HTTP] Prompt: length=" << execution.prompt.size() << " workspace=" << working_directory
                                      << " timeout="
                                      << (execution.timeout ? std::to_string(execution.timeout->count()) + "ms"
                                                            : std::string("none")));

    agent::AgentExecutionResult result = runner_.execute(execution);
    LOG_INFO("[HTTP] Prompt completed: success=" << (result.success ? "true" : "false")
                                                 << " output_length=" << result.raw_output.size());

    if (!result.success) {
        LOG_ERROR("[HTTP] Prompt failed: " << result.error.value_or(""));
        send_execution_failure(res, result);
        return;
    }

    res.status = status_code_to_http(StatusCode::OK);
    res.set_content(result.raw_output, "text/plain");
}

}  // namespace http
}  // namespace agentgate
