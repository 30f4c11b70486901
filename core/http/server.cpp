#include "server.hpp"

#include <algorithm>
#include <chrono>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace agentgate {
namespace http {

namespace {
constexpr int kReadTimeoutSeconds = 5;
// Streams write as the agent produces output; a stalled client is dropped after this
constexpr int kWriteTimeoutSeconds = 30;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;

void set_preflight_headers(httplib::Response &res) {
    res.status = kStatusNoContent;
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}
}  // namespace

HttpServer::HttpServer(const runtime::GatewayConfig &config, agent::IAgentRunner &runner)
    : config_(config), runner_(runner) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    const runtime::HttpConfig &http_config = config_.http;
    LOG_INFO("[HTTP] Starting server on " << http_config.bind << ":" << http_config.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kReadTimeoutSeconds, 0);
    server_->set_write_timeout(kWriteTimeoutSeconds, 0);

    // Buffered executions and open streams each hold a worker for the whole run
    int pool_size = http_config.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = http_config.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = http_config.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // JSON bodies for errors raised by httplib itself (unknown route, bad request)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        res.set_content(dump_json(make_error_response(code, message)), "application/json");
    });

    // Handler exceptions fail only the request that raised them
    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        res.status = kStatusInternal;
        res.set_content(dump_json(make_error_response(StatusCode::INTERNAL, msg)), "application/json");
    });

    if (http_config.port == 0) {
        int bound = server_->bind_to_any_port(http_config.bind.c_str());
        if (bound < 0) {
            error = "Failed to bind to " + http_config.bind + " (any port)";
            server_.reset();
            return false;
        }
        port_ = bound;
    } else {
        if (!server_->bind_to_port(http_config.bind.c_str(), http_config.port)) {
            error = "Failed to bind to " + http_config.bind + ":" + std::to_string(http_config.port);
            server_.reset();
            return false;
        }
        port_ = http_config.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << http_config.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    // Open streams observe running_ on their next poll and cancel their agent
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

agent::AgentExecutionRequest HttpServer::make_execution_request(std::string prompt,
                                                                std::string working_directory) const {
    agent::AgentExecutionRequest request;
    request.prompt = std::move(prompt);
    request.working_directory = std::move(working_directory);
    if (config_.request_timeout_ms > 0) {
        request.timeout = std::chrono::milliseconds(config_.request_timeout_ms);
    }
    return request;
}

void HttpServer::setup_routes() {
    // POST /v1/chat/completions - Chat Completions (buffered or SSE)
    server_->Post("/v1/chat/completions", [this](const httplib::Request &req, httplib::Response &res) {
        handle_post_chat_completions(req, res);
    });

    // POST /v1/responses - Responses API (buffered or SSE)
    server_->Post("/v1/responses",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_responses(req, res); });

    // GET /v1/models - The single supported model
    server_->Get("/v1/models",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_models(req, res); });

    // GET /api/health - Liveness and API key presence
    server_->Get("/api/health",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });

    // POST /api/prompt - Raw prompt execution, plain text output
    server_->Post("/api/prompt",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_prompt(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) { set_preflight_headers(res); });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   POST /v1/chat/completions");
    LOG_INFO("[HTTP]   POST /v1/responses");
    LOG_INFO("[HTTP]   GET  /v1/models");
    LOG_INFO("[HTTP]   GET  /api/health");
    LOG_INFO("[HTTP]   POST /api/prompt");
}

}  // namespace http
}  // namespace agentgate
