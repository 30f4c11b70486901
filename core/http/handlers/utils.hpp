#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace agentgate
{
    namespace http
    {

        // Helper: Parse request body as JSON. On failure the 400 response is already set.
        inline bool parse_json_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &body)
        {
            body = nlohmann::json::parse(req.body, nullptr, false);
            if (body.is_discarded())
            {
                res.status = status_code_to_http(StatusCode::INVALID_ARGUMENT);
                res.set_content(dump_json(make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid JSON in request body")),
                                "application/json");
                return false;
            }
            return true;
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(dump_json(body), "application/json");
        }

        // Helper: Send JSON error response
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

        // Helper: Map a failed execution to its error response
        inline void send_execution_failure(httplib::Response &res, const agent::AgentExecutionResult &result)
        {
            send_error(res, status_from_error_kind(result.error_kind),
                       "Agent execution failed: " + result.error.value_or("unknown error"));
        }

    } // namespace http
} // namespace agentgate
