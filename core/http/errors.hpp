#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "agent/agent_types.hpp"

namespace agentgate
{
    namespace http
    {

        /**
         * @brief Gateway status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - INTERNAL -> HTTP 500
         * - BAD_GATEWAY -> HTTP 502 (agent exited non-zero)
         * - UNAVAILABLE -> HTTP 503 (agent could not be started, stream limit)
         * - DEADLINE_EXCEEDED -> HTTP 504 (agent timed out)
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            INTERNAL,
            BAD_GATEWAY,
            UNAVAILABLE,
            DEADLINE_EXCEEDED
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::INTERNAL:
                return 500;
            case StatusCode::BAD_GATEWAY:
                return 502;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
            default:
                return 500;
            }
        }

        /**
         * @brief Convert StatusCode to string representation
         */
        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            case StatusCode::BAD_GATEWAY:
                return "BAD_GATEWAY";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief OpenAI-style error "type" for a status code
         */
        inline std::string status_code_to_error_type(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::INVALID_ARGUMENT:
                return "invalid_request_error";
            case StatusCode::NOT_FOUND:
                return "not_found_error";
            case StatusCode::DEADLINE_EXCEEDED:
                return "timeout_error";
            case StatusCode::UNAVAILABLE:
                return "service_unavailable_error";
            default:
                return "server_error";
            }
        }

        /**
         * @brief Map an execution failure to the status reported to the client
         */
        inline StatusCode status_from_error_kind(agent::ErrorKind kind)
        {
            switch (kind)
            {
            case agent::ErrorKind::NONE:
                return StatusCode::OK;
            case agent::ErrorKind::INVALID_REQUEST:
                return StatusCode::INVALID_ARGUMENT;
            case agent::ErrorKind::SPAWN_FAILED:
                return StatusCode::UNAVAILABLE;
            case agent::ErrorKind::TIMED_OUT:
                return StatusCode::DEADLINE_EXCEEDED;
            case agent::ErrorKind::NONZERO_EXIT:
                return StatusCode::BAD_GATEWAY;
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a complete JSON error response
         *
         * {"error": {"message": "...", "type": "invalid_request_error", "code": "INVALID_ARGUMENT"}}
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"error", {{"message", message}, {"type", status_code_to_error_type(code)}, {"code", status_code_to_string(code)}}}};
        }

        // Serialize a response body. Invalid UTF-8 (agent output, request paths) becomes U+FFFD.
        inline std::string dump_json(const nlohmann::json &body)
        {
            return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

    } // namespace http
} // namespace agentgate
