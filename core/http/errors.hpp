#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace mup1gw
{
    namespace http
    {

        /**
         * @brief Gateway outcomes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - PAYLOAD_TOO_LARGE -> HTTP 413
         * - UNPROCESSABLE -> HTTP 422 (missing form field)
         * - INTERNAL -> HTTP 500 (tool failure, I/O, spawn, exceptions)
         * - DEADLINE_EXCEEDED -> HTTP 504 (tool timeout)
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            PAYLOAD_TOO_LARGE,
            UNPROCESSABLE,
            INTERNAL,
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
            case StatusCode::PAYLOAD_TOO_LARGE:
                return 413;
            case StatusCode::UNPROCESSABLE:
                return 422;
            case StatusCode::INTERNAL:
                return 500;
            case StatusCode::DEADLINE_EXCEEDED:
                return 504;
            default:
                return 500;
            }
        }

        /**
         * @brief Convert StatusCode to string representation (for logs)
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
            case StatusCode::PAYLOAD_TOO_LARGE:
                return "PAYLOAD_TOO_LARGE";
            case StatusCode::UNPROCESSABLE:
                return "UNPROCESSABLE";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            case StatusCode::DEADLINE_EXCEEDED:
                return "DEADLINE_EXCEEDED";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Build the JSON error body
         *
         * Every failure, whatever its status, is reported as {"error": message}.
         */
        inline nlohmann::ordered_json make_error_response(const std::string &message)
        {
            nlohmann::ordered_json body = nlohmann::ordered_json::object();
            body["error"] = message;
            return body;
        }

    } // namespace http
} // namespace mup1gw
