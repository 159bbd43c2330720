#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace itemstore
{
    namespace http
    {

        /**
         * @brief Service status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - CREATED -> HTTP 201
         * - NO_CONTENT -> HTTP 204
         * - INVALID_ARGUMENT -> HTTP 400 (malformed HTTP request)
         * - NOT_FOUND -> HTTP 404
         * - UNPROCESSABLE_ENTITY -> HTTP 422 (bad id or body validation)
         * - UNAVAILABLE -> HTTP 503
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            CREATED,
            NO_CONTENT,
            INVALID_ARGUMENT,
            NOT_FOUND,
            UNPROCESSABLE_ENTITY,
            UNAVAILABLE,
            INTERNAL
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
            case StatusCode::CREATED:
                return 201;
            case StatusCode::NO_CONTENT:
                return 204;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::UNPROCESSABLE_ENTITY:
                return 422;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::INTERNAL:
                return 500;
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
            case StatusCode::CREATED:
                return "CREATED";
            case StatusCode::NO_CONTENT:
                return "NO_CONTENT";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::UNPROCESSABLE_ENTITY:
                return "UNPROCESSABLE_ENTITY";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Build a JSON status object
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? status_code_to_string(code) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         *
         * "detail" carries the message (or, for body validation, the list of
         * field errors); "status" carries the machine-readable code.
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message,
                                                  const nlohmann::json &detail = nullptr)
        {
            return {
                {"detail", detail.is_null() ? nlohmann::json(message) : detail},
                {"status", make_status(code, message)}};
        }

    } // namespace http
} // namespace itemstore
