#pragma once

#include <string>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"
#include "../json.hpp"

namespace itemstore
{
    namespace http
    {

        // Helper: Parse the item id from regex matches
        inline bool parse_path_id(const httplib::Request &req, std::string &id)
        {
            if (req.matches.size() >= 2)
            {
                id = req.matches[1].str();
                return true;
            }
            return false;
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(), "application/json");
        }

        // Helper: Send JSON error envelope
        inline void send_error(httplib::Response &res, StatusCode code, const std::string &message)
        {
            send_json(res, code, make_error_response(code, message));
        }

        // Helper: Send 422 with per-field validation detail
        inline void send_validation_error(httplib::Response &res, const std::vector<FieldError> &errors)
        {
            send_json(res, StatusCode::UNPROCESSABLE_ENTITY,
                      make_error_response(StatusCode::UNPROCESSABLE_ENTITY, "Request body validation failed",
                                          encode_field_errors(errors)));
        }

    } // namespace http
} // namespace itemstore
