#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "../errors.hpp"
#include "gateway/command_gateway.hpp"

namespace mup1gw
{
    namespace http
    {

        // Helper: Read a text form field from a multipart part, a urlencoded body or the query string
        inline std::optional<std::string> form_field(const httplib::Request &req, const std::string &name)
        {
            if (req.has_file(name))
            {
                return req.get_file_value(name).content;
            }
            if (req.has_param(name))
            {
                return req.get_param_value(name);
            }
            return std::nullopt;
        }

        // Helper: Read an uploaded file part. A part with neither name nor bytes
        // is what browsers send for an untouched file input and counts as absent.
        inline std::optional<gateway::Upload> form_upload(const httplib::Request &req, const std::string &name)
        {
            if (!req.has_file(name))
            {
                return std::nullopt;
            }
            const auto file = req.get_file_value(name);
            if (file.filename.empty() && file.content.empty())
            {
                return std::nullopt;
            }
            return gateway::Upload{file.content, file.filename};
        }

        // Helper: Send JSON response (invalid UTF-8 from the tool becomes U+FFFD)
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::ordered_json &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace),
                            "application/json");
        }

    } // namespace http
} // namespace mup1gw
