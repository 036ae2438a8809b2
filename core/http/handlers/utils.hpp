#pragma once

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../errors.hpp"
#include "../json.hpp"
#include "registry/device_registry.hpp"

namespace firetv
{
    namespace http
    {

        // Helper: Parse device_id (and optionally a second segment) from regex matches
        inline bool parse_path_params(const httplib::Request &req, std::string &device_id)
        {
            if (req.matches.size() >= 2)
            {
                device_id = req.matches[1].str();
                return true;
            }
            return false;
        }

        inline bool parse_path_params(const httplib::Request &req, std::string &device_id, std::string &second)
        {
            if (req.matches.size() >= 3)
            {
                device_id = req.matches[1].str();
                second = req.matches[2].str();
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

        /**
         * @brief Write the response for a failed registry operation
         *
         * Returns false (nothing written) when the operation succeeded.
         * Client errors become 4xx/503 error bodies; connection errors become
         * a 200 body reporting the device as disconnected.
         */
        inline bool send_if_failed(httplib::Response &res, const registry::DeviceResult &result)
        {
            if (result.success)
            {
                return false;
            }

            if (result.error == registry::ErrorKind::CONNECTION_ERROR)
            {
                send_json(res, StatusCode::OK, encode_connection_error(result));
                return true;
            }

            StatusCode code = error_kind_to_status(result.error);
            send_json(res, code, make_error_response(code, result.error_message));
            return true;
        }

    } // namespace http
} // namespace firetv
