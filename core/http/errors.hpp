#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "registry/device_registry.hpp"

namespace firetv
{
    namespace http
    {

        /**
         * @brief Response status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - UNAVAILABLE -> HTTP 503
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
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
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::INTERNAL:
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
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::INTERNAL:
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Map a registry failure to a response status
         *
         * CONNECTION_ERROR is OK: an unreachable device is a normal, reportable
         * state and the body carries "state": "disconnected".
         */
        inline StatusCode error_kind_to_status(registry::ErrorKind kind)
        {
            switch (kind)
            {
            case registry::ErrorKind::NONE:
            case registry::ErrorKind::CONNECTION_ERROR:
                return StatusCode::OK;
            case registry::ErrorKind::INVALID_IDENTIFIER:
            case registry::ErrorKind::INVALID_HOST:
            case registry::ErrorKind::INVALID_APP_ID:
                return StatusCode::INVALID_ARGUMENT;
            case registry::ErrorKind::UNKNOWN_DEVICE:
            case registry::ErrorKind::UNKNOWN_ACTION:
                return StatusCode::NOT_FOUND;
            case registry::ErrorKind::BUSY:
                return StatusCode::UNAVAILABLE;
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a JSON status object
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         *
         * {"success": false, "status": {"code": ..., "message": ...}}
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"success", false},
                {"status", make_status(code, message)}};
        }

    } // namespace http
} // namespace firetv
