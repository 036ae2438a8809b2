#include "../../logging/logger.hpp"
#include "../../registry/device_registry.hpp"
#include "../handlers.hpp"
#include "utils.hpp"

namespace firetv
{
    namespace http
    {

        //=============================================================================
        // GET /devices/{device_id}/apps/running
        //=============================================================================
        void HttpServer::handle_apps_running(const httplib::Request &req, httplib::Response &res)
        {
            std::string device_id;
            if (!parse_path_params(req, device_id))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
                return;
            }

            auto result = registry_.apps_running(device_id);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"running_apps", encode_running_apps(result.running_apps)}});
        }

        //=============================================================================
        // GET /devices/{device_id}/apps/{app_id}/start
        //=============================================================================
        void HttpServer::handle_app_start(const httplib::Request &req, httplib::Response &res)
        {
            std::string device_id, app_id;
            if (!parse_path_params(req, device_id, app_id))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
                return;
            }

            auto result = registry_.app_start(device_id, app_id);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"success", true}});
        }

        //=============================================================================
        // GET /devices/{device_id}/apps/{app_id}/stop
        //=============================================================================
        void HttpServer::handle_app_stop(const httplib::Request &req, httplib::Response &res)
        {
            std::string device_id, app_id;
            if (!parse_path_params(req, device_id, app_id))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
                return;
            }

            auto result = registry_.app_stop(device_id, app_id);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"success", true}});
        }

        //=============================================================================
        // GET /devices/{device_id}/apps/{app_id}/state
        //=============================================================================
        void HttpServer::handle_app_state(const httplib::Request &req, httplib::Response &res)
        {
            std::string device_id, app_id;
            if (!parse_path_params(req, device_id, app_id))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
                return;
            }

            auto result = registry_.app_state(device_id, app_id);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"status", device::app_state_to_string(result.app_state)}});
        }

        //=============================================================================
        // GET /devices/{device_id}/apps/state/{app_id} (deprecated)
        //=============================================================================
        void HttpServer::handle_app_state_deprecated(const httplib::Request &req, httplib::Response &res)
        {
            LOG_WARN("[HTTP] " << req.path << " is deprecated; use /devices/{device_id}/apps/{app_id}/state");
            handle_app_state(req, res);
        }

    } // namespace http
} // namespace firetv
