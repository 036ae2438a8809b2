#include "../../registry/device_registry.hpp"
#include "../handlers.hpp"
#include "utils.hpp"

namespace firetv
{
    namespace http
    {

        //=============================================================================
        // GET /devices/list
        //=============================================================================
        void HttpServer::handle_list_devices(const httplib::Request &, httplib::Response &res)
        {
            auto devices = registry_.list();

            nlohmann::json response = {{"devices", encode_device_list(devices)}};
            send_json(res, StatusCode::OK, response);
        }

        //=============================================================================
        // POST /devices/add
        //=============================================================================
        void HttpServer::handle_add_device(const httplib::Request &req, httplib::Response &res)
        {
            nlohmann::json request_json;
            try
            {
                request_json = nlohmann::json::parse(req.body);
            }
            catch (const std::exception &e)
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what()));
                return;
            }

            std::string device_id, host, error;
            if (!decode_add_request(request_json, device_id, host, error))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
                return;
            }

            auto result = registry_.add(device_id, host);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"success", true}});
        }

        //=============================================================================
        // GET /devices/connect/{device_id}
        //=============================================================================
        void HttpServer::handle_connect_device(const httplib::Request &req, httplib::Response &res)
        {
            std::string device_id;
            if (!parse_path_params(req, device_id))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
                return;
            }

            auto result = registry_.connect(device_id);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"success", true}, {"state", device::state_to_string(result.state)}});
        }

        //=============================================================================
        // GET /devices/state/{device_id}
        //=============================================================================
        void HttpServer::handle_get_device_state(const httplib::Request &req, httplib::Response &res)
        {
            std::string device_id;
            if (!parse_path_params(req, device_id))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
                return;
            }

            auto result = registry_.state(device_id);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"state", device::state_to_string(result.state)}});
        }

        //=============================================================================
        // GET /devices/action/{device_id}/{action_id}
        //=============================================================================
        void HttpServer::handle_device_action(const httplib::Request &req, httplib::Response &res)
        {
            std::string device_id, action_id;
            if (!parse_path_params(req, device_id, action_id))
            {
                send_json(res, StatusCode::INVALID_ARGUMENT,
                          make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
                return;
            }

            auto result = registry_.action(device_id, action_id);
            if (send_if_failed(res, result))
            {
                return;
            }

            send_json(res, StatusCode::OK, {{"success", true}});
        }

    } // namespace http
} // namespace firetv
