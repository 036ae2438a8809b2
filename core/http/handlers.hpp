#pragma once

/**
 * @brief HTTP Route Handlers
 *
 * All route handlers are defined as methods on HttpServer.
 *
 * Endpoints:
 * - GET  /devices/list                               -> handle_list_devices
 * - POST /devices/add                                -> handle_add_device
 * - GET  /devices/connect/{device_id}                -> handle_connect_device
 * - GET  /devices/state/{device_id}                  -> handle_get_device_state
 * - GET  /devices/action/{device_id}/{action_id}     -> handle_device_action
 * - GET  /devices/{device_id}/apps/running           -> handle_apps_running
 * - GET  /devices/{device_id}/apps/{app_id}/start    -> handle_app_start
 * - GET  /devices/{device_id}/apps/{app_id}/stop     -> handle_app_stop
 * - GET  /devices/{device_id}/apps/{app_id}/state    -> handle_app_state
 * - GET  /devices/{device_id}/apps/state/{app_id}    -> handle_app_state_deprecated
 *
 * Failures use {"success": false, "status": {"code", "message"}}; an
 * unreachable device is reported with HTTP 200 and "state": "disconnected".
 */

#include "server.hpp"
