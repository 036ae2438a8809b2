#pragma once

#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "registry/device_registry.hpp"

namespace firetv {
namespace http {

/**
 * @brief JSON encoding for the device endpoints
 *
 * States and app states use their lowercase wire names
 * ("play", "disconnected", "on", ...).
 */

// {"<device_id>": {"host": ..., "state": ...}, ...}
nlohmann::json encode_device_list(const std::vector<registry::DeviceSnapshot> &devices);

// ["com.example.app", ...] in sorted order
nlohmann::json encode_running_apps(const std::set<std::string> &apps);

// {"success": false, "state": "disconnected", "error": ...}
nlohmann::json encode_connection_error(const registry::DeviceResult &result);

// Decode POST /devices/add body
bool decode_add_request(const nlohmann::json &json, std::string &device_id, std::string &host, std::string &error);

}  // namespace http
}  // namespace firetv
