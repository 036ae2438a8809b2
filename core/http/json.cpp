#include "json.hpp"

#include "device/device_state.hpp"

namespace firetv {
namespace http {

nlohmann::json encode_device_list(const std::vector<registry::DeviceSnapshot> &devices) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto &device : devices) {
        result[device.device_id] = {{"host", device.host}, {"state", device::state_to_string(device.state)}};
    }
    return result;
}

nlohmann::json encode_running_apps(const std::set<std::string> &apps) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto &app : apps) {
        result.push_back(app);
    }
    return result;
}

nlohmann::json encode_connection_error(const registry::DeviceResult &result) {
    return {{"success", false},
            {"state", device::state_to_string(device::DeviceState::DISCONNECTED)},
            {"error", result.error_message}};
}

bool decode_add_request(const nlohmann::json &json, std::string &device_id, std::string &host, std::string &error) {
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (!json.contains("device_id") || !json["device_id"].is_string()) {
        error = "Missing or invalid 'device_id' field (expected string)";
        return false;
    }
    if (!json.contains("host") || !json["host"].is_string()) {
        error = "Missing or invalid 'host' field (expected \"<address>:<port>\")";
        return false;
    }

    device_id = json["device_id"].get<std::string>();
    host = json["host"].get<std::string>();
    return true;
}

}  // namespace http
}  // namespace firetv
