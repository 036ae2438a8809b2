#pragma once

#include <optional>
#include <string>

namespace firetv {
namespace device {

/**
 * @brief Power/playback classification of a Fire TV
 *
 * DISCONNECTED whenever the connection handle cannot be used; otherwise
 * exactly one of the other five values.
 */
enum class DeviceState { OFF, STANDBY, IDLE, PLAY, PAUSE, DISCONNECTED };

// State of a single app as seen by the device
enum class AppState { ON, OFF };

inline const char *state_to_string(DeviceState state) {
    switch (state) {
        case DeviceState::OFF:
            return "off";
        case DeviceState::STANDBY:
            return "standby";
        case DeviceState::IDLE:
            return "idle";
        case DeviceState::PLAY:
            return "play";
        case DeviceState::PAUSE:
            return "pause";
        case DeviceState::DISCONNECTED:
        default:
            return "disconnected";
    }
}

inline std::optional<DeviceState> string_to_state(const std::string &state_str) {
    if (state_str == "off") return DeviceState::OFF;
    if (state_str == "standby") return DeviceState::STANDBY;
    if (state_str == "idle") return DeviceState::IDLE;
    if (state_str == "play") return DeviceState::PLAY;
    if (state_str == "pause") return DeviceState::PAUSE;
    if (state_str == "disconnected") return DeviceState::DISCONNECTED;
    return std::nullopt;
}

inline const char *app_state_to_string(AppState state) { return state == AppState::ON ? "on" : "off"; }

}  // namespace device
}  // namespace firetv
