#ifndef FIRETV_CONTROL_ACTIONS_HPP
#define FIRETV_CONTROL_ACTIONS_HPP

#include <optional>
#include <string>
#include <vector>

#include "device/device_state.hpp"

namespace firetv {
namespace control {

// Android KeyEvent codes used by the remote actions
namespace keycodes {
constexpr int HOME = 3;
constexpr int VOLUME_UP = 24;
constexpr int VOLUME_DOWN = 25;
constexpr int POWER = 26;
constexpr int MEDIA_PLAY_PAUSE = 85;
constexpr int MEDIA_NEXT = 87;
constexpr int MEDIA_PREVIOUS = 88;
constexpr int MEDIA_PLAY = 126;
constexpr int MEDIA_PAUSE = 127;
}  // namespace keycodes

// Remote-control actions accepted on /devices/action
enum class Action {
    TURN_ON,
    TURN_OFF,
    HOME,
    MEDIA_PLAY_PAUSE,
    MEDIA_PLAY,
    MEDIA_PAUSE,
    MEDIA_NEXT,
    MEDIA_PREVIOUS,
    VOLUME_UP,
    VOLUME_DOWN
};

// POWER toggles, so power actions only fire from the matching state
enum class PowerPrecondition { NONE, ONLY_WHEN_OFF, ONLY_WHEN_NOT_OFF };

struct ActionSpec {
    Action action;
    const char *name;  // URL identifier, e.g. "volume_up"
    int keycode;
    PowerPrecondition precondition;
};

// Lookup table, one entry per Action in declaration order
const std::vector<ActionSpec> &action_table();

// Unknown names yield nullopt
std::optional<Action> parse_action(const std::string &name);

const ActionSpec &action_spec(Action action);

inline const char *action_to_string(Action action) { return action_spec(action).name; }

// Whether the key event should be sent given the device's current state
bool should_send(const ActionSpec &spec, device::DeviceState current);

}  // namespace control
}  // namespace firetv

#endif  // FIRETV_CONTROL_ACTIONS_HPP
