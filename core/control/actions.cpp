#include "actions.hpp"

#include <algorithm>

namespace firetv {
namespace control {

const std::vector<ActionSpec> &action_table() {
    static const std::vector<ActionSpec> table = {
        {Action::TURN_ON, "turn_on", keycodes::POWER, PowerPrecondition::ONLY_WHEN_OFF},
        {Action::TURN_OFF, "turn_off", keycodes::POWER, PowerPrecondition::ONLY_WHEN_NOT_OFF},
        {Action::HOME, "home", keycodes::HOME, PowerPrecondition::NONE},
        {Action::MEDIA_PLAY_PAUSE, "media_play_pause", keycodes::MEDIA_PLAY_PAUSE, PowerPrecondition::NONE},
        {Action::MEDIA_PLAY, "media_play", keycodes::MEDIA_PLAY, PowerPrecondition::NONE},
        {Action::MEDIA_PAUSE, "media_pause", keycodes::MEDIA_PAUSE, PowerPrecondition::NONE},
        {Action::MEDIA_NEXT, "media_next", keycodes::MEDIA_NEXT, PowerPrecondition::NONE},
        {Action::MEDIA_PREVIOUS, "media_previous", keycodes::MEDIA_PREVIOUS, PowerPrecondition::NONE},
        {Action::VOLUME_UP, "volume_up", keycodes::VOLUME_UP, PowerPrecondition::NONE},
        {Action::VOLUME_DOWN, "volume_down", keycodes::VOLUME_DOWN, PowerPrecondition::NONE},
    };
    return table;
}

std::optional<Action> parse_action(const std::string &name) {
    const auto &table = action_table();
    auto it = std::find_if(table.begin(), table.end(), [&name](const ActionSpec &spec) { return name == spec.name; });
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->action;
}

const ActionSpec &action_spec(Action action) { return action_table()[static_cast<size_t>(action)]; }

bool should_send(const ActionSpec &spec, device::DeviceState current) {
    switch (spec.precondition) {
        case PowerPrecondition::ONLY_WHEN_OFF:
            return current == device::DeviceState::OFF;
        case PowerPrecondition::ONLY_WHEN_NOT_OFF:
            return current != device::DeviceState::OFF;
        case PowerPrecondition::NONE:
        default:
            return true;
    }
}

}  // namespace control
}  // namespace firetv
