#pragma once

#include <optional>
#include <string>
#include <vector>

#include "device_state.hpp"

namespace firetv {
namespace device {

// Raw output of the state queries; nullopt means the query failed or timed out
struct StateQueries {
    std::optional<std::string> screen;         // dumpsys power
    std::optional<std::string> focus;          // dumpsys window windows
    std::optional<std::string> media_session;  // dumpsys media_session
};

enum class PlaybackStatus { NONE, PLAYING, PAUSED };

/**
 * @brief Maps raw query output to exactly one DeviceState
 *
 * Rules, first match wins:
 * 1. any query failed          -> DISCONNECTED
 * 2. screen off                -> OFF
 * 3. a session is playing      -> PLAY
 * 4. a session is paused       -> PAUSE
 * 5. launcher/screensaver focus -> IDLE
 * 6. otherwise                 -> STANDBY
 *
 * Stateless apart from the idle package list; safe to share between threads.
 */
class StateClassifier {
public:
    StateClassifier();
    explicit StateClassifier(std::vector<std::string> idle_packages);

    DeviceState classify(const StateQueries &queries) const;

    // Focus output mentions one of the idle (launcher/screensaver) packages
    bool is_idle_focus(const std::string &focus_output) const;

    const std::vector<std::string> &idle_packages() const { return idle_packages_; }

    static bool is_screen_on(const std::string &screen_output);
    static PlaybackStatus playback_status(const std::string &media_session_output);

    // Fire OS home launcher and the stock screensavers
    static std::vector<std::string> default_idle_packages();

private:
    std::vector<std::string> idle_packages_;
};

}  // namespace device
}  // namespace firetv
