#include "state_classifier.hpp"

#include <cctype>
#include <utility>

namespace firetv {
namespace device {

namespace {
// android.media.session.PlaybackState constants
constexpr int kPlaybackStatePaused = 2;
constexpr int kPlaybackStatePlaying = 3;
constexpr size_t kMaxPlaybackStateDigits = 3;

constexpr const char *kPlaybackStateMarker = "PlaybackState {state=";
}  // namespace

StateClassifier::StateClassifier() : idle_packages_(default_idle_packages()) {}

StateClassifier::StateClassifier(std::vector<std::string> idle_packages) : idle_packages_(std::move(idle_packages)) {}

std::vector<std::string> StateClassifier::default_idle_packages() {
    return {"com.amazon.tv.launcher", "com.amazon.bueller.photos", "com.amazon.ftv.screensaver"};
}

DeviceState StateClassifier::classify(const StateQueries &queries) const {
    if (!queries.screen || !queries.focus || !queries.media_session) {
        return DeviceState::DISCONNECTED;
    }

    if (!is_screen_on(*queries.screen)) {
        return DeviceState::OFF;
    }

    switch (playback_status(*queries.media_session)) {
        case PlaybackStatus::PLAYING:
            return DeviceState::PLAY;
        case PlaybackStatus::PAUSED:
            return DeviceState::PAUSE;
        case PlaybackStatus::NONE:
            break;
    }

    if (is_idle_focus(*queries.focus)) {
        return DeviceState::IDLE;
    }

    return DeviceState::STANDBY;
}

bool StateClassifier::is_idle_focus(const std::string &focus_output) const {
    for (const auto &package : idle_packages_) {
        if (!package.empty() && focus_output.find(package) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool StateClassifier::is_screen_on(const std::string &screen_output) {
    // Fire OS 5 reports mScreenOn, newer builds only "Display Power: state=ON"
    return screen_output.find("mScreenOn=true") != std::string::npos ||
           screen_output.find("Display Power: state=ON") != std::string::npos;
}

PlaybackStatus StateClassifier::playback_status(const std::string &media_session_output) {
    // One line per session; any playing session wins over a paused one
    bool paused = false;
    const std::string marker = kPlaybackStateMarker;

    size_t pos = media_session_output.find(marker);
    while (pos != std::string::npos) {
        size_t digits = pos + marker.size();
        int value = 0;
        size_t count = 0;
        while (digits < media_session_output.size() &&
               std::isdigit(static_cast<unsigned char>(media_session_output[digits]))) {
            if (count < kMaxPlaybackStateDigits) {
                value = value * 10 + (media_session_output[digits] - '0');
            }
            ++count;
            ++digits;
        }
        // Out-of-range codes match nothing
        bool has_digits = count > 0 && count <= kMaxPlaybackStateDigits;

        if (has_digits && value == kPlaybackStatePlaying) {
            return PlaybackStatus::PLAYING;
        }
        if (has_digits && value == kPlaybackStatePaused) {
            paused = true;
        }

        pos = media_session_output.find(marker, digits);
    }

    return paused ? PlaybackStatus::PAUSED : PlaybackStatus::NONE;
}

}  // namespace device
}  // namespace firetv
