#pragma once

#include <set>
#include <string>

#include "state_classifier.hpp"

namespace firetv {
namespace device {
namespace commands {

// Line printed between query sections of a combined shell command
extern const char *const kSectionMarker;

// "input keyevent <code>"
std::string key_event(int keycode);

// Launch the app's LAUNCHER activity
std::string start_app(const std::string &app_id);

// Force-stop the app
std::string stop_app(const std::string &app_id);

// Processes owned by app users (u0_a*), on both toybox and toolbox ps
std::string running_apps_query();

/**
 * @brief Screen, focus and media session queries in one round trip
 *
 * Each query is followed by kSectionMarker on its own line so that
 * parse_state_query() can split the output.
 */
std::string state_query();

// Split state_query() output. Sections missing from truncated output stay nullopt.
StateQueries parse_state_query(const std::string &output);

// Package names from "ps" output; process suffixes (":service") are dropped
std::set<std::string> parse_running_apps(const std::string &ps_output);

// Package of the focused window, empty if none can be found
std::string parse_focused_package(const std::string &focus_output);

}  // namespace commands
}  // namespace device
}  // namespace firetv
