#include "shell_commands.hpp"

#include <regex>
#include <sstream>
#include <vector>

namespace firetv {
namespace device {
namespace commands {

const char *const kSectionMarker = "__firetv_section__";

namespace {
constexpr const char *kScreenQuery = "dumpsys power | grep -E 'mScreenOn=|Display Power: state='";
constexpr const char *kFocusQuery = "dumpsys window windows | grep -E 'mCurrentFocus|mFocusedApp'";
constexpr const char *kMediaSessionQuery = "dumpsys media_session | grep 'state=PlaybackState'";

std::string focused_package_from_line(const std::string &line) {
    // "mCurrentFocus=Window{4c2a u0 com.amazon.tv.launcher/com.amazon.tv.launcher.ui.HomeActivity}"
    static const std::regex package_re(R"(([A-Za-z][A-Za-z0-9_]*(\.[A-Za-z0-9_]+)+)/)");
    std::smatch match;
    if (std::regex_search(line, match, package_re)) {
        return match[1].str();
    }
    return "";
}
}  // namespace

std::string key_event(int keycode) { return "input keyevent " + std::to_string(keycode); }

std::string start_app(const std::string &app_id) {
    return "monkey -p " + app_id + " -c android.intent.category.LAUNCHER 1";
}

std::string stop_app(const std::string &app_id) { return "am force-stop " + app_id; }

std::string running_apps_query() {
    // toybox ps (Fire OS 6+) lists only the caller's session without -A;
    // older toolbox ps lists everything and yields no match for -A
    return "ps -A | grep u0_a || ps | grep u0_a";
}

std::string state_query() {
    std::ostringstream cmd;
    const char *queries[] = {kScreenQuery, kFocusQuery, kMediaSessionQuery};
    for (const char *query : queries) {
        cmd << query << "; echo " << kSectionMarker << "; ";
    }
    std::string out = cmd.str();
    return out.substr(0, out.size() - 2);
}

StateQueries parse_state_query(const std::string &output) {
    std::vector<std::string> sections;
    std::string current;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line == kSectionMarker) {
            sections.push_back(current);
            current.clear();
        } else {
            current += line;
            current += '\n';
        }
    }

    StateQueries queries;
    if (sections.size() > 0) queries.screen = sections[0];
    if (sections.size() > 1) queries.focus = sections[1];
    if (sections.size() > 2) queries.media_session = sections[2];
    return queries;
}

std::set<std::string> parse_running_apps(const std::string &ps_output) {
    std::set<std::string> apps;
    std::istringstream stream(ps_output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find("u0_a") == std::string::npos) {
            continue;
        }

        // Process name is the last column
        auto end = line.find_last_not_of(" \t");
        if (end == std::string::npos) {
            continue;
        }
        auto begin = line.find_last_of(" \t", end);
        size_t start = begin == std::string::npos ? 0 : begin + 1;
        std::string name = line.substr(start, end - start + 1);

        auto colon = name.find(':');
        if (colon != std::string::npos) {
            name = name.substr(0, colon);
        }
        if (name.find('.') != std::string::npos) {
            apps.insert(name);
        }
    }
    return apps;
}

std::string parse_focused_package(const std::string &focus_output) {
    std::string fallback;
    std::istringstream stream(focus_output);
    std::string line;
    while (std::getline(stream, line)) {
        std::string package = focused_package_from_line(line);
        if (package.empty()) {
            continue;
        }
        if (line.find("mCurrentFocus") != std::string::npos) {
            return package;
        }
        if (fallback.empty()) {
            fallback = package;
        }
    }
    return fallback;
}

}  // namespace commands
}  // namespace device
}  // namespace firetv
