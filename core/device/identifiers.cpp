#include "identifiers.hpp"

#include <algorithm>

namespace firetv {
namespace device {

namespace {
bool is_ascii_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool is_ascii_digit(char c) { return c >= '0' && c <= '9'; }
}  // namespace

bool is_valid_device_id(const std::string &device_id) {
    if (device_id.empty()) {
        return false;
    }
    return std::all_of(device_id.begin(), device_id.end(),
                       [](char c) { return is_ascii_alpha(c) || is_ascii_digit(c) || c == '_' || c == '-'; });
}

bool is_valid_host(const std::string &host) {
    auto colon = host.find(':');
    if (colon == std::string::npos || host.find(':', colon + 1) != std::string::npos) {
        return false;
    }

    const std::string port = host.substr(colon + 1);
    if (port.empty()) {
        return false;
    }
    return std::all_of(port.begin(), port.end(), is_ascii_digit);
}

bool is_valid_app_id(const std::string &app_id) {
    if (app_id.size() < 2 || !is_ascii_alpha(app_id[0])) {
        return false;
    }
    return std::all_of(app_id.begin() + 1, app_id.end(), [](char c) { return is_ascii_alpha(c) || c == '.'; });
}

}  // namespace device
}  // namespace firetv
