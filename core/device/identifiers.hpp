#pragma once

#include <string>

namespace firetv {
namespace device {

// Device identifier: ASCII word characters or dashes, non-empty
bool is_valid_device_id(const std::string &device_id);

// Host in <address>:<port> format, port made of digits only
bool is_valid_host(const std::string &host);

// App (package) identifier: a letter followed by letters and dots
bool is_valid_app_id(const std::string &app_id);

}  // namespace device
}  // namespace firetv
