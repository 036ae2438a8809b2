#include "device_registry.hpp"

#include <algorithm>

#include "control/actions.hpp"
#include "device/identifiers.hpp"
#include "device/shell_commands.hpp"
#include "device_store.hpp"
#include "logging/logger.hpp"

namespace firetv {
namespace registry {

const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::INVALID_IDENTIFIER:
            return "INVALID_IDENTIFIER";
        case ErrorKind::INVALID_HOST:
            return "INVALID_HOST";
        case ErrorKind::INVALID_APP_ID:
            return "INVALID_APP_ID";
        case ErrorKind::UNKNOWN_DEVICE:
            return "UNKNOWN_DEVICE";
        case ErrorKind::UNKNOWN_ACTION:
            return "UNKNOWN_ACTION";
        case ErrorKind::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorKind::BUSY:
            return "BUSY";
        default:
            return "UNKNOWN";
    }
}

DeviceRegistry::DeviceRegistry(device::IDeviceClient &client, const device::StateClassifier &classifier,
                               RegistryOptions options)
    : client_(client), classifier_(classifier), options_(options) {}

DeviceResult DeviceRegistry::add(const std::string &device_id, const std::string &host) {
    if (!device::is_valid_device_id(device_id)) {
        LOG_WARN("[Registry] Rejected device id: '" << device_id << "'");
        return failure(ErrorKind::INVALID_IDENTIFIER, "Invalid device id: '" + device_id + "'");
    }
    if (!device::is_valid_host(host)) {
        LOG_WARN("[Registry] Rejected host for " << device_id << ": '" << host << "'");
        return failure(ErrorKind::INVALID_HOST, "Invalid host: '" + host + "' (expected <address>:<port>)");
    }

    bool changed = true;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = devices_.find(device_id);
        if (it != devices_.end() && it->second->host == host) {
            // Same target: keep the live connection
            changed = false;
        } else {
            devices_[device_id] = std::make_shared<RegisteredDevice>(device_id, host);
        }
    }

    if (changed) {
        LOG_INFO("[Registry] Registered: " << device_id << " -> " << host);
        if (store_ != nullptr) {
            // Copy and write as one step so a slower save never overwrites a newer list
            std::lock_guard<std::mutex> persist_lock(persist_mutex_);
            std::string error;
            if (!store_->save(hosts(), error)) {
                LOG_WARN("[Registry] Device list not persisted: " << error);
            }
        }
    } else {
        LOG_DEBUG("[Registry] " << device_id << " already registered at " << host);
    }

    DeviceResult result;
    result.success = true;
    return result;
}

std::vector<DeviceSnapshot> DeviceRegistry::list() {
    std::vector<DeviceSnapshot> snapshots;
    for (const auto &device : all_devices()) {
        DeviceLock lock;
        if (!lock_device(*device, lock)) {
            // Report what is known rather than stalling the whole listing
            LOG_DEBUG("[Registry] " << device->device_id << " busy, listing cached state");
            snapshots.push_back(snapshot(*device));
            continue;
        }

        std::string error;
        if (ensure_connected(*device, error)) {
            refresh_state(*device);
        }
        snapshots.push_back(snapshot(*device));
    }
    return snapshots;
}

DeviceResult DeviceRegistry::connect(const std::string &device_id) {
    auto device = find(device_id);
    if (!device) {
        return failure(ErrorKind::UNKNOWN_DEVICE, "Unknown device: " + device_id);
    }

    DeviceLock lock;
    if (!lock_device(*device, lock)) {
        return failure(ErrorKind::BUSY, "Device " + device_id + " is busy");
    }

    std::string error;
    if (!open_connection(*device, error)) {
        device->classified_at = std::chrono::steady_clock::now();
        return connection_failure(device_id, error);
    }

    DeviceResult result;
    result.state = refresh_state(*device);
    if (result.state == device::DeviceState::DISCONNECTED) {
        return connection_failure(device_id, "Connected but state query failed");
    }
    result.success = true;
    return result;
}

DeviceResult DeviceRegistry::state(const std::string &device_id) {
    auto device = find(device_id);
    if (!device) {
        return failure(ErrorKind::UNKNOWN_DEVICE, "Unknown device: " + device_id);
    }

    DeviceLock lock;
    if (!lock_device(*device, lock)) {
        return failure(ErrorKind::BUSY, "Device " + device_id + " is busy");
    }

    DeviceResult result;
    result.success = true;

    auto now = std::chrono::steady_clock::now();
    if (device->classified_at && now - *device->classified_at < std::chrono::milliseconds(options_.state_ttl_ms)) {
        result.state = device->last_state.load();
        return result;
    }

    std::string error;
    if (!ensure_connected(*device, error)) {
        device->classified_at = now;
        result.state = device::DeviceState::DISCONNECTED;
        return result;
    }

    result.state = refresh_state(*device);
    return result;
}

DeviceResult DeviceRegistry::action(const std::string &device_id, const std::string &action_id) {
    auto device = find(device_id);
    if (!device) {
        return failure(ErrorKind::UNKNOWN_DEVICE, "Unknown device: " + device_id);
    }

    auto action = control::parse_action(action_id);
    if (!action) {
        LOG_WARN("[Registry] Unknown action '" << action_id << "' for " << device_id);
        return failure(ErrorKind::UNKNOWN_ACTION, "Unknown action: " + action_id);
    }
    const control::ActionSpec &spec = control::action_spec(*action);

    DeviceLock lock;
    if (!lock_device(*device, lock)) {
        return failure(ErrorKind::BUSY, "Device " + device_id + " is busy");
    }

    std::string error;
    if (!ensure_connected(*device, error)) {
        return connection_failure(device_id, error);
    }

    DeviceResult result;
    if (spec.precondition != control::PowerPrecondition::NONE) {
        auto current = refresh_state(*device);
        if (current == device::DeviceState::DISCONNECTED) {
            return connection_failure(device_id, "State query failed");
        }
        if (!control::should_send(spec, current)) {
            LOG_DEBUG("[Registry] " << device_id << ": " << spec.name << " skipped (state "
                                    << device::state_to_string(current) << ")");
            result.success = true;
            result.state = current;
            return result;
        }
    }

    std::string output;
    if (!run_shell(*device, device::commands::key_event(spec.keycode), output, error)) {
        return connection_failure(device_id, error);
    }

    LOG_INFO("[Registry] " << device_id << ": " << spec.name);

    // The key event changes what the device shows; the next state() re-queries
    device->classified_at.reset();

    result.success = true;
    result.state = device->last_state.load();
    return result;
}

DeviceResult DeviceRegistry::apps_running(const std::string &device_id) {
    auto device = find(device_id);
    if (!device) {
        return failure(ErrorKind::UNKNOWN_DEVICE, "Unknown device: " + device_id);
    }

    DeviceLock lock;
    if (!lock_device(*device, lock)) {
        return failure(ErrorKind::BUSY, "Device " + device_id + " is busy");
    }

    std::string error;
    if (!ensure_connected(*device, error)) {
        return connection_failure(device_id, error);
    }

    std::string output;
    if (!run_shell(*device, device::commands::running_apps_query(), output, error)) {
        return connection_failure(device_id, error);
    }
    device->running_apps = device::commands::parse_running_apps(output);

    DeviceResult result;
    result.success = true;
    result.state = device->last_state.load();
    result.running_apps = device->running_apps;
    return result;
}

DeviceResult DeviceRegistry::app_state(const std::string &device_id, const std::string &app_id) {
    DevicePtr device;
    DeviceLock lock;
    DeviceResult result;
    if (!begin_app_operation(device_id, app_id, device, lock, result)) {
        return result;
    }

    device::StateQueries queries = query_state(*device);
    auto state = classifier_.classify(queries);
    device->last_state = state;
    device->classified_at = std::chrono::steady_clock::now();
    if (state == device::DeviceState::DISCONNECTED) {
        return connection_failure(device_id, "State query failed");
    }

    bool focused = device::commands::parse_focused_package(*queries.focus) == app_id;
    result.success = true;
    result.state = state;
    result.app_state = (state != device::DeviceState::OFF && focused) ? device::AppState::ON : device::AppState::OFF;
    return result;
}

DeviceResult DeviceRegistry::app_start(const std::string &device_id, const std::string &app_id) {
    DevicePtr device;
    DeviceLock lock;
    DeviceResult result;
    if (!begin_app_operation(device_id, app_id, device, lock, result)) {
        return result;
    }

    std::string output;
    std::string error;
    if (!run_shell(*device, device::commands::start_app(app_id), output, error)) {
        return connection_failure(device_id, error);
    }

    LOG_INFO("[Registry] " << device_id << ": started " << app_id);
    device->classified_at.reset();
    result.success = true;
    result.state = device->last_state.load();
    return result;
}

DeviceResult DeviceRegistry::app_stop(const std::string &device_id, const std::string &app_id) {
    DevicePtr device;
    DeviceLock lock;
    DeviceResult result;
    if (!begin_app_operation(device_id, app_id, device, lock, result)) {
        return result;
    }

    std::string output;
    std::string error;
    if (!run_shell(*device, device::commands::stop_app(app_id), output, error)) {
        return connection_failure(device_id, error);
    }

    LOG_INFO("[Registry] " << device_id << ": stopped " << app_id);
    device->classified_at.reset();
    result.success = true;
    result.state = device->last_state.load();
    return result;
}

std::optional<DeviceSnapshot> DeviceRegistry::get_device_copy(const std::string &device_id) const {
    auto device = find(device_id);
    if (!device) {
        return std::nullopt;
    }
    return snapshot(*device);
}

bool DeviceRegistry::has_device(const std::string &device_id) const { return find(device_id) != nullptr; }

size_t DeviceRegistry::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

std::map<std::string, std::string> DeviceRegistry::hosts() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, std::string> result;
    for (const auto &[device_id, device] : devices_) {
        result[device_id] = device->host;
    }
    return result;
}

DeviceRegistry::DevicePtr DeviceRegistry::find(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<DeviceRegistry::DevicePtr> DeviceRegistry::all_devices() const {
    std::vector<DevicePtr> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(devices_.size());
        for (const auto &entry : devices_) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const DevicePtr &a, const DevicePtr &b) { return a->device_id < b->device_id; });
    return result;
}

bool DeviceRegistry::lock_device(RegisteredDevice &device, DeviceLock &lock) const {
    lock = DeviceLock(device.mutex, std::defer_lock);
    if (lock.try_lock_for(std::chrono::milliseconds(options_.busy_timeout_ms))) {
        return true;
    }
    LOG_WARN("[Registry] " << device.device_id << " busy for " << options_.busy_timeout_ms << "ms");
    return false;
}

DeviceSnapshot DeviceRegistry::snapshot(const RegisteredDevice &device) {
    DeviceSnapshot result;
    result.device_id = device.device_id;
    result.host = device.host;
    result.state = device.last_state.load();
    return result;
}

bool DeviceRegistry::ensure_connected(RegisteredDevice &device, std::string &error) {
    if (device.handle.valid()) {
        return true;
    }
    return open_connection(device, error);
}

bool DeviceRegistry::open_connection(RegisteredDevice &device, std::string &error) {
    device.handle.reset();
    if (!client_.connect(device.host, device.handle, error)) {
        LOG_WARN("[Registry] " << device.device_id << " unreachable at " << device.host << ": " << error);
        mark_disconnected(device);
        return false;
    }

    LOG_INFO("[Registry] " << device.device_id << " connected (" << device.host << ")");
    return true;
}

bool DeviceRegistry::run_shell(RegisteredDevice &device, const std::string &command, std::string &output,
                               std::string &error) {
    if (!client_.shell(device.handle, command, output, error)) {
        LOG_WARN("[Registry] " << device.device_id << " command failed, dropping connection: " << error);
        mark_disconnected(device);
        return false;
    }
    return true;
}

device::StateQueries DeviceRegistry::query_state(RegisteredDevice &device) {
    if (!device.handle.valid()) {
        return {};
    }

    std::string output;
    std::string error;
    if (!run_shell(device, device::commands::state_query(), output, error)) {
        return {};
    }
    return device::commands::parse_state_query(output);
}

device::DeviceState DeviceRegistry::refresh_state(RegisteredDevice &device) {
    auto state = classifier_.classify(query_state(device));
    device.last_state = state;
    device.classified_at = std::chrono::steady_clock::now();
    LOG_DEBUG("[Registry] " << device.device_id << " state: " << device::state_to_string(state));
    return state;
}

void DeviceRegistry::mark_disconnected(RegisteredDevice &device) {
    device.handle.reset();
    device.last_state = device::DeviceState::DISCONNECTED;
}

bool DeviceRegistry::begin_app_operation(const std::string &device_id, const std::string &app_id, DevicePtr &device,
                                         DeviceLock &lock, DeviceResult &result) {
    device = find(device_id);
    if (!device) {
        result = failure(ErrorKind::UNKNOWN_DEVICE, "Unknown device: " + device_id);
        return false;
    }

    if (!device::is_valid_app_id(app_id)) {
        LOG_WARN("[Registry] Rejected app id: '" << app_id << "'");
        result = failure(ErrorKind::INVALID_APP_ID, "Invalid app id: '" + app_id + "'");
        return false;
    }

    if (!lock_device(*device, lock)) {
        result = failure(ErrorKind::BUSY, "Device " + device_id + " is busy");
        return false;
    }

    std::string error;
    if (!ensure_connected(*device, error)) {
        result = connection_failure(device_id, error);
        return false;
    }
    return true;
}

DeviceResult DeviceRegistry::failure(ErrorKind kind, const std::string &message) {
    DeviceResult result;
    result.success = false;
    result.error = kind;
    result.error_message = message;
    return result;
}

DeviceResult DeviceRegistry::connection_failure(const std::string &device_id, const std::string &message) {
    DeviceResult result = failure(ErrorKind::CONNECTION_ERROR, message);
    result.state = device::DeviceState::DISCONNECTED;
    LOG_DEBUG("[Registry] " << device_id << ": connection error reported to caller");
    return result;
}

}  // namespace registry
}  // namespace firetv
