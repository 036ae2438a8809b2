#ifndef FIRETV_REGISTRY_DEVICE_REGISTRY_HPP
#define FIRETV_REGISTRY_DEVICE_REGISTRY_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "device/device_state.hpp"
#include "device/i_device_client.hpp"
#include "device/state_classifier.hpp"

namespace firetv {
namespace registry {

class DeviceStore;

// Failure taxonomy of registry operations
enum class ErrorKind {
    NONE,
    INVALID_IDENTIFIER,
    INVALID_HOST,
    INVALID_APP_ID,
    UNKNOWN_DEVICE,
    UNKNOWN_ACTION,
    CONNECTION_ERROR,
    BUSY
};

const char *error_kind_to_string(ErrorKind kind);

struct RegistryOptions {
    int busy_timeout_ms = 2000;  // Max wait for the device's command lock
    int state_ttl_ms = 1000;     // state() reuses a classification younger than this
};

// Point-in-time view of a device (safe to hold after the registry changes)
struct DeviceSnapshot {
    std::string device_id;
    std::string host;
    device::DeviceState state = device::DeviceState::DISCONNECTED;
};

// Result of a registry operation
struct DeviceResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;

    device::DeviceState state = device::DeviceState::DISCONNECTED;
    std::set<std::string> running_apps;                   // apps_running()
    device::AppState app_state = device::AppState::OFF;  // app_state()
};

// Registered device. Fields below `mutex` are guarded by it; last_state
// mirrors the latest classification for lock-free reads (list of a busy device, snapshots).
struct RegisteredDevice {
    RegisteredDevice(std::string id, std::string target) : device_id(std::move(id)), host(std::move(target)) {}

    const std::string device_id;
    const std::string host;

    std::atomic<device::DeviceState> last_state{device::DeviceState::DISCONNECTED};

    // Serializes use of the connection handle: one in-flight command per device
    std::timed_mutex mutex;

    device::ConnectionHandle handle;
    std::set<std::string> running_apps;
    std::optional<std::chrono::steady_clock::time_point> classified_at;
};

/**
 * @brief In-memory device registry and per-device command path
 *
 * Owns every Device and its connection handle. Requests for different
 * devices run concurrently; requests for the same device take the device's
 * timed mutex and give up with BUSY after busy_timeout_ms.
 *
 * Thread Safety:
 * - The id -> device map is guarded by a shared_mutex (lookups share, add is exclusive)
 * - Entries are shared_ptr, so replacing a device never invalidates an in-flight request
 * - Network I/O is never performed under the map lock
 *
 * Connection errors are routine: state queries report DISCONNECTED, and a failed
 * shell command drops the handle until the next successful connect.
 */
class DeviceRegistry {
public:
    DeviceRegistry(device::IDeviceClient &client, const device::StateClassifier &classifier,
                   RegistryOptions options = {});

    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;

    // Persist the device list after every successful add() (nullptr disables)
    void set_device_store(DeviceStore *store) { store_ = store; }

    // Create or replace; never connects
    DeviceResult add(const std::string &device_id, const std::string &host);

    // Every device with a best-effort state (connect if needed, then classify)
    std::vector<DeviceSnapshot> list();

    // Force a (re)connect and classify
    DeviceResult connect(const std::string &device_id);

    // Cached classification if fresh, otherwise one classification round trip
    DeviceResult state(const std::string &device_id);

    // Send a remote-control action (see control::action_table)
    DeviceResult action(const std::string &device_id, const std::string &action_id);

    DeviceResult apps_running(const std::string &device_id);
    DeviceResult app_state(const std::string &device_id, const std::string &app_id);
    DeviceResult app_start(const std::string &device_id, const std::string &app_id);
    DeviceResult app_stop(const std::string &device_id, const std::string &app_id);

    // Lookup without network I/O
    std::optional<DeviceSnapshot> get_device_copy(const std::string &device_id) const;
    bool has_device(const std::string &device_id) const;
    size_t device_count() const;

    // device id -> host, as persisted
    std::map<std::string, std::string> hosts() const;

private:
    using DevicePtr = std::shared_ptr<RegisteredDevice>;
    using DeviceLock = std::unique_lock<std::timed_mutex>;

    device::IDeviceClient &client_;
    const device::StateClassifier &classifier_;
    RegistryOptions options_;
    DeviceStore *store_ = nullptr;
    std::mutex persist_mutex_;

    std::unordered_map<std::string, DevicePtr> devices_;
    mutable std::shared_mutex mutex_;

    DevicePtr find(const std::string &device_id) const;
    std::vector<DevicePtr> all_devices() const;

    // Take the device's command lock within busy_timeout_ms
    bool lock_device(RegisteredDevice &device, DeviceLock &lock) const;

    static DeviceSnapshot snapshot(const RegisteredDevice &device);

    // Helpers below require the device lock
    bool ensure_connected(RegisteredDevice &device, std::string &error);
    bool open_connection(RegisteredDevice &device, std::string &error);
    bool run_shell(RegisteredDevice &device, const std::string &command, std::string &output, std::string &error);
    device::StateQueries query_state(RegisteredDevice &device);
    device::DeviceState refresh_state(RegisteredDevice &device);
    void mark_disconnected(RegisteredDevice &device);

    // Shared prologue of app operations: lookup, app id check, lock, connect
    bool begin_app_operation(const std::string &device_id, const std::string &app_id, DevicePtr &device,
                             DeviceLock &lock, DeviceResult &result);

    static DeviceResult failure(ErrorKind kind, const std::string &message);
    static DeviceResult connection_failure(const std::string &device_id, const std::string &message);
};

}  // namespace registry
}  // namespace firetv

#endif  // FIRETV_REGISTRY_DEVICE_REGISTRY_HPP
