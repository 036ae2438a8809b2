#include "runtime.hpp"

#include <chrono>
#include <map>
#include <thread>

#include "device/adb_client.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace firetv {
namespace runtime {

namespace {
constexpr const char *kDefaultDeviceId = "default";
}

Runtime::Runtime(const RuntimeConfig &config)
    : Runtime(config, std::make_unique<device::AdbClient>(config.adb)) {}

Runtime::Runtime(const RuntimeConfig &config, std::unique_ptr<device::IDeviceClient> client)
    : config_(config), client_(std::move(client)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing firetv-server");

    if (!init_registry(error)) {
        return false;
    }

    if (!init_devices(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete (" << registry_->device_count() << " devices)");
    return true;
}

bool Runtime::init_registry(std::string &error) {
    if (!client_) {
        error = "No device client";
        return false;
    }

    classifier_ = std::make_unique<device::StateClassifier>(config_.classifier.idle_packages);

    registry::RegistryOptions options;
    options.busy_timeout_ms = config_.devices.busy_timeout_ms;
    options.state_ttl_ms = config_.devices.state_ttl_ms;
    registry_ = std::make_unique<registry::DeviceRegistry>(*client_, *classifier_, options);

    return true;
}

bool Runtime::init_devices(std::string &error) {
    // Later sources win: inline entries, then the persisted list, then --default
    for (const auto &entry : config_.devices.entries) {
        auto result = registry_->add(entry.id, entry.host);
        if (!result.success) {
            error = "Invalid device entry '" + entry.id + "': " + result.error_message;
            return false;
        }
    }

    if (!config_.devices.store.empty()) {
        store_ = std::make_unique<registry::DeviceStore>(config_.devices.store);

        std::map<std::string, std::string> stored;
        std::string store_error;
        if (!store_->load(stored, store_error)) {
            error = "Failed to load device store: " + store_error;
            return false;
        }

        for (const auto &[device_id, host] : stored) {
            auto result = registry_->add(device_id, host);
            if (!result.success) {
                LOG_WARN("[Runtime] Skipping stored device '" << device_id << "': " << result.error_message);
            }
        }
        LOG_INFO("[Runtime] Loaded " << stored.size() << " devices from " << store_->path());
    }

    if (!config_.devices.default_host.empty()) {
        auto result = registry_->add(kDefaultDeviceId, config_.devices.default_host);
        if (!result.success) {
            error = "Invalid default device: " + result.error_message;
            return false;
        }
        LOG_INFO("[Runtime] Default device: " << config_.devices.default_host);
    }

    // Attached last so startup registration does not rewrite the file
    if (store_) {
        registry_->set_device_store(store_.get());
    }

    return true;
}

bool Runtime::init_http(std::string &error) {
    LOG_INFO("[Runtime] Creating HTTP server");
    http_server_ = std::make_unique<http::HttpServer>(config_.http, *registry_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    LOG_INFO("[Runtime] Ready, accepting requests on port " << http_server_->get_port());
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
        }
    }

    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    if (http_server_ && http_server_->is_running()) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }
}

}  // namespace runtime
}  // namespace firetv
