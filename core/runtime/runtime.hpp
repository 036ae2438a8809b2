#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "device/i_device_client.hpp"
#include "device/state_classifier.hpp"
#include "http/server.hpp"
#include "registry/device_registry.hpp"
#include "registry/device_store.hpp"

namespace firetv {
namespace runtime {

class Runtime {
public:
    // Uses an AdbClient built from config.adb
    explicit Runtime(const RuntimeConfig &config);

    // Injected client (tests)
    Runtime(const RuntimeConfig &config, std::unique_ptr<device::IDeviceClient> client);

    ~Runtime();

    // Register configured devices, then start the HTTP server
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    registry::DeviceRegistry &get_registry() { return *registry_; }

private:
    bool init_registry(std::string &error);
    bool init_devices(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<device::IDeviceClient> client_;
    std::unique_ptr<device::StateClassifier> classifier_;
    std::unique_ptr<registry::DeviceStore> store_;
    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace firetv
