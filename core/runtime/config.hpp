#pragma once

#include <string>
#include <vector>

#include "device/state_classifier.hpp"

namespace firetv {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 5556;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct AdbConfig {
    std::string executable = "adb";  // Resolved through PATH unless absolute
    int connect_timeout_ms = 5000;   // "adb connect" + "get-state"
    int command_timeout_ms = 5000;   // Each "adb shell" invocation
};

struct DeviceEntryConfig {
    std::string id;
    std::string host;  // <address>:<port>
};

struct DevicesConfig {
    std::string default_host;                // Registered as "default" when set
    std::string store;                       // Persisted device list (YAML), optional
    std::vector<DeviceEntryConfig> entries;  // Devices declared inline
    int busy_timeout_ms = 2000;              // Max wait for another request on the same device
    int state_ttl_ms = 1000;                 // Reuse a classification younger than this
};

struct ClassifierConfig {
    std::vector<std::string> idle_packages = device::StateClassifier::default_idle_packages();
};

struct RuntimeConfig {
    HttpConfig http;
    AdbConfig adb;
    DevicesConfig devices;
    ClassifierConfig classifier;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

// One-line summary per section at INFO
void log_config(const RuntimeConfig &config);

}  // namespace runtime
}  // namespace firetv
