#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>

#include "device/identifiers.hpp"
#include "logging/logger.hpp"

namespace firetv {
namespace runtime {

namespace {
constexpr int kMinTimeoutMs = 100;

bool validate_device_entry(const std::string &id, const std::string &host, std::string &error) {
    if (!device::is_valid_device_id(id)) {
        error = "Invalid device id '" + id + "': only word characters and '-' allowed";
        return false;
    }
    if (!device::is_valid_host(host)) {
        error = "Device '" + id + "' has invalid host '" + host + "': expected <address>:<port>";
        return false;
    }
    return true;
}
}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate ADB settings
    if (config.adb.executable.empty()) {
        error = "adb.executable must not be empty";
        return false;
    }
    if (config.adb.connect_timeout_ms < kMinTimeoutMs) {
        error = "adb.connect_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.adb.command_timeout_ms < kMinTimeoutMs) {
        error = "adb.command_timeout_ms must be >= 100ms";
        return false;
    }

    // Validate device settings
    if (!config.devices.default_host.empty() && !device::is_valid_host(config.devices.default_host)) {
        error = "Invalid default host '" + config.devices.default_host + "': expected <address>:<port>";
        return false;
    }
    for (const auto &entry : config.devices.entries) {
        if (!validate_device_entry(entry.id, entry.host, error)) {
            return false;
        }
    }
    if (config.devices.busy_timeout_ms < 0) {
        error = "devices.busy_timeout_ms must be >= 0";
        return false;
    }
    if (config.devices.state_ttl_ms < 0) {
        error = "devices.state_ttl_ms must be >= 0";
        return false;
    }

    // Validate classifier settings
    for (const auto &package : config.classifier.idle_packages) {
        if (package.empty()) {
            error = "classifier.idle_packages must not contain empty names";
            return false;
        }
    }

    // Validate Logging settings
    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "adb", "devices", "classifier", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load ADB config
        if (yaml["adb"]) {
            const auto &adb = yaml["adb"];
            if (adb["executable"]) {
                config.adb.executable = adb["executable"].as<std::string>();
            }
            if (adb["connect_timeout_ms"]) {
                config.adb.connect_timeout_ms = adb["connect_timeout_ms"].as<int>();
            }
            if (adb["command_timeout_ms"]) {
                config.adb.command_timeout_ms = adb["command_timeout_ms"].as<int>();
            }
        }

        // Load devices
        if (yaml["devices"]) {
            const auto &devices = yaml["devices"];
            if (devices["default"]) {
                config.devices.default_host = devices["default"].as<std::string>();
            }
            if (devices["store"]) {
                config.devices.store = devices["store"].as<std::string>();
            }
            if (devices["busy_timeout_ms"]) {
                config.devices.busy_timeout_ms = devices["busy_timeout_ms"].as<int>();
            }
            if (devices["state_ttl_ms"]) {
                config.devices.state_ttl_ms = devices["state_ttl_ms"].as<int>();
            }

            // entries: mapping of device id -> host
            if (devices["entries"]) {
                const auto &entries = devices["entries"];
                if (!entries.IsMap()) {
                    error = "devices.entries must be a mapping of device id to host";
                    return false;
                }
                config.devices.entries.clear();  // Ensure idempotent parsing
                for (const auto &entry : entries) {
                    DeviceEntryConfig device;
                    device.id = entry.first.as<std::string>();
                    device.host = entry.second.as<std::string>();
                    config.devices.entries.push_back(device);
                }
            }
        }

        // Load classifier config
        if (yaml["classifier"]) {
            if (yaml["classifier"]["idle_packages"]) {
                config.classifier.idle_packages.clear();
                for (const auto &package : yaml["classifier"]["idle_packages"]) {
                    config.classifier.idle_packages.push_back(package.as<std::string>());
                }
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        return true;
    } catch (const YAML::BadFile &) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

void log_config(const RuntimeConfig &config) {
    LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                               << config.http.thread_pool_size << " workers)");
    LOG_INFO("[Config] ADB: " << config.adb.executable << " (connect " << config.adb.connect_timeout_ms
                              << "ms, command " << config.adb.command_timeout_ms << "ms)");

    std::stringstream devices_msg;
    devices_msg << "[Config] Devices: " << config.devices.entries.size() << " inline";
    if (!config.devices.default_host.empty()) {
        devices_msg << ", default " << config.devices.default_host;
    }
    if (!config.devices.store.empty()) {
        devices_msg << ", store " << config.devices.store;
    }
    LOG_INFO(devices_msg.str());

    LOG_INFO("[Config] Idle packages: " << config.classifier.idle_packages.size());
    LOG_INFO("[Config] Log level: " << config.logging.level);
}

}  // namespace runtime
}  // namespace firetv
