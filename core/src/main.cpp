// firetv-server
// REST control server for Fire TV devices over adb

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

namespace {

constexpr const char *kDefaultConfigPath = "firetv-server.yaml";

void print_usage() {
    std::cerr << "Usage: firetv-server [OPTIONS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH           Path to config file (default: " << kDefaultConfigPath
              << " if present)\n";
    std::cerr << "  --port, -p PORT         Listen port (default: 5556)\n";
    std::cerr << "  --default, -d HOST:PORT Register a device under the id \"default\"\n";
    std::cerr << "  --help, -h              Show this help\n";
}

bool parse_port(const std::string &value, int &port) {
    try {
        size_t consumed = 0;
        port = std::stoi(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception &) {
        return false;
    }
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path;
    std::string port_arg;
    std::string default_host;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            port_arg = argv[++i];
        } else if (arg.rfind("--port=", 0) == 0) {
            port_arg = arg.substr(7);
        } else if ((arg == "--default" || arg == "-d") && i + 1 < argc) {
            default_host = argv[++i];
        } else if (arg.rfind("--default=", 0) == 0) {
            default_host = arg.substr(10);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    firetv::runtime::RuntimeConfig config;
    std::string error;

    // An explicit --config must exist; the default path is optional
    if (config_path.empty() && std::filesystem::exists(kDefaultConfigPath)) {
        config_path = kDefaultConfigPath;
    }

    if (!config_path.empty()) {
        LOG_INFO("Loading config: " << config_path);
        if (!firetv::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    if (!port_arg.empty()) {
        if (!parse_port(port_arg, config.http.port)) {
            LOG_ERROR("Invalid port: " << port_arg);
            return 1;
        }
    }
    if (!default_host.empty()) {
        config.devices.default_host = default_host;
    }

    // Overrides are validated like file values
    if (!firetv::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }

    firetv::logging::Logger::set_level(firetv::logging::string_to_level(config.logging.level));
    firetv::runtime::log_config(config);

    firetv::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    firetv::runtime::SignalHandler::install();

    LOG_INFO("firetv-server ready");
    LOG_INFO("  Devices: " << runtime.get_registry().device_count());
    LOG_INFO("  Listening: " << config.http.bind << ":" << config.http.port);

    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
