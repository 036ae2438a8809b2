#include "device_store.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <utility>

#include "logging/logger.hpp"

namespace firetv {
namespace registry {

DeviceStore::DeviceStore(std::string path) : path_(std::move(path)) {}

bool DeviceStore::load(std::map<std::string, std::string> &devices, std::string &error) const {
    devices.clear();

    if (!std::filesystem::exists(path_)) {
        LOG_INFO("[Store] No device store at " << path_ << " (starting empty)");
        return true;
    }

    try {
        YAML::Node yaml = YAML::LoadFile(path_);
        if (!yaml["devices"]) {
            return true;
        }
        if (!yaml["devices"].IsMap()) {
            error = "Device store " + path_ + ": 'devices' must be a mapping of device id to host";
            return false;
        }
        for (const auto &entry : yaml["devices"]) {
            devices[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    } catch (const YAML::ParserException &e) {
        error = "Device store " + path_ + " parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Device store " + path_ + " load error: " + std::string(e.what());
        return false;
    }

    LOG_INFO("[Store] Loaded " << devices.size() << " device(s) from " << path_);
    return true;
}

bool DeviceStore::save(const std::map<std::string, std::string> &devices, std::string &error) {
    std::lock_guard<std::mutex> lock(save_mutex_);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "devices" << YAML::Value << YAML::BeginMap;
    for (const auto &[device_id, host] : devices) {
        out << YAML::Key << device_id << YAML::Value << host;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    if (!out.good()) {
        error = "YAML emit error: " + out.GetLastError();
        return false;
    }

    const std::string temp_path = path_ + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file) {
            error = "Cannot write device store: " + temp_path;
            return false;
        }
        file << out.c_str() << "\n";
        if (!file) {
            error = "Write failed: " + temp_path;
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        error = "Cannot replace " + path_ + ": " + ec.message();
        std::filesystem::remove(temp_path, ec);
        return false;
    }

    LOG_DEBUG("[Store] Saved " << devices.size() << " device(s) to " << path_);
    return true;
}

}  // namespace registry
}  // namespace firetv
