#ifndef FIRETV_REGISTRY_DEVICE_STORE_HPP
#define FIRETV_REGISTRY_DEVICE_STORE_HPP

#include <map>
#include <mutex>
#include <string>

namespace firetv {
namespace registry {

/**
 * @brief Persisted device list (device id -> host) in a YAML file
 *
 * File layout:
 *
 *     devices:
 *       living-room: 192.168.1.20:5555
 *
 * A missing file loads as an empty list. Saves write a sibling temp file and
 * rename it over the target.
 */
class DeviceStore {
public:
    explicit DeviceStore(std::string path);

    bool load(std::map<std::string, std::string> &devices, std::string &error) const;
    bool save(const std::map<std::string, std::string> &devices, std::string &error);

    const std::string &path() const { return path_; }

private:
    std::string path_;
    std::mutex save_mutex_;
};

}  // namespace registry
}  // namespace firetv

#endif  // FIRETV_REGISTRY_DEVICE_STORE_HPP
