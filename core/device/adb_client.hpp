#pragma once

#include <string>

#include "i_device_client.hpp"
#include "runtime/config.hpp"

namespace firetv {
namespace device {

/**
 * @brief IDeviceClient backed by the adb command-line tool
 *
 * Every operation is one short-lived adb invocation:
 * - connect: "adb connect <host>" then "adb -s <host> get-state"
 * - shell:   "adb -s <host> shell <command>"
 *
 * The adb server owns the transport, RSA authentication and framing.
 * Each invocation is bounded by the configured timeout; a hung adb is
 * killed and reported as a connection error.
 */
class AdbClient : public IDeviceClient {
public:
    explicit AdbClient(const runtime::AdbConfig &config);

    bool connect(const std::string &host, ConnectionHandle &handle, std::string &error) override;

    bool shell(const ConnectionHandle &handle, const std::string &command, std::string &output,
               std::string &error) override;

private:
    runtime::AdbConfig config_;
};

}  // namespace device
}  // namespace firetv
