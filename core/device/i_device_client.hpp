#pragma once

#include <string>

namespace firetv {
namespace device {

// Open session to a device's debug endpoint
struct ConnectionHandle {
    std::string serial;  // Debug bridge serial, "<address>:<port>"

    bool valid() const { return !serial.empty(); }
    void reset() { serial.clear(); }
};

/**
 * @brief Remote debug client capability
 *
 * The only seam between the registry and the debug bridge. Implementations
 * own the wire protocol and authentication; callers see a handle and text.
 *
 * Implementations must be safe to call concurrently for different handles.
 * The registry never issues two calls for the same handle at once.
 */
class IDeviceClient {
public:
    virtual ~IDeviceClient() = default;

    // Open (or reuse) a session to host. Fills handle on success.
    virtual bool connect(const std::string &host, ConnectionHandle &handle, std::string &error) = 0;

    // Run a shell command on the device and capture its standard output
    virtual bool shell(const ConnectionHandle &handle, const std::string &command, std::string &output,
                       std::string &error) = 0;
};

}  // namespace device
}  // namespace firetv
