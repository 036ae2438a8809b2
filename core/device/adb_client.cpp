#include "adb_client.hpp"

#include <algorithm>

#include "child_process.hpp"
#include "logging/logger.hpp"

namespace firetv {
namespace device {

namespace {
std::string trim(const std::string &s) {
    const char *ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// adb shell on older servers converts LF to CRLF
std::string strip_carriage_returns(std::string s) {
    s.erase(std::remove(s.begin(), s.end(), '\r'), s.end());
    return s;
}

bool starts_with(const std::string &s, const std::string &prefix) { return s.compare(0, prefix.size(), prefix) == 0; }

// execvp failure in the child: exit 127 with nothing written
bool exec_failed(const ProcessResult &result) {
    return result.exit_code == 127 && result.stdout_text.empty() && result.stderr_text.empty();
}
}  // namespace

AdbClient::AdbClient(const runtime::AdbConfig &config) : config_(config) {}

bool AdbClient::connect(const std::string &host, ConnectionHandle &handle, std::string &error) {
    LOG_DEBUG("[ADB] Connecting to " << host);

    ChildProcess connect_proc(config_.executable, {"connect", host});
    ProcessResult result;
    if (!connect_proc.run(config_.connect_timeout_ms, result)) {
        error = "adb connect " + host + ": " + connect_proc.last_error();
        return false;
    }
    if (exec_failed(result)) {
        error = "adb executable not found: " + config_.executable;
        return false;
    }

    // adb prints "connected to" / "already connected to" on success and
    // "failed to connect" / "unable to connect" otherwise, often with exit 0
    std::string output = trim(result.stdout_text + result.stderr_text);
    if (result.exit_code != 0 || output.find("connected to") == std::string::npos) {
        error = output.empty() ? "adb connect " + host + " failed" : output;
        return false;
    }

    // A TCP session can be up while the device is still "unauthorized" or "offline"
    ChildProcess state_proc(config_.executable, {"-s", host, "get-state"});
    if (!state_proc.run(config_.command_timeout_ms, result)) {
        error = "adb get-state " + host + ": " + state_proc.last_error();
        return false;
    }
    std::string device_state = trim(result.stdout_text);
    if (device_state != "device") {
        std::string detail = trim(result.stderr_text);
        error = "Device " + host + " not ready: " + (detail.empty() ? device_state : detail);
        return false;
    }

    handle.serial = host;
    LOG_INFO("[ADB] Connected to " << host);
    return true;
}

bool AdbClient::shell(const ConnectionHandle &handle, const std::string &command, std::string &output,
                      std::string &error) {
    if (!handle.valid()) {
        error = "Not connected";
        return false;
    }

    LOG_DEBUG("[ADB] " << handle.serial << " shell: " << command);

    ChildProcess proc(config_.executable, {"-s", handle.serial, "shell", command});
    ProcessResult result;
    if (!proc.run(config_.command_timeout_ms, result)) {
        error = "adb shell on " + handle.serial + ": " + proc.last_error();
        return false;
    }

    // The remote exit status is not an error ("grep" without a match exits 1);
    // adb itself reports transport failures as "error: ..." on stderr.
    if (exec_failed(result)) {
        error = "adb executable not found: " + config_.executable;
        return false;
    }
    std::string diagnostics = trim(result.stderr_text);
    if (starts_with(diagnostics, "error:")) {
        error = diagnostics;
        return false;
    }

    output = strip_carriage_returns(result.stdout_text);
    return true;
}

}  // namespace device
}  // namespace firetv
