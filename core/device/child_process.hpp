#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace firetv {
namespace device {

// Outcome of one child process run
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

// ChildProcess runs a command-line tool to completion with a deadline
// Responsibilities:
// - Spawn with stdin on /dev/null and stdout/stderr captured
// - Kill the child when the deadline passes
// - Reap the child on every path
class ChildProcess {
public:
    ChildProcess(const std::string &executable, const std::vector<std::string> &args = {});
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Run and wait. Returns false on spawn failure or timeout (sets error_).
    // A non-zero exit status is not a failure; inspect result.exit_code.
    bool run(int timeout_ms, ProcessResult &result);

    const std::string &last_error() const { return error_; }

    // Command line as logged ("adb -s host shell ...")
    std::string command_line() const;

private:
    std::string executable_;
    std::vector<std::string> args_;
    std::string error_;
    pid_t pid_;

    bool spawn(int &stdout_fd, int &stderr_fd);
    bool collect_output(int stdout_fd, int stderr_fd, int timeout_ms, ProcessResult &result);
    bool try_reap(int &exit_code);
    bool wait_for_exit(int timeout_ms, int &exit_code);
    void force_terminate();
};

}  // namespace device
}  // namespace firetv
