#include "child_process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"

namespace firetv {
namespace device {

namespace {
constexpr int kPollSliceMs = 50;
constexpr int kReapGraceMs = 500;
constexpr size_t kReadChunk = 4096;

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

int decode_exit_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Read whatever is available on fd. Returns false once the write end is closed.
bool read_available(int fd, std::string &out) {
    char buf[kReadChunk];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
        return true;
    }
    return false;
}
}  // namespace

ChildProcess::ChildProcess(const std::string &executable, const std::vector<std::string> &args)
    : executable_(executable), args_(args), pid_(-1) {}

ChildProcess::~ChildProcess() {
    if (pid_ > 0) {
        force_terminate();
        int exit_code = 0;
        wait_for_exit(kReapGraceMs, exit_code);
    }
}

std::string ChildProcess::command_line() const {
    std::string cmdline = executable_;
    for (const auto &arg : args_) {
        cmdline += " " + arg;
    }
    return cmdline;
}

bool ChildProcess::run(int timeout_ms, ProcessResult &result) {
    result = ProcessResult{};
    error_.clear();

    int stdout_fd = -1;
    int stderr_fd = -1;
    if (!spawn(stdout_fd, stderr_fd)) {
        return false;
    }

    bool finished = collect_output(stdout_fd, stderr_fd, timeout_ms, result);
    close(stdout_fd);
    close(stderr_fd);

    if (!finished) {
        LOG_WARN("[Process] Timeout after " << timeout_ms << "ms - killing: " << command_line());
        force_terminate();
        int exit_code = 0;
        wait_for_exit(kReapGraceMs, exit_code);
        result.timed_out = true;
        error_ = "Timed out after " + std::to_string(timeout_ms) + "ms";
        return false;
    }

    LOG_DEBUG("[Process] " << command_line() << " exited with " << result.exit_code);
    return true;
}

bool ChildProcess::spawn(int &stdout_fd, int &stderr_fd) {
    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) < 0) {
        error_ = "Failed to create stdout pipe: " + std::string(strerror(errno));
        return false;
    }
    if (pipe(stderr_pipe) < 0) {
        error_ = "Failed to create stderr pipe: " + std::string(strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    // Build argv before fork; the child must not allocate
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(executable_.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_ = fork();
    if (pid_ < 0) {
        error_ = "Fork failed: " + std::string(strerror(errno));
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return false;
    }

    if (pid_ == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        // The server ignores SIGPIPE; an ignored disposition would survive exec
        signal(SIGPIPE, SIG_DFL);

        execvp(argv[0], argv.data());

        // exec failed; 127 mirrors the shell's "command not found"
        _exit(127);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    stdout_fd = stdout_pipe[0];
    stderr_fd = stderr_pipe[0];
    return true;
}

bool ChildProcess::collect_output(int stdout_fd, int stderr_fd, int timeout_ms, ProcessResult &result) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool stdout_open = true;
    bool stderr_open = true;
    bool exited = false;

    // Stop at child exit rather than at EOF: a daemon forked by the child
    // (the adb server on first use) can inherit the pipes and hold them open.
    while (true) {
        struct pollfd pfds[2];
        nfds_t count = 0;
        if (stdout_open) {
            pfds[count].fd = stdout_fd;
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            ++count;
        }
        if (stderr_open) {
            pfds[count].fd = stderr_fd;
            pfds[count].events = POLLIN;
            pfds[count].revents = 0;
            ++count;
        }

        int wait_ms = exited ? 0 : std::min(kPollSliceMs, remaining_ms(deadline));
        int ready = count > 0 ? poll(pfds, count, wait_ms) : 0;
        if (ready < 0 && errno != EINTR) {
            error_ = "poll failed: " + std::string(strerror(errno));
            return false;
        }
        if (count == 0 && !exited) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        }

        bool drained_any = false;
        for (nfds_t i = 0; ready > 0 && i < count; ++i) {
            if ((pfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            drained_any = true;
            if (pfds[i].fd == stdout_fd) {
                stdout_open = read_available(stdout_fd, result.stdout_text);
            } else {
                stderr_open = read_available(stderr_fd, result.stderr_text);
            }
        }

        if (exited && !drained_any) {
            return true;
        }

        if (!exited && try_reap(result.exit_code)) {
            exited = true;
            continue;
        }

        if (exited && !stdout_open && !stderr_open) {
            return true;
        }

        if (!exited && remaining_ms(deadline) == 0) {
            return false;
        }
    }
}

bool ChildProcess::try_reap(int &exit_code) {
    if (pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_code = decode_exit_status(status);
        pid_ = -1;
        return true;
    }
    if (result == -1 && errno == ECHILD) {
        pid_ = -1;
        return true;
    }
    return false;
}

bool ChildProcess::wait_for_exit(int timeout_ms, int &exit_code) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (try_reap(exit_code)) {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildProcess::force_terminate() {
    if (pid_ > 0) {
        kill(pid_, SIGKILL);
    }
}

}  // namespace device
}  // namespace firetv
