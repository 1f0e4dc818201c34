/**
 * @file process_utils.cpp
 * @brief fork/exec runner with process-group isolation and capped capture
 *
 * **Execution Flow**:
 * ```
 * pipe2(O_CLOEXEC) x3 → fork → child: setpgid, chdir, setrlimit, dup2, execvpe
 *                             → parent: wait for exec status, poll stdout/stderr
 *                                       until EOF, deadline or reap
 * ```
 *
 * **Timeout Handling**:
 * The deadline is a steady_clock time point. When it passes, SIGKILL goes to
 * the child's process group (every descendant that did not create its own
 * session), the child is reaped, and whatever already sits in the pipes is
 * drained for a short grace period so partial output is preserved.
 *
 * **Leftover Processes**:
 * Background daemons started by a test suite inherit the pipes and would keep
 * them open forever. After the direct child exits the whole group is killed,
 * which closes those pipe ends.
 *
 * **Exec Failure Reporting**:
 * A third CLOEXEC pipe carries errno from the child when execvpe fails; a
 * successful exec closes it and the parent reads EOF.
 *
 * @date 2025
 */

#include "crucible/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace crucible {
namespace utils {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kDrainGrace{500};

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

void ApplyLimit(int resource, std::size_t value) {
    if (value == 0) {
        return;
    }
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    ::setrlimit(resource, &rl);
}

// Append to a capped buffer, dropping overflow
void AppendCapped(std::string& buffer, const char* data, std::size_t size,
                  std::size_t cap, bool& truncated) {
    if (buffer.size() >= cap) {
        truncated = truncated || size > 0;
        return;
    }
    std::size_t room = cap - buffer.size();
    if (size > room) {
        buffer.append(data, room);
        truncated = true;
    } else {
        buffer.append(data, size);
    }
}

// Read whatever is currently available; returns false on EOF or hard error
bool DrainFd(int fd, std::string& buffer, std::size_t cap, bool& truncated) {
    char chunk[8192];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            AppendCapped(buffer, chunk, static_cast<std::size_t>(n), cap, truncated);
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Merge the inherited environment with overrides into KEY=VALUE strings
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult ProcessUtils::Run(const ProcessOptions& options) {
    if (options.argv.empty()) {
        throw std::invalid_argument("ProcessUtils::Run requires a non-empty argv");
    }

    ProcessResult result;
    spdlog::debug("Spawning: {} (timeout {} ms)", options.argv.front(), options.timeout.count());

    // Everything the child touches is prepared before fork; only
    // async-signal-safe calls happen between fork and exec.
    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    auto env_strings = BuildEnvironment(options.environment);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::string workdir = options.working_dir ? options.working_dir->string() : std::string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.error_message = std::string("pipe2 failed: ") + std::strerror(errno);
        spdlog::error("{}", result.error_message);
        CloseFd(out_pipe[0]); CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]); CloseFd(err_pipe[1]);
        CloseFd(exec_pipe[0]); CloseFd(exec_pipe[1]);
        return result;
    }

    auto start_time = std::chrono::steady_clock::now();
    pid_t pid = ::fork();

    if (pid < 0) {
        result.error_message = std::string("fork failed: ") + std::strerror(errno);
        spdlog::error("{}", result.error_message);
        CloseFd(out_pipe[0]); CloseFd(out_pipe[1]);
        CloseFd(err_pipe[0]); CloseFd(err_pipe[1]);
        CloseFd(exec_pipe[0]); CloseFd(exec_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        ApplyLimit(RLIMIT_AS, options.limits.address_space_mb * 1024 * 1024);
        ApplyLimit(RLIMIT_CPU, options.limits.cpu_seconds);
        ApplyLimit(RLIMIT_NPROC, options.limits.max_processes);
        ApplyLimit(RLIMIT_FSIZE, options.limits.max_file_size_mb * 1024 * 1024);

        ::execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);  // Also done in the child; whichever runs first wins
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        CloseFd(out_pipe[0]);
        CloseFd(err_pipe[0]);
        result.exit_code = 127;
        result.error_message = "Failed to execute '" + options.argv.front() + "': " +
                               std::strerror(exec_errno);
        result.stderr_output = result.error_message;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        spdlog::debug("{}", result.error_message);
        return result;
    }

    result.started = true;
    SetNonBlocking(out_pipe[0]);
    SetNonBlocking(err_pipe[0]);

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start_time + options.timeout;
    std::optional<std::chrono::steady_clock::time_point> drain_until;

    bool reaped = false;
    int status = 0;

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        auto now = std::chrono::steady_clock::now();

        if (!reaped && has_deadline && now >= deadline) {
            result.timed_out = true;
            spdlog::warn("Command '{}' exceeded {} ms, killing process group {}",
                         options.argv.front(), options.timeout.count(), pid);
            KillProcessGroup(pid);
            ::waitpid(pid, &status, 0);
            reaped = true;
            drain_until = std::chrono::steady_clock::now() + kDrainGrace;
        }

        if (drain_until && now >= *drain_until) {
            break;
        }

        auto slice = kPollSlice;
        if (!reaped && has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            slice = std::max(std::chrono::milliseconds(1), std::min(slice, remaining));
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        int out_index = -1;
        int err_index = -1;
        if (out_pipe[0] >= 0) {
            fds[nfds].fd = out_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            out_index = static_cast<int>(nfds++);
        }
        if (err_pipe[0] >= 0) {
            fds[nfds].fd = err_pipe[0];
            fds[nfds].events = POLLIN;
            fds[nfds].revents = 0;
            err_index = static_cast<int>(nfds++);
        }

        int ready = ::poll(fds, nfds, static_cast<int>(slice.count()));
        if (ready < 0 && errno != EINTR) {
            spdlog::error("poll failed: {}", std::strerror(errno));
            break;
        }

        if (ready > 0) {
            if (out_index >= 0 && (fds[out_index].revents & (POLLIN | POLLHUP | POLLERR))) {
                if (!DrainFd(out_pipe[0], result.stdout_output, options.max_output_bytes,
                             result.stdout_truncated)) {
                    CloseFd(out_pipe[0]);
                }
            }
            if (err_index >= 0 && (fds[err_index].revents & (POLLIN | POLLHUP | POLLERR))) {
                if (!DrainFd(err_pipe[0], result.stderr_output, options.max_output_bytes,
                             result.stderr_truncated)) {
                    CloseFd(err_pipe[0]);
                }
            }
        }

        if (!reaped) {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
                // Descendants still holding the pipes open
                KillProcessGroup(pid);
                drain_until = std::chrono::steady_clock::now() + kDrainGrace;
            }
        }
    }

    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);

    if (!reaped) {
        KillProcessGroup(pid);
        ::waitpid(pid, &status, 0);
    }

    result.exit_code = result.timed_out ? 128 + SIGKILL : DecodeStatus(status);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (result.stdout_truncated || result.stderr_truncated) {
        spdlog::debug("Output capped at {} bytes (stdout truncated: {}, stderr truncated: {})",
                      options.max_output_bytes, result.stdout_truncated, result.stderr_truncated);
    }

    spdlog::debug("'{}' finished: exit {} in {} ms{}", options.argv.front(), result.exit_code,
                  result.duration.count(), result.timed_out ? " (timed out)" : "");

    return result;
}

ProcessResult ProcessUtils::Run(const std::vector<std::string>& argv,
                                std::chrono::milliseconds timeout) {
    ProcessOptions options;
    options.argv = argv;
    options.timeout = timeout;
    return Run(options);
}

// ============================================================================
// HELPERS
// ============================================================================

bool ProcessUtils::IsOnPath(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return false;
    }

    std::string path_str(path);
    std::size_t start = 0;
    while (start <= path_str.size()) {
        auto end = path_str.find(':', start);
        if (end == std::string::npos) {
            end = path_str.size();
        }
        std::string dir = path_str.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + program;
        struct stat st;
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            ::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

bool ProcessUtils::KillProcessGroup(int pgid) {
    if (pgid <= 0) {
        return false;
    }
    if (::kill(-pgid, SIGKILL) == 0) {
        return true;
    }
    return errno == ESRCH;
}

} // namespace utils
} // namespace crucible
