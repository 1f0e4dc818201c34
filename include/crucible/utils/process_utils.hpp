/**
 * @file process_utils.hpp
 * @brief Child process execution with bounded capture and wall-clock timeout
 *
 * Every external command the engine runs (docker CLI calls, local sandbox
 * commands, `git rev-parse`) goes through ProcessUtils::Run. The child is
 * placed in its own process group so that a timeout kills the whole tree,
 * stdout and stderr are streamed through non-blocking pipes into buffers
 * with a hard byte cap, and the result records whether the deadline fired.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace utils {

/**
 * @struct ProcessLimits
 * @brief setrlimit ceilings applied in the child before exec
 *
 * Zero means "leave the inherited limit in place".
 */
struct ProcessLimits {
    std::size_t address_space_mb{0};   ///< RLIMIT_AS
    std::size_t cpu_seconds{0};        ///< RLIMIT_CPU
    std::size_t max_processes{0};      ///< RLIMIT_NPROC
    std::size_t max_file_size_mb{0};   ///< RLIMIT_FSIZE
};

/**
 * @struct ProcessOptions
 * @brief Everything needed to launch one command
 */
struct ProcessOptions {
    std::vector<std::string> argv;                      ///< Program and arguments (argv[0] resolved via PATH)
    std::map<std::string, std::string> environment;    ///< Added to (or overriding) the inherited environment
    std::optional<std::filesystem::path> working_dir;   ///< chdir target, inherited if empty
    std::chrono::milliseconds timeout{0};               ///< Wall-clock limit, 0 = unlimited
    std::size_t max_output_bytes{4 * 1024 * 1024};      ///< Per-stream capture cap
    ProcessLimits limits;                                ///< Resource ceilings
};

/**
 * @struct ProcessResult
 * @brief Raw outcome of a child process
 */
struct ProcessResult {
    int exit_code{-1};                       ///< Exit status, 128+signal if killed, -1 if never started
    std::string stdout_output;               ///< Captured stdout (up to the cap)
    std::string stderr_output;               ///< Captured stderr (up to the cap)
    std::chrono::milliseconds duration{0};   ///< Wall-clock time from spawn to reap
    bool timed_out{false};                   ///< Deadline fired and the group was killed
    bool stdout_truncated{false};            ///< Bytes were dropped from stdout
    bool stderr_truncated{false};            ///< Bytes were dropped from stderr
    bool started{false};                     ///< exec succeeded
    std::string error_message;               ///< Spawn failure description

    bool Succeeded() const { return started && !timed_out && exit_code == 0; }
};

/**
 * @class ProcessUtils
 * @brief Static process helpers
 *
 * **Usage Example**:
 * @code
 * ProcessOptions opts;
 * opts.argv = {"git", "rev-parse", "HEAD"};
 * opts.working_dir = checkout;
 * opts.timeout = std::chrono::seconds(10);
 *
 * auto result = ProcessUtils::Run(opts);
 * if (result.Succeeded()) {
 *     commit = StringUtils::Trim(result.stdout_output);
 * }
 * @endcode
 *
 * **Thread Safety**: Run() is safe to call from multiple worker threads;
 * every call owns its pipes and child.
 */
class ProcessUtils {
public:
    /**
     * @brief Spawn, capture and reap a child process
     *
     * Never throws for child-side failures: an exec failure yields
     * `started == false` with `error_message` set and exit code 127.
     *
     * @param options Launch options
     * @return Captured result
     * @throws std::invalid_argument if argv is empty
     */
    static ProcessResult Run(const ProcessOptions& options);

    /**
     * @brief Convenience wrapper for short helper commands
     * @param argv Program and arguments
     * @param timeout Wall-clock limit
     * @return Captured result
     */
    static ProcessResult Run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief Check whether an executable is reachable via PATH
     * @param program Program name
     * @return true if found and executable
     */
    static bool IsOnPath(const std::string& program);

    /**
     * @brief Send SIGKILL to a whole process group
     * @param pgid Process group id
     * @return true if the signal was delivered or the group is already gone
     */
    static bool KillProcessGroup(int pgid);
};

} // namespace utils
} // namespace crucible
