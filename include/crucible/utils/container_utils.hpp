/**
 * @file container_utils.hpp
 * @brief Docker CLI wrapper for sandbox container lifecycle
 *
 * Thin, argv-based wrapper around the docker command line. Every
 * call goes through ProcessUtils, so no shell ever interprets repository
 * controlled strings, and long-running `exec` calls inherit the same capped
 * capture and wall-clock timeout as local commands.
 *
 * @date 2025
 */

#pragma once

#include "crucible/utils/process_utils.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace crucible {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states tracked locally
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    DEAD,      ///< Container was killed
    UNKNOWN    ///< Unknown state
};

/**
 * @struct ContainerConfig
 * @brief Container configuration for `docker create`
 */
struct ContainerConfig {
    // Basic Settings
    std::string name;                                ///< Container name
    std::string image{"crucible-runner:latest"};     ///< Base image
    std::vector<std::string> command{"sleep", "infinity"};  ///< Keep-alive entry command

    // Resource Limits
    std::size_t memory_limit_mb{4096};    ///< Memory limit (swap pinned to the same value)
    double cpu_limit{2.0};                ///< CPU limit (cores)
    int pids_limit{512};                  ///< Process limit
    std::size_t disk_limit_mb{0};         ///< Writable layer size, 0 = storage driver default

    // Network Settings
    std::string network{"none"};          ///< Network at creation time

    // Security Settings
    std::vector<std::string> capabilities_drop{"ALL"};  ///< Dropped capabilities
    bool no_new_privileges{true};                       ///< --security-opt no-new-privileges

    // Filesystem Settings
    std::map<std::filesystem::path, std::filesystem::path> mounts;  ///< host → container bind mounts
    std::filesystem::path working_dir{"/workspace/repo"};           ///< Working directory

    // Metadata
    std::map<std::string, std::string> labels;             ///< Labels for cleanup queries
};

/**
 * @struct ContainerExecOptions
 * @brief Options for a single `docker exec`
 */
struct ContainerExecOptions {
    std::optional<std::filesystem::path> working_dir;      ///< -w inside the container
    std::map<std::string, std::string> environment;        ///< -e KEY=VALUE
    std::chrono::milliseconds timeout{0};                  ///< Wall-clock limit, 0 = unlimited
    std::size_t max_output_bytes{4 * 1024 * 1024};          ///< Per-stream capture cap
};

/**
 * @struct ContainerExecResult
 * @brief Result of a docker CLI invocation or in-container command
 */
struct ContainerExecResult {
    int exit_code{0};                         ///< Exit code
    std::string stdout_output;                ///< Standard output
    std::string stderr_output;                ///< Standard error
    std::chrono::milliseconds duration{0};    ///< Execution duration
    bool timed_out{false};                    ///< Deadline fired
    bool stdout_truncated{false};             ///< Capture cap hit on stdout
    bool stderr_truncated{false};             ///< Capture cap hit on stderr
    bool success{false};                      ///< Exit code 0 and no timeout
};

/**
 * @class ContainerUtils
 * @brief Container lifecycle management for sandboxes
 *
 * **Usage Example**:
 * @code
 * ContainerUtils docker;
 *
 * auto config = ContainerBuilder()
 *     .WithName("crucible-3f9a1c0b2d4e")
 *     .WithImage("crucible-runner:latest")
 *     .WithMemoryLimit(4096)
 *     .WithMount(workspace, "/workspace/repo")
 *     .Build();
 *
 * std::string id = docker.CreateContainer(config);
 * docker.StartContainer(id);
 * auto result = docker.ExecuteCommand(id, {"sh", "-c", "npm test"}, opts);
 * docker.RemoveContainer(id, true);
 * @endcode
 *
 * **Thread Safety**: All methods are safe to call concurrently; the tracked
 * container table is guarded by a mutex. Failures are reported per call
 * through the optional @p error out-parameter, never through shared state.
 */
class ContainerUtils {
public:
    /**
     * @brief Construct container utilities
     *
     * Does not contact the daemon; call IsRuntimeAvailable() for that.
     */
    ContainerUtils();

    ~ContainerUtils();

    ContainerUtils(const ContainerUtils&) = delete;
    ContainerUtils& operator=(const ContainerUtils&) = delete;

    /**
     * @brief Check that the CLI exists and the daemon answers
     * @return true if `docker version` succeeds
     */
    bool IsRuntimeAvailable() const;

    /**
     * @brief Check whether an image is present locally
     * @param image Image reference
     * @return true if `docker image inspect` succeeds
     */
    bool IsImagePresent(const std::string& image) const;

    /**
     * @brief Create (but do not start) a container
     * @param config Container configuration
     * @param error Receives the CLI's stderr on failure
     * @return Container ID, empty on failure
     */
    std::string CreateContainer(const ContainerConfig& config, std::string* error = nullptr);

    /**
     * @brief Start container
     * @param container_id Container ID
     * @param error Receives the CLI's stderr on failure
     * @return true if started successfully
     */
    bool StartContainer(const std::string& container_id, std::string* error = nullptr);

    /**
     * @brief Kill container forcefully (terminates every exec'd process)
     * @param container_id Container ID
     * @return true if killed successfully
     */
    bool KillContainer(const std::string& container_id);

    /**
     * @brief Remove container
     * @param container_id Container ID
     * @param force Force removal of a running container
     * @return true if removed successfully
     */
    bool RemoveContainer(const std::string& container_id, bool force = false);

    /**
     * @brief Execute command in a running container
     *
     * On timeout the docker client is killed and the container itself is
     * killed, which is the only reliable way to stop the in-container tree.
     *
     * @param container_id Container ID
     * @param command Command argv
     * @param options Working directory, environment, timeout, capture cap
     * @return Execution result
     */
    ContainerExecResult ExecuteCommand(const std::string& container_id,
                                       const std::vector<std::string>& command,
                                       const ContainerExecOptions& options = {});

    /**
     * @brief Attach container to a network
     * @param container_id Container ID
     * @param network Network name (e.g. "bridge")
     * @param error Receives the CLI's stderr on failure
     * @return true on success
     */
    bool ConnectNetwork(const std::string& container_id, const std::string& network,
                        std::string* error = nullptr);

    /**
     * @brief Detach container from a network
     * @param container_id Container ID
     * @param network Network name
     * @return true on success
     */
    bool DisconnectNetwork(const std::string& container_id, const std::string& network);

    /**
     * @brief Force-remove every container created through this instance
     */
    void CleanupAll();

    /**
     * @brief Number of containers created and not yet removed
     */
    std::size_t TrackedCount() const;

    /**
     * @brief Delete the contents of a host directory from a throwaway container
     *
     * Files written by a sandbox are owned by the container's root user, so
     * the host process often cannot remove them. This works even when the
     * sandbox container itself has been killed.
     *
     * @param image Image that provides `find`
     * @param host_dir Absolute host directory whose contents are removed
     * @param error Receives the CLI's stderr on failure
     * @return true on success
     */
    bool WipeDirectory(const std::string& image, const std::filesystem::path& host_dir,
                       std::string* error = nullptr);

    /**
     * @brief Build the `docker create` argument vector (without the binary)
     * @param config Container configuration
     * @return Arguments
     */
    static std::vector<std::string> BuildCreateCommand(const ContainerConfig& config);

    /**
     * @brief Build the `docker run --rm` argument vector used by WipeDirectory
     */
    static std::vector<std::string> BuildWipeCommand(const std::string& image,
                                                     const std::filesystem::path& host_dir);

private:
    mutable std::mutex mutex_;                                   ///< Guards the table below
    std::map<std::string, ContainerState> tracked_containers_;   ///< Tracked containers

    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                             std::chrono::milliseconds timeout = std::chrono::seconds(120),
                                             std::size_t max_output_bytes = 1024 * 1024) const;
    void SetState(const std::string& container_id, ContainerState state);
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithMemoryLimit(std::size_t mb);
    ContainerBuilder& WithCPULimit(double cpus);
    ContainerBuilder& WithPidsLimit(int pids);
    ContainerBuilder& WithDiskLimit(std::size_t mb);
    ContainerBuilder& WithNetwork(const std::string& network);
    ContainerBuilder& WithMount(const std::filesystem::path& host,
                                const std::filesystem::path& container);
    ContainerBuilder& WithWorkingDir(const std::filesystem::path& dir);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);
    ContainerBuilder& DropAllCapabilities();

    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace utils
} // namespace crucible
