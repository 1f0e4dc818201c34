/**
 * @file container_utils.cpp
 * @brief Implementation of the docker CLI wrapper
 *
 * **Security Hardening Layers** (applied at create time):
 * 1. Capability Dropping: --cap-drop ALL
 * 2. No New Privileges: --security-opt no-new-privileges
 * 3. Resource Limits: --memory / --memory-swap / --cpus / --pids-limit
 * 4. Network Isolation: created on `none`, attached to the install network
 *    only for the duration of the commands that are allowed to use it
 *
 * **Container Lifecycle**:
 * ```
 * Create → Start → Exec (install) → Exec (test) → Remove --force
 * ```
 *
 * The entry command is `sleep infinity` so the container stays up between
 * exec calls; all real work runs through `docker exec`.
 *
 * @date 2025
 */

#include "crucible/utils/container_utils.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace crucible {
namespace utils {

namespace {

constexpr const char* kDockerBinary = "docker";
constexpr const char* kWipeMountPoint = "/crucible-wipe";

void Report(std::string* error, const ContainerExecResult& result) {
    if (error) {
        *error = StringUtils::Trim(result.stderr_output);
        if (error->empty() && result.timed_out) {
            *error = "docker command timed out";
        }
    }
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

ContainerUtils::ContainerUtils() {
    spdlog::debug("Container Utils initialized with runtime: {}", kDockerBinary);
}

ContainerUtils::~ContainerUtils() {
    std::size_t leftover = TrackedCount();
    if (leftover > 0) {
        spdlog::warn("Container Utils destroyed with {} tracked container(s), cleaning up",
                     leftover);
        CleanupAll();
    }
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable() const {
    if (!ProcessUtils::IsOnPath(kDockerBinary)) {
        spdlog::debug("{} CLI not found on PATH", kDockerBinary);
        return false;
    }

    // `version` contacts the daemon, `--version` does not
    auto result = ExecuteDockerCommand({"version", "--format", "{{.Server.Version}}"},
                                       std::chrono::seconds(15));
    return result.success;
}

bool ContainerUtils::IsImagePresent(const std::string& image) const {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image},
                                       std::chrono::seconds(30));
    return result.success;
}

// ============================================================================
// CONTAINER CREATION
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config, std::string* error) {
    spdlog::info("Creating container: {} ({})", config.name, config.image);

    auto result = ExecuteDockerCommand(BuildCreateCommand(config), std::chrono::minutes(2));

    if (result.success) {
        std::string container_id = StringUtils::Trim(result.stdout_output);
        spdlog::debug("Container created: {}", container_id);
        SetState(container_id, ContainerState::CREATED);
        return container_id;
    }

    Report(error, result);
    spdlog::error("Failed to create container: {}", StringUtils::Trim(result.stderr_output));
    return "";
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

bool ContainerUtils::StartContainer(const std::string& container_id, std::string* error) {
    spdlog::debug("Starting container: {}", container_id);

    auto result = ExecuteDockerCommand({"start", container_id}, std::chrono::minutes(1));

    if (result.success) {
        SetState(container_id, ContainerState::RUNNING);
        return true;
    }

    Report(error, result);
    spdlog::error("Failed to start container {}: {}", container_id,
                  StringUtils::Trim(result.stderr_output));
    return false;
}

bool ContainerUtils::KillContainer(const std::string& container_id) {
    spdlog::info("Killing container: {}", container_id);

    auto result = ExecuteDockerCommand({"kill", container_id}, std::chrono::seconds(30));

    if (result.success) {
        SetState(container_id, ContainerState::DEAD);
    } else {
        spdlog::warn("Failed to kill container {}: {}", container_id,
                     StringUtils::Trim(result.stderr_output));
    }

    return result.success;
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::debug("Removing container: {} (force: {})", container_id, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args, std::chrono::minutes(2));

    if (result.success) {
        std::lock_guard<std::mutex> lock(mutex_);
        tracked_containers_.erase(container_id);
        return true;
    }

    spdlog::error("Failed to remove container {}: {}", container_id,
                  StringUtils::Trim(result.stderr_output));
    return false;
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteCommand(const std::string& container_id,
                                                   const std::vector<std::string>& command,
                                                   const ContainerExecOptions& options) {
    std::vector<std::string> args = {"exec"};

    if (options.working_dir) {
        args.push_back("-w");
        args.push_back(options.working_dir->string());
    }
    for (const auto& [key, value] : options.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    args.push_back(container_id);
    args.insert(args.end(), command.begin(), command.end());

    spdlog::debug("Executing in {}: {}", container_id, StringUtils::Join(command, " "));

    auto result = ExecuteDockerCommand(args, options.timeout, options.max_output_bytes);

    if (result.timed_out) {
        // Killing the client leaves the exec'd tree running inside the container
        spdlog::warn("Exec in {} timed out after {} ms", container_id, options.timeout.count());
        KillContainer(container_id);
    }

    return result;
}

// ============================================================================
// NETWORK POLICY
// ============================================================================

bool ContainerUtils::ConnectNetwork(const std::string& container_id, const std::string& network,
                                    std::string* error) {
    auto result = ExecuteDockerCommand({"network", "connect", network, container_id},
                                       std::chrono::seconds(30));
    if (!result.success) {
        Report(error, result);
        spdlog::error("Failed to connect {} to network {}: {}", container_id, network,
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

bool ContainerUtils::DisconnectNetwork(const std::string& container_id, const std::string& network) {
    auto result = ExecuteDockerCommand({"network", "disconnect", "--force", network, container_id},
                                       std::chrono::seconds(30));
    if (!result.success) {
        spdlog::error("Failed to disconnect {} from network {}: {}", container_id, network,
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

// ============================================================================
// CLEANUP
// ============================================================================

void ContainerUtils::CleanupAll() {
    std::map<std::string, ContainerState> containers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        containers = tracked_containers_;
    }

    for (const auto& [id, state] : containers) {
        spdlog::info("Cleaning up container: {}", id);
        RemoveContainer(id, true);
    }
}

std::size_t ContainerUtils::TrackedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_containers_.size();
}

bool ContainerUtils::WipeDirectory(const std::string& image, const std::filesystem::path& host_dir,
                                   std::string* error) {
    spdlog::debug("Wiping {} through a throwaway {} container", host_dir.string(), image);

    auto result = ExecuteDockerCommand(BuildWipeCommand(image, host_dir), std::chrono::minutes(2));
    if (!result.success) {
        Report(error, result);
        spdlog::error("Failed to wipe {}: {}", host_dir.string(),
                      StringUtils::Trim(result.stderr_output));
    }
    return result.success;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                         std::chrono::milliseconds timeout,
                                                         std::size_t max_output_bytes) const {
    ProcessOptions options;
    options.argv.push_back(kDockerBinary);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.timeout = timeout;
    options.max_output_bytes = max_output_bytes;

    auto proc = ProcessUtils::Run(options);

    ContainerExecResult exec_result;
    exec_result.exit_code = proc.exit_code;
    exec_result.stdout_output = std::move(proc.stdout_output);
    exec_result.stderr_output = std::move(proc.stderr_output);
    exec_result.duration = proc.duration;
    exec_result.timed_out = proc.timed_out;
    exec_result.stdout_truncated = proc.stdout_truncated;
    exec_result.stderr_truncated = proc.stderr_truncated;
    exec_result.success = proc.Succeeded();

    return exec_result;
}

std::vector<std::string> ContainerUtils::BuildCreateCommand(const ContainerConfig& config) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Memory limit (swap pinned so the limit is hard)
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    if (config.cpu_limit > 0) {
        std::ostringstream cpus;
        cpus << config.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    if (config.disk_limit_mb > 0) {
        args.push_back("--storage-opt");
        args.push_back("size=" + std::to_string(config.disk_limit_mb) + "m");
    }

    args.push_back("--network");
    args.push_back(config.network.empty() ? "none" : config.network);

    // Security: Drop capabilities
    for (const auto& cap : config.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (config.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    for (const auto& [host, container] : config.mounts) {
        args.push_back("--volume");
        args.push_back(host.string() + ":" + container.string());
    }

    if (!config.working_dir.empty()) {
        args.push_back("--workdir");
        args.push_back(config.working_dir.string());
    }

    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());

    return args;
}

std::vector<std::string> ContainerUtils::BuildWipeCommand(const std::string& image,
                                                          const std::filesystem::path& host_dir) {
    // Runs as the image's root with default capabilities so it can unlink
    // files owned by either the host user or the sandbox
    return {
        "run", "--rm",
        "--network", "none",
        "--security-opt", "no-new-privileges",
        "--volume", host_dir.string() + ":" + kWipeMountPoint,
        "--entrypoint", "find",
        image,
        kWipeMountPoint, "-mindepth", "1", "-delete"
    };
}

void ContainerUtils::SetState(const std::string& container_id, ContainerState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    tracked_containers_[container_id] = state;
}

// ============================================================================
// CONTAINER BUILDER
// ============================================================================

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMemoryLimit(std::size_t mb) {
    config_.memory_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCPULimit(double cpus) {
    config_.cpu_limit = cpus;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithPidsLimit(int pids) {
    config_.pids_limit = pids;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithDiskLimit(std::size_t mb) {
    config_.disk_limit_mb = mb;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(const std::string& network) {
    config_.network = network;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::filesystem::path& host,
                                              const std::filesystem::path& container) {
    config_.mounts[host] = container;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::filesystem::path& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::DropAllCapabilities() {
    config_.capabilities_drop = {"ALL"};
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    return config_;
}

} // namespace utils
} // namespace crucible
