/**
 * @file sandbox_runtime.cpp
 * @brief Docker and local isolation backends
 *
 * **Per-run layout on the host**:
 * ```
 * <workspace_root>/<sandbox id>/        host_root, removed on Destroy
 *                             repo/     private checkout copy (host_workdir)
 * ```
 *
 * @date 2025
 */

#include "crucible/core/sandbox_runtime.hpp"
#include "crucible/utils/hash_utils.hpp"
#include "crucible/utils/process_utils.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <system_error>

namespace crucible {
namespace core {

namespace fs = std::filesystem;

using utils::StringUtils;

namespace {

std::atomic<std::uint64_t> g_sandbox_counter{0};

/// Unique, docker-safe sandbox name
std::string MakeSandboxId(const EvaluationJob& job) {
    auto now = std::chrono::system_clock::now().time_since_epoch().count();
    std::string seed = job.repository.remote_url + "|" + job.checkout_path.string() + "|" +
                       std::to_string(now) + "|" + std::to_string(g_sandbox_counter++);
    return "crucible-" + utils::HashUtils::ShortId(seed, 12);
}

/**
 * @brief Create host_root and copy the checkout into host_root/repo
 * @throws SandboxProvisionError; host_root is removed on failure
 */
void PrepareWorkspace(const EvaluationJob& job, Sandbox& sandbox, const fs::path& workspace_root) {
    std::error_code ec;

    if (!fs::is_directory(job.checkout_path, ec)) {
        throw SandboxProvisionError("Checkout is not a directory: " + job.checkout_path.string());
    }

    sandbox.host_root = workspace_root / sandbox.id;
    sandbox.host_workdir = sandbox.host_root / "repo";

    fs::create_directories(sandbox.host_root, ec);
    if (ec) {
        throw SandboxProvisionError("Cannot create sandbox workspace " +
                                    sandbox.host_root.string() + ": " + ec.message());
    }

    fs::copy(job.checkout_path, sandbox.host_workdir,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove_all(sandbox.host_root, cleanup_ec);
        throw SandboxProvisionError("Failed to copy checkout into sandbox: " + ec.message());
    }

    spdlog::debug("[sandbox] {} workspace ready at {}", sandbox.id, sandbox.host_workdir.string());
}

void RemoveWorkspace(const Sandbox& sandbox) noexcept {
    if (sandbox.host_root.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(sandbox.host_root, ec);
    if (ec) {
        spdlog::warn("[sandbox] {} could not remove {}: {}", sandbox.id,
                     sandbox.host_root.string(), ec.message());
    }
}

SandboxLimits LimitsFrom(const SandboxSettings& settings) {
    SandboxLimits limits;
    limits.memory_mb = settings.memory_mb;
    limits.cpus = settings.cpus;
    limits.pids_limit = settings.pids_limit;
    limits.disk_mb = settings.disk_mb;
    return limits;
}

/// Capture for a command that never reached the backend
ExecutionCapture SetupFailureCapture(const std::string& message, int return_code) {
    ExecutionCapture capture;
    capture.stderr_output = message;
    capture.return_code = return_code;
    return capture;
}

} // anonymous namespace

// ============================================================================
// DOCKER RUNTIME
// ============================================================================

DockerRuntime::DockerRuntime(SandboxSettings settings)
    : settings_(std::move(settings)) {
}

bool DockerRuntime::IsAvailable() const {
    return docker_.IsRuntimeAvailable();
}

Sandbox DockerRuntime::Provision(const EvaluationJob& job) {
    Sandbox sandbox;
    sandbox.id = MakeSandboxId(job);
    sandbox.runtime_name = Name();
    sandbox.sandbox_workdir = kContainerWorkdir;
    sandbox.limits = LimitsFrom(settings_);
    sandbox.install_network_allowed = settings_.allow_install_network;
    sandbox.test_network_allowed = settings_.allow_test_network;

    if (!docker_.IsImagePresent(settings_.image)) {
        throw SandboxProvisionError("Sandbox image not found: " + settings_.image);
    }

    PrepareWorkspace(job, sandbox, settings_.workspace_root);

    auto builder = utils::ContainerBuilder()
        .WithName(sandbox.id)
        .WithImage(settings_.image)
        .WithMemoryLimit(settings_.memory_mb)
        .WithCPULimit(settings_.cpus)
        .WithPidsLimit(settings_.pids_limit)
        .WithNetwork("none")
        .WithMount(fs::absolute(sandbox.host_workdir), kContainerWorkdir)
        .WithWorkingDir(kContainerWorkdir)
        .WithLabel("crucible.sandbox", sandbox.id)
        .DropAllCapabilities();

    if (settings_.disk_mb > 0) {
        builder.WithDiskLimit(settings_.disk_mb);
    }

    std::string error;
    std::string container_id = docker_.CreateContainer(builder.Build(), &error);

    // size= is only honoured by some storage drivers
    if (container_id.empty() && settings_.disk_mb > 0 &&
        StringUtils::Contains(error, "storage-opt")) {
        spdlog::warn("[sandbox] Storage driver rejects a disk limit, creating {} without one",
                     sandbox.id);
        error.clear();
        container_id = docker_.CreateContainer(builder.WithDiskLimit(0).Build(), &error);
    }

    if (container_id.empty()) {
        RemoveWorkspace(sandbox);
        throw SandboxProvisionError("docker create failed: " + error);
    }
    sandbox.container_id = container_id;

    if (!docker_.StartContainer(container_id, &error)) {
        docker_.RemoveContainer(container_id, true);
        RemoveWorkspace(sandbox);
        throw SandboxProvisionError("docker start failed: " + error);
    }

    spdlog::info("[sandbox] {} provisioned (container {})", sandbox.id,
                 StringUtils::Truncate(container_id, 12, ""));
    return sandbox;
}

ExecutionCapture DockerRuntime::Execute(const Sandbox& sandbox, const SandboxCommand& command) {
    const bool wants_network = command.command.network == NetworkPolicy::ENABLED;

    if (wants_network) {
        std::string error;
        if (!docker_.ConnectNetwork(sandbox.container_id, settings_.install_network, &error)) {
            return SetupFailureCapture("Failed to attach sandbox to network '" +
                                       settings_.install_network + "': " + error,
                                       125);
        }
    }

    utils::ContainerExecOptions options;
    options.working_dir = fs::path(sandbox.sandbox_workdir) / command.workdir;
    options.environment = command.command.environment;
    options.timeout = command.timeout;
    options.max_output_bytes = command.max_output_bytes;

    auto result = docker_.ExecuteCommand(sandbox.container_id, command.command.argv, options);

    if (wants_network && !result.timed_out) {
        docker_.DisconnectNetwork(sandbox.container_id, settings_.install_network);
    }

    ExecutionCapture capture;
    capture.stdout_output = std::move(result.stdout_output);
    capture.stderr_output = std::move(result.stderr_output);
    capture.return_code = result.exit_code;
    capture.duration_ms = result.duration.count();
    capture.timed_out = result.timed_out;
    capture.stdout_truncated = result.stdout_truncated;
    capture.stderr_truncated = result.stderr_truncated;
    return capture;
}

void DockerRuntime::Destroy(const Sandbox& sandbox) noexcept {
    try {
        if (!sandbox.container_id.empty()) {
            // Files written by the container are root-owned on the host
            utils::ContainerExecOptions options;
            options.timeout = std::chrono::seconds(60);
            auto wiped = docker_.ExecuteCommand(sandbox.container_id,
                                                {"find", kContainerWorkdir, "-mindepth", "1", "-delete"},
                                                options);
            docker_.RemoveContainer(sandbox.container_id, true);

            // A timed-out exec kills the container, so the in-place wipe cannot run
            if (!wiped.success && !sandbox.host_workdir.empty()) {
                spdlog::debug("[sandbox] {} in-container wipe failed, using a throwaway container",
                              sandbox.id);
                std::string error;
                if (!docker_.WipeDirectory(settings_.image, fs::absolute(sandbox.host_workdir), &error)) {
                    spdlog::warn("[sandbox] {} workspace wipe failed: {}", sandbox.id, error);
                }
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[sandbox] {} container removal failed: {}", sandbox.id, e.what());
    }

    RemoveWorkspace(sandbox);
    spdlog::debug("[sandbox] {} destroyed", sandbox.id);
}

// ============================================================================
// LOCAL RUNTIME
// ============================================================================

LocalRuntime::LocalRuntime(SandboxSettings settings)
    : settings_(std::move(settings)) {
}

Sandbox LocalRuntime::Provision(const EvaluationJob& job) {
    Sandbox sandbox;
    sandbox.id = MakeSandboxId(job);
    sandbox.runtime_name = Name();
    sandbox.limits = LimitsFrom(settings_);
    sandbox.install_network_allowed = settings_.allow_install_network;
    sandbox.test_network_allowed = settings_.allow_test_network;

    PrepareWorkspace(job, sandbox, settings_.workspace_root);
    sandbox.sandbox_workdir = sandbox.host_workdir;

    if (!settings_.allow_test_network && !network_warning_logged_.exchange(true)) {
        spdlog::warn("[sandbox] Local runtime does not isolate the network; "
                     "tests can reach it despite allow_test_network=false");
    }

    spdlog::info("[sandbox] {} provisioned (local)", sandbox.id);
    return sandbox;
}

ExecutionCapture LocalRuntime::Execute(const Sandbox& sandbox, const SandboxCommand& command) {
    utils::ProcessOptions options;
    options.argv = command.command.argv;
    options.environment = command.command.environment;
    options.working_dir = sandbox.host_workdir / command.workdir;
    options.timeout = command.timeout;
    options.max_output_bytes = command.max_output_bytes;

    options.limits.address_space_mb = sandbox.limits.memory_mb;
    options.limits.max_file_size_mb = sandbox.limits.disk_mb;
    if (sandbox.limits.pids_limit > 0) {
        options.limits.max_processes = static_cast<std::size_t>(sandbox.limits.pids_limit);
    }
    if (command.timeout.count() > 0 && sandbox.limits.cpus > 0) {
        double seconds = std::ceil(command.timeout.count() / 1000.0 * sandbox.limits.cpus);
        options.limits.cpu_seconds = static_cast<std::size_t>(seconds);
    }

    if (options.argv.empty()) {
        return SetupFailureCapture("Empty command", 127);
    }

    auto result = utils::ProcessUtils::Run(options);

    ExecutionCapture capture;
    capture.stdout_output = std::move(result.stdout_output);
    capture.stderr_output = std::move(result.stderr_output);
    capture.return_code = result.exit_code;
    capture.duration_ms = result.duration.count();
    capture.timed_out = result.timed_out;
    capture.stdout_truncated = result.stdout_truncated;
    capture.stderr_truncated = result.stderr_truncated;

    if (!result.started && !result.error_message.empty()) {
        if (!capture.stderr_output.empty()) {
            capture.stderr_output += "\n";
        }
        capture.stderr_output += result.error_message;
    }
    return capture;
}

void LocalRuntime::Destroy(const Sandbox& sandbox) noexcept {
    RemoveWorkspace(sandbox);
    spdlog::debug("[sandbox] {} destroyed", sandbox.id);
}

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<SandboxRuntime> CreateSandboxRuntime(const SandboxSettings& settings) {
    if (settings.runtime == "docker") {
        return std::make_unique<DockerRuntime>(settings);
    }
    if (settings.runtime == "local") {
        return std::make_unique<LocalRuntime>(settings);
    }
    throw ConfigError("Unknown sandbox runtime: " + settings.runtime);
}

} // namespace core
} // namespace crucible
