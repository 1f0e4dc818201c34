/**
 * @file dependency_installer.cpp
 * @brief Implementation of the install stage
 *
 * @date 2025
 */

#include "crucible/core/dependency_installer.hpp"

#include <spdlog/spdlog.h>

namespace crucible {
namespace core {

DependencyInstaller::DependencyInstaller(SandboxRuntime& runtime, const EngineConfig& config)
    : runtime_(runtime), config_(config) {
}

InstallResult DependencyInstaller::Install(const Sandbox& sandbox,
                                           const DetectedInvocation& invocation,
                                           std::chrono::milliseconds timeout) const {
    InstallResult result;

    if (!invocation.install_command) {
        spdlog::info("[install] Nothing to install for {}", invocation.adapter_name);
        result.success = true;
        return result;
    }

    SandboxCommand command;
    command.command = *invocation.install_command;
    command.command.network = sandbox.install_network_allowed ? NetworkPolicy::ENABLED
                                                              : NetworkPolicy::DISABLED;
    command.workdir = invocation.workdir;
    command.timeout = timeout;
    command.max_output_bytes = config_.capture.max_output_bytes;

    spdlog::info("[install] {} (timeout {}s)", command.command.ToString(),
                 std::chrono::duration_cast<std::chrono::seconds>(timeout).count());

    ExecutionCapture capture = runtime_.Execute(sandbox, command);
    result.ran = true;

    if (capture.timed_out) {
        result.error_message = "Dependency installation timed out after " +
                               std::to_string(capture.duration_ms) + " ms";
    } else if (capture.return_code != 0) {
        result.error_message = "Dependency installation exited with code " +
                               std::to_string(capture.return_code);
    } else {
        result.success = true;
    }

    if (result.success) {
        spdlog::info("[install] Completed in {} ms", capture.duration_ms);
    } else {
        spdlog::warn("[install] {}", result.error_message);
    }

    result.capture = std::move(capture);
    return result;
}

} // namespace core
} // namespace crucible
