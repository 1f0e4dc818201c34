/**
 * @file dependency_installer.hpp
 * @brief Runs the detected install command inside the sandbox
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/engine_config.hpp"
#include "crucible/core/sandbox_runtime.hpp"
#include "crucible/core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace crucible {
namespace core {

/**
 * @struct InstallResult
 * @brief Outcome of the install stage
 */
struct InstallResult {
    bool success{false};                    ///< Install finished with exit code 0 (or nothing to do)
    bool ran{false};                        ///< An install command was executed
    std::optional<ExecutionCapture> capture;  ///< Install evidence, when ran
    std::string error_message;              ///< Why the install failed
};

/**
 * @class DependencyInstaller
 * @brief Install stage: network per settings, install timeout, capped capture
 */
class DependencyInstaller {
public:
    DependencyInstaller(SandboxRuntime& runtime, const EngineConfig& config);

    /**
     * @brief Run the invocation's install command, if any
     * @param sandbox Provisioned sandbox
     * @param invocation Detected invocation
     * @param timeout Wall-clock limit (already clamped to the worker deadline)
     * @return Result; success without running anything when there is no command
     */
    InstallResult Install(const Sandbox& sandbox,
                          const DetectedInvocation& invocation,
                          std::chrono::milliseconds timeout) const;

private:
    SandboxRuntime& runtime_;
    const EngineConfig& config_;
};

} // namespace core
} // namespace crucible
