/**
 * @file sandbox_runtime.hpp
 * @brief Isolation backends that provision sandboxes and run commands in them
 *
 * A runtime owns the mechanics of isolation. It turns a host checkout into a
 * private, resource-limited environment, runs argv commands inside it with a
 * capped capture and a wall-clock timeout, and tears everything down again.
 * The pipeline never talks to docker or fork directly.
 *
 * Two backends ship:
 * - DockerRuntime: one long-lived container per run, the private checkout
 *   copy bind-mounted at /workspace/repo, network attached per command
 * - LocalRuntime: host processes in their own process group with setrlimit
 *   ceilings; no network isolation
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/engine_config.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/core/types.hpp"
#include "crucible/utils/container_utils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace crucible {
namespace core {

/**
 * @struct SandboxCommand
 * @brief One command to run inside a sandbox
 */
struct SandboxCommand {
    CommandLine command;                             ///< argv, environment, network request
    std::string workdir{"."};                        ///< Relative to the checkout root
    std::chrono::milliseconds timeout{0};            ///< Wall-clock limit, 0 = unlimited
    std::size_t max_output_bytes{4 * 1024 * 1024};   ///< Per-stream capture cap
};

/**
 * @class SandboxRuntime
 * @brief Interface implemented by every isolation backend
 *
 * **Thread Safety**: Implementations must allow concurrent Provision,
 * Execute and Destroy calls on different sandboxes.
 */
class SandboxRuntime {
public:
    virtual ~SandboxRuntime() = default;

    /// "docker" or "local"
    virtual std::string Name() const = 0;

    /// Backend can be used on this host
    virtual bool IsAvailable() const = 0;

    /**
     * @brief Create an isolated environment seeded with a private checkout copy
     * @param job Job whose checkout is copied
     * @return Ready sandbox handle
     * @throws SandboxProvisionError on any failure; nothing is left behind
     */
    virtual Sandbox Provision(const EvaluationJob& job) = 0;

    /**
     * @brief Run a command inside the sandbox
     *
     * Never throws for command failures: a non-zero exit, a timeout or an
     * exec failure are all reported in the capture.
     */
    virtual ExecutionCapture Execute(const Sandbox& sandbox, const SandboxCommand& command) = 0;

    /**
     * @brief Remove the environment and its workspace; safe to call once per sandbox
     */
    virtual void Destroy(const Sandbox& sandbox) noexcept = 0;
};

/**
 * @class DockerRuntime
 * @brief Container-per-run backend driven through the docker CLI
 *
 * The container is created with `--network none`, all capabilities dropped
 * and `no-new-privileges`. Commands that request network access are run
 * between `docker network connect` and `docker network disconnect` on the
 * configured install network.
 */
class DockerRuntime : public SandboxRuntime {
public:
    explicit DockerRuntime(SandboxSettings settings);

    std::string Name() const override { return "docker"; }
    bool IsAvailable() const override;
    Sandbox Provision(const EvaluationJob& job) override;
    ExecutionCapture Execute(const Sandbox& sandbox, const SandboxCommand& command) override;
    void Destroy(const Sandbox& sandbox) noexcept override;

    /// Container path of the checkout
    static constexpr const char* kContainerWorkdir = "/workspace/repo";

private:
    SandboxSettings settings_;
    mutable utils::ContainerUtils docker_;
};

/**
 * @class LocalRuntime
 * @brief Process-level backend for development hosts and tests
 *
 * Applies RLIMIT_AS from memory_mb, RLIMIT_FSIZE from disk_mb, RLIMIT_NPROC
 * from pids_limit and RLIMIT_CPU from the command timeout times the CPU
 * quota. Network access is not restricted.
 */
class LocalRuntime : public SandboxRuntime {
public:
    explicit LocalRuntime(SandboxSettings settings);

    std::string Name() const override { return "local"; }
    bool IsAvailable() const override { return true; }
    Sandbox Provision(const EvaluationJob& job) override;
    ExecutionCapture Execute(const Sandbox& sandbox, const SandboxCommand& command) override;
    void Destroy(const Sandbox& sandbox) noexcept override;

private:
    SandboxSettings settings_;
    std::atomic<bool> network_warning_logged_{false};
};

/**
 * @brief Instantiate the backend named by `settings.runtime`
 * @throws ConfigError for an unknown runtime name
 */
std::unique_ptr<SandboxRuntime> CreateSandboxRuntime(const SandboxSettings& settings);

} // namespace core
} // namespace crucible
