/**
 * @file evaluation_pipeline.hpp
 * @brief Per-repository state machine from sandbox acquisition to TestRun
 *
 * **Stages**:
 * ```
 * START → SANDBOXED → DETECTED → INSTALLED → EXECUTED (TIMED_OUT) → PARSED → ASSEMBLED
 *           │            │           │
 *           │            │           └─ INSTALL_ERROR
 *           │            └─ NO_TESTS_DETECTED
 *           └─ SANDBOX_PROVISION_ERROR
 *
 * any stage → WORKER_TIMEOUT (total deadline) | INTERNAL_ERROR (exception)
 * ```
 *
 * Every path yields exactly one TestRun and releases the sandbox exactly once.
 *
 * @date 2025
 */

#pragma once

#include "crucible/adapters/adapter_registry.hpp"
#include "crucible/core/dependency_installer.hpp"
#include "crucible/core/engine_config.hpp"
#include "crucible/core/output_parser.hpp"
#include "crucible/core/result_assembler.hpp"
#include "crucible/core/sandbox_manager.hpp"
#include "crucible/core/sandbox_runtime.hpp"
#include "crucible/core/test_detector.hpp"
#include "crucible/core/test_executor.hpp"
#include "crucible/core/types.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace crucible {
namespace core {

/**
 * @enum PipelineStage
 * @brief Last stage a run reached
 */
enum class PipelineStage {
    START,       ///< Nothing done yet
    SANDBOXED,   ///< Sandbox provisioned
    DETECTED,    ///< Invocation detected
    INSTALLED,   ///< Dependencies installed
    EXECUTED,    ///< Test command finished
    TIMED_OUT,   ///< Test command killed by its timeout
    PARSED,      ///< Verdict computed
    ASSEMBLED    ///< Record built
};

std::string PipelineStageToString(PipelineStage stage);

/**
 * @class JobRunner
 * @brief Anything that turns a job into exactly one record
 *
 * The worker pool depends on this seam rather than on EvaluationPipeline so
 * pool behaviour can be tested without sandboxes.
 */
class JobRunner {
public:
    virtual ~JobRunner() = default;

    /**
     * @brief Evaluate one job; must not throw
     */
    virtual TestRun Run(const EvaluationJob& job, SandboxCapacity& capacity) = 0;

    /**
     * @brief Record for a job that could not be evaluated
     */
    virtual TestRun FailureRecord(const EvaluationJob& job,
                                  RunOutcome outcome,
                                  const std::string& reason) const = 0;
};

/**
 * @class EvaluationPipeline
 * @brief Production JobRunner
 *
 * **Deadline handling**: the worker-level total timeout becomes a deadline
 * at Run() entry. Each stage timeout is clamped to the remaining budget and
 * the deadline is checked between stages; a clamped stage that times out,
 * or an expired deadline, ends the run as WORKER_TIMEOUT.
 *
 * **Usage Example**:
 * @code
 * auto runtime = CreateSandboxRuntime(config.sandbox);
 * EvaluationPipeline pipeline(config, *runtime, AdapterRegistry::CreateDefault());
 * SandboxCapacity capacity(config.workers.max_sandboxes);
 *
 * TestRun run = pipeline.Run(job, capacity);
 * @endcode
 *
 * **Thread Safety**: Run() may be called concurrently from worker threads.
 */
class EvaluationPipeline : public JobRunner {
public:
    EvaluationPipeline(const EngineConfig& config,
                       SandboxRuntime& runtime,
                       std::shared_ptr<const adapters::AdapterRegistry> registry);

    TestRun Run(const EvaluationJob& job, SandboxCapacity& capacity) override;

    TestRun FailureRecord(const EvaluationJob& job,
                          RunOutcome outcome,
                          const std::string& reason) const override;

    const SandboxManager& Manager() const { return manager_; }

private:
    struct StageBudget {
        std::chrono::milliseconds timeout{0};  ///< Effective timeout
        bool clamped{false};                   ///< Cut short by the deadline
    };

    const EngineConfig& config_;
    SandboxRuntime& runtime_;
    SandboxManager manager_;
    TestDetector detector_;
    DependencyInstaller installer_;
    TestExecutor executor_;
    OutputParser parser_;

    static StageBudget Budget(std::chrono::seconds stage_timeout,
                              std::chrono::steady_clock::time_point deadline,
                              PipelineStage stage);

    std::string ResolveCommit(const Sandbox& sandbox,
                              std::chrono::steady_clock::time_point deadline) const;

    TestRun Failure(const EvaluationJob& job,
                    const std::string& commit_id,
                    RunOutcome outcome,
                    const std::string& reason,
                    AssemblyContext context,
                    const std::string& diagnostics = "") const;
};

} // namespace core
} // namespace crucible
