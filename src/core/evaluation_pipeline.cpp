/**
 * @file evaluation_pipeline.cpp
 * @brief Implementation of the per-repository evaluation state machine
 *
 * @date 2025
 */

#include "crucible/core/evaluation_pipeline.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace crucible {
namespace core {

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;
using utils::StringUtils;

namespace {

constexpr std::size_t kDiagnosticTailBytes = 16 * 1024;

std::string Tail(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    return "..." + text.substr(text.size() - max_bytes);
}

std::string InstallDiagnostics(const ExecutionCapture& capture) {
    std::string diagnostics;
    if (!capture.stdout_output.empty()) {
        diagnostics += "--- install stdout ---\n" + Tail(capture.stdout_output, kDiagnosticTailBytes) + "\n";
    }
    if (!capture.stderr_output.empty()) {
        diagnostics += "--- install stderr ---\n" + Tail(capture.stderr_output, kDiagnosticTailBytes) + "\n";
    }
    return diagnostics;
}

bool LooksLikeCommitId(const std::string& value) {
    if (value.size() < 7 || value.size() > 64) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // anonymous namespace

std::string PipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::START:     return "START";
        case PipelineStage::SANDBOXED: return "SANDBOXED";
        case PipelineStage::DETECTED:  return "DETECTED";
        case PipelineStage::INSTALLED: return "INSTALLED";
        case PipelineStage::EXECUTED:  return "EXECUTED";
        case PipelineStage::TIMED_OUT: return "TIMED_OUT";
        case PipelineStage::PARSED:    return "PARSED";
        case PipelineStage::ASSEMBLED: return "ASSEMBLED";
        default:                       return "UNKNOWN";
    }
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

EvaluationPipeline::EvaluationPipeline(const EngineConfig& config,
                                       SandboxRuntime& runtime,
                                       std::shared_ptr<const adapters::AdapterRegistry> registry)
    : config_(config),
      runtime_(runtime),
      manager_(runtime),
      detector_(registry, RepoTreeOptions{config.detection.max_depth, config.detection.max_entries}),
      installer_(runtime, config),
      executor_(runtime, config),
      parser_(registry) {
}

// ============================================================================
// RUN
// ============================================================================

TestRun EvaluationPipeline::Run(const EvaluationJob& job, SandboxCapacity& capacity) {
    const auto deadline = steady_clock::now() + config_.timeouts.total;

    AssemblyContext context;
    context.started_at = std::chrono::system_clock::now();

    std::string commit = job.commit_id.value_or("unknown");
    PipelineStage stage = PipelineStage::START;

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("EVALUATING {}", job.repository.remote_url);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    try {
        SandboxLease lease = manager_.Acquire(job, capacity, deadline);
        stage = PipelineStage::SANDBOXED;
        spdlog::info("[{}] {}", PipelineStageToString(stage), lease->id);

        if (!job.commit_id) {
            commit = ResolveCommit(lease.Get(), deadline);
        }

        Budget(config_.timeouts.total, deadline, stage);
        auto invocation = detector_.Detect(lease.Get());
        if (!invocation) {
            manager_.Release(lease);
            return Failure(job, commit, RunOutcome::NO_TESTS_DETECTED,
                           "no supported test framework detected", context);
        }
        stage = PipelineStage::DETECTED;
        spdlog::info("[{}] {} ({})", PipelineStageToString(stage),
                     invocation->adapter_name, invocation->fingerprint);

        context.framework = invocation->framework;
        context.adapter_name = invocation->adapter_name;
        context.integration_test_content = TestDetector::LoadIntegrationTestContent(
            RepoTree::FromPaths(lease->host_workdir, invocation->integration_test_files),
            invocation->integration_test_files,
            config_.capture.max_integration_test_bytes);

        // Install
        StageBudget install_budget = Budget(config_.timeouts.install, deadline, stage);
        InstallResult install = installer_.Install(lease.Get(), *invocation, install_budget.timeout);
        context.install = install.capture;

        if (!install.success) {
            manager_.Release(lease);
            std::string diagnostics = install.capture ? InstallDiagnostics(*install.capture) : "";
            if (install.capture && install.capture->timed_out && install_budget.clamped) {
                return Failure(job, commit, RunOutcome::WORKER_TIMEOUT,
                               "worker deadline expired during dependency installation",
                               context, diagnostics);
            }
            return Failure(job, commit, RunOutcome::INSTALL_ERROR, install.error_message,
                           context, diagnostics);
        }
        stage = PipelineStage::INSTALLED;
        spdlog::info("[{}] ok", PipelineStageToString(stage));

        // Execute
        StageBudget execute_budget = Budget(config_.timeouts.execute, deadline, stage);
        ExecutionCapture capture = executor_.Execute(lease.Get(), *invocation, execute_budget.timeout);
        manager_.Release(lease);

        stage = capture.timed_out ? PipelineStage::TIMED_OUT : PipelineStage::EXECUTED;
        spdlog::info("[{}] rc={} {} ms", PipelineStageToString(stage),
                     capture.return_code, capture.duration_ms);

        // Parse + assemble; the real capture is kept even when the deadline cut it short
        ParsedResult parsed = parser_.Parse(capture, invocation->framework, invocation->adapter_name);
        stage = PipelineStage::PARSED;
        spdlog::info("[{}] pass={}{}", PipelineStageToString(stage), parsed.pass,
                     parsed.reason ? " (" + *parsed.reason + ")" : std::string());

        if (capture.timed_out && execute_budget.clamped && !parsed.pass) {
            context.terminal_outcome = RunOutcome::WORKER_TIMEOUT;
            context.failure_reason = "worker deadline expired during test execution";
            spdlog::warn("{} → {}: {}", job.repository.remote_url,
                         RunOutcomeToString(RunOutcome::WORKER_TIMEOUT), *context.failure_reason);
        }

        TestRun run = ResultAssembler::Assemble(job.repository, commit, parsed, capture, context);
        stage = PipelineStage::ASSEMBLED;

        spdlog::info("═══════════════════════════════════════════════════════════════");
        spdlog::info("{} → {}", job.repository.remote_url, RunOutcomeToString(run.outcome));
        spdlog::info("═══════════════════════════════════════════════════════════════");
        return run;

    } catch (const SandboxProvisionError& e) {
        spdlog::error("[{}] Sandbox provisioning failed: {}", PipelineStageToString(stage), e.what());
        return Failure(job, commit, RunOutcome::SANDBOX_PROVISION_ERROR,
                       std::string("sandbox provisioning failed: ") + e.what(), context);
    } catch (const DeadlineExceeded& e) {
        spdlog::error("[{}] {}", PipelineStageToString(stage), e.what());
        return Failure(job, commit, RunOutcome::WORKER_TIMEOUT, e.what(), context);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Internal error: {}", PipelineStageToString(stage), e.what());
        return Failure(job, commit, RunOutcome::INTERNAL_ERROR,
                       std::string("internal error: ") + e.what(), context);
    } catch (...) {
        spdlog::error("[{}] Internal error: unknown exception", PipelineStageToString(stage));
        return Failure(job, commit, RunOutcome::INTERNAL_ERROR,
                       "internal error: unknown exception", context);
    }
}

TestRun EvaluationPipeline::FailureRecord(const EvaluationJob& job,
                                          RunOutcome outcome,
                                          const std::string& reason) const {
    AssemblyContext context;
    context.started_at = std::chrono::system_clock::now();
    return Failure(job, job.commit_id.value_or("unknown"), outcome, reason, context);
}

// ============================================================================
// HELPERS
// ============================================================================

EvaluationPipeline::StageBudget EvaluationPipeline::Budget(std::chrono::seconds stage_timeout,
                                                           steady_clock::time_point deadline,
                                                           PipelineStage stage) {
    auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
    if (remaining.count() <= 0) {
        throw DeadlineExceeded("worker deadline expired after stage " + PipelineStageToString(stage));
    }

    StageBudget budget;
    auto wanted = duration_cast<milliseconds>(stage_timeout);
    if (wanted >= remaining) {
        budget.timeout = remaining;
        budget.clamped = true;
    } else {
        budget.timeout = wanted;
    }
    return budget;
}

std::string EvaluationPipeline::ResolveCommit(const Sandbox& sandbox,
                                              steady_clock::time_point deadline) const {
    SandboxCommand command;
    command.command.argv = {"git", "rev-parse", "HEAD"};
    // The checkout is owned by another uid inside the container
    command.command.environment = {
        {"GIT_CONFIG_COUNT", "1"},
        {"GIT_CONFIG_KEY_0", "safe.directory"},
        {"GIT_CONFIG_VALUE_0", "*"}
    };
    command.timeout = Budget(config_.timeouts.commit_lookup, deadline, PipelineStage::SANDBOXED).timeout;
    command.max_output_bytes = 4096;

    ExecutionCapture capture = runtime_.Execute(sandbox, command);
    std::string commit = StringUtils::Trim(capture.stdout_output);

    if (capture.return_code == 0 && !capture.timed_out && LooksLikeCommitId(commit)) {
        spdlog::debug("[commit] {}", commit);
        return commit;
    }

    spdlog::warn("[commit] Could not resolve HEAD: {}",
                 StringUtils::Truncate(StringUtils::Trim(capture.stderr_output), 200));
    return "unknown";
}

TestRun EvaluationPipeline::Failure(const EvaluationJob& job,
                                    const std::string& commit_id,
                                    RunOutcome outcome,
                                    const std::string& reason,
                                    AssemblyContext context,
                                    const std::string& diagnostics) const {
    ExecutionCapture synthetic;
    synthetic.return_code = 1;
    synthetic.stderr_output = diagnostics.empty() ? reason : reason + "\n" + diagnostics;

    // Same parser path as real captures, so pass stays derivable from result
    ParsedResult parsed = parser_.Parse(synthetic, Framework::NONE);

    context.terminal_outcome = outcome;
    context.failure_reason = reason;

    spdlog::warn("{} → {}: {}", job.repository.remote_url, RunOutcomeToString(outcome), reason);
    return ResultAssembler::Assemble(job.repository, commit_id, parsed, synthetic, context);
}

} // namespace core
} // namespace crucible
