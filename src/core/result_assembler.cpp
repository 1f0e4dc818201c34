/**
 * @file result_assembler.cpp
 * @brief Implementation of TestRun assembly
 *
 * @date 2025
 */

#include "crucible/core/result_assembler.hpp"
#include "crucible/utils/hash_utils.hpp"

namespace crucible {
namespace core {

TestRun ResultAssembler::Assemble(const Repository& repository,
                                  const std::string& commit_id,
                                  const ParsedResult& parsed,
                                  const ExecutionCapture& capture,
                                  const AssemblyContext& context) {
    TestRun run;
    run.repository = repository;
    run.commit_id = commit_id.empty() ? "unknown" : commit_id;
    run.result = capture;
    run.pass = parsed.pass;

    if (context.terminal_outcome) {
        run.outcome = *context.terminal_outcome;
    } else if (parsed.pass) {
        run.outcome = RunOutcome::PASSED;
    } else if (capture.timed_out) {
        run.outcome = RunOutcome::EXECUTION_TIMEOUT;
    } else {
        run.outcome = RunOutcome::TESTS_FAILED;
    }
    run.status = StatusForOutcome(run.outcome);

    run.framework = context.framework;
    run.adapter_name = context.adapter_name;
    run.reason = context.failure_reason ? context.failure_reason : parsed.reason;
    run.total_tests = parsed.total_tests;
    run.failed = parsed.failed;
    run.ambiguous = parsed.ambiguous;

    run.integration_test_content = context.integration_test_content;
    run.install = context.install;

    run.stdout_sha256 = utils::HashUtils::ComputeStringHash(capture.stdout_output);
    run.stderr_sha256 = utils::HashUtils::ComputeStringHash(capture.stderr_output);
    run.started_at = context.started_at;

    return run;
}

} // namespace core
} // namespace crucible
