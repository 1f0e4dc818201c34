/**
 * @file result_assembler.hpp
 * @brief Combines identity, capture and verdict into a TestRun record
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace crucible {
namespace core {

/**
 * @struct AssemblyContext
 * @brief Run metadata that is not part of the capture or verdict
 */
struct AssemblyContext {
    Framework framework{Framework::NONE};                ///< Framework tag
    std::string adapter_name;                            ///< Adapter that matched
    std::optional<RunOutcome> terminal_outcome;          ///< Set for stage failures
    std::optional<std::string> failure_reason;           ///< Overrides the parser's reason
    std::string integration_test_content;                ///< Diagnostic file content
    std::optional<ExecutionCapture> install;             ///< Install evidence
    std::chrono::system_clock::time_point started_at;    ///< Run start
};

/**
 * @class ResultAssembler
 * @brief Pure record construction; no I/O
 */
class ResultAssembler {
public:
    /**
     * @brief Build the persisted record
     *
     * `pass` is copied from the verdict; the outcome is the terminal outcome
     * when one is set, otherwise PASSED, EXECUTION_TIMEOUT or TESTS_FAILED.
     */
    static TestRun Assemble(const Repository& repository,
                            const std::string& commit_id,
                            const ParsedResult& parsed,
                            const ExecutionCapture& capture,
                            const AssemblyContext& context);
};

} // namespace core
} // namespace crucible
