/**
 * @file output_parser.hpp
 * @brief Turns an ExecutionCapture into a normalized pass/fail verdict
 *
 * **Decision Table** (summary = adapter-recognised counts):
 * ```
 * timed out, summary failed == 0 && total > 0   pass, "timed out after a complete success summary"
 * timed out, otherwise                          fail, "execution timed out"
 * no summary                                    pass = rc == 0, fallback marker
 * summary total == 0                            fail, zero executed tests
 * summary agrees with exit code                 verdict, counts populated
 * summary disagrees with exit code              exit code wins, ambiguous, counts withheld
 * ```
 *
 * Whenever `failed` is populated, `pass == (failed == 0)`.
 *
 * @date 2025
 */

#pragma once

#include "crucible/adapters/adapter_registry.hpp"
#include "crucible/core/types.hpp"

#include <memory>
#include <string>

namespace crucible {
namespace core {

/**
 * @class OutputParser
 * @brief Pure, deterministic verdict computation
 *
 * **Thread Safety**: Stateless apart from the shared registry; safe for
 * concurrent use.
 */
class OutputParser {
public:
    static constexpr const char* kFallbackReason = "unparsed output, fell back to exit code";
    static constexpr const char* kTimeoutReason = "execution timed out";
    static constexpr const char* kTimeoutSuccessReason = "timed out after a complete success summary";
    static constexpr const char* kZeroTestsReason = "test summary reports zero executed tests";

    explicit OutputParser(std::shared_ptr<const adapters::AdapterRegistry> registry);

    /**
     * @brief Compute the verdict for a capture
     * @param capture Raw evidence
     * @param framework Framework tag of the invocation
     * @param adapter_name Adapter that produced the invocation; preferred over the tag
     * @return Verdict; never throws for malformed output
     */
    ParsedResult Parse(const ExecutionCapture& capture,
                       Framework framework,
                       const std::string& adapter_name = "") const;

private:
    std::shared_ptr<const adapters::AdapterRegistry> registry_;

    const adapters::TestFrameworkAdapter* ResolveAdapter(Framework framework,
                                                         const std::string& adapter_name) const;
};

} // namespace core
} // namespace crucible
