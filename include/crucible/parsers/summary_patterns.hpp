/**
 * @file summary_patterns.hpp
 * @brief Recognizers for test-runner summary lines
 *
 * Each recognizer scans captured output (ANSI already stripped) for the
 * summary format of one test runner and returns aggregated counts, or
 * nullopt when the format does not appear. Recognizers are pure functions;
 * adapters pick the ones that apply to their ecosystem.
 *
 * **Recognized formats**:
 * | Runner        | Example line                                                        |
 * |---------------|---------------------------------------------------------------------|
 * | ScalaTest     | `Tests: succeeded 6, failed 0, canceled 0, ignored 0, pending 0`    |
 * | sbt           | `Passed: Total 6, Failed 0, Errors 0, Passed 6`                     |
 * | uTest (Mill)  | `Tests: 6, Passed: 6, Failed: 0`                                    |
 * | Surefire      | `Tests run: 3, Failures: 0, Errors: 0, Skipped: 2`                  |
 * | Gradle        | `5 tests completed, 2 failed, 1 skipped`                            |
 * | go test       | `--- PASS: TestX (0.00s)` / `--- FAIL: ...`                         |
 * | cargo         | `test result: ok. 3 passed; 0 failed; 1 ignored; ...`               |
 * | Jest          | `Tests:       1 failed, 3 passed, 4 total`                          |
 * | Vitest        | `Tests  1 failed | 3 passed (4)`                                    |
 * | Mocha         | `3 passing (12ms)` / `1 failing`                                    |
 * | TAP/node:test | `# tests 4` / `# pass 4` / `# fail 0`                               |
 * | pytest        | `==== 2 failed, 3 passed in 0.12s ====`                             |
 * | dotnet        | `Passed!  - Failed: 0, Passed: 3, Skipped: 0, Total: 3`             |
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/types.hpp"

#include <optional>
#include <string>

namespace crucible {
namespace parsers {

/**
 * @class SummaryPatterns
 * @brief Static summary-line recognizers
 *
 * **Usage Example**:
 * @code
 * auto counts = SummaryPatterns::ParseSurefire(output);
 * if (counts) {
 *     spdlog::info("{} tests, {} failed", counts->total, counts->failed);
 * }
 * @endcode
 */
class SummaryPatterns {
public:
    /// ScalaTest reporter; sums every summary block (one per module)
    static std::optional<core::SummaryCounts> ParseScalaTest(const std::string& output);

    /// sbt's own `Passed:/Failed:/Error: Total ...` aggregate
    static std::optional<core::SummaryCounts> ParseSbtTotals(const std::string& output);

    /// uTest as run by Mill
    static std::optional<core::SummaryCounts> ParseUTest(const std::string& output);

    /**
     * @brief Maven Surefire/Failsafe
     *
     * Aggregate lines (no `Time elapsed`) are summed across modules and
     * plugins; per-class lines are used only when no aggregate is present.
     */
    static std::optional<core::SummaryCounts> ParseSurefire(const std::string& output);

    /// Gradle failure summary (Gradle prints counts only when tests fail)
    static std::optional<core::SummaryCounts> ParseGradle(const std::string& output);

    /// `go test -v` per-test result lines plus build/setup failures
    static std::optional<core::SummaryCounts> ParseGoTest(const std::string& output);

    /// cargo `test result:` lines, summed over every test binary
    static std::optional<core::SummaryCounts> ParseCargo(const std::string& output);

    /// Jest `Tests:` line (last occurrence)
    static std::optional<core::SummaryCounts> ParseJest(const std::string& output);

    /// Vitest `Tests` line (last occurrence)
    static std::optional<core::SummaryCounts> ParseVitest(const std::string& output);

    /// Mocha spec reporter `passing/failing/pending`
    static std::optional<core::SummaryCounts> ParseMocha(const std::string& output);

    /// TAP / node:test trailer (`# tests`, `# pass`, `# fail`)
    static std::optional<core::SummaryCounts> ParseTap(const std::string& output);

    /// pytest terminal summary (last occurrence)
    static std::optional<core::SummaryCounts> ParsePytest(const std::string& output);

    /// dotnet test per-project result lines
    static std::optional<core::SummaryCounts> ParseDotnet(const std::string& output);
};

} // namespace parsers
} // namespace crucible
