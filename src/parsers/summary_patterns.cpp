/**
 * @file summary_patterns.cpp
 * @brief Regex-based summary recognizers
 *
 * Output is scanned line by line. A cheap substring check guards every
 * regex so multi-megabyte logs only pay regex cost on candidate lines.
 *
 * Where a runner prints one summary per module/binary (ScalaTest, sbt,
 * Surefire aggregates, cargo, dotnet) the counts are summed. Where a runner
 * prints exactly one final summary (Jest, Vitest, pytest) the last
 * occurrence wins, which skips any summary echoed earlier by watch mode or
 * nested runs.
 *
 * @date 2025
 */

#include "crucible/parsers/summary_patterns.hpp"
#include "crucible/utils/string_utils.hpp"

#include <cctype>
#include <climits>
#include <regex>
#include <stdexcept>

namespace crucible {
namespace parsers {

using core::SummaryCounts;
using utils::StringUtils;

namespace {

int ToInt(const std::string& digits) {
    try {
        long long value = std::stoll(digits);
        return value > INT_MAX ? INT_MAX : static_cast<int>(value);
    } catch (const std::out_of_range&) {
        return INT_MAX;
    }
}

// Counts come from untrusted output; sums saturate at INT_MAX instead of wrapping
int Add(int a, int b) {
    long long sum = static_cast<long long>(a) + static_cast<long long>(b);
    return sum > INT_MAX ? INT_MAX : static_cast<int>(sum);
}

int Add(int a, int b, int c) {
    return Add(Add(a, b), c);
}

void Accumulate(SummaryCounts& into, const SummaryCounts& add) {
    into.total = Add(into.total, add.total);
    into.passed = Add(into.passed, add.passed);
    into.failed = Add(into.failed, add.failed);
    into.skipped = Add(into.skipped, add.skipped);
}

/// total - a - b, floored at zero
int Remaining(int total, int a, int b) {
    long long rest = static_cast<long long>(total) - a - b;
    return rest < 0 ? 0 : static_cast<int>(rest);
}

} // anonymous namespace

// ============================================================================
// SCALA (ScalaTest / sbt / uTest)
// ============================================================================

std::optional<SummaryCounts> SummaryPatterns::ParseScalaTest(const std::string& output) {
    static const std::regex pattern(
        R"(Tests: succeeded (\d+), failed (\d+), canceled (\d+), ignored (\d+), pending (\d+))");

    SummaryCounts sum;
    bool found = false;

    for (const auto& line : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(line, "Tests: succeeded")) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        SummaryCounts counts;
        counts.passed = ToInt(m[1].str());
        counts.failed = ToInt(m[2].str());
        counts.skipped = Add(ToInt(m[3].str()), ToInt(m[4].str()), ToInt(m[5].str()));
        counts.total = Add(counts.passed, counts.failed, counts.skipped);
        Accumulate(sum, counts);
        found = true;
    }

    if (!found) {
        return std::nullopt;
    }
    return sum;
}

std::optional<SummaryCounts> SummaryPatterns::ParseSbtTotals(const std::string& output) {
    static const std::regex pattern(
        R"((?:Passed|Failed|Error): Total (\d+), Failed (\d+), Errors (\d+), Passed (\d+))");
    static const std::regex extra(R"((Skipped|Ignored|Canceled|Pending) (\d+))");

    SummaryCounts sum;
    bool found = false;

    for (const auto& line : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(line, ": Total ")) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        SummaryCounts counts;
        counts.total = ToInt(m[1].str());
        counts.failed = Add(ToInt(m[2].str()), ToInt(m[3].str()));
        counts.passed = ToInt(m[4].str());

        std::string tail = m.suffix().str();
        for (std::sregex_iterator it(tail.begin(), tail.end(), extra), end; it != end; ++it) {
            counts.skipped = Add(counts.skipped, ToInt((*it)[2].str()));
        }

        Accumulate(sum, counts);
        found = true;
    }

    if (!found) {
        return std::nullopt;
    }
    return sum;
}

std::optional<SummaryCounts> SummaryPatterns::ParseUTest(const std::string& output) {
    static const std::regex pattern(R"(Tests: (\d+), Passed: (\d+), Failed: (\d+))");

    SummaryCounts sum;
    bool found = false;

    for (const auto& line : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(line, "Passed:")) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        SummaryCounts counts;
        counts.total = ToInt(m[1].str());
        counts.passed = ToInt(m[2].str());
        counts.failed = ToInt(m[3].str());
        counts.skipped = Remaining(counts.total, counts.passed, counts.failed);
        Accumulate(sum, counts);
        found = true;
    }

    if (!found) {
        return std::nullopt;
    }
    return sum;
}

// ============================================================================
// JVM (Maven / Gradle)
// ============================================================================

std::optional<SummaryCounts> SummaryPatterns::ParseSurefire(const std::string& output) {
    static const std::regex pattern(
        R"(Tests run: (\d+), Failures: (\d+), Errors: (\d+), Skipped: (\d+))");

    SummaryCounts aggregate;
    SummaryCounts per_class;
    bool found_aggregate = false;
    bool found_class = false;

    for (const auto& line : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(line, "Tests run:")) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        SummaryCounts counts;
        counts.total = ToInt(m[1].str());
        counts.failed = Add(ToInt(m[2].str()), ToInt(m[3].str()));
        counts.skipped = ToInt(m[4].str());
        counts.passed = Remaining(counts.total, counts.failed, counts.skipped);

        if (StringUtils::Contains(m.suffix().str(), "Time elapsed")) {
            Accumulate(per_class, counts);
            found_class = true;
        } else {
            Accumulate(aggregate, counts);
            found_aggregate = true;
        }
    }

    if (found_aggregate) {
        return aggregate;
    }
    if (found_class) {
        return per_class;
    }
    return std::nullopt;
}

std::optional<SummaryCounts> SummaryPatterns::ParseGradle(const std::string& output) {
    static const std::regex pattern(R"((\d+) tests? completed, (\d+) failed(?:, (\d+) skipped)?)");

    SummaryCounts sum;
    bool found = false;

    for (const auto& line : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(line, "completed,")) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        SummaryCounts counts;
        counts.total = ToInt(m[1].str());
        counts.failed = ToInt(m[2].str());
        counts.skipped = m[3].matched ? ToInt(m[3].str()) : 0;
        counts.passed = Remaining(counts.total, counts.failed, counts.skipped);
        Accumulate(sum, counts);
        found = true;
    }

    if (!found) {
        return std::nullopt;
    }
    return sum;
}

// ============================================================================
// GO / RUST
// ============================================================================

std::optional<SummaryCounts> SummaryPatterns::ParseGoTest(const std::string& output) {
    static const std::regex broken_package(R"(^FAIL\s+\S+\s+\[(build|setup) failed\])");

    SummaryCounts counts;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        if (StringUtils::StartsWith(line, "--- PASS:")) {
            ++counts.passed;
        } else if (StringUtils::StartsWith(line, "--- FAIL:")) {
            ++counts.failed;
        } else if (StringUtils::StartsWith(line, "--- SKIP:")) {
            ++counts.skipped;
        } else if (StringUtils::StartsWith(line, "FAIL") &&
                   std::regex_search(line, broken_package)) {
            // A package that fails to compile runs zero tests but is a failure
            ++counts.failed;
        }
    }

    counts.total = Add(counts.passed, counts.failed, counts.skipped);
    if (counts.total == 0) {
        return std::nullopt;
    }
    return counts;
}

std::optional<SummaryCounts> SummaryPatterns::ParseCargo(const std::string& output) {
    static const std::regex pattern(
        R"(test result: (?:ok|FAILED)\. (\d+) passed; (\d+) failed; (\d+) ignored)");

    SummaryCounts sum;
    bool found = false;

    for (const auto& line : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(line, "test result:")) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        SummaryCounts counts;
        counts.passed = ToInt(m[1].str());
        counts.failed = ToInt(m[2].str());
        counts.skipped = ToInt(m[3].str());
        counts.total = Add(counts.passed, counts.failed, counts.skipped);
        Accumulate(sum, counts);
        found = true;
    }

    if (!found) {
        return std::nullopt;
    }
    return sum;
}

// ============================================================================
// JAVASCRIPT (Jest / Vitest / Mocha / TAP)
// ============================================================================

std::optional<SummaryCounts> SummaryPatterns::ParseJest(const std::string& output) {
    static const std::regex part(R"((\d+) (failed|skipped|passed|todo|total))");

    std::optional<SummaryCounts> last;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        if (!StringUtils::StartsWith(line, "Tests:") || !StringUtils::Contains(line, "total")) {
            continue;
        }

        SummaryCounts counts;
        bool has_total = false;
        for (std::sregex_iterator it(line.begin(), line.end(), part), end; it != end; ++it) {
            int value = ToInt((*it)[1].str());
            std::string kind = (*it)[2].str();
            if (kind == "failed") {
                counts.failed = value;
            } else if (kind == "passed") {
                counts.passed = value;
            } else if (kind == "skipped" || kind == "todo") {
                counts.skipped = Add(counts.skipped, value);
            } else if (kind == "total") {
                counts.total = value;
                has_total = true;
            }
        }

        if (has_total) {
            last = counts;
        }
    }

    return last;
}

std::optional<SummaryCounts> SummaryPatterns::ParseVitest(const std::string& output) {
    static const std::regex line_pattern(R"(^Tests\s+(.*)\((\d+)\)\s*$)");
    static const std::regex part(R"((\d+) (failed|passed|skipped|todo))");

    std::optional<SummaryCounts> last;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        if (!StringUtils::StartsWith(line, "Tests ")) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, line_pattern)) {
            continue;
        }

        SummaryCounts counts;
        counts.total = ToInt(m[2].str());

        std::string parts = m[1].str();
        for (std::sregex_iterator it(parts.begin(), parts.end(), part), end; it != end; ++it) {
            int value = ToInt((*it)[1].str());
            std::string kind = (*it)[2].str();
            if (kind == "failed") {
                counts.failed = value;
            } else if (kind == "passed") {
                counts.passed = value;
            } else {
                counts.skipped = Add(counts.skipped, value);
            }
        }

        last = counts;
    }

    return last;
}

std::optional<SummaryCounts> SummaryPatterns::ParseMocha(const std::string& output) {
    static const std::regex pattern(R"(^(\d+) (passing|failing|pending)\b)");

    SummaryCounts counts;
    bool found = false;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        if (line.empty() || !std::isdigit(static_cast<unsigned char>(line[0]))) {
            continue;
        }
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        int value = ToInt(m[1].str());
        std::string kind = m[2].str();
        if (kind == "passing") {
            counts.passed = Add(counts.passed, value);
            found = true;
        } else if (kind == "failing") {
            counts.failed = Add(counts.failed, value);
            found = true;
        } else {
            counts.skipped = Add(counts.skipped, value);
        }
    }

    if (!found) {
        return std::nullopt;
    }
    counts.total = Add(counts.passed, counts.failed, counts.skipped);
    return counts;
}

std::optional<SummaryCounts> SummaryPatterns::ParseTap(const std::string& output) {
    // node:test uses '#' for TAP and 'ℹ' for its spec reporter
    static const std::regex pattern(R"(^(?:#|ℹ) (tests|pass|fail|skipped|todo|cancelled) (\d+)\s*$)");

    SummaryCounts counts;
    bool found = false;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::string line = StringUtils::Trim(raw);
        std::smatch m;
        if (!std::regex_search(line, m, pattern)) {
            continue;
        }

        int value = ToInt(m[2].str());
        std::string kind = m[1].str();
        if (kind == "tests") {
            counts.total = Add(counts.total, value);
            found = true;
        } else if (kind == "pass") {
            counts.passed = Add(counts.passed, value);
        } else if (kind == "fail" || kind == "cancelled") {
            counts.failed = Add(counts.failed, value);
        } else {
            counts.skipped = Add(counts.skipped, value);
        }
    }

    if (!found) {
        return std::nullopt;
    }
    return counts;
}

// ============================================================================
// PYTHON / .NET
// ============================================================================

std::optional<SummaryCounts> SummaryPatterns::ParsePytest(const std::string& output) {
    static const std::regex duration(R"(\bin \d+(?:\.\d+)?s\b)");
    static const std::regex part(R"((\d+) (passed|failed|errors?|skipped|xfailed|xpassed)\b)");

    std::optional<SummaryCounts> last;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        if (!StringUtils::Contains(raw, " in ")) {
            continue;
        }

        std::string line = StringUtils::Trim(raw);
        auto first = line.find_first_not_of('=');
        auto last_char = line.find_last_not_of('=');
        if (first == std::string::npos) {
            continue;
        }
        line = StringUtils::Trim(line.substr(first, last_char - first + 1));

        if (!std::regex_search(line, duration)) {
            continue;
        }

        SummaryCounts counts;
        bool matched = StringUtils::StartsWith(line, "no tests ran");

        for (std::sregex_iterator it(line.begin(), line.end(), part), end; it != end; ++it) {
            int value = ToInt((*it)[1].str());
            std::string kind = (*it)[2].str();
            if (kind == "passed" || kind == "xpassed") {
                counts.passed = Add(counts.passed, value);
            } else if (kind == "failed" || kind == "error" || kind == "errors") {
                counts.failed = Add(counts.failed, value);
            } else {
                counts.skipped = Add(counts.skipped, value);
            }
            matched = true;
        }

        if (matched) {
            counts.total = Add(counts.passed, counts.failed, counts.skipped);
            last = counts;
        }
    }

    return last;
}

std::optional<SummaryCounts> SummaryPatterns::ParseDotnet(const std::string& output) {
    static const std::regex modern(
        R"((?:Passed|Failed)!\s+-\s+Failed:\s+(\d+),\s+Passed:\s+(\d+),\s+Skipped:\s+(\d+),\s+Total:\s+(\d+))");
    static const std::regex legacy_total(R"(^Total tests:\s*(\d+))");
    static const std::regex legacy_part(R"(^(Passed|Failed|Skipped):\s*(\d+)\s*$)");

    SummaryCounts sum;
    bool found = false;

    SummaryCounts legacy;
    bool in_legacy = false;
    bool found_legacy = false;

    for (const auto& raw : StringUtils::SplitLines(output)) {
        std::smatch m;
        if (StringUtils::Contains(raw, "Total:") && std::regex_search(raw, m, modern)) {
            SummaryCounts counts;
            counts.failed = ToInt(m[1].str());
            counts.passed = ToInt(m[2].str());
            counts.skipped = ToInt(m[3].str());
            counts.total = ToInt(m[4].str());
            Accumulate(sum, counts);
            found = true;
            continue;
        }

        std::string line = StringUtils::Trim(raw);
        if (std::regex_search(line, m, legacy_total)) {
            legacy.total = Add(legacy.total, ToInt(m[1].str()));
            in_legacy = true;
            found_legacy = true;
            continue;
        }
        if (in_legacy && std::regex_search(line, m, legacy_part)) {
            int value = ToInt(m[2].str());
            if (m[1].str() == "Passed") {
                legacy.passed = Add(legacy.passed, value);
            } else if (m[1].str() == "Failed") {
                legacy.failed = Add(legacy.failed, value);
            } else {
                legacy.skipped = Add(legacy.skipped, value);
            }
        } else if (in_legacy && !line.empty()) {
            in_legacy = false;
        }
    }

    if (found) {
        return sum;
    }
    if (found_legacy) {
        return legacy;
    }
    return std::nullopt;
}

} // namespace parsers
} // namespace crucible
