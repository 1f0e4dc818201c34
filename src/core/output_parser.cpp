/**
 * @file output_parser.cpp
 * @brief Implementation of the verdict decision table
 *
 * @date 2025
 */

#include "crucible/core/output_parser.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace crucible {
namespace core {

OutputParser::OutputParser(std::shared_ptr<const adapters::AdapterRegistry> registry)
    : registry_(std::move(registry)) {
}

ParsedResult OutputParser::Parse(const ExecutionCapture& capture,
                                 Framework framework,
                                 const std::string& adapter_name) const {
    ParsedResult result;
    const bool exit_ok = capture.return_code == 0 && !capture.timed_out;

    std::optional<SummaryCounts> summary;
    if (const auto* adapter = ResolveAdapter(framework, adapter_name)) {
        std::string output = utils::StringUtils::StripAnsi(
            capture.stdout_output + "\n" + capture.stderr_output);
        try {
            summary = adapter->ParseSummary(output);
        } catch (const std::exception& e) {
            spdlog::warn("[parse] {} summary recognizer failed: {}", adapter->GetName(), e.what());
        }
    }
    result.summary = summary;

    // ========================================================================
    // Timeout
    // ========================================================================
    if (capture.timed_out) {
        if (summary && summary->failed == 0 && summary->total > 0) {
            result.pass = true;
            result.total_tests = summary->total;
            result.failed = 0;
            result.reason = kTimeoutSuccessReason;
        } else {
            result.pass = false;
            result.reason = kTimeoutReason;
            if (summary && summary->failed > 0) {
                result.total_tests = summary->total;
                result.failed = summary->failed;
            }
        }
        return result;
    }

    // ========================================================================
    // No summary
    // ========================================================================
    if (!summary) {
        result.pass = exit_ok;
        result.reason = kFallbackReason;
        result.used_fallback = true;
        return result;
    }

    // ========================================================================
    // Zero executed tests
    // ========================================================================
    if (summary->total == 0) {
        result.pass = false;
        result.total_tests = 0;
        result.reason = kZeroTestsReason;
        return result;
    }

    // ========================================================================
    // Summary vs exit code
    // ========================================================================
    const bool summary_ok = summary->failed == 0;

    if (summary_ok == exit_ok) {
        result.pass = summary_ok;
        result.total_tests = summary->total;
        result.failed = summary->failed;
        if (!summary_ok) {
            result.reason = std::to_string(summary->failed) + " of " +
                            std::to_string(summary->total) + " tests failed";
        }
        return result;
    }

    // Exit code is authoritative
    result.pass = exit_ok;
    result.ambiguous = true;
    result.reason = "summary reports " + std::to_string(summary->failed) + " failed of " +
                    std::to_string(summary->total) + " but exit code was " +
                    std::to_string(capture.return_code);

    spdlog::warn("[parse] Ambiguous result for {}: {}",
                 adapter_name.empty() ? FrameworkToString(framework) : adapter_name,
                 *result.reason);
    return result;
}

const adapters::TestFrameworkAdapter* OutputParser::ResolveAdapter(Framework framework,
                                                                   const std::string& adapter_name) const {
    if (!registry_ || framework == Framework::NONE) {
        return nullptr;
    }
    if (!adapter_name.empty()) {
        if (const auto* adapter = registry_->FindByName(adapter_name)) {
            return adapter;
        }
    }
    return registry_->FindByFramework(framework);
}

} // namespace core
} // namespace crucible
