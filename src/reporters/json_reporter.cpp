/**
 * @file json_reporter.cpp
 * @brief Implementation of TestRun serialization
 *
 * @date 2025
 */

#include "crucible/reporters/json_reporter.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace crucible {
namespace reporters {

using json = nlohmann::json;

namespace {

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

json JsonReporter::ToJson(const core::TestRun& run) {
    json j;

    // Sorted for stable output
    json languages = json::array();
    for (const auto& language : run.repository.languages) {
        languages.push_back(language);
    }

    j["Repo"] = {
        {"remoteUrl", run.repository.remote_url},
        {"languages", languages}
    };

    j["IntegrationTest"] = {
        {"fileContent", run.integration_test_content}
    };

    j["IntegrationTestRun"] = {
        {"commitId", run.commit_id},
        {"result", {
            {"stdout", run.result.stdout_output},
            {"stderr", run.result.stderr_output},
            {"returnCode", run.result.return_code}
        }},
        {"pass", run.pass}
    };

    json install = nullptr;
    if (run.install) {
        install = {
            {"stdout", run.install->stdout_output},
            {"stderr", run.install->stderr_output},
            {"returnCode", run.install->return_code},
            {"timedOut", run.install->timed_out}
        };
    }

    j["Evaluation"] = {
        {"outcome", core::RunOutcomeToString(run.outcome)},
        {"status", core::TestStatusToString(run.status)},
        {"framework", core::FrameworkToString(run.framework)},
        {"adapter", run.adapter_name},
        {"reason", OptionalToJson(run.reason)},
        {"totalTests", OptionalToJson(run.total_tests)},
        {"failed", OptionalToJson(run.failed)},
        {"ambiguous", run.ambiguous},
        {"durationMs", run.result.duration_ms},
        {"timedOut", run.result.timed_out},
        {"stdoutTruncated", run.result.stdout_truncated},
        {"stderrTruncated", run.result.stderr_truncated},
        {"stdoutSha256", run.stdout_sha256},
        {"stderrSha256", run.stderr_sha256},
        {"install", install},
        {"startedAt", FormatTimestamp(run.started_at)}
    };

    return j;
}

std::string JsonReporter::Serialize(const core::TestRun& run, bool pretty) {
    return ToJson(run).dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace);
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace reporters
} // namespace crucible
