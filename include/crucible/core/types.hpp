/**
 * @file types.hpp
 * @brief Shared data model for the evaluation engine
 *
 * Value types that flow between the pipeline stages: the job a worker
 * consumes, the sandbox handle, the detected invocation, the raw capture,
 * the normalized verdict and the persisted TestRun record.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace crucible {
namespace core {

/**
 * @enum Framework
 * @brief Build/test ecosystem tag attached to a detected invocation
 */
enum class Framework {
    MILL,      ///< Mill (Scala)
    SBT,       ///< sbt (Scala)
    MAVEN,     ///< Maven Surefire/Failsafe
    GRADLE,    ///< Gradle
    GO,        ///< go test
    CARGO,     ///< cargo test
    JEST,      ///< Jest
    VITEST,    ///< Vitest
    MOCHA,     ///< Mocha
    NPM,       ///< Generic npm script
    PYTEST,    ///< pytest
    DOTNET,    ///< dotnet test
    MAKE,      ///< make target
    CUSTOM,    ///< Externally registered adapter
    NONE       ///< No adapter
};

/**
 * @enum NetworkPolicy
 * @brief Network access requested for a single command
 */
enum class NetworkPolicy {
    DISABLED,  ///< No network (default for test execution)
    ENABLED    ///< Attached to the install network
};

/**
 * @enum RunOutcome
 * @brief Terminal classification of one evaluation
 */
enum class RunOutcome {
    PASSED,                    ///< Tests ran and passed
    TESTS_FAILED,              ///< Tests ran and failed
    EXECUTION_TIMEOUT,         ///< Test command exceeded its timeout
    NO_TESTS_DETECTED,         ///< No adapter matched the repository
    INSTALL_ERROR,             ///< Dependency installation failed
    SANDBOX_PROVISION_ERROR,   ///< Sandbox could not be created
    WORKER_TIMEOUT,            ///< Whole-run deadline expired
    INTERNAL_ERROR             ///< Unexpected exception
};

/**
 * @enum TestStatus
 * @brief Tri-state status stored alongside the verdict
 */
enum class TestStatus {
    PASSED,    ///< Tests ran and passed
    FAILED,    ///< Tests ran and failed or timed out
    INVALID    ///< Tests could not be run
};

/**
 * @struct Repository
 * @brief Repository identity; languages are hints only
 */
struct Repository {
    std::string remote_url;              ///< Clone URL, unique key in the store
    std::set<std::string> languages;     ///< Language hints from discovery
};

/**
 * @struct EvaluationJob
 * @brief Unit of work consumed by a worker
 */
struct EvaluationJob {
    Repository repository;                   ///< Repository identity
    std::filesystem::path checkout_path;     ///< Host path of the cloned checkout
    std::optional<std::string> commit_id;    ///< Absent = resolve inside the sandbox
};

/**
 * @struct SandboxLimits
 * @brief Resource ceilings applied to a sandbox
 */
struct SandboxLimits {
    std::size_t memory_mb{4096};   ///< Memory ceiling
    double cpus{2.0};              ///< CPU quota (cores)
    int pids_limit{512};           ///< Process count ceiling
    std::size_t disk_mb{0};        ///< Disk ceiling, 0 = backend default
};

/**
 * @struct Sandbox
 * @brief Handle to a provisioned, isolated execution environment
 */
struct Sandbox {
    std::string id;                          ///< Unique sandbox name
    std::string runtime_name;                ///< "docker" or "local"
    std::filesystem::path host_root;         ///< Per-run host directory (removed on release)
    std::filesystem::path host_workdir;      ///< Host path of the private checkout copy
    std::filesystem::path sandbox_workdir;   ///< Checkout path as seen by commands
    std::string container_id;                ///< Docker container id, empty for local
    SandboxLimits limits;                    ///< Applied ceilings
    bool install_network_allowed{true};      ///< Install commands may reach the network
    bool test_network_allowed{false};        ///< Test commands may reach the network
};

/**
 * @struct CommandLine
 * @brief argv-form command plus environment and network request
 */
struct CommandLine {
    std::vector<std::string> argv;                   ///< Program and arguments
    std::map<std::string, std::string> environment;  ///< Extra environment
    NetworkPolicy network{NetworkPolicy::DISABLED};  ///< Requested network access

    /**
     * @brief Wrap a shell script as `sh -c <script>`
     */
    static CommandLine Shell(const std::string& script,
                             NetworkPolicy network = NetworkPolicy::DISABLED);

    /**
     * @brief Human-readable rendering for logs
     */
    std::string ToString() const;
};

/**
 * @struct DetectedInvocation
 * @brief How to install and test a repository; immutable once produced
 */
struct DetectedInvocation {
    Framework framework{Framework::NONE};               ///< Framework tag
    std::string adapter_name;                           ///< Adapter that matched
    std::optional<CommandLine> install_command;         ///< Absent = nothing to install
    CommandLine test_command;                           ///< Test invocation
    std::string workdir{"."};                           ///< Relative to the checkout root
    std::string fingerprint;                            ///< Marker that triggered the match
    std::vector<std::string> integration_test_files;    ///< Relative paths, most relevant first
};

/**
 * @struct ExecutionCapture
 * @brief Raw evidence of a command run; never mutated after capture
 */
struct ExecutionCapture {
    std::string stdout_output;       ///< Captured stdout
    std::string stderr_output;       ///< Captured stderr
    int return_code{0};              ///< Exit code
    std::int64_t duration_ms{0};     ///< Wall-clock duration
    bool timed_out{false};           ///< Killed by the timeout
    bool stdout_truncated{false};    ///< Capture cap hit on stdout
    bool stderr_truncated{false};    ///< Capture cap hit on stderr
};

/**
 * @struct SummaryCounts
 * @brief Counts extracted from a framework summary line
 */
struct SummaryCounts {
    int total{0};     ///< Tests executed (including skipped where the framework counts them)
    int passed{0};    ///< Passed
    int failed{0};    ///< Failed plus errored
    int skipped{0};   ///< Skipped / ignored / pending

    bool operator==(const SummaryCounts& other) const {
        return total == other.total && passed == other.passed &&
               failed == other.failed && skipped == other.skipped;
    }
};

/**
 * @struct ParsedResult
 * @brief Normalized verdict derived from an ExecutionCapture
 *
 * Whenever `failed` is present, `pass == (*failed == 0)`.
 */
struct ParsedResult {
    bool pass{false};                        ///< Verdict
    std::optional<int> total_tests;          ///< Tests executed, if known
    std::optional<int> failed;               ///< Failed tests, if known and consistent
    std::optional<std::string> reason;       ///< Explanation for non-obvious verdicts
    std::optional<SummaryCounts> summary;    ///< Raw counts as recognised
    bool ambiguous{false};                   ///< Summary conflicted with the exit code
    bool used_fallback{false};               ///< No summary; verdict from the exit code
};

/**
 * @struct TestRun
 * @brief Persisted record of one evaluation
 */
struct TestRun {
    Repository repository;                           ///< Repository identity
    std::string commit_id{"unknown"};                ///< Evaluated commit
    ExecutionCapture result;                         ///< Test command evidence
    bool pass{false};                                ///< Copied from ParsedResult

    RunOutcome outcome{RunOutcome::INTERNAL_ERROR};  ///< Terminal classification
    TestStatus status{TestStatus::INVALID};          ///< Tri-state status
    Framework framework{Framework::NONE};            ///< Framework tag
    std::string adapter_name;                        ///< Adapter that matched, if any
    std::optional<std::string> reason;               ///< Verdict/failure explanation
    std::optional<int> total_tests;                  ///< From ParsedResult
    std::optional<int> failed;                       ///< From ParsedResult
    bool ambiguous{false};                           ///< From ParsedResult

    std::string integration_test_content;            ///< First integration test file (capped)
    std::optional<ExecutionCapture> install;         ///< Install evidence, when install ran

    std::string stdout_sha256;                       ///< Digest of result.stdout_output
    std::string stderr_sha256;                       ///< Digest of result.stderr_output
    std::chrono::system_clock::time_point started_at;  ///< Run start time
};

// ============================================================================
// String conversions
// ============================================================================

std::string FrameworkToString(Framework framework);
std::optional<Framework> FrameworkFromString(const std::string& name);
std::string RunOutcomeToString(RunOutcome outcome);
std::string TestStatusToString(TestStatus status);

/**
 * @brief Status implied by an outcome
 */
TestStatus StatusForOutcome(RunOutcome outcome);

} // namespace core
} // namespace crucible
