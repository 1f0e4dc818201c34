/**
 * @file engine_config.hpp
 * @brief Engine configuration: settings structs, JSON loader, fluent builder
 *
 * Configuration is a JSON document with one object per concern. Missing keys
 * keep their defaults; values that cannot work (non-positive timeouts, zero
 * workers, tiny memory ceilings, unknown runtimes) are rejected with
 * ConfigError before any sandbox is created.
 *
 * **Example**:
 * @code{.json}
 * {
 *   "sandbox":  { "runtime": "docker", "image": "crucible-runner:latest", "memory_mb": 4096 },
 *   "timeouts": { "install_seconds": 900, "execute_seconds": 1800, "total_seconds": 3600 },
 *   "workers":  { "parallel": 4, "max_sandboxes": 4 },
 *   "detection": { "disabled_adapters": ["make"], "priority_overrides": { "jest": 70 } }
 * }
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace crucible {
namespace core {

/**
 * @class ConfigError
 * @brief Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct SandboxSettings
 * @brief Isolation backend and resource ceilings
 */
struct SandboxSettings {
    std::string runtime{"docker"};                           ///< "docker" or "local"
    std::string image{"crucible-runner:latest"};             ///< Runner image (docker only)
    std::size_t memory_mb{4096};                             ///< Memory ceiling
    double cpus{2.0};                                        ///< CPU quota
    int pids_limit{512};                                     ///< Process ceiling, 0 = none
    std::size_t disk_mb{10240};                              ///< Disk ceiling, 0 = none
    bool allow_install_network{true};                        ///< Network during install
    bool allow_test_network{false};                          ///< Network during tests
    std::string install_network{"bridge"};                   ///< Docker network used for install
    std::filesystem::path workspace_root{"/tmp/crucible"};   ///< Per-run directories live here
};

/**
 * @struct TimeoutSettings
 * @brief Per-stage and whole-run wall-clock limits
 */
struct TimeoutSettings {
    std::chrono::seconds install{900};     ///< Dependency install
    std::chrono::seconds execute{1800};    ///< Test execution
    std::chrono::seconds total{3600};      ///< Whole run, including provisioning
    std::chrono::seconds commit_lookup{10}; ///< `git rev-parse HEAD`
};

/**
 * @struct CaptureSettings
 * @brief Output capture limits
 */
struct CaptureSettings {
    std::size_t max_output_bytes{4 * 1024 * 1024};   ///< Per-stream cap
    std::size_t max_integration_test_bytes{64 * 1024};  ///< IntegrationTest.fileContent cap
};

/**
 * @struct WorkerSettings
 * @brief Concurrency limits
 */
struct WorkerSettings {
    std::size_t parallel{4};         ///< Worker threads
    std::size_t max_sandboxes{4};    ///< Concurrently provisioned sandboxes
};

/**
 * @struct DetectionSettings
 * @brief Adapter registry adjustments
 */
struct DetectionSettings {
    std::vector<std::string> disabled_adapters;      ///< Adapter names to skip
    std::map<std::string, int> priority_overrides;   ///< Adapter name → priority
    int max_depth{3};                                ///< RepoTree scan depth
    std::size_t max_entries{5000};                   ///< RepoTree entry cap
};

/**
 * @struct LoggingSettings
 * @brief spdlog level and pattern
 */
struct LoggingSettings {
    std::string level{"info"};                          ///< trace|debug|info|warn|error|critical|off
    std::string pattern{"[%H:%M:%S] [%^%l%$] [%t] %v"}; ///< spdlog pattern
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 */
struct EngineConfig {
    SandboxSettings sandbox;
    TimeoutSettings timeouts;
    CaptureSettings capture;
    WorkerSettings workers;
    DetectionSettings detection;
    LoggingSettings logging;

    /**
     * @brief Parse from JSON, keeping defaults for missing keys
     * @param j JSON object
     * @return Validated configuration
     * @throws ConfigError on type errors or invalid values
     */
    static EngineConfig FromJson(const nlohmann::json& j);

    /**
     * @brief Load and parse a JSON file
     * @param path Configuration file
     * @return Validated configuration
     * @throws ConfigError if unreadable, malformed or invalid
     */
    static EngineConfig LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Serialize back to the JSON layout
     */
    nlohmann::json ToJson() const;

    /**
     * @brief Reject values the engine cannot run with
     * @throws ConfigError describing the first invalid field
     */
    void Validate() const;
};

/**
 * @class EngineConfigBuilder
 * @brief Fluent API for building engine configurations
 *
 * **Usage Example**:
 * @code
 * auto config = EngineConfigBuilder()
 *     .WithRuntime("local")
 *     .WithParallel(2)
 *     .WithExecuteTimeout(std::chrono::seconds(60))
 *     .Build();
 * @endcode
 */
class EngineConfigBuilder {
public:
    EngineConfigBuilder() = default;
    explicit EngineConfigBuilder(EngineConfig base) : config_(std::move(base)) {}

    EngineConfigBuilder& WithRuntime(const std::string& runtime);
    EngineConfigBuilder& WithImage(const std::string& image);
    EngineConfigBuilder& WithMemoryLimit(std::size_t mb);
    EngineConfigBuilder& WithCPULimit(double cpus);
    EngineConfigBuilder& WithPidsLimit(int pids);
    EngineConfigBuilder& WithWorkspaceRoot(const std::filesystem::path& root);
    EngineConfigBuilder& WithInstallNetwork(bool allowed);
    EngineConfigBuilder& WithTestNetwork(bool allowed);
    EngineConfigBuilder& WithInstallTimeout(std::chrono::seconds timeout);
    EngineConfigBuilder& WithExecuteTimeout(std::chrono::seconds timeout);
    EngineConfigBuilder& WithTotalTimeout(std::chrono::seconds timeout);
    EngineConfigBuilder& WithMaxOutputBytes(std::size_t bytes);
    EngineConfigBuilder& WithParallel(std::size_t workers);
    EngineConfigBuilder& WithMaxSandboxes(std::size_t sandboxes);
    EngineConfigBuilder& DisableAdapter(const std::string& name);
    EngineConfigBuilder& WithAdapterPriority(const std::string& name, int priority);
    EngineConfigBuilder& WithLogLevel(const std::string& level);

    /**
     * @brief Validate and return the configuration
     * @throws ConfigError if invalid
     */
    EngineConfig Build() const;

private:
    EngineConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace crucible
