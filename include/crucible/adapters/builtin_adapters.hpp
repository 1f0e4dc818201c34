/**
 * @file builtin_adapters.hpp
 * @brief Adapters for the ecosystems supported out of the box
 *
 * Install commands fetch everything the test run needs, because tests run
 * with the network disabled. Test commands prefer an explicit integration
 * entry point (Failsafe `verify`, an `integrationTest` Gradle task, a
 * `test:integration` npm script, a `tests/integration` directory) and fall
 * back to the ecosystem's default test command.
 *
 * | Adapter | Priority | Fingerprint                                   |
 * |---------|----------|-----------------------------------------------|
 * | mill    | 100      | build.mill / build.sc                         |
 * | sbt     | 95       | build.sbt                                     |
 * | maven   | 90       | pom.xml                                       |
 * | gradle  | 85       | build.gradle(.kts) / settings.gradle(.kts)    |
 * | cargo   | 80       | Cargo.toml                                    |
 * | go      | 75       | go.mod                                        |
 * | dotnet  | 70       | *.sln / *.csproj / *.fsproj                   |
 * | vitest  | 65       | vitest in package.json / vitest.config.*      |
 * | jest    | 60       | jest in package.json / jest.config.*          |
 * | mocha   | 55       | mocha in package.json / .mocharc.*            |
 * | pytest  | 50       | pytest.ini / conftest.py / pytest config      |
 * | npm     | 40       | package.json with a real test script          |
 * | make    | 10       | Makefile with a test target                   |
 *
 * @date 2025
 */

#pragma once

#include "crucible/adapters/test_framework_adapter.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace crucible {
namespace adapters {

// ============================================================================
// Scala
// ============================================================================

class MillAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "mill"; }
    core::Framework GetFramework() const override { return core::Framework::MILL; }
    int GetPriority() const override { return 100; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

private:
    static std::string Launcher(const core::RepoTree& tree);
};

class SbtAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "sbt"; }
    core::Framework GetFramework() const override { return core::Framework::SBT; }
    int GetPriority() const override { return 95; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;
};

// ============================================================================
// JVM
// ============================================================================

/**
 * @class MavenAdapter
 * @brief Maven with Surefire (unit) and Failsafe (integration) reports
 *
 * Runs `verify` so Failsafe-bound `*IT` classes execute; uses `./mvnw` when
 * the wrapper is committed.
 */
class MavenAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "maven"; }
    core::Framework GetFramework() const override { return core::Framework::MAVEN; }
    int GetPriority() const override { return 90; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

private:
    static std::string Launcher(const core::RepoTree& tree);
};

/**
 * @class GradleAdapter
 * @brief Gradle (Groovy or Kotlin DSL)
 *
 * Runs the `integrationTest` task when a build script declares one.
 */
class GradleAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "gradle"; }
    core::Framework GetFramework() const override { return core::Framework::GRADLE; }
    int GetPriority() const override { return 85; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

private:
    static std::string Launcher(const core::RepoTree& tree);
    static bool HasIntegrationTask(const core::RepoTree& tree);
};

// ============================================================================
// Native toolchains
// ============================================================================

class CargoAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "cargo"; }
    core::Framework GetFramework() const override { return core::Framework::CARGO; }
    int GetPriority() const override { return 80; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;
};

/**
 * @class GoAdapter
 * @brief Go modules; builds with the `integration` tag so tagged suites run
 */
class GoAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "go"; }
    core::Framework GetFramework() const override { return core::Framework::GO; }
    int GetPriority() const override { return 75; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;
};

class DotnetAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "dotnet"; }
    core::Framework GetFramework() const override { return core::Framework::DOTNET; }
    int GetPriority() const override { return 70; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;
};

// ============================================================================
// JavaScript
// ============================================================================

/**
 * @struct PackageManifest
 * @brief The parts of package.json that drive Node detection
 */
struct PackageManifest {
    std::map<std::string, std::string> scripts;   ///< scripts section
    std::set<std::string> dependencies;           ///< dependencies ∪ devDependencies names
    bool has_jest_config{false};                  ///< top-level "jest" key
    bool has_mocha_config{false};                 ///< top-level "mocha" key

    /// Parse package.json at the checkout root; nullopt if absent or malformed
    static std::optional<PackageManifest> Load(const core::RepoTree& tree);

    bool DependsOn(const std::string& package) const;

    /// First script among the conventional integration-test names
    std::optional<std::string> IntegrationScript() const;

    /// True if `scripts.test` exists and is not npm's placeholder
    bool HasRealTestScript() const;
};

/**
 * @class NodeAdapter
 * @brief Shared lockfile-aware install and script selection
 */
class NodeAdapter : public TestFrameworkAdapter {
public:
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;

protected:
    /// Runner invocation used when no integration script exists
    virtual std::string DefaultTestScript(const core::RepoTree& tree) const = 0;

    /// npm, yarn or pnpm according to the committed lockfile
    static std::string PackageManager(const core::RepoTree& tree);
};

class VitestAdapter : public NodeAdapter {
public:
    std::string GetName() const override { return "vitest"; }
    core::Framework GetFramework() const override { return core::Framework::VITEST; }
    int GetPriority() const override { return 65; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

protected:
    std::string DefaultTestScript(const core::RepoTree& tree) const override;
};

class JestAdapter : public NodeAdapter {
public:
    std::string GetName() const override { return "jest"; }
    core::Framework GetFramework() const override { return core::Framework::JEST; }
    int GetPriority() const override { return 60; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

protected:
    std::string DefaultTestScript(const core::RepoTree& tree) const override;
};

class MochaAdapter : public NodeAdapter {
public:
    std::string GetName() const override { return "mocha"; }
    core::Framework GetFramework() const override { return core::Framework::MOCHA; }
    int GetPriority() const override { return 55; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

protected:
    std::string DefaultTestScript(const core::RepoTree& tree) const override;
};

/**
 * @class NpmAdapter
 * @brief Any package.json with a real `test` script
 *
 * The runner behind the script is unknown, so every JavaScript summary
 * format is tried in a fixed order (Jest, Vitest, Mocha, TAP).
 */
class NpmAdapter : public NodeAdapter {
public:
    std::string GetName() const override { return "npm"; }
    core::Framework GetFramework() const override { return core::Framework::NPM; }
    int GetPriority() const override { return 40; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

protected:
    std::string DefaultTestScript(const core::RepoTree& tree) const override;
};

// ============================================================================
// Python
// ============================================================================

class PytestAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "pytest"; }
    core::Framework GetFramework() const override { return core::Framework::PYTEST; }
    int GetPriority() const override { return 50; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;
};

// ============================================================================
// Make
// ============================================================================

/**
 * @class MakeAdapter
 * @brief Last-resort adapter for a Makefile test target
 *
 * A Makefile can wrap any runner, so no summary format is assumed and the
 * verdict comes from the exit code.
 */
class MakeAdapter : public TestFrameworkAdapter {
public:
    std::string GetName() const override { return "make"; }
    core::Framework GetFramework() const override { return core::Framework::MAKE; }
    int GetPriority() const override { return 10; }
    std::optional<std::string> FingerprintMatch(const core::RepoTree& tree) const override;
    std::optional<core::CommandLine> InstallCommand(const core::RepoTree& tree) const override;
    core::CommandLine TestCommand(const core::RepoTree& tree) const override;
    std::optional<core::SummaryCounts> ParseSummary(const std::string& output) const override;

private:
    static std::optional<std::string> FindTarget(const core::RepoTree& tree);
};

} // namespace adapters
} // namespace crucible
