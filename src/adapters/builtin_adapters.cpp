/**
 * @file builtin_adapters.cpp
 * @brief Fingerprints, commands and summary parsing for built-in ecosystems
 *
 * All commands are shell strings wrapped as `sh -c` because several of them
 * chain steps (`pip install ... && pip install -e .`) or pick a launcher
 * (`./gradlew` vs `gradle`). Repository-derived values that end up in a
 * script (project file names, npm script names) are shell-quoted.
 *
 * @date 2025
 */

#include "crucible/adapters/builtin_adapters.hpp"
#include "crucible/parsers/summary_patterns.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <regex>

namespace crucible {
namespace adapters {

using core::CommandLine;
using core::NetworkPolicy;
using core::RepoTree;
using core::SummaryCounts;
using parsers::SummaryPatterns;
using utils::StringUtils;

namespace {

std::optional<std::string> FirstRootFile(const RepoTree& tree,
                                         std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (tree.HasFile(name)) {
            return std::string(name);
        }
    }
    return std::nullopt;
}

std::optional<std::string> RootFileWithPrefix(const RepoTree& tree, const std::string& prefix) {
    for (const auto& file : tree.RootFiles()) {
        if (StringUtils::StartsWith(file, prefix)) {
            return file;
        }
    }
    return std::nullopt;
}

bool FileContains(const RepoTree& tree, const std::string& path, const std::string& needle) {
    auto content = tree.ReadFile(path);
    return content && StringUtils::Contains(*content, needle);
}

CommandLine Install(const std::string& script) {
    return CommandLine::Shell(script, NetworkPolicy::ENABLED);
}

CommandLine Test(const std::string& script) {
    return CommandLine::Shell(script, NetworkPolicy::DISABLED);
}

// First recognizer that finds a summary
template <typename... Parsers>
std::optional<SummaryCounts> FirstOf(const std::string& output, Parsers... parsers) {
    std::optional<SummaryCounts> result;
    ((result ? void() : void(result = parsers(output))), ...);
    return result;
}

} // anonymous namespace

// ============================================================================
// MILL
// ============================================================================

std::optional<std::string> MillAdapter::FingerprintMatch(const RepoTree& tree) const {
    return FirstRootFile(tree, {"build.mill", "build.mill.scala", "build.sc"});
}

std::string MillAdapter::Launcher(const RepoTree& tree) {
    return tree.HasFile("mill") ? "./mill" : "mill";
}

std::optional<CommandLine> MillAdapter::InstallCommand(const RepoTree& tree) const {
    return Install(Launcher(tree) + " --no-server __.compile");
}

CommandLine MillAdapter::TestCommand(const RepoTree& tree) const {
    return Test(Launcher(tree) + " --no-server __.test");
}

std::optional<SummaryCounts> MillAdapter::ParseSummary(const std::string& output) const {
    return FirstOf(output, &SummaryPatterns::ParseScalaTest, &SummaryPatterns::ParseUTest,
                   &SummaryPatterns::ParseSbtTotals);
}

// ============================================================================
// SBT
// ============================================================================

std::optional<std::string> SbtAdapter::FingerprintMatch(const RepoTree& tree) const {
    if (tree.HasFile("build.sbt")) {
        return std::string("build.sbt");
    }
    if (tree.HasFile("project/build.properties") && FileContains(tree, "project/build.properties", "sbt.version")) {
        return std::string("project/build.properties");
    }
    return std::nullopt;
}

std::optional<CommandLine> SbtAdapter::InstallCommand(const RepoTree&) const {
    return Install("sbt -batch update Test/compile");
}

CommandLine SbtAdapter::TestCommand(const RepoTree& tree) const {
    if (tree.HasDirectory("src/it")) {
        return Test("sbt -batch test IntegrationTest/test");
    }
    return Test("sbt -batch test");
}

std::optional<SummaryCounts> SbtAdapter::ParseSummary(const std::string& output) const {
    return FirstOf(output, &SummaryPatterns::ParseScalaTest, &SummaryPatterns::ParseSbtTotals);
}

// ============================================================================
// MAVEN
// ============================================================================

std::optional<std::string> MavenAdapter::FingerprintMatch(const RepoTree& tree) const {
    return FirstRootFile(tree, {"pom.xml"});
}

std::string MavenAdapter::Launcher(const RepoTree& tree) {
    return tree.HasFile("mvnw") ? "./mvnw" : "mvn";
}

std::optional<CommandLine> MavenAdapter::InstallCommand(const RepoTree& tree) const {
    // install (not go-offline) so sibling reactor modules resolve
    return Install(Launcher(tree) + " -B -ntp -DskipTests -DskipITs install");
}

CommandLine MavenAdapter::TestCommand(const RepoTree& tree) const {
    return Test(Launcher(tree) + " -B -ntp verify");
}

std::optional<SummaryCounts> MavenAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseSurefire(output);
}

// ============================================================================
// GRADLE
// ============================================================================

std::optional<std::string> GradleAdapter::FingerprintMatch(const RepoTree& tree) const {
    return FirstRootFile(tree, {"build.gradle", "build.gradle.kts",
                                "settings.gradle", "settings.gradle.kts"});
}

std::string GradleAdapter::Launcher(const RepoTree& tree) {
    return tree.HasFile("gradlew") ? "./gradlew" : "gradle";
}

bool GradleAdapter::HasIntegrationTask(const RepoTree& tree) {
    for (const char* script : {"build.gradle", "build.gradle.kts"}) {
        if (tree.HasFile(script) && FileContains(tree, script, "integrationTest")) {
            return true;
        }
    }
    return false;
}

std::optional<CommandLine> GradleAdapter::InstallCommand(const RepoTree& tree) const {
    return Install(Launcher(tree) + " --no-daemon --console=plain testClasses");
}

CommandLine GradleAdapter::TestCommand(const RepoTree& tree) const {
    std::string task = HasIntegrationTask(tree) ? "integrationTest" : "test";
    return Test(Launcher(tree) + " --no-daemon --console=plain " + task);
}

std::optional<SummaryCounts> GradleAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseGradle(output);
}

// ============================================================================
// CARGO
// ============================================================================

std::optional<std::string> CargoAdapter::FingerprintMatch(const RepoTree& tree) const {
    return FirstRootFile(tree, {"Cargo.toml"});
}

std::optional<CommandLine> CargoAdapter::InstallCommand(const RepoTree&) const {
    return Install("cargo fetch");
}

CommandLine CargoAdapter::TestCommand(const RepoTree&) const {
    return Test("cargo test --offline");
}

std::optional<SummaryCounts> CargoAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseCargo(output);
}

// ============================================================================
// GO
// ============================================================================

std::optional<std::string> GoAdapter::FingerprintMatch(const RepoTree& tree) const {
    return FirstRootFile(tree, {"go.mod"});
}

std::optional<CommandLine> GoAdapter::InstallCommand(const RepoTree&) const {
    return Install("go mod download");
}

CommandLine GoAdapter::TestCommand(const RepoTree&) const {
    CommandLine cmd = Test("go test -v -tags=integration ./...");
    cmd.environment["GOFLAGS"] = "-mod=mod";
    cmd.environment["GOPROXY"] = "off";
    return cmd;
}

std::optional<SummaryCounts> GoAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseGoTest(output);
}

// ============================================================================
// DOTNET
// ============================================================================

namespace {

std::optional<std::string> DotnetTarget(const RepoTree& tree) {
    for (const auto& file : tree.RootFiles()) {
        if (StringUtils::EndsWith(file, ".sln")) {
            return file;
        }
    }

    std::vector<std::string> projects = tree.FindBySuffix(".csproj");
    auto fsprojects = tree.FindBySuffix(".fsproj");
    projects.insert(projects.end(), fsprojects.begin(), fsprojects.end());
    if (projects.empty()) {
        return std::nullopt;
    }

    // Prefer a test project
    for (const auto& project : projects) {
        if (StringUtils::ContainsIgnoreCase(core::BaseName(project), "test")) {
            return project;
        }
    }
    return projects.front();
}

} // anonymous namespace

std::optional<std::string> DotnetAdapter::FingerprintMatch(const RepoTree& tree) const {
    return DotnetTarget(tree);
}

std::optional<CommandLine> DotnetAdapter::InstallCommand(const RepoTree& tree) const {
    auto target = DotnetTarget(tree);
    return Install("dotnet restore " + StringUtils::ShellQuote(target.value_or(".")));
}

CommandLine DotnetAdapter::TestCommand(const RepoTree& tree) const {
    auto target = DotnetTarget(tree);
    CommandLine cmd = Test("dotnet test " + StringUtils::ShellQuote(target.value_or(".")) + " --no-restore");
    cmd.environment["DOTNET_CLI_TELEMETRY_OPTOUT"] = "1";
    cmd.environment["DOTNET_NOLOGO"] = "1";
    return cmd;
}

std::optional<SummaryCounts> DotnetAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseDotnet(output);
}

// ============================================================================
// NODE: package.json
// ============================================================================

std::optional<PackageManifest> PackageManifest::Load(const RepoTree& tree) {
    if (!tree.HasFile("package.json")) {
        return std::nullopt;
    }

    auto content = tree.ReadFile("package.json", 1024 * 1024);
    if (!content) {
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::debug("package.json is not a valid JSON object");
        return std::nullopt;
    }

    PackageManifest manifest;

    if (j.contains("scripts") && j["scripts"].is_object()) {
        for (const auto& [name, value] : j["scripts"].items()) {
            if (value.is_string()) {
                manifest.scripts[name] = value.get<std::string>();
            }
        }
    }

    for (const char* section : {"dependencies", "devDependencies", "peerDependencies"}) {
        if (j.contains(section) && j[section].is_object()) {
            for (const auto& [name, version] : j[section].items()) {
                manifest.dependencies.insert(name);
            }
        }
    }

    manifest.has_jest_config = j.contains("jest");
    manifest.has_mocha_config = j.contains("mocha");
    return manifest;
}

bool PackageManifest::DependsOn(const std::string& package) const {
    return dependencies.count(package) > 0;
}

std::optional<std::string> PackageManifest::IntegrationScript() const {
    static const char* const names[] = {
        "test:integration", "test-integration", "integration-test", "integration:test",
        "test:int", "test:it", "integration", "test:e2e", "e2e"
    };
    for (const char* name : names) {
        if (scripts.count(name)) {
            return std::string(name);
        }
    }
    return std::nullopt;
}

bool PackageManifest::HasRealTestScript() const {
    auto it = scripts.find("test");
    if (it == scripts.end()) {
        return false;
    }
    // npm init placeholder
    return !StringUtils::Contains(it->second, "no test specified");
}

// ============================================================================
// NODE: shared install / script selection
// ============================================================================

std::string NodeAdapter::PackageManager(const RepoTree& tree) {
    if (tree.HasFile("pnpm-lock.yaml")) {
        return "pnpm";
    }
    if (tree.HasFile("yarn.lock")) {
        return "yarn";
    }
    return "npm";
}

std::optional<CommandLine> NodeAdapter::InstallCommand(const RepoTree& tree) const {
    std::string pm = PackageManager(tree);
    if (pm == "pnpm") {
        return Install("pnpm install --frozen-lockfile");
    }
    if (pm == "yarn") {
        return Install("yarn install --frozen-lockfile");
    }
    if (tree.HasFile("package-lock.json") || tree.HasFile("npm-shrinkwrap.json")) {
        return Install("npm ci --no-audit --no-fund");
    }
    return Install("npm install --no-audit --no-fund");
}

CommandLine NodeAdapter::TestCommand(const RepoTree& tree) const {
    auto manifest = PackageManifest::Load(tree);
    std::string script;

    if (manifest) {
        if (auto integration = manifest->IntegrationScript()) {
            script = PackageManager(tree) + " run " + StringUtils::ShellQuote(*integration);
        }
    }
    if (script.empty()) {
        script = DefaultTestScript(tree);
    }

    CommandLine cmd = Test(script);
    cmd.environment["CI"] = "true";
    return cmd;
}

// ============================================================================
// VITEST / JEST / MOCHA / NPM
// ============================================================================

std::optional<std::string> VitestAdapter::FingerprintMatch(const RepoTree& tree) const {
    if (auto config = RootFileWithPrefix(tree, "vitest.config")) {
        return config;
    }
    if (auto workspace = RootFileWithPrefix(tree, "vitest.workspace")) {
        return workspace;
    }
    auto manifest = PackageManifest::Load(tree);
    if (manifest && manifest->DependsOn("vitest")) {
        return std::string("package.json (vitest)");
    }
    return std::nullopt;
}

std::string VitestAdapter::DefaultTestScript(const RepoTree&) const {
    return "npx --no-install vitest run";
}

std::optional<SummaryCounts> VitestAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseVitest(output);
}

std::optional<std::string> JestAdapter::FingerprintMatch(const RepoTree& tree) const {
    if (auto config = RootFileWithPrefix(tree, "jest.config")) {
        return config;
    }
    auto manifest = PackageManifest::Load(tree);
    if (manifest && (manifest->DependsOn("jest") || manifest->has_jest_config)) {
        return std::string("package.json (jest)");
    }
    return std::nullopt;
}

std::string JestAdapter::DefaultTestScript(const RepoTree&) const {
    return "npx --no-install jest --ci";
}

std::optional<SummaryCounts> JestAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseJest(output);
}

std::optional<std::string> MochaAdapter::FingerprintMatch(const RepoTree& tree) const {
    if (auto config = RootFileWithPrefix(tree, ".mocharc")) {
        return config;
    }
    auto manifest = PackageManifest::Load(tree);
    if (manifest && (manifest->DependsOn("mocha") || manifest->has_mocha_config)) {
        return std::string("package.json (mocha)");
    }
    return std::nullopt;
}

std::string MochaAdapter::DefaultTestScript(const RepoTree&) const {
    return "npx --no-install mocha";
}

std::optional<SummaryCounts> MochaAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParseMocha(output);
}

std::optional<std::string> NpmAdapter::FingerprintMatch(const RepoTree& tree) const {
    auto manifest = PackageManifest::Load(tree);
    if (manifest && (manifest->HasRealTestScript() || manifest->IntegrationScript())) {
        return std::string("package.json (scripts)");
    }
    return std::nullopt;
}

std::string NpmAdapter::DefaultTestScript(const RepoTree& tree) const {
    return PackageManager(tree) + " test";
}

std::optional<SummaryCounts> NpmAdapter::ParseSummary(const std::string& output) const {
    return FirstOf(output, &SummaryPatterns::ParseJest, &SummaryPatterns::ParseVitest,
                   &SummaryPatterns::ParseMocha, &SummaryPatterns::ParseTap);
}

// ============================================================================
// PYTEST
// ============================================================================

std::optional<std::string> PytestAdapter::FingerprintMatch(const RepoTree& tree) const {
    if (tree.HasFile("pytest.ini")) {
        return std::string("pytest.ini");
    }
    if (tree.HasFileNamed("conftest.py")) {
        return std::string("conftest.py");
    }
    if (tree.HasFile("pyproject.toml") && FileContains(tree, "pyproject.toml", "[tool.pytest")) {
        return std::string("pyproject.toml [tool.pytest]");
    }
    if (tree.HasFile("setup.cfg") && FileContains(tree, "setup.cfg", "[tool:pytest]")) {
        return std::string("setup.cfg [tool:pytest]");
    }
    if (tree.HasFile("tox.ini") && FileContains(tree, "tox.ini", "[pytest]")) {
        return std::string("tox.ini [pytest]");
    }
    for (const char* req : {"requirements.txt", "requirements-dev.txt", "requirements-test.txt"}) {
        if (tree.HasFile(req) && FileContains(tree, req, "pytest")) {
            return std::string(req) + " (pytest)";
        }
    }
    for (const auto& file : tree.Files()) {
        std::string base = core::BaseName(file);
        if ((StringUtils::StartsWith(file, "tests/") || StringUtils::StartsWith(file, "test/")) &&
            StringUtils::StartsWith(base, "test_") && StringUtils::EndsWith(base, ".py")) {
            return file;
        }
    }
    return std::nullopt;
}

std::optional<CommandLine> PytestAdapter::InstallCommand(const RepoTree& tree) const {
    std::vector<std::string> steps;
    const std::string pip = "python -m pip install --quiet --disable-pip-version-check";

    for (const char* req : {"requirements.txt", "requirements-dev.txt", "requirements-test.txt"}) {
        if (tree.HasFile(req)) {
            steps.push_back(pip + " -r " + req);
        }
    }
    if (tree.HasFile("pyproject.toml") || tree.HasFile("setup.py")) {
        steps.push_back(pip + " -e .");
    }
    steps.push_back(pip + " pytest");

    return Install(StringUtils::Join(steps, " && "));
}

CommandLine PytestAdapter::TestCommand(const RepoTree& tree) const {
    static const char* const integration_dirs[] = {
        "tests/integration", "test/integration", "tests/integration_tests",
        "integration_tests", "integration"
    };

    std::string script = "python -m pytest";
    for (const char* dir : integration_dirs) {
        if (tree.HasDirectory(dir)) {
            script += " ";
            script += dir;
            break;
        }
    }

    CommandLine cmd = Test(script);
    cmd.environment["PYTHONDONTWRITEBYTECODE"] = "1";
    return cmd;
}

std::optional<SummaryCounts> PytestAdapter::ParseSummary(const std::string& output) const {
    return SummaryPatterns::ParsePytest(output);
}

// ============================================================================
// MAKE
// ============================================================================

std::optional<std::string> MakeAdapter::FindTarget(const RepoTree& tree) {
    static const std::regex target_line(R"(^([A-Za-z0-9_.-]+)\s*:(?!=))");
    static const char* const preferred[] = {
        "integration-test", "test-integration", "integration", "test"
    };

    auto makefile = FirstRootFile(tree, {"Makefile", "makefile", "GNUmakefile"});
    if (!makefile) {
        return std::nullopt;
    }
    auto content = tree.ReadFile(*makefile);
    if (!content) {
        return std::nullopt;
    }

    std::set<std::string> targets;
    for (const auto& line : StringUtils::SplitLines(*content)) {
        std::smatch m;
        if (std::regex_search(line, m, target_line)) {
            targets.insert(m[1].str());
        }
    }

    for (const char* name : preferred) {
        if (targets.count(name)) {
            return std::string(name);
        }
    }
    return std::nullopt;
}

std::optional<std::string> MakeAdapter::FingerprintMatch(const RepoTree& tree) const {
    auto target = FindTarget(tree);
    if (!target) {
        return std::nullopt;
    }
    return "Makefile (" + *target + ")";
}

std::optional<CommandLine> MakeAdapter::InstallCommand(const RepoTree&) const {
    return std::nullopt;
}

CommandLine MakeAdapter::TestCommand(const RepoTree& tree) const {
    return Test("make " + FindTarget(tree).value_or("test"));
}

std::optional<SummaryCounts> MakeAdapter::ParseSummary(const std::string&) const {
    return std::nullopt;
}

} // namespace adapters
} // namespace crucible
