#include <gtest/gtest.h>
#include "crucible/adapters/adapter_registry.hpp"
#include "crucible/adapters/builtin_adapters.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace crucible::adapters;
using namespace crucible::core;
using crucible::testing::TempDir;

namespace {

class StubAdapter : public TestFrameworkAdapter {
public:
    StubAdapter(std::string name, int priority, bool matches)
        : name_(std::move(name)), priority_(priority), matches_(matches) {}

    std::string GetName() const override { return name_; }
    Framework GetFramework() const override { return Framework::CUSTOM; }
    int GetPriority() const override { return priority_; }

    std::optional<std::string> FingerprintMatch(const RepoTree&) const override {
        return matches_ ? std::optional<std::string>(name_) : std::nullopt;
    }
    std::optional<CommandLine> InstallCommand(const RepoTree&) const override { return std::nullopt; }
    CommandLine TestCommand(const RepoTree&) const override { return CommandLine::Shell("true"); }
    std::optional<SummaryCounts> ParseSummary(const std::string&) const override { return std::nullopt; }

private:
    std::string name_;
    int priority_;
    bool matches_;
};

std::vector<std::string> Names(const AdapterRegistry& registry) {
    std::vector<std::string> names;
    for (const auto* adapter : registry.Ordered()) {
        names.push_back(adapter->GetName());
    }
    return names;
}

} // namespace

// ─── Registry ──────────────────────────────────────────────────

TEST(AdapterRegistryTest, DefaultRegistryHasAllBuiltins) {
    auto registry = AdapterRegistry::CreateDefault();
    EXPECT_EQ(registry->Size(), 13u);

    auto names = Names(*registry);
    ASSERT_FALSE(names.empty());
    EXPECT_EQ(names.front(), "mill");
    EXPECT_EQ(names.back(), "make");
    EXPECT_NE(registry->FindByName("pytest"), nullptr);
    EXPECT_EQ(registry->FindByFramework(Framework::MAVEN)->GetName(), "maven");
}

TEST(AdapterRegistryTest, EqualPrioritiesKeepRegistrationOrder) {
    AdapterRegistry registry;
    registry.Register(std::make_unique<StubAdapter>("first", 10, true));
    registry.Register(std::make_unique<StubAdapter>("second", 10, true));
    registry.Register(std::make_unique<StubAdapter>("high", 20, true));
    registry.Register(std::make_unique<StubAdapter>("third", 10, true));

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(Names(registry), (std::vector<std::string>{"high", "first", "second", "third"}));
    }
}

TEST(AdapterRegistryTest, RegisterRejectsNullAndDuplicates) {
    AdapterRegistry registry;
    EXPECT_THROW(registry.Register(nullptr), std::invalid_argument);
    registry.Register(std::make_unique<StubAdapter>("dup", 1, true));
    EXPECT_THROW(registry.Register(std::make_unique<StubAdapter>("dup", 2, true)),
                 std::invalid_argument);
}

TEST(AdapterRegistryTest, ExplicitPriorityOverridesDefault) {
    AdapterRegistry registry;
    registry.Register(std::make_unique<StubAdapter>("a", 50, true));
    registry.Register(std::make_unique<StubAdapter>("b", 10, true), 99);
    EXPECT_EQ(registry.PriorityOf("b").value_or(-1), 99);
    EXPECT_EQ(Names(registry).front(), "b");
    EXPECT_FALSE(registry.PriorityOf("missing").has_value());
}

TEST(AdapterRegistryTest, SettingsDisableAndReprioritize) {
    DetectionSettings settings;
    settings.disabled_adapters = {"mill"};
    settings.priority_overrides = {{"make", 1000}};

    auto registry = AdapterRegistry::CreateFromSettings(settings);
    auto names = Names(*registry);
    EXPECT_EQ(names.front(), "make");
    EXPECT_EQ(std::count(names.begin(), names.end(), "mill"), 0);
    EXPECT_NE(registry->FindByName("mill"), nullptr);
}

TEST(AdapterRegistryTest, SettingsWithUnknownAdapterThrow) {
    DetectionSettings disabled;
    disabled.disabled_adapters = {"ant"};
    EXPECT_THROW(AdapterRegistry::CreateFromSettings(disabled), ConfigError);

    DetectionSettings priority;
    priority.priority_overrides = {{"ant", 1}};
    EXPECT_THROW(AdapterRegistry::CreateFromSettings(priority), ConfigError);
}

// ─── JVM / Scala Adapters ──────────────────────────────────────

TEST(BuiltinAdaptersTest, MavenUsesWrapperWhenPresent) {
    MavenAdapter maven;
    auto plain = RepoTree::FromPaths("/r", {"pom.xml"});
    auto wrapped = RepoTree::FromPaths("/r", {"pom.xml", "mvnw"});

    ASSERT_TRUE(maven.FingerprintMatch(plain).has_value());
    EXPECT_EQ(maven.TestCommand(plain).ToString(), "mvn -B -ntp verify");
    EXPECT_EQ(maven.TestCommand(wrapped).ToString(), "./mvnw -B -ntp verify");

    auto install = maven.InstallCommand(plain);
    ASSERT_TRUE(install.has_value());
    EXPECT_EQ(install->network, NetworkPolicy::ENABLED);
    EXPECT_EQ(maven.TestCommand(plain).network, NetworkPolicy::DISABLED);
}

TEST(BuiltinAdaptersTest, SbtAddsIntegrationConfiguration) {
    SbtAdapter sbt;
    auto plain = RepoTree::FromPaths("/r", {"build.sbt"});
    auto with_it = RepoTree::FromPaths("/r", {"build.sbt", "src/it/scala/ApiSpec.scala"});

    EXPECT_EQ(sbt.TestCommand(plain).ToString(), "sbt -batch test");
    EXPECT_EQ(sbt.TestCommand(with_it).ToString(), "sbt -batch test IntegrationTest/test");
}

TEST(BuiltinAdaptersTest, MillParsesScalaTestSummary) {
    MillAdapter mill;
    auto tree = RepoTree::FromPaths("/r", {"build.mill"});
    EXPECT_EQ(mill.FingerprintMatch(tree), std::optional<std::string>("build.mill"));

    auto counts = mill.ParseSummary("Tests: succeeded 6, failed 0, canceled 0, ignored 0, pending 0");
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->total, 6);
}

TEST(BuiltinAdaptersTest, GradlePicksIntegrationTask) {
    TempDir dir;
    dir.Write("build.gradle", "tasks.register('integrationTest', Test) {}\n");
    auto tree = RepoTree::Scan(dir.Path());

    GradleAdapter gradle;
    EXPECT_EQ(gradle.TestCommand(tree).ToString(),
              "gradle --no-daemon --console=plain integrationTest");
}

// ─── Native / .NET Adapters ────────────────────────────────────

TEST(BuiltinAdaptersTest, GoDisablesModuleProxy) {
    GoAdapter go;
    auto cmd = go.TestCommand(RepoTree::FromPaths("/r", {"go.mod"}));
    EXPECT_EQ(cmd.environment.at("GOPROXY"), "off");
    EXPECT_EQ(cmd.network, NetworkPolicy::DISABLED);
}

TEST(BuiltinAdaptersTest, DotnetPrefersSolutionThenTestProject) {
    DotnetAdapter dotnet;
    auto with_sln = RepoTree::FromPaths("/r", {"Shop.sln", "src/Shop/Shop.csproj"});
    EXPECT_EQ(dotnet.FingerprintMatch(with_sln), std::optional<std::string>("Shop.sln"));

    auto projects = RepoTree::FromPaths("/r", {"src/Shop/Shop.csproj", "tests/Shop.Tests/Shop.Tests.csproj"});
    EXPECT_EQ(dotnet.FingerprintMatch(projects),
              std::optional<std::string>("tests/Shop.Tests/Shop.Tests.csproj"));
    EXPECT_EQ(dotnet.TestCommand(projects).ToString(),
              "dotnet test 'tests/Shop.Tests/Shop.Tests.csproj' --no-restore");
}

// ─── Node Adapters ─────────────────────────────────────────────

TEST(BuiltinAdaptersTest, NodeInstallFollowsLockfile) {
    TempDir dir;
    dir.Write("package.json", R"({"devDependencies": {"jest": "^29"}})");
    dir.Write("yarn.lock");
    auto tree = RepoTree::Scan(dir.Path());

    JestAdapter jest;
    ASSERT_TRUE(jest.FingerprintMatch(tree).has_value());
    EXPECT_EQ(jest.InstallCommand(tree)->ToString(), "yarn install --frozen-lockfile");
    EXPECT_EQ(jest.TestCommand(tree).ToString(), "npx --no-install jest --ci");
    EXPECT_EQ(jest.TestCommand(tree).environment.at("CI"), "true");
}

TEST(BuiltinAdaptersTest, NodePrefersIntegrationScript) {
    TempDir dir;
    dir.Write("package.json", R"({
        "scripts": {"test": "jest", "test:integration": "jest -c jest.int.js"},
        "devDependencies": {"jest": "^29"}
    })");
    dir.Write("package-lock.json", "{}");
    auto tree = RepoTree::Scan(dir.Path());

    JestAdapter jest;
    EXPECT_EQ(jest.InstallCommand(tree)->ToString(), "npm ci --no-audit --no-fund");
    EXPECT_EQ(jest.TestCommand(tree).ToString(), "npm run 'test:integration'");
}

TEST(BuiltinAdaptersTest, NpmIgnoresPlaceholderTestScript) {
    TempDir dir;
    dir.Write("package.json",
              R"({"scripts": {"test": "echo \"Error: no test specified\" && exit 1"}})");
    auto tree = RepoTree::Scan(dir.Path());

    NpmAdapter npm;
    EXPECT_FALSE(npm.FingerprintMatch(tree).has_value());
}

TEST(BuiltinAdaptersTest, MalformedPackageJsonIsIgnored) {
    TempDir dir;
    dir.Write("package.json", "{ broken");
    auto tree = RepoTree::Scan(dir.Path());

    EXPECT_FALSE(PackageManifest::Load(tree).has_value());
    EXPECT_FALSE(JestAdapter().FingerprintMatch(tree).has_value());
}

// ─── Python / Make Adapters ────────────────────────────────────

TEST(BuiltinAdaptersTest, PytestTargetsIntegrationDirectory) {
    auto tree = RepoTree::FromPaths("/r", {
        "requirements.txt", "tests/integration/test_api.py", "tests/unit/test_model.py"
    });

    PytestAdapter pytest;
    ASSERT_TRUE(pytest.FingerprintMatch(tree).has_value());
    EXPECT_EQ(pytest.TestCommand(tree).ToString(), "python -m pytest tests/integration");

    auto install = pytest.InstallCommand(tree);
    ASSERT_TRUE(install.has_value());
    EXPECT_NE(install->ToString().find("-r requirements.txt"), std::string::npos);
}

TEST(BuiltinAdaptersTest, MakePrefersIntegrationTarget) {
    TempDir dir;
    dir.Write("Makefile", "CC := gcc\nbuild:\n\tcc main.c\ntest: build\n\t./run\nintegration: build\n\t./it\n");
    auto tree = RepoTree::Scan(dir.Path());

    MakeAdapter make;
    EXPECT_EQ(make.FingerprintMatch(tree), std::optional<std::string>("Makefile (integration)"));
    EXPECT_EQ(make.TestCommand(tree).ToString(), "make integration");
    EXPECT_FALSE(make.InstallCommand(tree).has_value());
}

TEST(BuiltinAdaptersTest, MakeWithoutTestTargetDoesNotMatch) {
    TempDir dir;
    dir.Write("Makefile", "all:\n\tcc main.c\n");
    auto tree = RepoTree::Scan(dir.Path());
    EXPECT_FALSE(MakeAdapter().FingerprintMatch(tree).has_value());
}
