#include <gtest/gtest.h>
#include "crucible/core/test_detector.hpp"
#include "crucible/adapters/adapter_registry.hpp"
#include "test_helpers.hpp"

using namespace crucible::core;
using crucible::adapters::AdapterRegistry;
using crucible::testing::TempDir;

// ─── Detection ─────────────────────────────────────────────────

TEST(TestDetectorTest, RequiresRegistry) {
    EXPECT_THROW(TestDetector(nullptr), std::invalid_argument);
}

TEST(TestDetectorTest, DetectsMavenProject) {
    TestDetector detector(AdapterRegistry::CreateDefault());
    auto tree = RepoTree::FromPaths("/r", {"pom.xml", "src/test/java/com/acme/OrderIT.java"});

    auto invocation = detector.DetectInTree(tree);
    ASSERT_TRUE(invocation.has_value());
    EXPECT_EQ(invocation->framework, Framework::MAVEN);
    EXPECT_EQ(invocation->adapter_name, "maven");
    EXPECT_EQ(invocation->fingerprint, "pom.xml");
    ASSERT_TRUE(invocation->install_command.has_value());
    ASSERT_EQ(invocation->integration_test_files.size(), 1u);
    EXPECT_EQ(invocation->integration_test_files[0], "src/test/java/com/acme/OrderIT.java");
}

TEST(TestDetectorTest, HigherPriorityAdapterWins) {
    TestDetector detector(AdapterRegistry::CreateDefault());
    // A Makefile wrapping sbt is still an sbt project
    auto tree = RepoTree::FromPaths("/r", {"build.sbt", "Makefile", "pom.xml"});

    auto invocation = detector.DetectInTree(tree);
    ASSERT_TRUE(invocation.has_value());
    EXPECT_EQ(invocation->adapter_name, "sbt");
}

TEST(TestDetectorTest, PriorityOverrideChangesWinner) {
    DetectionSettings settings;
    settings.priority_overrides = {{"cargo", 500}};
    TestDetector detector(AdapterRegistry::CreateFromSettings(settings));

    auto tree = RepoTree::FromPaths("/r", {"pom.xml", "Cargo.toml"});
    auto invocation = detector.DetectInTree(tree);
    ASSERT_TRUE(invocation.has_value());
    EXPECT_EQ(invocation->adapter_name, "cargo");
}

TEST(TestDetectorTest, NothingRecognizableGivesNoInvocation) {
    TestDetector detector(AdapterRegistry::CreateDefault());
    auto tree = RepoTree::FromPaths("/r", {"README.md", "docs/index.html"});
    EXPECT_FALSE(detector.DetectInTree(tree).has_value());
}

TEST(TestDetectorTest, DetectScansSandboxCheckout) {
    TempDir dir;
    dir.Write("go.mod", "module example.com/orders\n");
    dir.Write("store/store_integration_test.go", "package store\n");

    Sandbox sandbox;
    sandbox.host_workdir = dir.Path();

    TestDetector detector(AdapterRegistry::CreateDefault());
    auto invocation = detector.Detect(sandbox);
    ASSERT_TRUE(invocation.has_value());
    EXPECT_EQ(invocation->framework, Framework::GO);
    ASSERT_FALSE(invocation->integration_test_files.empty());
    EXPECT_EQ(invocation->integration_test_files[0], "store/store_integration_test.go");
}

// ─── Integration Test Files ────────────────────────────────────

TEST(TestDetectorTest, IntegrationFilesRankedByNamingThenDirectory) {
    auto tree = RepoTree::FromPaths("/r", {
        "e2e/login.spec.ts",
        "src/it/scala/ApiSpec.scala",
        "src/test/java/OrderIT.java",
        "src/test/java/OrderTest.java",
        "tests/integration/conftest.py",
        "docs/integration.md",
        "tests/db.rs"
    });

    auto files = TestDetector::FindIntegrationTestFiles(tree);
    ASSERT_EQ(files.size(), 5u);
    EXPECT_EQ(files[0], "src/test/java/OrderIT.java");
    EXPECT_EQ(files[1], "src/it/scala/ApiSpec.scala");
    EXPECT_EQ(files[2], "tests/db.rs");
    EXPECT_EQ(files[3], "tests/integration/conftest.py");
    EXPECT_EQ(files[4], "e2e/login.spec.ts");
}

TEST(TestDetectorTest, LoadContentSkipsUnreadableFiles) {
    TempDir dir;
    dir.Write("it/ApiIT.java", "class ApiIT {}");
    auto tree = RepoTree::Scan(dir.Path());

    std::string content = TestDetector::LoadIntegrationTestContent(
        tree, {"it/MissingIT.java", "it/ApiIT.java"});
    EXPECT_EQ(content, "class ApiIT {}");

    EXPECT_EQ(TestDetector::LoadIntegrationTestContent(tree, {}), "");
    EXPECT_EQ(TestDetector::LoadIntegrationTestContent(tree, {"it/ApiIT.java"}, 5), "class");
}

TEST(TestDetectorTest, SymlinkedIntegrationTestDoesNotLeakHostFile) {
    TempDir host;
    auto secret = host.Write("credentials", "HOST-SECRET-KEY");

    TempDir dir;
    dir.Write("pom.xml", "<project/>");
    std::filesystem::create_directories(dir.Path() / "src/it");
    std::filesystem::create_symlink(secret, dir.Path() / "src/it/LeakIT.java");

    TestDetector detector(AdapterRegistry::CreateDefault());
    auto tree = RepoTree::Scan(dir.Path());
    auto invocation = detector.DetectInTree(tree);
    ASSERT_TRUE(invocation.has_value());

    std::string content = TestDetector::LoadIntegrationTestContent(
        tree, invocation->integration_test_files);
    EXPECT_EQ(content.find("HOST-SECRET-KEY"), std::string::npos);
}
