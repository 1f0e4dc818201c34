#include <gtest/gtest.h>
#include "crucible/core/engine_config.hpp"
#include "test_helpers.hpp"

using namespace crucible::core;
using crucible::testing::TempDir;
using json = nlohmann::json;

// ─── Defaults ──────────────────────────────────────────────────

TEST(EngineConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_NO_THROW(config.Validate());
    EXPECT_EQ(config.sandbox.runtime, "docker");
    EXPECT_FALSE(config.sandbox.allow_test_network);
    EXPECT_TRUE(config.sandbox.allow_install_network);
    EXPECT_EQ(config.timeouts.execute, std::chrono::seconds(1800));
}

TEST(EngineConfigTest, EmptyObjectKeepsDefaults) {
    auto config = EngineConfig::FromJson(json::object());
    EXPECT_EQ(config.workers.parallel, EngineConfig{}.workers.parallel);
    EXPECT_EQ(config.sandbox.image, EngineConfig{}.sandbox.image);
}

// ─── JSON Loading ──────────────────────────────────────────────

TEST(EngineConfigTest, ReadsAllSections) {
    json j = {
        {"sandbox", {{"runtime", "local"}, {"memory_mb", 2048}, {"cpus", 1.5},
                     {"allow_test_network", true}, {"workspace_root", "/var/tmp/cru"}}},
        {"timeouts", {{"install_seconds", 60}, {"execute_seconds", 120}, {"total_seconds", 300}}},
        {"capture", {{"max_output_bytes", 1024}}},
        {"workers", {{"parallel", 8}, {"max_sandboxes", 2}}},
        {"detection", {{"disabled_adapters", {"make"}}, {"priority_overrides", {{"pytest", 99}}}}},
        {"logging", {{"level", "debug"}}}
    };

    auto config = EngineConfig::FromJson(j);
    EXPECT_EQ(config.sandbox.runtime, "local");
    EXPECT_EQ(config.sandbox.memory_mb, 2048u);
    EXPECT_DOUBLE_EQ(config.sandbox.cpus, 1.5);
    EXPECT_TRUE(config.sandbox.allow_test_network);
    EXPECT_EQ(config.sandbox.workspace_root.string(), "/var/tmp/cru");
    EXPECT_EQ(config.timeouts.install, std::chrono::seconds(60));
    EXPECT_EQ(config.timeouts.execute, std::chrono::seconds(120));
    EXPECT_EQ(config.timeouts.total, std::chrono::seconds(300));
    EXPECT_EQ(config.capture.max_output_bytes, 1024u);
    EXPECT_EQ(config.workers.parallel, 8u);
    EXPECT_EQ(config.workers.max_sandboxes, 2u);
    ASSERT_EQ(config.detection.disabled_adapters.size(), 1u);
    EXPECT_EQ(config.detection.disabled_adapters[0], "make");
    EXPECT_EQ(config.detection.priority_overrides.at("pytest"), 99);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(EngineConfigTest, ToJsonRoundTripsThroughFromJson) {
    auto original = EngineConfigBuilder()
                        .WithRuntime("local")
                        .WithImage("runner:2")
                        .WithMemoryLimit(1024)
                        .WithPidsLimit(64)
                        .WithWorkspaceRoot("/var/tmp/crucible-ws")
                        .WithInstallNetwork(false)
                        .WithTestNetwork(true)
                        .WithInstallTimeout(std::chrono::seconds(120))
                        .WithTotalTimeout(std::chrono::seconds(900))
                        .WithMaxOutputBytes(65536)
                        .WithParallel(3)
                        .WithMaxSandboxes(2)
                        .WithAdapterPriority("maven", 5)
                        .Build();
    auto restored = EngineConfig::FromJson(original.ToJson());
    EXPECT_EQ(restored.ToJson(), original.ToJson());
}

TEST(EngineConfigTest, LoadFromFile) {
    TempDir dir;
    auto path = dir.Write("config.json", R"({"workers": {"parallel": 2}})");
    auto config = EngineConfig::LoadFromFile(path);
    EXPECT_EQ(config.workers.parallel, 2u);
}

// ─── Validation Errors ─────────────────────────────────────────

TEST(EngineConfigTest, RejectsNonObjectRoot) {
    EXPECT_THROW(EngineConfig::FromJson(json::array()), ConfigError);
}

TEST(EngineConfigTest, RejectsNonObjectSection) {
    EXPECT_THROW(EngineConfig::FromJson({{"sandbox", 5}}), ConfigError);
}

TEST(EngineConfigTest, RejectsWrongValueTypes) {
    EXPECT_THROW(EngineConfig::FromJson({{"workers", {{"parallel", "four"}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::FromJson({{"sandbox", {{"cpus", "two"}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::FromJson({{"detection", {{"disabled_adapters", "make"}}}}), ConfigError);
}

TEST(EngineConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(EngineConfig::FromJson({{"sandbox", {{"runtime", "vm"}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::FromJson({{"sandbox", {{"memory_mb", 64}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::FromJson({{"sandbox", {{"disk_mb", -1}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::FromJson({{"timeouts", {{"execute_seconds", 0}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::FromJson({{"workers", {{"parallel", 0}}}}), ConfigError);
    EXPECT_THROW(EngineConfig::FromJson({{"logging", {{"level", "loud"}}}}), ConfigError);
}

TEST(EngineConfigTest, MissingOrMalformedFileThrows) {
    TempDir dir;
    EXPECT_THROW(EngineConfig::LoadFromFile(dir.Path() / "absent.json"), ConfigError);
    auto path = dir.Write("broken.json", "{ not json");
    EXPECT_THROW(EngineConfig::LoadFromFile(path), ConfigError);
}

// ─── Builder ───────────────────────────────────────────────────

TEST(EngineConfigBuilderTest, OverridesOnTopOfBase) {
    EngineConfig base;
    base.workers.parallel = 2;
    auto config = EngineConfigBuilder(base)
                      .WithExecuteTimeout(std::chrono::seconds(42))
                      .DisableAdapter("make")
                      .Build();
    EXPECT_EQ(config.workers.parallel, 2u);
    EXPECT_EQ(config.timeouts.execute, std::chrono::seconds(42));
    ASSERT_EQ(config.detection.disabled_adapters.size(), 1u);
}

TEST(EngineConfigBuilderTest, BuildValidates) {
    EXPECT_THROW(EngineConfigBuilder().WithRuntime("qemu").Build(), ConfigError);
    EXPECT_THROW(EngineConfigBuilder().WithCPULimit(0).Build(), ConfigError);
    EXPECT_THROW(EngineConfigBuilder().WithMaxSandboxes(0).Build(), ConfigError);
    EXPECT_THROW(EngineConfigBuilder().WithMaxOutputBytes(0).Build(), ConfigError);
}
