#include <gtest/gtest.h>
#include "crucible/core/sandbox_runtime.hpp"
#include "crucible/core/errors.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using namespace crucible::core;
using crucible::testing::TempDir;

namespace {

SandboxSettings LocalSettings(const TempDir& workspace) {
    SandboxSettings settings;
    settings.runtime = "local";
    settings.workspace_root = workspace.Path();
    settings.pids_limit = 0;
    return settings;
}

SandboxCommand Shell(const std::string& script, std::chrono::milliseconds timeout = std::chrono::seconds(30)) {
    SandboxCommand command;
    command.command = CommandLine::Shell(script);
    command.timeout = timeout;
    return command;
}

} // namespace

// ─── Provisioning ──────────────────────────────────────────────

TEST(LocalRuntimeTest, ProvisionCopiesCheckoutAndDestroyRemovesIt) {
    TempDir checkout;
    TempDir workspace;
    checkout.Write("pom.xml", "<project/>");
    checkout.Write("src/it/java/ApiIT.java", "class ApiIT {}");

    LocalRuntime runtime(LocalSettings(workspace));
    EvaluationJob job;
    job.repository.remote_url = "https://example.com/api.git";
    job.checkout_path = checkout.Path();

    Sandbox sandbox = runtime.Provision(job);
    EXPECT_EQ(sandbox.runtime_name, "local");
    EXPECT_EQ(sandbox.id.rfind("crucible-", 0), 0u);
    EXPECT_TRUE(std::filesystem::exists(sandbox.host_workdir / "pom.xml"));
    EXPECT_TRUE(std::filesystem::exists(sandbox.host_workdir / "src/it/java/ApiIT.java"));
    EXPECT_NE(sandbox.host_workdir.string(), checkout.Path().string());

    runtime.Destroy(sandbox);
    EXPECT_FALSE(std::filesystem::exists(sandbox.host_root));
    EXPECT_TRUE(std::filesystem::exists(checkout.Path() / "pom.xml"));
}

TEST(LocalRuntimeTest, ProvisionRejectsMissingCheckout) {
    TempDir workspace;
    LocalRuntime runtime(LocalSettings(workspace));
    EvaluationJob job;
    job.checkout_path = workspace.Path() / "does-not-exist";
    EXPECT_THROW(runtime.Provision(job), SandboxProvisionError);
}

TEST(LocalRuntimeTest, SandboxIdsAreUnique) {
    TempDir checkout;
    TempDir workspace;
    LocalRuntime runtime(LocalSettings(workspace));
    EvaluationJob job;
    job.checkout_path = checkout.Path();

    Sandbox a = runtime.Provision(job);
    Sandbox b = runtime.Provision(job);
    EXPECT_NE(a.id, b.id);
    runtime.Destroy(a);
    runtime.Destroy(b);
}

// ─── Execution ─────────────────────────────────────────────────

TEST(LocalRuntimeTest, ExecuteRunsInsideCopiedCheckout) {
    TempDir checkout;
    TempDir workspace;
    checkout.Write("marker.txt", "present");

    LocalRuntime runtime(LocalSettings(workspace));
    EvaluationJob job;
    job.checkout_path = checkout.Path();
    Sandbox sandbox = runtime.Provision(job);

    auto capture = runtime.Execute(sandbox, Shell("cat marker.txt; touch created.txt; echo oops >&2; exit 4"));
    EXPECT_EQ(capture.stdout_output, "present");
    EXPECT_EQ(capture.stderr_output, "oops\n");
    EXPECT_EQ(capture.return_code, 4);
    EXPECT_FALSE(capture.timed_out);

    // Writes land in the copy, never in the original checkout
    EXPECT_TRUE(std::filesystem::exists(sandbox.host_workdir / "created.txt"));
    EXPECT_FALSE(std::filesystem::exists(checkout.Path() / "created.txt"));

    runtime.Destroy(sandbox);
}

TEST(LocalRuntimeTest, ExecutePassesEnvironmentAndHonoursTimeout) {
    TempDir checkout;
    TempDir workspace;
    LocalRuntime runtime(LocalSettings(workspace));
    EvaluationJob job;
    job.checkout_path = checkout.Path();
    Sandbox sandbox = runtime.Provision(job);

    SandboxCommand env = Shell("printf %s \"$CI\"");
    env.command.environment["CI"] = "true";
    EXPECT_EQ(runtime.Execute(sandbox, env).stdout_output, "true");

    auto slow = runtime.Execute(sandbox, Shell("sleep 30", std::chrono::milliseconds(300)));
    EXPECT_TRUE(slow.timed_out);
    EXPECT_NE(slow.return_code, 0);

    runtime.Destroy(sandbox);
}

TEST(LocalRuntimeTest, MissingProgramReportsInStderr) {
    TempDir checkout;
    TempDir workspace;
    LocalRuntime runtime(LocalSettings(workspace));
    EvaluationJob job;
    job.checkout_path = checkout.Path();
    Sandbox sandbox = runtime.Provision(job);

    SandboxCommand command;
    command.command.argv = {"crucible-no-such-program-xyz"};
    auto capture = runtime.Execute(sandbox, command);
    EXPECT_EQ(capture.return_code, 127);
    EXPECT_NE(capture.stderr_output.find("crucible-no-such-program-xyz"), std::string::npos);

    runtime.Destroy(sandbox);
}

// ─── Factory ───────────────────────────────────────────────────

TEST(SandboxRuntimeFactoryTest, CreatesByName) {
    SandboxSettings settings;
    settings.runtime = "local";
    EXPECT_EQ(CreateSandboxRuntime(settings)->Name(), "local");

    settings.runtime = "docker";
    EXPECT_EQ(CreateSandboxRuntime(settings)->Name(), "docker");

    settings.runtime = "firecracker";
    EXPECT_THROW(CreateSandboxRuntime(settings), ConfigError);
}
