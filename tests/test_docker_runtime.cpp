#include <gtest/gtest.h>
#include "crucible/core/sandbox_runtime.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/utils/string_utils.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace crucible::core;
using crucible::testing::TempDir;
using crucible::utils::StringUtils;

namespace {

// Stand-in docker CLI: logs every invocation, fails `exec` the way a killed
// container does, and fails `create` on demand through marker files.
const char* kDockerScript = R"(#!/bin/sh
echo "$*" >> "$(dirname "$0")/calls.log"
case "$1" in
  create)
    for arg in "$@"; do
      if [ "$arg" = "--storage-opt" ] && [ -f "$(dirname "$0")/reject-storage" ]; then
        echo "Error response from daemon: --storage-opt is supported only for overlay over xfs" >&2
        exit 1
      fi
    done
    if [ -f "$(dirname "$0")/fail-create" ]; then
      echo "Error response from daemon: sandbox-specific create failure" >&2
      exit 1
    fi
    echo "cid-0123456789ab"
    ;;
  exec)
    echo "Error response from daemon: container cid-0123456789ab is not running" >&2
    exit 1
    ;;
esac
exit 0
)";

class DockerRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto script = bin_.Write("docker", kDockerScript);
        std::filesystem::permissions(script, std::filesystem::perms::owner_all);

        const char* path = std::getenv("PATH");
        saved_path_ = path ? path : "";
        ::setenv("PATH", (bin_.Path().string() + ":" + saved_path_).c_str(), 1);

        checkout_.Write("pom.xml", "<project/>");

        settings_.runtime = "docker";
        settings_.image = "runner:test";
        settings_.workspace_root = workspace_.Path();
        settings_.disk_mb = 2048;
    }

    void TearDown() override {
        ::setenv("PATH", saved_path_.c_str(), 1);
    }

    EvaluationJob Job() const {
        EvaluationJob job;
        job.repository.remote_url = "https://github.com/acme/orders.git";
        job.checkout_path = checkout_.Path();
        return job;
    }

    std::vector<std::string> Calls() const {
        std::ifstream log(bin_.Path() / "calls.log");
        std::stringstream buffer;
        buffer << log.rdbuf();
        return StringUtils::SplitLines(buffer.str());
    }

    std::vector<std::string> CallsStartingWith(const std::string& prefix) const {
        std::vector<std::string> matching;
        for (const auto& call : Calls()) {
            if (StringUtils::StartsWith(call, prefix)) {
                matching.push_back(call);
            }
        }
        return matching;
    }

    TempDir bin_;
    TempDir checkout_;
    TempDir workspace_;
    SandboxSettings settings_;
    std::string saved_path_;
};

} // namespace

// ─── Teardown ──────────────────────────────────────────────────

TEST_F(DockerRuntimeTest, DestroyWipesThroughThrowawayContainerWhenSandboxIsStopped) {
    DockerRuntime runtime(settings_);
    Sandbox sandbox = runtime.Provision(Job());
    EXPECT_EQ(sandbox.container_id, "cid-0123456789ab");
    std::string mount = std::filesystem::absolute(sandbox.host_workdir).string();

    runtime.Destroy(sandbox);

    auto removals = CallsStartingWith("rm --force cid-0123456789ab");
    EXPECT_EQ(removals.size(), 1u);

    auto wipes = CallsStartingWith("run --rm");
    ASSERT_EQ(wipes.size(), 1u);
    EXPECT_NE(wipes[0].find("--volume " + mount + ":/crucible-wipe"), std::string::npos);
    EXPECT_NE(wipes[0].find("--entrypoint find runner:test /crucible-wipe -mindepth 1 -delete"),
              std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(sandbox.host_root));
}

// ─── Provisioning Errors ───────────────────────────────────────

TEST_F(DockerRuntimeTest, RejectedDiskLimitRetriesWithoutStorageOpt) {
    bin_.Write("reject-storage");

    DockerRuntime runtime(settings_);
    Sandbox sandbox = runtime.Provision(Job());
    EXPECT_EQ(sandbox.container_id, "cid-0123456789ab");

    auto creates = CallsStartingWith("create");
    ASSERT_EQ(creates.size(), 2u);
    EXPECT_NE(creates[0].find("--storage-opt size=2048m"), std::string::npos);
    EXPECT_EQ(creates[1].find("--storage-opt"), std::string::npos);

    runtime.Destroy(sandbox);
}

TEST_F(DockerRuntimeTest, CreateFailureCarriesThatCallsError) {
    bin_.Write("fail-create");
    settings_.disk_mb = 0;

    DockerRuntime runtime(settings_);
    try {
        runtime.Provision(Job());
        FAIL() << "Provision should throw";
    } catch (const SandboxProvisionError& e) {
        EXPECT_NE(std::string(e.what()).find("sandbox-specific create failure"), std::string::npos);
    }

    EXPECT_TRUE(CallsStartingWith("start").empty());
    EXPECT_TRUE(std::filesystem::is_empty(workspace_.Path()));
}
