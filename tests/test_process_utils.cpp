#include <gtest/gtest.h>
#include "crucible/utils/process_utils.hpp"
#include "test_helpers.hpp"

#include <chrono>

using namespace crucible::utils;
using crucible::testing::TempDir;

// ─── Basic Execution ───────────────────────────────────────────

TEST(ProcessUtilsTest, CapturesBothStreamsAndExitCode) {
    auto result = ProcessUtils::Run({"sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_FALSE(result.Succeeded());
}

TEST(ProcessUtilsTest, SucceededOnZeroExit) {
    auto result = ProcessUtils::Run({"true"});
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessUtilsTest, EmptyArgvThrows) {
    ProcessOptions options;
    EXPECT_THROW(ProcessUtils::Run(options), std::invalid_argument);
}

TEST(ProcessUtilsTest, MissingProgramReportsExecFailure) {
    auto result = ProcessUtils::Run({"crucible-no-such-program-xyz"});
    EXPECT_FALSE(result.started);
    EXPECT_EQ(result.exit_code, 127);
    EXPECT_FALSE(result.error_message.empty());
}

// ─── Options ───────────────────────────────────────────────────

TEST(ProcessUtilsTest, WorkingDirectoryAndEnvironment) {
    TempDir dir;
    dir.Write("marker.txt", "hello");

    ProcessOptions options;
    options.argv = {"sh", "-c", "cat marker.txt; printf ' %s' \"$CRUCIBLE_TEST_VAR\""};
    options.working_dir = dir.Path();
    options.environment["CRUCIBLE_TEST_VAR"] = "value";

    auto result = ProcessUtils::Run(options);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello value");
}

TEST(ProcessUtilsTest, TimeoutKillsProcessGroup) {
    ProcessOptions options;
    options.argv = {"sh", "-c", "sleep 30 & sleep 30"};
    options.timeout = std::chrono::milliseconds(300);

    auto start = std::chrono::steady_clock::now();
    auto result = ProcessUtils::Run(options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, 137);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ProcessUtilsTest, OutputIsCappedAndFlagged) {
    ProcessOptions options;
    options.argv = {"sh", "-c", "head -c 10000 /dev/zero | tr '\\0' a"};
    options.max_output_bytes = 1000;

    auto result = ProcessUtils::Run(options);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output.size(), 1000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
}

TEST(ProcessUtilsTest, IsOnPath) {
    EXPECT_TRUE(ProcessUtils::IsOnPath("sh"));
    EXPECT_FALSE(ProcessUtils::IsOnPath("crucible-no-such-program-xyz"));
}
