#include <gtest/gtest.h>
#include "crucible/core/sandbox_manager.hpp"
#include "fake_runtime.hpp"

#include <thread>

using namespace crucible::core;
using crucible::testing::FakeRuntime;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {

EvaluationJob Job() {
    EvaluationJob job;
    job.repository.remote_url = "https://example.com/repo.git";
    job.checkout_path = "/tmp/checkout";
    return job;
}

steady_clock::time_point Soon(int ms = 2000) {
    return steady_clock::now() + milliseconds(ms);
}

} // namespace

// ─── Capacity ──────────────────────────────────────────────────

TEST(SandboxCapacityTest, ZeroLimitBecomesOne) {
    SandboxCapacity capacity(0);
    EXPECT_EQ(capacity.Limit(), 1u);
}

TEST(SandboxCapacityTest, AcquireTimesOutWhenExhausted) {
    SandboxCapacity capacity(1);
    auto first = capacity.Acquire(Soon());
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(capacity.InUse(), 1u);

    auto second = capacity.Acquire(steady_clock::now() + milliseconds(50));
    EXPECT_FALSE(second.has_value());
}

TEST(SandboxCapacityTest, TokenDestructionReturnsUnit) {
    SandboxCapacity capacity(1);
    {
        auto token = capacity.Acquire(Soon());
        ASSERT_TRUE(token.has_value());
    }
    EXPECT_EQ(capacity.InUse(), 0u);
}

TEST(SandboxCapacityTest, ReturnIsIdempotentAndMovesTransferOwnership) {
    SandboxCapacity capacity(2);
    auto token = capacity.Acquire(Soon());
    ASSERT_TRUE(token.has_value());

    CapacityToken moved = std::move(*token);
    EXPECT_FALSE(token->Valid());
    EXPECT_TRUE(moved.Valid());
    EXPECT_EQ(capacity.InUse(), 1u);

    moved.Return();
    moved.Return();
    EXPECT_EQ(capacity.InUse(), 0u);
}

TEST(SandboxCapacityTest, WaiterWakesWhenUnitReturns) {
    SandboxCapacity capacity(1);
    auto held = capacity.Acquire(Soon());
    ASSERT_TRUE(held.has_value());

    std::thread releaser([&] {
        std::this_thread::sleep_for(milliseconds(50));
        held->Return();
    });

    auto waited = capacity.Acquire(Soon(5000));
    releaser.join();
    EXPECT_TRUE(waited.has_value());
}

// ─── Manager / Lease ───────────────────────────────────────────

TEST(SandboxManagerTest, LeaseReleasesExactlyOnce) {
    FakeRuntime runtime;
    SandboxManager manager(runtime);
    SandboxCapacity capacity(1);

    {
        SandboxLease lease = manager.Acquire(Job(), capacity, Soon());
        EXPECT_TRUE(lease.Active());
        EXPECT_EQ(manager.ActiveCount(), 1u);
        EXPECT_EQ(capacity.InUse(), 1u);

        manager.Release(lease);
        EXPECT_FALSE(lease.Active());
        manager.Release(lease);
    }

    EXPECT_EQ(runtime.destroys.load(), 1);
    EXPECT_EQ(manager.ReleaseCount(), 1u);
    EXPECT_EQ(manager.ActiveCount(), 0u);
    EXPECT_EQ(capacity.InUse(), 0u);
}

TEST(SandboxManagerTest, DestructorReleasesUnreleasedLease) {
    FakeRuntime runtime;
    SandboxManager manager(runtime);
    SandboxCapacity capacity(1);

    {
        SandboxLease lease = manager.Acquire(Job(), capacity, Soon());
        SandboxLease moved = std::move(lease);
        EXPECT_FALSE(lease.Active());
        EXPECT_TRUE(moved.Active());
    }

    EXPECT_EQ(runtime.destroys.load(), 1);
    EXPECT_EQ(capacity.InUse(), 0u);
}

TEST(SandboxManagerTest, ProvisionFailureReturnsCapacity) {
    FakeRuntime runtime;
    runtime.fail_provision = true;
    SandboxManager manager(runtime);
    SandboxCapacity capacity(1);

    EXPECT_THROW(manager.Acquire(Job(), capacity, Soon()), SandboxProvisionError);
    EXPECT_EQ(capacity.InUse(), 0u);
    EXPECT_EQ(runtime.destroys.load(), 0);
}

TEST(SandboxManagerTest, ExhaustedCapacityThrowsDeadlineExceeded) {
    FakeRuntime runtime;
    SandboxManager manager(runtime);
    SandboxCapacity capacity(1);

    SandboxLease held = manager.Acquire(Job(), capacity, Soon());
    EXPECT_THROW(manager.Acquire(Job(), capacity, steady_clock::now() + milliseconds(50)),
                 DeadlineExceeded);
    EXPECT_EQ(runtime.provisions.load(), 1);
}
