/**
 * @file sandbox_manager.hpp
 * @brief Capacity-bounded sandbox acquisition with scoped release
 *
 * **Ownership**:
 * ```
 * SandboxCapacity (shared by all workers)
 *     └─ CapacityToken (move-only, one per live sandbox)
 *            └─ SandboxLease (move-only, owns token + Sandbox handle)
 * ```
 *
 * A lease is released exactly once: explicitly through
 * SandboxManager::Release, or by its destructor on any other exit path
 * (exception, early return, deadline).
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/errors.hpp"
#include "crucible/core/sandbox_runtime.hpp"
#include "crucible/core/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace crucible {
namespace core {

class SandboxCapacity;

/**
 * @class CapacityToken
 * @brief One unit of sandbox capacity; returned to the pool on destruction
 */
class CapacityToken {
public:
    CapacityToken() = default;
    ~CapacityToken();

    CapacityToken(CapacityToken&& other) noexcept;
    CapacityToken& operator=(CapacityToken&& other) noexcept;

    CapacityToken(const CapacityToken&) = delete;
    CapacityToken& operator=(const CapacityToken&) = delete;

    bool Valid() const { return owner_ != nullptr; }

    /// Give the unit back early; no-op if already returned
    void Return();

private:
    friend class SandboxCapacity;
    explicit CapacityToken(SandboxCapacity* owner) : owner_(owner) {}

    SandboxCapacity* owner_{nullptr};
};

/**
 * @class SandboxCapacity
 * @brief Counting semaphore bounding concurrently provisioned sandboxes
 *
 * Must outlive every token it hands out.
 */
class SandboxCapacity {
public:
    explicit SandboxCapacity(std::size_t limit);

    SandboxCapacity(const SandboxCapacity&) = delete;
    SandboxCapacity& operator=(const SandboxCapacity&) = delete;

    /**
     * @brief Wait for a free unit
     * @param deadline Give up at this point
     * @return Token, or nullopt if the deadline passed first
     */
    std::optional<CapacityToken> Acquire(std::chrono::steady_clock::time_point deadline);

    std::size_t Limit() const { return limit_; }
    std::size_t InUse() const;

private:
    friend class CapacityToken;
    void Release();

    const std::size_t limit_;
    std::size_t in_use_{0};
    mutable std::mutex mutex_;
    std::condition_variable available_;
};

class SandboxManager;

/**
 * @class SandboxLease
 * @brief RAII ownership of one provisioned sandbox
 */
class SandboxLease {
public:
    SandboxLease() = default;
    ~SandboxLease();

    SandboxLease(SandboxLease&& other) noexcept;
    SandboxLease& operator=(SandboxLease&& other) noexcept;

    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;

    const Sandbox& Get() const { return sandbox_; }
    const Sandbox* operator->() const { return &sandbox_; }

    /// True until released
    bool Active() const { return manager_ != nullptr; }

private:
    friend class SandboxManager;
    SandboxLease(SandboxManager* manager, Sandbox sandbox, CapacityToken token);

    void ReleaseNow() noexcept;

    SandboxManager* manager_{nullptr};
    Sandbox sandbox_;
    CapacityToken token_;
};

/**
 * @class SandboxManager
 * @brief Hands out sandbox leases backed by a SandboxRuntime
 *
 * **Usage Example**:
 * @code
 * SandboxCapacity capacity(4);
 * SandboxManager manager(runtime);
 *
 * auto lease = manager.Acquire(job, capacity, deadline);
 * runtime.Execute(lease.Get(), command);
 * manager.Release(lease);   // or let the lease go out of scope
 * @endcode
 *
 * **Thread Safety**: Safe for concurrent use by worker threads.
 */
class SandboxManager {
public:
    explicit SandboxManager(SandboxRuntime& runtime);

    SandboxManager(const SandboxManager&) = delete;
    SandboxManager& operator=(const SandboxManager&) = delete;

    /**
     * @brief Wait for capacity, then provision a sandbox for the job
     * @param job Job whose checkout seeds the sandbox
     * @param capacity Shared capacity semaphore
     * @param deadline Worker deadline; bounds the capacity wait
     * @return Active lease
     * @throws DeadlineExceeded if no capacity frees up before the deadline
     * @throws SandboxProvisionError if the runtime cannot provision
     */
    SandboxLease Acquire(const EvaluationJob& job,
                         SandboxCapacity& capacity,
                         std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Destroy the sandbox and return its capacity; no-op if already released
     */
    void Release(SandboxLease& lease) noexcept;

    SandboxRuntime& Runtime() { return runtime_; }

    /// Sandboxes currently provisioned through this manager
    std::size_t ActiveCount() const { return active_.load(); }

    /// Total releases performed
    std::size_t ReleaseCount() const { return releases_.load(); }

private:
    friend class SandboxLease;
    void Destroy(const Sandbox& sandbox) noexcept;

    SandboxRuntime& runtime_;
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> releases_{0};
};

} // namespace core
} // namespace crucible
