/**
 * @file sandbox_manager.cpp
 * @brief Implementation of capacity tokens, leases and the sandbox manager
 *
 * @date 2025
 */

#include "crucible/core/sandbox_manager.hpp"

#include <spdlog/spdlog.h>

namespace crucible {
namespace core {

// ============================================================================
// CAPACITY TOKEN
// ============================================================================

CapacityToken::~CapacityToken() {
    Return();
}

CapacityToken::CapacityToken(CapacityToken&& other) noexcept
    : owner_(other.owner_) {
    other.owner_ = nullptr;
}

CapacityToken& CapacityToken::operator=(CapacityToken&& other) noexcept {
    if (this != &other) {
        Return();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void CapacityToken::Return() {
    if (owner_) {
        owner_->Release();
        owner_ = nullptr;
    }
}

// ============================================================================
// SANDBOX CAPACITY
// ============================================================================

SandboxCapacity::SandboxCapacity(std::size_t limit)
    : limit_(limit == 0 ? 1 : limit) {
}

std::optional<CapacityToken> SandboxCapacity::Acquire(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!available_.wait_until(lock, deadline, [this] { return in_use_ < limit_; })) {
        return std::nullopt;
    }

    ++in_use_;
    return CapacityToken(this);
}

std::size_t SandboxCapacity::InUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

void SandboxCapacity::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    available_.notify_one();
}

// ============================================================================
// SANDBOX LEASE
// ============================================================================

SandboxLease::SandboxLease(SandboxManager* manager, Sandbox sandbox, CapacityToken token)
    : manager_(manager), sandbox_(std::move(sandbox)), token_(std::move(token)) {
}

SandboxLease::~SandboxLease() {
    ReleaseNow();
}

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : manager_(other.manager_),
      sandbox_(std::move(other.sandbox_)),
      token_(std::move(other.token_)) {
    other.manager_ = nullptr;
}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
    if (this != &other) {
        ReleaseNow();
        manager_ = other.manager_;
        sandbox_ = std::move(other.sandbox_);
        token_ = std::move(other.token_);
        other.manager_ = nullptr;
    }
    return *this;
}

void SandboxLease::ReleaseNow() noexcept {
    if (!manager_) {
        return;
    }
    SandboxManager* manager = manager_;
    manager_ = nullptr;

    manager->Destroy(sandbox_);
    token_.Return();
}

// ============================================================================
// SANDBOX MANAGER
// ============================================================================

SandboxManager::SandboxManager(SandboxRuntime& runtime)
    : runtime_(runtime) {
}

SandboxLease SandboxManager::Acquire(const EvaluationJob& job,
                                     SandboxCapacity& capacity,
                                     std::chrono::steady_clock::time_point deadline) {
    spdlog::debug("[sandbox] Waiting for capacity ({}/{} in use)",
                  capacity.InUse(), capacity.Limit());

    auto token = capacity.Acquire(deadline);
    if (!token) {
        throw DeadlineExceeded("Deadline expired while waiting for sandbox capacity");
    }

    // Provision failures return the token as it unwinds
    Sandbox sandbox = runtime_.Provision(job);
    ++active_;

    return SandboxLease(this, std::move(sandbox), std::move(*token));
}

void SandboxManager::Release(SandboxLease& lease) noexcept {
    lease.ReleaseNow();
}

void SandboxManager::Destroy(const Sandbox& sandbox) noexcept {
    runtime_.Destroy(sandbox);
    --active_;
    ++releases_;
    spdlog::debug("[sandbox] {} released", sandbox.id);
}

} // namespace core
} // namespace crucible
