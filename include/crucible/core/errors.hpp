/**
 * @file errors.hpp
 * @brief Exception types raised at provisioning and deadline boundaries
 *
 * Stage outcomes (install failure, no tests detected, parse ambiguity) are
 * carried as values; only conditions that abort a stage mid-flight are
 * thrown, and the pipeline converts every one of them into a record.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace crucible {
namespace core {

/**
 * @class SandboxProvisionError
 * @brief Runtime unavailable, image missing, copy failure or resource exhaustion
 */
class SandboxProvisionError : public std::runtime_error {
public:
    explicit SandboxProvisionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class DeadlineExceeded
 * @brief The worker-level deadline expired while waiting or between stages
 */
class DeadlineExceeded : public std::runtime_error {
public:
    explicit DeadlineExceeded(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace core
} // namespace crucible
