/**
 * @file result_store.hpp
 * @brief Append-only persistence of TestRun records
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/types.hpp"

#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace crucible {
namespace reporters {

/**
 * @class StoreError
 * @brief The store could not persist a record
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ResultStore
 * @brief Persistence seam for evaluation records
 */
class ResultStore {
public:
    virtual ~ResultStore() = default;

    /**
     * @brief Persist one record
     * @throws StoreError on write failure
     */
    virtual void Append(const core::TestRun& run) = 0;

    /// Remote URLs that already have a record
    virtual std::set<std::string> EvaluatedUrls() const = 0;
};

/**
 * @class JsonlResultStore
 * @brief One compact JSON document per line, appended under a mutex
 *
 * Each Append opens the file in append mode, writes one line and flushes,
 * so a crash loses at most the record being written. Lines that fail to
 * parse on read-back (a torn final line) are skipped with a warning.
 */
class JsonlResultStore : public ResultStore {
public:
    explicit JsonlResultStore(std::filesystem::path path);

    void Append(const core::TestRun& run) override;
    std::set<std::string> EvaluatedUrls() const override;

    const std::filesystem::path& Path() const { return path_; }

    /// Records appended through this instance
    std::size_t AppendedCount() const;

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::size_t appended_{0};
};

} // namespace reporters
} // namespace crucible
