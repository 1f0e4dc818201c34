/**
 * @file worker_pool.hpp
 * @brief Bounded pool of workers, each running one job at a time
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/evaluation_pipeline.hpp"
#include "crucible/core/sandbox_manager.hpp"
#include "crucible/core/types.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace crucible {
namespace core {

/// Receives each record as soon as its run finishes; calls are serialized
using ResultSink = std::function<void(const TestRun&)>;

/**
 * @class WorkerPool
 * @brief Fixed-size std::thread pool over a shared job queue
 *
 * Runs are isolated: an exception escaping one run (from the runner or the
 * sink) is logged and turned into an INTERNAL_ERROR record, and the other
 * workers carry on.
 *
 * **Usage Example**:
 * @code
 * WorkerPool pool(pipeline, capacity, config.workers.parallel);
 * auto runs = pool.RunAll(jobs, [&store](const TestRun& run) { store.Append(run); });
 * @endcode
 */
class WorkerPool {
public:
    WorkerPool(JobRunner& runner, SandboxCapacity& capacity, std::size_t parallel);

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Evaluate every job; blocks until all have a record
     * @param jobs Jobs to evaluate
     * @param sink Optional per-record callback
     * @return One record per job, in job order
     */
    std::vector<TestRun> RunAll(const std::vector<EvaluationJob>& jobs,
                                const ResultSink& sink = nullptr);

    std::size_t Parallelism() const { return parallel_; }

private:
    JobRunner& runner_;
    SandboxCapacity& capacity_;
    std::size_t parallel_;
    std::mutex sink_mutex_;
};

} // namespace core
} // namespace crucible
