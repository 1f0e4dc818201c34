/**
 * @file worker_pool.cpp
 * @brief Implementation of the worker pool
 *
 * @date 2025
 */

#include "crucible/core/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <thread>

namespace crucible {
namespace core {

WorkerPool::WorkerPool(JobRunner& runner, SandboxCapacity& capacity, std::size_t parallel)
    : runner_(runner), capacity_(capacity), parallel_(parallel == 0 ? 1 : parallel) {
}

std::vector<TestRun> WorkerPool::RunAll(const std::vector<EvaluationJob>& jobs,
                                        const ResultSink& sink) {
    std::vector<TestRun> runs(jobs.size());
    if (jobs.empty()) {
        return runs;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> completed{0};
    const std::size_t total = jobs.size();

    auto worker = [&](std::size_t worker_id) {
        for (std::size_t index = next++; index < total; index = next++) {
            const EvaluationJob& job = jobs[index];
            spdlog::debug("Worker {} picked {}", worker_id, job.repository.remote_url);

            TestRun run;
            try {
                run = runner_.Run(job, capacity_);
            } catch (const std::exception& e) {
                spdlog::error("Worker {}: run for {} threw: {}", worker_id,
                              job.repository.remote_url, e.what());
                run = runner_.FailureRecord(job, RunOutcome::INTERNAL_ERROR,
                                            std::string("internal error: ") + e.what());
            }

            if (sink) {
                std::lock_guard<std::mutex> lock(sink_mutex_);
                try {
                    sink(run);
                } catch (const std::exception& e) {
                    spdlog::error("Worker {}: result sink failed for {}: {}", worker_id,
                                  job.repository.remote_url, e.what());
                }
            }

            runs[index] = std::move(run);
            spdlog::info("Progress: {}/{} evaluated", ++completed, total);
        }
    };

    std::size_t thread_count = std::min(parallel_, total);
    spdlog::info("Starting {} worker(s) for {} job(s)", thread_count, total);

    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    return runs;
}

} // namespace core
} // namespace crucible
