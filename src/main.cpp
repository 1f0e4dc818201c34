/**
 * @file main.cpp
 * @brief Crucible integration-test evaluation engine - Command-line interface
 *
 * Loads the engine configuration, builds the job list from a repo-list file
 * and/or `REMOTE_URL=CHECKOUT` arguments, skips repositories the result store
 * already holds, and evaluates the rest on the worker pool. Every record is
 * appended to the JSON-Lines store as soon as its run finishes.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include "crucible/adapters/adapter_registry.hpp"
#include "crucible/core/engine_config.hpp"
#include "crucible/core/evaluation_pipeline.hpp"
#include "crucible/core/job_loader.hpp"
#include "crucible/core/sandbox_manager.hpp"
#include "crucible/core/sandbox_runtime.hpp"
#include "crucible/core/worker_pool.hpp"
#include "crucible/reporters/result_store.hpp"

#include <atomic>
#include <filesystem>
#include <iostream>
#include <map>

using namespace crucible;

/*******************************************************************************
 * Summary Output
 ******************************************************************************/

void PrintRunSummary(const std::vector<core::TestRun>& runs) {
    std::map<std::string, int> by_outcome;
    int passed = 0;
    for (const auto& run : runs) {
        by_outcome[core::RunOutcomeToString(run.outcome)]++;
        if (run.pass) {
            passed++;
        }
    }

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[DONE] {} evaluated, {} passed", runs.size(), passed);
    for (const auto& [outcome, count] : by_outcome) {
        spdlog::info("  {:<24} {}", outcome, count);
    }
    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
}

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Crucible - sandboxed integration test evaluation"};

    std::string config_path;
    std::string repo_list_path;
    std::size_t parallel = 0;
    std::size_t batch_size = 0;
    std::string output_path = "./results.jsonl";
    std::string runtime;
    int timeout_seconds = 0;
    bool verbose = false;
    std::vector<std::string> job_specs;

    app.add_option("-c,--config", config_path, "JSON engine configuration")
        ->check(CLI::ExistingFile);
    app.add_option("-l,--repo-list", repo_list_path,
                   "JSON array of {remoteUrl, checkout, languages?, commitId?}")
        ->check(CLI::ExistingFile);
    app.add_option("-p,--parallel", parallel, "Worker pool size (overrides config)")
        ->check(CLI::PositiveNumber);
    app.add_option("-b,--batch-size", batch_size,
                   "Evaluate at most N jobs not already present in the store");
    app.add_option("-o,--output", output_path, "JSON-Lines result store")
        ->default_val("./results.jsonl");
    app.add_option("--runtime", runtime, "Sandbox backend")
        ->check(CLI::IsMember({"docker", "local"}));
    app.add_option("--timeout", timeout_seconds, "Test execution timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("repos", job_specs, "REMOTE_URL=CHECKOUT pairs");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

    try {
        // ====================================================================
        // Configuration
        // ====================================================================
        core::EngineConfig base = config_path.empty()
            ? core::EngineConfig{}
            : core::EngineConfig::LoadFromFile(config_path);

        core::EngineConfigBuilder builder(base);
        if (!runtime.empty()) {
            builder.WithRuntime(runtime);
        }
        if (parallel > 0) {
            builder.WithParallel(parallel);
        }
        if (timeout_seconds > 0) {
            builder.WithExecuteTimeout(std::chrono::seconds(timeout_seconds));
        }
        if (verbose) {
            builder.WithLogLevel("debug");
        }
        const core::EngineConfig config = builder.Build();

        spdlog::set_pattern(config.logging.pattern);
        spdlog::set_level(spdlog::level::from_str(config.logging.level));
        spdlog::debug("[DEBUG] Effective configuration: {}", config.ToJson().dump());

        // ====================================================================
        // Jobs
        // ====================================================================
        std::vector<core::EvaluationJob> jobs;
        if (!repo_list_path.empty()) {
            jobs = core::JobLoader::LoadFromFile(repo_list_path);
        }
        for (const auto& spec : job_specs) {
            jobs.push_back(core::JobLoader::ParseSpec(spec));
        }
        if (jobs.empty()) {
            std::cerr << "No repositories given; use --repo-list or REMOTE_URL=CHECKOUT\n"
                      << app.help() << std::endl;
            return 1;
        }

        reporters::JsonlResultStore store(output_path);
        auto selected = core::JobLoader::SelectBatch(jobs, store.EvaluatedUrls(), batch_size);
        spdlog::info("[INIT] {} job(s) given, {} selected for evaluation", jobs.size(), selected.size());
        if (selected.empty()) {
            spdlog::info("[DONE] Nothing to evaluate");
            return 0;
        }

        // ====================================================================
        // Engine
        // ====================================================================
        auto registry = adapters::AdapterRegistry::CreateFromSettings(config.detection);
        auto sandbox_runtime = core::CreateSandboxRuntime(config.sandbox);

        spdlog::info("[INIT] Sandbox runtime: {}", sandbox_runtime->Name());
        if (!sandbox_runtime->IsAvailable()) {
            spdlog::error("[INIT] Runtime '{}' is not available; runs will be recorded as {}",
                          sandbox_runtime->Name(),
                          core::RunOutcomeToString(core::RunOutcome::SANDBOX_PROVISION_ERROR));
        }

        core::EvaluationPipeline pipeline(config, *sandbox_runtime, registry);
        core::SandboxCapacity capacity(config.workers.max_sandboxes);
        core::WorkerPool pool(pipeline, capacity, config.workers.parallel);

        std::atomic<std::size_t> store_failures{0};
        auto runs = pool.RunAll(selected, [&](const core::TestRun& run) {
            try {
                store.Append(run);
            } catch (const reporters::StoreError& e) {
                spdlog::error("[STORE] {}", e.what());
                ++store_failures;
            }
        });

        PrintRunSummary(runs);
        spdlog::info("[REPORT] Records appended to {}", output_path);

        if (store_failures > 0) {
            spdlog::error("[ERROR] {} record(s) could not be stored", store_failures.load());
            return 1;
        }
        return 0;

    } catch (const core::ConfigError& e) {
        spdlog::error("[ERROR] Configuration error: {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
