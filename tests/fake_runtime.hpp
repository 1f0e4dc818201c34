#pragma once

#include "crucible/core/errors.hpp"
#include "crucible/core/sandbox_runtime.hpp"

#include <atomic>
#include <mutex>
#include <vector>

namespace crucible {
namespace testing {

/**
 * In-memory SandboxRuntime. Provision points the sandbox at the job's
 * checkout; Execute answers from canned captures chosen by command kind
 * (commit lookup, network-enabled install, network-disabled test).
 */
class FakeRuntime : public core::SandboxRuntime {
public:
    std::string Name() const override { return "fake"; }
    bool IsAvailable() const override { return true; }

    core::Sandbox Provision(const core::EvaluationJob& job) override {
        ++provisions;
        if (fail_provision) {
            throw core::SandboxProvisionError("image not found");
        }
        core::Sandbox sandbox;
        sandbox.id = "fake-" + std::to_string(provisions.load());
        sandbox.runtime_name = Name();
        sandbox.host_root = job.checkout_path;
        sandbox.host_workdir = job.checkout_path;
        sandbox.sandbox_workdir = job.checkout_path;
        sandbox.install_network_allowed = true;
        sandbox.test_network_allowed = false;
        return sandbox;
    }

    core::ExecutionCapture Execute(const core::Sandbox&, const core::SandboxCommand& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        commands.push_back(command);

        if (!command.command.argv.empty() && command.command.argv[0] == "git") {
            ++commit_lookups;
            return commit_response;
        }
        if (command.command.network == core::NetworkPolicy::ENABLED) {
            ++installs;
            return install_response;
        }
        ++tests;
        return test_response;
    }

    void Destroy(const core::Sandbox&) noexcept override {
        ++destroys;
    }

    // Canned responses
    core::ExecutionCapture commit_response;
    core::ExecutionCapture install_response;
    core::ExecutionCapture test_response;
    bool fail_provision{false};

    // Observations
    std::atomic<int> provisions{0};
    std::atomic<int> destroys{0};
    int commit_lookups{0};
    int installs{0};
    int tests{0};
    std::vector<core::SandboxCommand> commands;

private:
    std::mutex mutex_;
};

} // namespace testing
} // namespace crucible
