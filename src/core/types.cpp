/**
 * @file types.cpp
 * @brief String conversions for the shared data model
 *
 * @date 2025
 */

#include "crucible/core/types.hpp"
#include "crucible/utils/string_utils.hpp"

namespace crucible {
namespace core {

CommandLine CommandLine::Shell(const std::string& script, NetworkPolicy network) {
    CommandLine cmd;
    cmd.argv = {"sh", "-c", script};
    cmd.network = network;
    return cmd;
}

std::string CommandLine::ToString() const {
    if (argv.size() == 3 && argv[0] == "sh" && argv[1] == "-c") {
        return argv[2];
    }
    return utils::StringUtils::Join(argv, " ");
}

std::string FrameworkToString(Framework framework) {
    switch (framework) {
        case Framework::MILL:   return "mill";
        case Framework::SBT:    return "sbt";
        case Framework::MAVEN:  return "maven";
        case Framework::GRADLE: return "gradle";
        case Framework::GO:     return "go";
        case Framework::CARGO:  return "cargo";
        case Framework::JEST:   return "jest";
        case Framework::VITEST: return "vitest";
        case Framework::MOCHA:  return "mocha";
        case Framework::NPM:    return "npm";
        case Framework::PYTEST: return "pytest";
        case Framework::DOTNET: return "dotnet";
        case Framework::MAKE:   return "make";
        case Framework::CUSTOM: return "custom";
        case Framework::NONE:   return "none";
    }
    return "none";
}

std::optional<Framework> FrameworkFromString(const std::string& name) {
    static const Framework all[] = {
        Framework::MILL, Framework::SBT, Framework::MAVEN, Framework::GRADLE,
        Framework::GO, Framework::CARGO, Framework::JEST, Framework::VITEST,
        Framework::MOCHA, Framework::NPM, Framework::PYTEST, Framework::DOTNET,
        Framework::MAKE, Framework::CUSTOM, Framework::NONE
    };

    std::string lower = utils::StringUtils::ToLower(name);
    for (Framework f : all) {
        if (FrameworkToString(f) == lower) {
            return f;
        }
    }
    return std::nullopt;
}

std::string RunOutcomeToString(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::PASSED:                  return "PASSED";
        case RunOutcome::TESTS_FAILED:            return "TESTS_FAILED";
        case RunOutcome::EXECUTION_TIMEOUT:       return "EXECUTION_TIMEOUT";
        case RunOutcome::NO_TESTS_DETECTED:       return "NO_TESTS_DETECTED";
        case RunOutcome::INSTALL_ERROR:           return "INSTALL_ERROR";
        case RunOutcome::SANDBOX_PROVISION_ERROR: return "SANDBOX_PROVISION_ERROR";
        case RunOutcome::WORKER_TIMEOUT:          return "WORKER_TIMEOUT";
        case RunOutcome::INTERNAL_ERROR:          return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

std::string TestStatusToString(TestStatus status) {
    switch (status) {
        case TestStatus::PASSED:  return "PASSED";
        case TestStatus::FAILED:  return "FAILED";
        case TestStatus::INVALID: return "INVALID";
    }
    return "INVALID";
}

TestStatus StatusForOutcome(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::PASSED:
            return TestStatus::PASSED;
        case RunOutcome::TESTS_FAILED:
        case RunOutcome::EXECUTION_TIMEOUT:
            return TestStatus::FAILED;
        default:
            return TestStatus::INVALID;
    }
}

} // namespace core
} // namespace crucible
