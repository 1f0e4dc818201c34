/**
 * @file test_detector.cpp
 * @brief Implementation of adapter selection and integration test discovery
 *
 * @date 2025
 */

#include "crucible/core/test_detector.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace crucible {
namespace core {

using utils::StringUtils;

namespace {

const std::set<std::string> kSourceExtensions = {
    ".java", ".kt", ".scala", ".go", ".rs", ".js", ".mjs", ".cjs", ".jsx",
    ".ts", ".tsx", ".py", ".cs", ".fs", ".rb", ".sh"
};

std::string Extension(const std::string& base) {
    auto pos = base.rfind('.');
    return pos == std::string::npos ? "" : base.substr(pos);
}

/**
 * @brief How specifically a path names an integration test
 * @return 0 if not an integration test
 */
int IntegrationScore(const std::string& path) {
    std::string base = BaseName(path);
    std::string ext = Extension(base);
    if (kSourceExtensions.count(ext) == 0) {
        return 0;
    }

    std::string stem = base.substr(0, base.size() - ext.size());
    std::string lower_path = StringUtils::ToLower(path);
    std::string lower_stem = StringUtils::ToLower(stem);

    // Naming conventions: OrderIT.java, OrderIntegrationTest.kt, db_integration_test.go,
    // api.integration.test.ts, test_integration_db.py
    if (StringUtils::EndsWith(stem, "IT") || StringUtils::EndsWith(stem, "ITCase") ||
        StringUtils::EndsWith(lower_stem, "integrationtest") ||
        StringUtils::EndsWith(lower_stem, "integrationtests") ||
        StringUtils::EndsWith(lower_stem, "_integration_test") ||
        StringUtils::Contains(lower_stem, ".integration.") ||
        StringUtils::Contains(lower_stem, ".int.test") ||
        StringUtils::StartsWith(lower_stem, "test_integration")) {
        return 3;
    }

    // Directory conventions: src/it/, tests/integration/, integration_tests/
    if (StringUtils::Contains(lower_path, "integration") ||
        StringUtils::StartsWith(path, "src/it/") ||
        StringUtils::Contains(path, "/src/it/")) {
        return 2;
    }

    // Cargo: every file directly in tests/ is an integration test
    if (ext == ".rs" && StringUtils::StartsWith(path, "tests/") &&
        path.find('/', 6) == std::string::npos) {
        return 2;
    }

    if (StringUtils::Contains(lower_path, "e2e")) {
        return 1;
    }

    return 0;
}

} // anonymous namespace

TestDetector::TestDetector(std::shared_ptr<const adapters::AdapterRegistry> registry,
                           RepoTreeOptions options)
    : registry_(std::move(registry)), options_(std::move(options)) {
    if (!registry_) {
        throw std::invalid_argument("TestDetector requires an adapter registry");
    }
}

std::optional<DetectedInvocation> TestDetector::Detect(const Sandbox& sandbox) const {
    RepoTree tree = RepoTree::Scan(sandbox.host_workdir, options_);

    spdlog::debug("[detect] Scanned {} entries in {}{}", tree.EntryCount(),
                  sandbox.host_workdir.string(), tree.Truncated() ? " (truncated)" : "");

    return DetectInTree(tree);
}

std::optional<DetectedInvocation> TestDetector::DetectInTree(const RepoTree& tree) const {
    for (const auto* adapter : registry_->Ordered()) {
        auto marker = adapter->FingerprintMatch(tree);
        if (!marker) {
            continue;
        }

        DetectedInvocation invocation;
        invocation.framework = adapter->GetFramework();
        invocation.adapter_name = adapter->GetName();
        invocation.install_command = adapter->InstallCommand(tree);
        invocation.test_command = adapter->TestCommand(tree);
        invocation.fingerprint = *marker;
        invocation.integration_test_files = FindIntegrationTestFiles(tree);

        spdlog::info("[detect] {} matched on {}", invocation.adapter_name, invocation.fingerprint);
        spdlog::debug("[detect] install: {}", invocation.install_command
                          ? invocation.install_command->ToString() : std::string("(none)"));
        spdlog::debug("[detect] test: {}", invocation.test_command.ToString());
        spdlog::debug("[detect] {} integration test file(s)", invocation.integration_test_files.size());

        return invocation;
    }

    spdlog::info("[detect] No adapter matched");
    return std::nullopt;
}

std::vector<std::string> TestDetector::FindIntegrationTestFiles(const RepoTree& tree) {
    std::vector<std::pair<int, std::string>> scored;

    for (const auto& file : tree.Files()) {
        int score = IntegrationScore(file);
        if (score > 0) {
            scored.emplace_back(score, file);
        }
    }

    // Files() is sorted, so stable_sort keeps paths ordered within a score
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::string> files;
    files.reserve(scored.size());
    for (auto& [score, file] : scored) {
        files.push_back(std::move(file));
    }
    return files;
}

std::string TestDetector::LoadIntegrationTestContent(const RepoTree& tree,
                                                     const std::vector<std::string>& files,
                                                     std::size_t max_bytes) {
    for (const auto& file : files) {
        auto content = tree.ReadFile(file, max_bytes);
        if (content) {
            return *content;
        }
        spdlog::debug("[detect] Could not read integration test {}", file);
    }
    return "";
}

} // namespace core
} // namespace crucible
