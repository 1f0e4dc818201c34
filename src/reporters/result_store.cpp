/**
 * @file result_store.cpp
 * @brief Implementation of the JSON-Lines result store
 *
 * @date 2025
 */

#include "crucible/reporters/result_store.hpp"
#include "crucible/reporters/json_reporter.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>

namespace crucible {
namespace reporters {

using json = nlohmann::json;

JsonlResultStore::JsonlResultStore(std::filesystem::path path)
    : path_(std::move(path)) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StoreError("Cannot create directory for " + path_.string() + ": " + ec.message());
        }
    }
}

void JsonlResultStore::Append(const core::TestRun& run) {
    std::string line = JsonReporter::Serialize(run);

    std::lock_guard<std::mutex> lock(mutex_);

    std::ofstream file(path_, std::ios::app | std::ios::binary);
    if (!file) {
        throw StoreError("Failed to open result store for writing: " + path_.string());
    }

    file << line << '\n';
    file.flush();
    if (!file) {
        throw StoreError("Failed to write record to " + path_.string());
    }

    ++appended_;
    spdlog::debug("Stored record for {} ({} bytes)", run.repository.remote_url, line.size());
}

std::set<std::string> JsonlResultStore::EvaluatedUrls() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> urls;
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return urls;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (utils::StringUtils::Trim(line).empty()) {
            continue;
        }

        json j = json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            spdlog::warn("{}:{}: skipping malformed record", path_.string(), line_number);
            continue;
        }

        const json* url = nullptr;
        if (j.contains("Repo") && j["Repo"].is_object() && j["Repo"].contains("remoteUrl")) {
            url = &j["Repo"]["remoteUrl"];
        }
        if (url && url->is_string()) {
            urls.insert(url->get<std::string>());
        } else {
            spdlog::warn("{}:{}: record has no Repo.remoteUrl", path_.string(), line_number);
        }
    }

    return urls;
}

std::size_t JsonlResultStore::AppendedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return appended_;
}

} // namespace reporters
} // namespace crucible
