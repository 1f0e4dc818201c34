/**
 * @file job_loader.cpp
 * @brief Implementation of job list parsing and batch selection
 *
 * @date 2025
 */

#include "crucible/core/job_loader.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace crucible {
namespace core {

using json = nlohmann::json;
using utils::StringUtils;

std::vector<EvaluationJob> JobLoader::FromJson(const json& j) {
    if (!j.is_array()) {
        throw ConfigError("Repo list must be a JSON array");
    }

    std::vector<EvaluationJob> jobs;
    jobs.reserve(j.size());

    for (std::size_t i = 0; i < j.size(); ++i) {
        const json& entry = j[i];
        const std::string where = "repo list entry " + std::to_string(i);

        if (!entry.is_object()) {
            throw ConfigError(where + ": expected an object");
        }
        if (!entry.contains("remoteUrl") || !entry["remoteUrl"].is_string()) {
            throw ConfigError(where + ": missing string 'remoteUrl'");
        }
        if (!entry.contains("checkout") || !entry["checkout"].is_string()) {
            throw ConfigError(where + ": missing string 'checkout'");
        }

        EvaluationJob job;
        job.repository.remote_url = entry["remoteUrl"].get<std::string>();
        job.checkout_path = entry["checkout"].get<std::string>();

        if (job.repository.remote_url.empty() || job.checkout_path.empty()) {
            throw ConfigError(where + ": 'remoteUrl' and 'checkout' must not be empty");
        }

        if (entry.contains("languages")) {
            if (!entry["languages"].is_array()) {
                throw ConfigError(where + ": 'languages' must be an array");
            }
            for (const auto& language : entry["languages"]) {
                if (!language.is_string()) {
                    throw ConfigError(where + ": 'languages' must contain strings");
                }
                job.repository.languages.insert(language.get<std::string>());
            }
        }

        if (entry.contains("commitId") && !entry["commitId"].is_null()) {
            if (!entry["commitId"].is_string()) {
                throw ConfigError(where + ": 'commitId' must be a string");
            }
            job.commit_id = entry["commitId"].get<std::string>();
        }

        jobs.push_back(std::move(job));
    }

    return jobs;
}

std::vector<EvaluationJob> JobLoader::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open repo list: " + path.string());
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed repo list " + path.string() + ": " + e.what());
    }

    auto jobs = FromJson(j);
    spdlog::info("Loaded {} job(s) from {}", jobs.size(), path.string());
    return jobs;
}

EvaluationJob JobLoader::ParseSpec(const std::string& spec) {
    auto pos = spec.rfind('=');
    if (pos == std::string::npos) {
        throw ConfigError("Expected REMOTE_URL=CHECKOUT, got '" + spec + "'");
    }

    std::string url = StringUtils::Trim(spec.substr(0, pos));
    std::string checkout = StringUtils::Trim(spec.substr(pos + 1));
    if (url.empty() || checkout.empty()) {
        throw ConfigError("Expected REMOTE_URL=CHECKOUT, got '" + spec + "'");
    }

    EvaluationJob job;
    job.repository.remote_url = url;
    job.checkout_path = checkout;
    return job;
}

std::vector<EvaluationJob> JobLoader::SelectBatch(const std::vector<EvaluationJob>& jobs,
                                                  const std::set<std::string>& evaluated,
                                                  std::size_t batch_size) {
    std::vector<EvaluationJob> selected;
    std::set<std::string> seen;

    for (const auto& job : jobs) {
        if (batch_size > 0 && selected.size() >= batch_size) {
            break;
        }
        const std::string& url = job.repository.remote_url;
        if (evaluated.count(url)) {
            spdlog::debug("Skipping already evaluated {}", url);
            continue;
        }
        if (!seen.insert(url).second) {
            spdlog::debug("Skipping duplicate {}", url);
            continue;
        }
        selected.push_back(job);
    }

    return selected;
}

} // namespace core
} // namespace crucible
