/**
 * @file job_loader.hpp
 * @brief Builds EvaluationJobs from repo-list files and command-line specs
 *
 * **Repo list format**:
 * @code{.json}
 * [
 *   { "remoteUrl": "https://github.com/acme/orders.git",
 *     "checkout": "/data/clones/acme-orders",
 *     "languages": ["Java"],
 *     "commitId": "3f9a1c0b2d4e..." }
 * ]
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/engine_config.hpp"
#include "crucible/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace crucible {
namespace core {

/**
 * @class JobLoader
 * @brief Static job construction helpers
 */
class JobLoader {
public:
    /**
     * @brief Parse a JSON array of job objects
     * @throws ConfigError naming the offending entry
     */
    static std::vector<EvaluationJob> FromJson(const nlohmann::json& j);

    /**
     * @brief Load a repo-list file
     * @throws ConfigError if unreadable or malformed
     */
    static std::vector<EvaluationJob> LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Parse `REMOTE_URL=CHECKOUT_PATH`
     *
     * Splits at the last '=' so URLs with query strings survive.
     *
     * @throws ConfigError if either side is empty
     */
    static EvaluationJob ParseSpec(const std::string& spec);

    /**
     * @brief Keep at most @p batch_size jobs whose URL is not in @p evaluated
     * @param batch_size 0 = no limit
     */
    static std::vector<EvaluationJob> SelectBatch(const std::vector<EvaluationJob>& jobs,
                                                  const std::set<std::string>& evaluated,
                                                  std::size_t batch_size);
};

} // namespace core
} // namespace crucible
