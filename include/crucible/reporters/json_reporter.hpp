/**
 * @file json_reporter.hpp
 * @brief Serialization of TestRun records to the published JSON shape
 *
 * **Record Layout**:
 * ```json
 * {
 *   "Repo": { "remoteUrl": "...", "languages": ["Java"] },
 *   "IntegrationTest": { "fileContent": "..." },
 *   "IntegrationTestRun": {
 *     "commitId": "3f9a1c0b...",
 *     "result": { "stdout": "...", "stderr": "...", "returnCode": 0 },
 *     "pass": true
 *   },
 *   "Evaluation": { "outcome": "PASSED", "status": "PASSED", "framework": "maven", ... }
 * }
 * ```
 *
 * Captured output is arbitrary bytes; invalid UTF-8 is replaced with U+FFFD
 * when dumping rather than failing the record.
 *
 * @date 2025
 */

#pragma once

#include "crucible/core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace crucible {
namespace reporters {

/**
 * @class JsonReporter
 * @brief Static TestRun → JSON conversion
 */
class JsonReporter {
public:
    /**
     * @brief Build the JSON document for one record
     */
    static nlohmann::json ToJson(const core::TestRun& run);

    /**
     * @brief Dump a record
     * @param run Record
     * @param pretty Indent with two spaces; compact single line otherwise
     * @return JSON text (never throws on invalid UTF-8)
     */
    static std::string Serialize(const core::TestRun& run, bool pretty = false);

    /**
     * @brief UTC ISO 8601 timestamp, e.g. 2025-03-14T09:26:53Z
     */
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);
};

} // namespace reporters
} // namespace crucible
