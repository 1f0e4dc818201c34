/**
 * @file hash_utils.hpp
 * @brief Digest utilities for evaluation evidence
 *
 * Captured test output is persisted verbatim, and every record also carries a
 * SHA-256 digest of each stream so downstream consumers can deduplicate and
 * verify evidence without re-reading large blobs. Digests are also used to
 * derive short, collision-resistant sandbox names from repository URLs.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace crucible {
namespace utils {

/**
 * @class HashUtils
 * @brief Static SHA-256 helpers backed by OpenSSL EVP
 *
 * All functions are thread-safe and reentrant; each call owns its own
 * digest context.
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeStringHash(capture.stdout_output);
 * std::string name = "crucible-" + HashUtils::ShortId(repo.remote_url, 12);
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute the SHA-256 hex digest of an in-memory buffer
     * @param data Bytes to hash
     * @return Lowercase hexadecimal digest (64 characters)
     * @throws std::runtime_error if OpenSSL fails to initialize a context
     */
    static std::string ComputeStringHash(const std::string& data);

    /**
     * @brief First @p length hex characters of the SHA-256 of @p data
     */
    static std::string ShortId(const std::string& data, std::size_t length = 12);

    /**
     * @brief Convert raw bytes to lowercase hex
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace crucible
