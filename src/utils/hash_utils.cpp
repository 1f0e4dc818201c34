/**
 * @file hash_utils.cpp
 * @brief Implementation of digest helpers using OpenSSL EVP
 *
 * **Error Handling**:
 * - OpenSSL context failures: Logged and rethrown as std::runtime_error
 *
 * @date 2025
 */

#include "crucible/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <openssl/evp.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace crucible {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewContext() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("Failed to initialize OpenSSL digest context");
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

} // anonymous namespace

// Convert raw digest bytes to hex
std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// Hash an in-memory buffer
std::string HashUtils::ComputeStringHash(const std::string& data) {
    auto ctx = NewContext();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return BinaryToHex(hash, length);
}

std::string HashUtils::ShortId(const std::string& data, std::size_t length) {
    return ComputeStringHash(data).substr(0, length);
}

} // namespace utils
} // namespace crucible
