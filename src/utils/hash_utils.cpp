/**
 * @file hash_utils.cpp
 * @brief SHA-256 hashing through the OpenSSL EVP interface
 *
 * Reports carry the SHA-256 of the canonical request payload so callers can
 * correlate identical submissions. Digests are lowercase hex.
 *
 * @date 2025
 */

#include "codecell/utils/hash_utils.hpp"

#include <openssl/evp.h>

#include <sstream>
#include <iomanip>
#include <memory>
#include <stdexcept>

namespace codecell {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
    return ctx;
}

std::string FinishDigest(EVP_MD_CTX* ctx) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return HashUtils::BinaryToHex(hash, length);
}

} // namespace

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    auto ctx = NewSha256Context();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return FinishDigest(ctx.get());
}

} // namespace utils
} // namespace codecell
