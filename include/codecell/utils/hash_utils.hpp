/**
 * @file hash_utils.hpp
 * @brief SHA-256 fingerprints of request payloads
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstddef>

namespace codecell {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed hashing helpers
 *
 * **Usage**:
 * @code
 * auto digest = HashUtils::ComputeSHA256(core::CanonicalPayload(request));
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of an in-memory buffer
     * @return Lowercase hex digest (64 characters)
     * @throws std::runtime_error if OpenSSL fails
     */
    static std::string ComputeSHA256(const std::string& data);

    /// Lowercase hex encoding of raw bytes
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace codecell
