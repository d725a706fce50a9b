/**
 * @file string_utils.hpp
 * @brief String helpers used across the execution core
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace codecell {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * **Usage Example**:
 * @code
 * auto lines = StringUtils::Split(stdout_text, '\n');
 * auto head = StringUtils::Truncate(trace, 16 * 1024);
 * @endcode
 */
class StringUtils {
public:
    /// Marker appended to every bounded field that lost data
    static const std::string kTruncationMarker;

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split by delimiter
     * @param keep_empty Keep empty tokens (line splitting needs them)
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter,
                                          bool keep_empty = false);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static std::string ReplaceAll(const std::string& str,
                                  const std::string& from,
                                  const std::string& to);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);

    /**
     * @brief Bound a string to max_length bytes
     *
     * When the input is longer, the result is at most max_length bytes and
     * ends with the suffix. The cut never splits a UTF-8 sequence.
     *
     * @param str Input string
     * @param max_length Maximum result length in bytes, suffix included
     * @param suffix Marker appended when data was dropped
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = kTruncationMarker);

    /**
     * @brief Largest prefix length <= limit that ends on a UTF-8 boundary
     */
    static std::size_t Utf8SafePrefix(const std::string& str, std::size_t limit);

    /// Last non-blank line of a multi-line text
    static std::string LastNonEmptyLine(const std::string& str);
};

} // namespace utils
} // namespace codecell
