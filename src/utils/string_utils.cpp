/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "codecell/utils/string_utils.hpp"

#include <sstream>
#include <algorithm>
#include <cctype>

namespace codecell {
namespace utils {

const std::string StringUtils::kTruncationMarker = "\n...[truncated]";

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter,
                                            bool keep_empty) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (keep_empty || !token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// Replace all occurrences
std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;

    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }

    return result;
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ============================================================================
// BOUNDED OUTPUT
// ============================================================================

std::size_t StringUtils::Utf8SafePrefix(const std::string& str, std::size_t limit) {
    if (limit >= str.size()) {
        return str.size();
    }

    // Back up over continuation bytes (10xxxxxx), at most 3
    std::size_t cut = limit;
    std::size_t steps = 0;
    while (cut > 0 && steps < 3 &&
           (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
        ++steps;
    }
    if ((static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        // Not valid UTF-8 around the cut anyway
        return limit;
    }
    return cut;
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return suffix.substr(0, max_length);
    }

    std::size_t keep = Utf8SafePrefix(str, max_length - suffix.length());
    return str.substr(0, keep) + suffix;
}

std::string StringUtils::LastNonEmptyLine(const std::string& str) {
    auto lines = Split(str, '\n');
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        auto trimmed = Trim(*it);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return "";
}

} // namespace utils
} // namespace codecell
