/**
 * @file json_reporter.hpp
 * @brief Stable JSON serialization of ExecutionReport
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"

#include <string>
#include <filesystem>
#include <chrono>

namespace codecell {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Serialization options
 */
struct JsonReporterConfig {
    int indent{-1};                 ///< -1 for compact output
    bool include_streams{true};     ///< Emit top-level stdout/stderr
    bool include_timestamp{true};   ///< Emit generated_at
};

/**
 * @class JsonReporter
 * @brief Machine-readable report writer
 *
 * **Document**:
 * @code
 * {
 *   "schema_version": "1.0",
 *   "request_id": "job-42", "trace_id": "...", "request_digest": "<sha256>",
 *   "parser": "pytest-json", "generated_at": "2025-01-01T00:00:00Z",
 *   "summary": {"passed": 1, "failed": 1, "error": 0, "skipped": 0,
 *               "duration_seconds": 0.42, "outcome": "completed"},
 *   "tests": [{"id": "...", "status": "failed", "duration_seconds": 0.01,
 *              "detail": {"message": "...", "trace": "..."}}],
 *   "execution": {"status": "completed", "exit_code": 1, "signal": null,
 *                 "elapsed_seconds": 0.42, "reason": "...",
 *                 "stdout_truncated": false, "stderr_truncated": false},
 *   "stdout": "...", "stderr": "...",
 *   "error": {"kind": "LimitSetupError", "message": "..."}   // only on faults
 * }
 * @endcode
 *
 * Invalid UTF-8 in any string is replaced with U+FFFD, never rejected.
 */
class JsonReporter {
public:
    static const char* const kSchemaVersion;

    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    /// Serialize a report
    std::string GenerateJsonString(const ExecutionReport& report) const;

    /**
     * @brief Serialize and write to a file
     * @return false (and logs) if the file could not be written
     */
    bool GenerateReport(const ExecutionReport& report, const std::filesystem::path& output_path) const;

    static bool ValidateSyntax(const std::string& json_str);
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

    /// Random RFC 4122 version 4 UUID, used for generated request ids
    static std::string GenerateUUID();

private:
    bool SaveJson(const std::string& json_content, const std::filesystem::path& output_path) const;

    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace codecell
