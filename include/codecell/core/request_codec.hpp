/**
 * @file request_codec.hpp
 * @brief JSON decoding of execution requests and limits
 *
 * Request document:
 * @code
 * {
 *   "request_id": "job-42",            // optional
 *   "trace_id": "4bf92f3577b34da6",    // optional
 *   "files": {"solution.py": "...", "tests/test_solution.py": "..."},
 *   "manifest": "pytest==8.2\n",       // optional
 *   "time_budget_seconds": 30          // optional
 * }
 * @endcode
 *
 * Limits document: any subset of cpu_time_seconds, wall_clock_seconds,
 * memory_bytes, max_processes, network_disabled, max_file_bytes,
 * max_open_files.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"

#include <string>

namespace codecell {
namespace core {

/**
 * @brief Decode an ExecutionRequest
 * @throws std::runtime_error on malformed JSON or wrong field types
 */
ExecutionRequest ParseRequest(const std::string& json_text);

/**
 * @brief Decode limits on top of a base set
 * @throws std::runtime_error on malformed JSON or wrong field types
 */
ExecutionLimits ParseLimits(const std::string& json_text,
                            const ExecutionLimits& base = ExecutionLimits{});

/**
 * @brief Check a request id against [A-Za-z0-9_-]{1,64}
 *
 * Request ids name workspace directories, so anything else is rejected.
 */
bool IsValidRequestId(const std::string& id);

/**
 * @brief Deterministic serialization of the payload part of a request
 *
 * Covers files, manifest and time budget; excludes request and trace ids
 * so identical payloads fingerprint identically.
 */
std::string CanonicalPayload(const ExecutionRequest& request);

} // namespace core
} // namespace codecell
