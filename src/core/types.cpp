/**
 * @file types.cpp
 * @brief String conversions and limit validation for core types
 *
 * @date 2025
 */

#include "codecell/core/types.hpp"

#include <cmath>
#include <sstream>

namespace codecell {

std::string ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::PENDING:         return "pending";
        case ExecutionStatus::RUNNING:         return "running";
        case ExecutionStatus::COMPLETED:       return "completed";
        case ExecutionStatus::TIMED_OUT:       return "timed_out";
        case ExecutionStatus::RESOURCE_KILLED: return "killed_resource_limit";
        case ExecutionStatus::CRASHED:         return "crashed";
        case ExecutionStatus::CANCELLED:       return "cancelled";
    }
    return "unknown";
}

std::string ToString(TestStatus status) {
    switch (status) {
        case TestStatus::PASSED:  return "passed";
        case TestStatus::FAILED:  return "failed";
        case TestStatus::ERROR:   return "error";
        case TestStatus::SKIPPED: return "skipped";
    }
    return "unknown";
}

std::string ToString(FaultKind kind) {
    switch (kind) {
        case FaultKind::NONE:               return "none";
        case FaultKind::PRIVILEGE_ERROR:    return "PrivilegeError";
        case FaultKind::LIMIT_SETUP_ERROR:  return "LimitSetupError";
        case FaultKind::WORKSPACE_ERROR:    return "WorkspaceError";
        case FaultKind::EXECUTION_FAULT:    return "ExecutionFault";
        case FaultKind::REPORT_PARSE_ERROR: return "ReportParseError";
    }
    return "unknown";
}

std::vector<std::string> ExecutionLimits::Validate() const {
    std::vector<std::string> issues;

    auto check_seconds = [&issues](const char* name, double value) {
        if (!std::isfinite(value) || value <= 0.0) {
            std::ostringstream oss;
            oss << name << " must be positive and finite (got " << value << ")";
            issues.push_back(oss.str());
        }
    };
    auto check_count = [&issues](const char* name, std::uint64_t value) {
        if (value == 0) {
            issues.push_back(std::string(name) + " must be positive");
        }
    };

    check_seconds("cpu_time_seconds", cpu_time_seconds);
    check_seconds("wall_clock_seconds", wall_clock_seconds);
    check_count("memory_bytes", memory_bytes);
    check_count("max_processes", max_processes);
    check_count("max_file_bytes", max_file_bytes);
    check_count("max_open_files", max_open_files);

    return issues;
}

} // namespace codecell
