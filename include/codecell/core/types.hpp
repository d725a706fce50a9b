/**
 * @file types.hpp
 * @brief Core value types shared by every stage of a sandboxed test run
 *
 * Defines the request submitted by a caller, the limits applied to a run,
 * the raw outcome produced by the execution harness, the per-test results
 * produced by the result reporter, and the final report returned to the
 * caller. Also defines the fault taxonomy used inside the core.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace codecell {

/**
 * @enum ExecutionStatus
 * @brief Terminal state of one harness invocation
 *
 * Lifecycle: PENDING → RUNNING → {COMPLETED, TIMED_OUT, RESOURCE_KILLED,
 * CRASHED, CANCELLED}. Test failures are COMPLETED; only infrastructure
 * faults and abnormal terminations leave the COMPLETED path.
 */
enum class ExecutionStatus {
    PENDING,          ///< Not started yet
    RUNNING,          ///< Runner subprocess alive
    COMPLETED,        ///< Runner exited with one of its completed exit codes
    TIMED_OUT,        ///< Watchdog deadline elapsed first
    RESOURCE_KILLED,  ///< Terminated because a resource ceiling was hit
    CRASHED,          ///< Abnormal termination or setup fault
    CANCELLED         ///< Cancelled by the caller
};

/**
 * @enum TestStatus
 * @brief Outcome of one discovered test
 */
enum class TestStatus {
    PASSED,
    FAILED,
    ERROR,
    SKIPPED
};

/**
 * @enum FaultKind
 * @brief Classification of infrastructure faults that abort a run
 */
enum class FaultKind {
    NONE,
    PRIVILEGE_ERROR,     ///< Identity switch failed or could not be verified
    LIMIT_SETUP_ERROR,   ///< A resource ceiling could not be applied
    WORKSPACE_ERROR,     ///< Payload could not be materialized
    EXECUTION_FAULT,     ///< Runner could not be started or monitored
    REPORT_PARSE_ERROR   ///< Runner payload absent or malformed
};

std::string ToString(ExecutionStatus status);
std::string ToString(TestStatus status);
std::string ToString(FaultKind kind);

/**
 * @brief Base class for faults raised inside the core
 *
 * Never crosses Orchestrator::Run(); the orchestrator converts it into
 * report data.
 */
class SandboxError : public std::runtime_error {
public:
    SandboxError(FaultKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    FaultKind Kind() const { return kind_; }

private:
    FaultKind kind_;
};

/// Identity switch failed, or the identity is still privileged afterwards
class PrivilegeError : public SandboxError {
public:
    explicit PrivilegeError(const std::string& message)
        : SandboxError(FaultKind::PRIVILEGE_ERROR, message) {}
};

/// A ceiling could not be applied or verified (fail closed)
class LimitSetupError : public SandboxError {
public:
    explicit LimitSetupError(const std::string& message)
        : SandboxError(FaultKind::LIMIT_SETUP_ERROR, message) {}
};

/// Per-run workspace could not be created or populated
class WorkspaceError : public SandboxError {
public:
    explicit WorkspaceError(const std::string& message)
        : SandboxError(FaultKind::WORKSPACE_ERROR, message) {}
};

/// Runner could not be started, monitored or reaped
class ExecutionFault : public SandboxError {
public:
    explicit ExecutionFault(const std::string& message)
        : SandboxError(FaultKind::EXECUTION_FAULT, message) {}
};

/// Structured runner payload absent or malformed
class ReportParseError : public SandboxError {
public:
    explicit ReportParseError(const std::string& message)
        : SandboxError(FaultKind::REPORT_PARSE_ERROR, message) {}
};

/**
 * @struct ExecutionRequest
 * @brief Untrusted payload submitted by a caller
 *
 * Immutable once built; owned by the orchestrator for one run.
 */
struct ExecutionRequest {
    std::string request_id;                       ///< Caller id ([A-Za-z0-9_-], generated if empty)
    std::string trace_id;                         ///< Distributed tracing id (optional)
    std::map<std::string, std::string> files;     ///< Relative path → content
    std::optional<std::string> manifest;          ///< Dependency manifest content
    std::optional<std::chrono::milliseconds> time_budget;  ///< Caller time budget
};

/**
 * @struct ExecutionLimits
 * @brief Per-run resource ceilings
 *
 * All numeric limits must be positive and finite; see Validate().
 */
struct ExecutionLimits {
    double cpu_time_seconds{60.0};               ///< CPU time ceiling
    double wall_clock_seconds{60.0};             ///< Wall-clock deadline
    std::uint64_t memory_bytes{512ULL * 1024 * 1024};  ///< Address space ceiling (512 MiB)
    std::uint64_t max_processes{100};            ///< Process/thread ceiling
    bool network_disabled{true};                 ///< Detach from every network
    std::uint64_t max_file_bytes{64ULL * 1024 * 1024};  ///< Largest file the run may write
    std::uint64_t max_open_files{256};           ///< File descriptor ceiling

    /**
     * @brief List every invariant violation
     * @return Empty vector if the limits are usable
     */
    std::vector<std::string> Validate() const;
};

/**
 * @struct ExecutionOutcome
 * @brief Raw result of one harness invocation
 */
struct ExecutionOutcome {
    ExecutionStatus status{ExecutionStatus::PENDING};
    std::optional<int> exit_code;       ///< Set when the runner exited
    std::optional<int> term_signal;     ///< Set when the runner was signalled
    std::string stdout_output;          ///< Bounded stdout capture
    std::string stderr_output;          ///< Bounded stderr capture
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::chrono::milliseconds elapsed{0};
    std::string reason;                 ///< Human-readable explanation of the status
    FaultKind fault{FaultKind::NONE};   ///< Infrastructure fault that aborted the run
    std::optional<std::string> report_payload;  ///< Contents of the runner's report file
};

/**
 * @struct FailureDetail
 * @brief Failure message and trace attached to a test (both bounded)
 */
struct FailureDetail {
    std::string message;
    std::string trace;
};

/**
 * @struct TestResult
 * @brief Outcome of one discovered test
 */
struct TestResult {
    std::string id;
    TestStatus status{TestStatus::PASSED};
    std::chrono::duration<double> duration{0.0};
    std::optional<FailureDetail> detail;
};

/**
 * @struct ReportSummary
 * @brief Aggregate counts of an ExecutionReport
 */
struct ReportSummary {
    int passed{0};
    int failed{0};
    int error{0};
    int skipped{0};
    std::chrono::duration<double> duration{0.0};
    ExecutionStatus outcome{ExecutionStatus::PENDING};
};

/**
 * @struct ExecutionReport
 * @brief The only artifact returned to a caller
 *
 * Self-describing: everything needed to interpret the run is inside.
 */
struct ExecutionReport {
    std::string request_id;
    std::string trace_id;
    std::string request_digest;      ///< SHA-256 of the canonical request payload
    std::string parser;              ///< Name of the report parser used
    std::vector<TestResult> tests;   ///< Discovery order
    ReportSummary summary;
    ExecutionOutcome execution;
};

} // namespace codecell
