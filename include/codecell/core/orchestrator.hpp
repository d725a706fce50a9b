/**
 * @file orchestrator.hpp
 * @brief Single entry point of the sandboxed test-execution core
 *
 * Sequences one run end to end: lease an identity, materialize the payload
 * into a fresh workspace, run the test runner de-escalated and limited under
 * an overall watchdog, turn the outcome into test results, and tear every
 * per-run resource down again. Whatever happens inside, the caller receives
 * a well-formed ExecutionReport.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"
#include "codecell/core/config.hpp"
#include "codecell/sandbox/privilege_deescalator.hpp"
#include "codecell/sandbox/resource_limiter.hpp"

#include <string>
#include <memory>
#include <chrono>

namespace codecell {
namespace core {

/**
 * @class Orchestrator
 * @brief Runs untrusted test suites and returns structured verdicts
 *
 * **Run sequence**:
 * 1. Validate limits (invalid limits fail closed)
 * 2. Lease a run identity from the pool
 * 3. Create and populate the workspace
 * 4. Start the overall watchdog (wall clock + grace)
 * 5. Execute the runner (de-escalate → limits → exec) and wait
 * 6. Parse the payload into TestResults, or synthesize one error result
 * 7. Remove the workspace and return the identity
 *
 * **Thread Safety**: Run() may be called concurrently for independent
 * requests; Cancel() may be called from any thread.
 *
 * **Usage Example**:
 * @code
 * SandboxConfig config;
 * Orchestrator orchestrator(config);
 * if (!orchestrator.Initialize()) {
 *     return 1;
 * }
 *
 * ExecutionRequest request;
 * request.files["test_math.py"] = "def test_add():\n    assert 1 + 1 == 2\n";
 *
 * ExecutionReport report = orchestrator.Run(request, config.default_limits);
 * spdlog::info("{} passed, {} failed", report.summary.passed, report.summary.failed);
 * @endcode
 */
class Orchestrator {
public:
    explicit Orchestrator(const SandboxConfig& config);

    /**
     * @brief Construct with injected system-call layers
     *
     * Null pointers select the Linux implementations.
     */
    Orchestrator(const SandboxConfig& config,
                 std::shared_ptr<sandbox::IdentitySyscalls> identity_syscalls,
                 std::shared_ptr<sandbox::RlimitSyscalls> rlimit_syscalls);

    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Check the configuration and the host before accepting runs
     *
     * Verifies the configuration, prepares the workspace root, locates the
     * runner executable, and checks that identities can be switched when
     * the pool is in use.
     *
     * @return true if runs can be accepted
     */
    bool Initialize();

    /**
     * @brief Host readiness as a JSON document
     */
    std::string HealthCheck() const;

    /**
     * @brief Execute one request
     *
     * Never throws for anything the request or the runner does; faults are
     * reported through ExecutionReport::execution.
     */
    ExecutionReport Run(const ExecutionRequest& request, const ExecutionLimits& limits);

    /// Run with the configured default limits
    ExecutionReport Run(const ExecutionRequest& request);

    /**
     * @brief Cancel an in-flight run
     * @return false if no run with this id is in flight
     */
    bool Cancel(const std::string& request_id);

    /// Number of runs currently in flight
    std::size_t ActiveRuns() const;

    const SandboxConfig& GetConfig() const { return config_; }

private:
    ExecutionOutcome Execute(const ExecutionRequest& request,
                             const ExecutionLimits& limits,
                             const std::string& request_id,
                             const std::string& label,
                             std::chrono::steady_clock::time_point started);

    SandboxConfig config_;

    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace core
} // namespace codecell
