/**
 * @file execution_harness.hpp
 * @brief Runs the test runner in a de-escalated, limited child process
 *
 * The harness forks one child per run. The child enters its own session,
 * detaches from the network, gets private temporary directories, drops to
 * the run identity, applies its rlimits and execs the runner inside the
 * workspace. The parent captures stdout and
 * stderr into bounded buffers, enforces the wall-clock deadline,
 * cancellation and the aggregate process/memory ceilings, and kills the
 * whole process tree when the run ends.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"
#include "codecell/core/cancellation.hpp"
#include "codecell/sandbox/privilege_deescalator.hpp"
#include "codecell/sandbox/resource_limiter.hpp"

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <chrono>
#include <filesystem>
#include <cstddef>
#include <cstdint>

namespace codecell {
namespace sandbox {

/**
 * @struct HarnessRun
 * @brief Everything one harness invocation needs
 */
struct HarnessRun {
    std::string label;                      ///< Log prefix for this run
    std::filesystem::path workspace;        ///< Working directory of the runner
    std::vector<std::string> argv;          ///< argv[0] must be an absolute path
    std::vector<std::string> environment;   ///< KEY=VALUE entries, the whole environment
    ExecutionLimits limits;
    std::chrono::milliseconds deadline{60000};  ///< Watchdog deadline from start

    Identity identity;                      ///< Identity the runner executes as
    bool require_identity_switch{true};
    bool sweep_identity{false};             ///< Kill every process of identity.uid at the end

    /// Replaced by a fresh tmpfs for this run; needs root. Missing ones are skipped.
    std::vector<std::string> private_directories;
    std::uint64_t private_tmp_bytes{64ULL * 1024 * 1024};

    std::string report_file;                ///< Relative to workspace; empty: stdout is the payload
    std::vector<int> completed_exit_codes{0, 1};

    std::size_t max_output_bytes{1024 * 1024};
    std::size_t max_report_bytes{8 * 1024 * 1024};
    std::chrono::milliseconds monitor_interval{50};
    std::chrono::milliseconds drain_timeout{500};
};

/**
 * @class ExecutionHarness
 * @brief Subprocess execution with containment
 *
 * **Status mapping**:
 * - exit code in completed_exit_codes → COMPLETED
 * - any other exit code → CRASHED
 * - SIGXCPU, SIGXFSZ, or SIGKILL the harness did not send → RESOURCE_KILLED
 * - any other signal → CRASHED
 * - deadline reached → TIMED_OUT
 * - token cancelled by the caller → CANCELLED (by the watchdog → TIMED_OUT)
 * - process/memory ceiling breached → RESOURCE_KILLED
 * - setup fault in the child → CRASHED with the fault kind
 *
 * **Thread Safety**: Run() may be called concurrently for different runs.
 */
class ExecutionHarness {
public:
    ExecutionHarness();
    ExecutionHarness(std::shared_ptr<IdentitySyscalls> identity_syscalls,
                     std::shared_ptr<RlimitSyscalls> rlimit_syscalls);

    /**
     * @brief Execute one run to completion
     *
     * Never returns while a process of the run is still alive. The
     * runner's process group is published on the token while it runs.
     *
     * @throws ExecutionFault if the child cannot be started
     * @throws LimitSetupError if the limits are invalid
     */
    ExecutionOutcome Run(const HarnessRun& run, core::CancellationToken& token);

    /**
     * @brief Map a runner termination to a status
     * @param exit_code Set when the runner exited
     * @param term_signal Set when the runner was killed by a signal
     * @param completed_exit_codes Exit codes that mean the tests ran
     * @param reason Receives a human-readable explanation
     */
    static ExecutionStatus ClassifyTermination(std::optional<int> exit_code,
                                               std::optional<int> term_signal,
                                               const std::vector<int>& completed_exit_codes,
                                               std::string& reason);

    /**
     * @brief Locate the runner executable
     * @throws ExecutionFault if nothing executable is found
     */
    static std::string ResolveExecutable(const std::string& name,
                                         const std::vector<std::string>& search_path);

    /**
     * @brief Read the runner's report file without following symlinks
     *
     * Every path component is opened with O_NOFOLLOW relative to the
     * workspace; the file must be regular and at most max_bytes long.
     *
     * @throws ReportParseError if the file is missing, unsafe or too large
     */
    static std::string ReadReportFile(const std::filesystem::path& workspace,
                                      const std::string& relative_path,
                                      std::size_t max_bytes);

private:
    std::shared_ptr<IdentitySyscalls> identity_syscalls_;
    std::shared_ptr<RlimitSyscalls> rlimit_syscalls_;
};

} // namespace sandbox
} // namespace codecell
