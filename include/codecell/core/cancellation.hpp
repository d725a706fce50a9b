/**
 * @file cancellation.hpp
 * @brief Cross-thread cancellation of a run
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <mutex>

#include <signal.h>
#include <sys/types.h>

namespace codecell {
namespace core {

/**
 * @enum CancelCause
 * @brief Who asked for the run to stop
 */
enum class CancelCause {
    NONE,
    CALLER,    ///< Orchestrator::Cancel()
    DEADLINE   ///< Orchestrator watchdog fired
};

/**
 * @class CancellationToken
 * @brief One-shot flag shared between the orchestrator and the harness
 *
 * The first Cancel() wins; later calls keep the original cause.
 *
 * While the runner is alive the harness publishes its process group here,
 * so a canceller can kill the tree itself instead of waiting for the
 * harness to notice the flag. The harness withdraws the group before it
 * reaps the leader, so a kill never reaches a recycled pid.
 */
class CancellationToken {
public:
    void Cancel(CancelCause cause) {
        int expected = static_cast<int>(CancelCause::NONE);
        cause_.compare_exchange_strong(expected, static_cast<int>(cause));
    }

    bool IsCancelled() const {
        return cause_.load() != static_cast<int>(CancelCause::NONE);
    }

    CancelCause Cause() const {
        return static_cast<CancelCause>(cause_.load());
    }

    void PublishProcess(pid_t pgid) {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_ = pgid;
    }

    void ClearProcess() {
        std::lock_guard<std::mutex> lock(process_mutex_);
        process_ = 0;
    }

    /// Published process group, 0 when none
    pid_t Process() const {
        std::lock_guard<std::mutex> lock(process_mutex_);
        return process_;
    }

    /**
     * @brief SIGKILL the published process group
     * @return false if nothing is published or kill() failed
     */
    bool KillProcessGroup() {
        std::lock_guard<std::mutex> lock(process_mutex_);
        if (process_ <= 0) {
            return false;
        }
        return ::kill(-process_, SIGKILL) == 0;
    }

private:
    std::atomic<int> cause_{static_cast<int>(CancelCause::NONE)};

    mutable std::mutex process_mutex_;
    pid_t process_{0};
};

} // namespace core
} // namespace codecell
