/**
 * @file process_monitor.hpp
 * @brief /proc sampling of a run's process tree
 *
 * The execution harness samples the runner's tree while it runs to enforce
 * aggregate ceilings (process count, resident memory) that per-process
 * rlimits cannot express, and uses the same view to kill every descendant
 * when a run ends.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace codecell {
namespace monitors {

/**
 * @struct ProcessInfo
 * @brief One /proc/[pid] entry
 */
struct ProcessInfo {
    int pid{0};           ///< Process ID
    int ppid{0};          ///< Parent process ID
    int pgid{0};          ///< Process group
    int sid{0};           ///< Session
    std::string name;     ///< comm
    char state{'?'};      ///< R, S, D, Z, ...
    int uid{-1};          ///< Real user ID
    int euid{-1};         ///< Effective user ID
    int thread_count{1};
    std::uint64_t rss_bytes{0};
};

/**
 * @struct TreeSample
 * @brief Aggregate view of a process tree at one instant
 */
struct TreeSample {
    std::vector<ProcessInfo> processes;  ///< Live (non-zombie) members
    std::uint64_t task_count{0};         ///< Processes plus their threads
    std::uint64_t rss_bytes{0};          ///< Summed resident memory
};

/**
 * @class ProcessMonitor
 * @brief Stateless reader of the process table
 *
 * A process belongs to a run's tree when it descends from the root pid or
 * shares the run's session id (descendants orphaned to init keep the
 * session).
 *
 * **Thread Safety**: Safe; every call reads /proc afresh.
 */
class ProcessMonitor {
public:
    explicit ProcessMonitor(std::filesystem::path proc_root = "/proc");

    /// Read one process; nullopt once it is gone
    std::optional<ProcessInfo> ReadProcessInfo(int pid) const;

    /// All processes currently visible
    std::vector<ProcessInfo> Snapshot() const;

    /**
     * @brief Members of the tree rooted at root_pid or in session sid
     * @param root_pid Runner pid
     * @param sid Runner session id (the runner is its own session leader)
     */
    TreeSample SampleTree(int root_pid, int sid) const;

    /**
     * @brief Tasks (threads included) owned by a real uid
     *
     * Matches what RLIMIT_NPROC counts against.
     */
    std::uint64_t CountTasksOfUser(int uid) const;

    /**
     * @brief SIGKILL every member of the tree until none is left
     *
     * Repeats the sweep so processes forked between passes are caught.
     *
     * @return Number of kill() calls that succeeded
     */
    int KillTree(int root_pid, int sid, int max_passes = 8) const;

private:
    std::vector<int> ListPids() const;

    std::filesystem::path proc_root_;
};

} // namespace monitors
} // namespace codecell
