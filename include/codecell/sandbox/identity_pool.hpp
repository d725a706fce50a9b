/**
 * @file identity_pool.hpp
 * @brief Per-run leasing of non-privileged identities
 *
 * Concurrent runs never share a uid: rlimits such as RLIMIT_NPROC are
 * accounted per uid, and the end-of-run sweep kills every process of the
 * run's uid. Each lease is returned (and swept) when it goes out of scope.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/config.hpp"
#include "codecell/sandbox/privilege_deescalator.hpp"

#include <functional>
#include <mutex>
#include <vector>
#include <cstddef>

namespace codecell {
namespace sandbox {

/**
 * @brief SIGKILL every process whose uid is the given one
 *
 * Forks a helper that switches to uid and calls kill(-1, SIGKILL).
 * Needs root; a no-op returning false otherwise.
 *
 * @return true if the sweep ran
 */
bool KillAllProcessesOf(uid_t uid);

/// Kills every process of a uid; returns false if it could not make sure
using UidSweeper = std::function<bool(uid_t)>;

class IdentityPool;

/**
 * @class IdentityLease
 * @brief A run's identity, returned to the pool on destruction
 */
class IdentityLease {
public:
    IdentityLease(IdentityLease&& other);
    IdentityLease& operator=(IdentityLease&&) = delete;
    IdentityLease(const IdentityLease&) = delete;
    IdentityLease& operator=(const IdentityLease&) = delete;
    ~IdentityLease();

    const Identity& Get() const { return identity_; }

    /// True when the identity came from the pool (and must be switched to)
    bool FromPool() const { return pool_ != nullptr; }

private:
    friend class IdentityPool;
    IdentityLease(IdentityPool* pool, std::size_t slot, Identity identity);

    IdentityPool* pool_;
    std::size_t slot_;
    Identity identity_;
};

/**
 * @class IdentityPool
 * @brief Thread-safe allocator of uid/gid pairs
 *
 * With use_pool and root privileges, slot i maps to
 * (uid_base + i, gid_base + i). Otherwise every lease is the invoking
 * identity, which requires require_identity_switch to be false.
 *
 * A returned identity is swept before its slot is freed. When the sweep
 * fails the slot is quarantined for the lifetime of the pool.
 */
class IdentityPool {
public:
    explicit IdentityPool(const core::IdentityConfig& config,
                          UidSweeper sweeper = KillAllProcessesOf);

    /**
     * @brief Lease an identity for one run
     * @throws PrivilegeError if the pool cannot be used as configured
     * @throws ExecutionFault if every pooled identity is in use
     */
    IdentityLease Acquire();

    /// True when leases come from the pool
    bool Pooled() const { return pooled_; }

    std::size_t Available() const;

    /// Slots withheld because their uid could not be swept
    std::size_t Quarantined() const;

private:
    friend class IdentityLease;
    void Release(std::size_t slot, const Identity& identity);

    core::IdentityConfig config_;
    UidSweeper sweeper_;
    bool pooled_;
    mutable std::mutex mutex_;
    std::vector<bool> in_use_;
    std::vector<bool> quarantined_;
};

} // namespace sandbox
} // namespace codecell
