/**
 * @file identity_pool.cpp
 * @brief Implementation of identity leasing and the end-of-run uid sweep
 *
 * @date 2025
 */

#include "codecell/sandbox/identity_pool.hpp"
#include "codecell/core/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codecell {
namespace sandbox {

bool KillAllProcessesOf(uid_t uid) {
    if (geteuid() != 0 || uid == 0) {
        return false;
    }

    pid_t helper = fork();
    if (helper < 0) {
        spdlog::error("Cannot fork uid sweeper for uid {}: {}", uid, std::strerror(errno));
        return false;
    }

    if (helper == 0) {
        // kill(-1) as uid reaches exactly the processes that uid may signal
        if (setresuid(uid, uid, uid) != 0) {
            _exit(1);
        }
        kill(-1, SIGKILL);
        _exit(0);
    }

    int status = 0;
    while (waitpid(helper, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("waitpid on uid sweeper failed: {}", std::strerror(errno));
            return false;
        }
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

// ============================================================================
// LEASE
// ============================================================================

IdentityLease::IdentityLease(IdentityPool* pool, std::size_t slot, Identity identity)
    : pool_(pool), slot_(slot), identity_(identity) {
}

IdentityLease::IdentityLease(IdentityLease&& other)
    : pool_(other.pool_), slot_(other.slot_), identity_(other.identity_) {
    other.pool_ = nullptr;
}

IdentityLease::~IdentityLease() {
    if (pool_) {
        pool_->Release(slot_, identity_);
    }
}

// ============================================================================
// POOL
// ============================================================================

IdentityPool::IdentityPool(const core::IdentityConfig& config, UidSweeper sweeper)
    : config_(config),
      sweeper_(std::move(sweeper)),
      pooled_(config.use_pool && geteuid() == 0),
      in_use_(config.use_pool ? config.pool_size : 0, false),
      quarantined_(in_use_.size(), false) {
}

IdentityLease IdentityPool::Acquire() {
    if (!pooled_) {
        if (config_.require_identity_switch) {
            throw PrivilegeError(config_.use_pool
                ? "Identity pool needs root to switch identities"
                : "Identity switch required but the identity pool is disabled");
        }
        if (getuid() == 0 || geteuid() == 0) {
            throw PrivilegeError("Refusing to run untrusted code as root without the identity pool");
        }
        return IdentityLease(nullptr, 0, Identity{getuid(), getgid()});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t slot = 0; slot < in_use_.size(); ++slot) {
        if (!in_use_[slot]) {
            in_use_[slot] = true;
            Identity identity{static_cast<uid_t>(config_.uid_base + slot),
                              static_cast<gid_t>(config_.gid_base + slot)};
            spdlog::debug("Leased identity {}:{}", identity.uid, identity.gid);
            return IdentityLease(this, slot, identity);
        }
    }

    auto withheld = std::count(quarantined_.begin(), quarantined_.end(), true);
    throw ExecutionFault("All " + std::to_string(in_use_.size()) +
                         " run identities are in use (" + std::to_string(withheld) +
                         " quarantined)");
}

std::size_t IdentityPool::Available() const {
    if (!pooled_) {
        return config_.require_identity_switch ? 0 : 1;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t free_slots = 0;
    for (bool used : in_use_) {
        if (!used) {
            ++free_slots;
        }
    }
    return free_slots;
}

std::size_t IdentityPool::Quarantined() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count(quarantined_.begin(), quarantined_.end(), true));
}

void IdentityPool::Release(std::size_t slot, const Identity& identity) {
    // Sweep before the uid can be handed to another run
    bool swept = sweeper_ && sweeper_(identity.uid);

    std::lock_guard<std::mutex> lock(mutex_);
    if (slot >= in_use_.size()) {
        return;
    }
    if (!swept) {
        // Survivors of the run may still hold this uid; never lease it again
        quarantined_[slot] = true;
        spdlog::error("⚠ uid sweep for {} failed, identity {}:{} quarantined",
                      identity.uid, identity.uid, identity.gid);
        return;
    }
    in_use_[slot] = false;
    spdlog::debug("Released identity {}:{}", identity.uid, identity.gid);
}

} // namespace sandbox
} // namespace codecell
