/**
 * @file privilege_deescalator.hpp
 * @brief One-way switch from the setup identity to a restricted run identity
 *
 * The privileged and unprivileged phases of a run are distinct types.
 * A SetupContext can only be turned into a RestrictedContext by
 * PrivilegeDeescalator::Drop(), which consumes it; there is no conversion
 * back. Code that must run after the drop takes a RestrictedContext, so it
 * cannot be reached without going through the verified switch.
 *
 * Runs in the forked child before exec. Nothing here logs.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>

#include <sys/types.h>

namespace codecell {
namespace sandbox {

/**
 * @struct Identity
 * @brief A uid/gid pair
 */
struct Identity {
    uid_t uid{0};
    gid_t gid{0};
};

/**
 * @class IdentitySyscalls
 * @brief Identity-related system calls, behind an interface for testing
 *
 * Every method follows the libc convention: 0 on success, -1 with errno.
 */
class IdentitySyscalls {
public:
    virtual ~IdentitySyscalls() = default;

    virtual int SetGroups(std::size_t count, const gid_t* groups) = 0;
    virtual int SetResGid(gid_t rgid, gid_t egid, gid_t sgid) = 0;
    virtual int SetResUid(uid_t ruid, uid_t euid, uid_t suid) = 0;
    virtual int SetNoNewPrivs() = 0;

    virtual int GetResUid(uid_t* ruid, uid_t* euid, uid_t* suid) = 0;
    virtual int GetResGid(gid_t* rgid, gid_t* egid, gid_t* sgid) = 0;

    /// Same contract as getgroups(2): returns the count, or -1
    virtual int GetGroups(int size, gid_t* list) = 0;

    /// Effective and permitted capability sets as 64-bit masks
    virtual int GetCapabilities(std::uint64_t* effective, std::uint64_t* permitted) = 0;
};

/**
 * @class LinuxIdentitySyscalls
 * @brief Pass-through to the kernel
 */
class LinuxIdentitySyscalls : public IdentitySyscalls {
public:
    int SetGroups(std::size_t count, const gid_t* groups) override;
    int SetResGid(gid_t rgid, gid_t egid, gid_t sgid) override;
    int SetResUid(uid_t ruid, uid_t euid, uid_t suid) override;
    int SetNoNewPrivs() override;
    int GetResUid(uid_t* ruid, uid_t* euid, uid_t* suid) override;
    int GetResGid(gid_t* rgid, gid_t* egid, gid_t* sgid) override;
    int GetGroups(int size, gid_t* list) override;
    int GetCapabilities(std::uint64_t* effective, std::uint64_t* permitted) override;
};

/**
 * @class SetupContext
 * @brief The run while it still holds the setup identity
 *
 * Move-only. Carries the identity the run will be switched to.
 */
class SetupContext {
public:
    /**
     * @param target Identity to switch to
     * @param require_switch When false, the target may equal the invoking
     *        (non-root) identity; the drop then only verifies
     */
    explicit SetupContext(Identity target, bool require_switch = true);

    SetupContext(const SetupContext&) = delete;
    SetupContext& operator=(const SetupContext&) = delete;
    SetupContext(SetupContext&&) = default;
    SetupContext& operator=(SetupContext&&) = default;

    const Identity& Target() const { return target_; }
    bool RequireSwitch() const { return require_switch_; }

private:
    Identity target_;
    bool require_switch_;
};

/**
 * @class RestrictedContext
 * @brief The run after a verified drop
 *
 * Only PrivilegeDeescalator can create one.
 */
class RestrictedContext {
public:
    RestrictedContext(const RestrictedContext&) = delete;
    RestrictedContext& operator=(const RestrictedContext&) = delete;
    RestrictedContext(RestrictedContext&&) = default;
    RestrictedContext& operator=(RestrictedContext&&) = default;

    const Identity& Current() const { return identity_; }

private:
    friend class PrivilegeDeescalator;
    explicit RestrictedContext(Identity identity) : identity_(identity) {}

    Identity identity_;
};

/**
 * @class PrivilegeDeescalator
 * @brief Performs and verifies the identity switch
 *
 * **Drop sequence**:
 * 1. Reject uid 0 / gid 0 targets
 * 2. Clear supplementary groups, setresgid, setresuid (all three ids)
 * 3. PR_SET_NO_NEW_PRIVS
 * 4. Re-query real/effective/saved ids, groups and capabilities
 *
 * Step 4 decides the result. A platform that reports success for step 2
 * but leaves the process privileged fails with PrivilegeError.
 */
class PrivilegeDeescalator {
public:
    PrivilegeDeescalator();
    explicit PrivilegeDeescalator(std::shared_ptr<IdentitySyscalls> syscalls);

    /**
     * @brief Switch to the context's target identity, irreversibly
     * @param context Consumed
     * @return Proof of the verified drop
     * @throws PrivilegeError if the switch fails or cannot be verified
     */
    RestrictedContext Drop(SetupContext&& context);

private:
    void Verify(const Identity& target, bool require_switch);

    std::shared_ptr<IdentitySyscalls> syscalls_;
};

} // namespace sandbox
} // namespace codecell
