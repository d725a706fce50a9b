/**
 * @file privilege_deescalator.cpp
 * @brief Implementation of the verified identity switch
 *
 * @date 2025
 */

#include "codecell/sandbox/privilege_deescalator.hpp"
#include "codecell/core/types.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <grp.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <linux/capability.h>

namespace codecell {
namespace sandbox {

namespace {

[[noreturn]] void Fail(const std::string& what) {
    throw PrivilegeError(what + ": " + std::strerror(errno));
}

// Upper bound on supplementary groups inspected during verification
constexpr int kMaxGroups = 256;

} // namespace

// ============================================================================
// LINUX SYSTEM CALLS
// ============================================================================

int LinuxIdentitySyscalls::SetGroups(std::size_t count, const gid_t* groups) {
    return setgroups(count, groups);
}

int LinuxIdentitySyscalls::SetResGid(gid_t rgid, gid_t egid, gid_t sgid) {
    return setresgid(rgid, egid, sgid);
}

int LinuxIdentitySyscalls::SetResUid(uid_t ruid, uid_t euid, uid_t suid) {
    return setresuid(ruid, euid, suid);
}

int LinuxIdentitySyscalls::SetNoNewPrivs() {
    return prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
}

int LinuxIdentitySyscalls::GetResUid(uid_t* ruid, uid_t* euid, uid_t* suid) {
    return getresuid(ruid, euid, suid);
}

int LinuxIdentitySyscalls::GetResGid(gid_t* rgid, gid_t* egid, gid_t* sgid) {
    return getresgid(rgid, egid, sgid);
}

int LinuxIdentitySyscalls::GetGroups(int size, gid_t* list) {
    return getgroups(size, list);
}

int LinuxIdentitySyscalls::GetCapabilities(std::uint64_t* effective, std::uint64_t* permitted) {
    struct __user_cap_header_struct header;
    struct __user_cap_data_struct data[_LINUX_CAPABILITY_U32S_3];
    std::memset(&header, 0, sizeof(header));
    std::memset(data, 0, sizeof(data));
    header.version = _LINUX_CAPABILITY_VERSION_3;
    header.pid = 0;

    if (syscall(SYS_capget, &header, data) != 0) {
        return -1;
    }

    *effective = static_cast<std::uint64_t>(data[0].effective) |
                 (static_cast<std::uint64_t>(data[1].effective) << 32);
    *permitted = static_cast<std::uint64_t>(data[0].permitted) |
                 (static_cast<std::uint64_t>(data[1].permitted) << 32);
    return 0;
}

// ============================================================================
// CONTEXTS
// ============================================================================

SetupContext::SetupContext(Identity target, bool require_switch)
    : target_(target), require_switch_(require_switch) {
}

// ============================================================================
// DE-ESCALATION
// ============================================================================

PrivilegeDeescalator::PrivilegeDeescalator()
    : syscalls_(std::make_shared<LinuxIdentitySyscalls>()) {
}

PrivilegeDeescalator::PrivilegeDeescalator(std::shared_ptr<IdentitySyscalls> syscalls)
    : syscalls_(std::move(syscalls)) {
    if (!syscalls_) {
        syscalls_ = std::make_shared<LinuxIdentitySyscalls>();
    }
}

RestrictedContext PrivilegeDeescalator::Drop(SetupContext&& context) {
    SetupContext consumed(std::move(context));
    const Identity target = consumed.Target();
    const bool require_switch = consumed.RequireSwitch();

    if (target.uid == 0 || target.gid == 0) {
        throw PrivilegeError("Refusing to run untrusted code as uid 0 or gid 0");
    }

    uid_t ruid = 0, euid = 0, suid = 0;
    if (syscalls_->GetResUid(&ruid, &euid, &suid) != 0) {
        Fail("getresuid");
    }

    const bool already_target = (ruid == target.uid && euid == target.uid && suid == target.uid);

    if (require_switch && already_target) {
        throw PrivilegeError("Run identity " + std::to_string(target.uid) +
                             " is the setup identity; no switch would happen");
    }

    if (!already_target) {
        // Groups first: setgroups needs the privilege setresuid gives up
        if (syscalls_->SetGroups(0, nullptr) != 0) {
            Fail("setgroups");
        }
        if (syscalls_->SetResGid(target.gid, target.gid, target.gid) != 0) {
            Fail("setresgid(" + std::to_string(target.gid) + ")");
        }
        if (syscalls_->SetResUid(target.uid, target.uid, target.uid) != 0) {
            Fail("setresuid(" + std::to_string(target.uid) + ")");
        }
    }

    if (syscalls_->SetNoNewPrivs() != 0) {
        Fail("prctl(PR_SET_NO_NEW_PRIVS)");
    }

    Verify(target, require_switch);

    return RestrictedContext(target);
}

void PrivilegeDeescalator::Verify(const Identity& target, bool require_switch) {
    uid_t ruid = 0, euid = 0, suid = 0;
    if (syscalls_->GetResUid(&ruid, &euid, &suid) != 0) {
        Fail("getresuid after switch");
    }
    if (ruid != target.uid || euid != target.uid || suid != target.uid) {
        throw PrivilegeError("Identity switch not in effect: uids are " +
                             std::to_string(ruid) + "/" + std::to_string(euid) + "/" +
                             std::to_string(suid) + ", expected " +
                             std::to_string(target.uid));
    }

    gid_t rgid = 0, egid = 0, sgid = 0;
    if (syscalls_->GetResGid(&rgid, &egid, &sgid) != 0) {
        Fail("getresgid after switch");
    }
    // Development mode keeps the invoking user's groups, but never gid 0
    if (require_switch) {
        if (rgid != target.gid || egid != target.gid || sgid != target.gid) {
            throw PrivilegeError("Group switch not in effect: gids are " +
                                 std::to_string(rgid) + "/" + std::to_string(egid) + "/" +
                                 std::to_string(sgid) + ", expected " +
                                 std::to_string(target.gid));
        }
    }
    else if (rgid == 0 || egid == 0 || sgid == 0) {
        throw PrivilegeError("Run identity still holds gid 0");
    }

    gid_t groups[kMaxGroups];
    int group_count = syscalls_->GetGroups(kMaxGroups, groups);
    if (group_count < 0) {
        Fail("getgroups after switch");
    }
    for (int i = 0; i < group_count; ++i) {
        if (groups[i] == 0) {
            throw PrivilegeError("Run identity still belongs to group 0");
        }
        if (require_switch && groups[i] != target.gid) {
            throw PrivilegeError("Supplementary group " + std::to_string(groups[i]) +
                                 " survived the switch");
        }
    }

    std::uint64_t effective = 0, permitted = 0;
    if (syscalls_->GetCapabilities(&effective, &permitted) != 0) {
        Fail("capget after switch");
    }
    if (effective != 0 || permitted != 0) {
        throw PrivilegeError("Run identity still holds capabilities (effective=" +
                             std::to_string(effective) + ", permitted=" +
                             std::to_string(permitted) + ")");
    }
}

} // namespace sandbox
} // namespace codecell
