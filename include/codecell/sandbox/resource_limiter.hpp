/**
 * @file resource_limiter.hpp
 * @brief Kernel-enforced ceilings for a run
 *
 * Applied in the forked child after the identity switch and before exec.
 * Every ceiling is read back after it is set; a ceiling that cannot be set
 * or does not read back as requested aborts the run (fail closed).
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"
#include "codecell/sandbox/privilege_deescalator.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <sys/resource.h>

namespace codecell {
namespace sandbox {

/**
 * @class RlimitSyscalls
 * @brief rlimit and namespace system calls, behind an interface for testing
 */
class RlimitSyscalls {
public:
    virtual ~RlimitSyscalls() = default;

    virtual int SetLimit(int resource, const struct rlimit& limit) = 0;
    virtual int GetLimit(int resource, struct rlimit* limit) = 0;
    virtual int UnshareNetwork() = 0;
    virtual int UnshareMounts() = 0;
    virtual int Mount(const char* source, const char* target, const char* fstype,
                      unsigned long flags, const char* data) = 0;
};

/**
 * @class LinuxRlimitSyscalls
 * @brief Pass-through to the kernel
 */
class LinuxRlimitSyscalls : public RlimitSyscalls {
public:
    int SetLimit(int resource, const struct rlimit& limit) override;
    int GetLimit(int resource, struct rlimit* limit) override;
    int UnshareNetwork() override;
    int UnshareMounts() override;
    int Mount(const char* source, const char* target, const char* fstype,
              unsigned long flags, const char* data) override;
};

/**
 * @struct RlimitPlan
 * @brief One ceiling to apply
 */
struct RlimitPlan {
    int resource{0};
    const char* name{""};
    rlim_t soft{0};
    rlim_t hard{0};
};

/**
 * @struct PrivateTempPlan
 * @brief Scratch directories to replace with a fresh tmpfs in the child
 *
 * Paths are canonical and exist. When the workspace lies below one of the
 * directories it is bind-mounted back into the new tmpfs at its own path.
 */
struct PrivateTempPlan {
    std::vector<std::string> directories;
    std::string workspace;
    std::uint64_t size_bytes{0};
};

/**
 * @class ResourceLimiter
 * @brief Applies ExecutionLimits to the calling process
 *
 * **Ceilings**:
 * - RLIMIT_CPU: soft = cpu_time_seconds (rounded up), hard = soft + 1
 * - RLIMIT_AS: memory_bytes
 * - RLIMIT_NPROC: baseline + max_processes + 1
 * - RLIMIT_FSIZE: max_file_bytes
 * - RLIMIT_NOFILE: max_open_files
 * - RLIMIT_CORE: 0
 *
 * RLIMIT_NPROC counts every task owned by the real uid, so the plan adds
 * the tasks that uid already owns (baseline_tasks). The extra slot lets the
 * process monitor observe a breach of max_processes and report it.
 */
class ResourceLimiter {
public:
    ResourceLimiter();
    explicit ResourceLimiter(std::shared_ptr<RlimitSyscalls> syscalls);

    /**
     * @brief Compute the ceilings for a set of limits
     * @throws LimitSetupError if the limits violate their invariants
     */
    static std::vector<RlimitPlan> Plan(const ExecutionLimits& limits,
                                        std::uint64_t baseline_tasks);

    /**
     * @brief Detach from every network by entering a fresh network namespace
     *
     * Needs the setup identity, hence the SetupContext. No-op when
     * network_disabled is false.
     *
     * @throws LimitSetupError if the namespace cannot be created
     */
    void DetachNetwork(const SetupContext& context, const ExecutionLimits& limits);

    /**
     * @brief Give the run private temporary directories
     *
     * Enters a new mount namespace, makes every mount private so nothing
     * propagates back to the host, and mounts an empty tmpfs over each
     * directory of the plan. Files a run leaves there vanish with it and
     * are never visible to a later run under the same uid. No-op for an
     * empty plan.
     *
     * @throws LimitSetupError if any step fails
     */
    void IsolateTemporaryDirectories(const SetupContext& context, const PrivateTempPlan& plan);

    /**
     * @brief Apply and verify every ceiling
     * @throws LimitSetupError on the first ceiling that fails
     */
    void Apply(const RestrictedContext& context, const ExecutionLimits& limits,
               std::uint64_t baseline_tasks);

private:
    std::shared_ptr<RlimitSyscalls> syscalls_;
};

} // namespace sandbox
} // namespace codecell
