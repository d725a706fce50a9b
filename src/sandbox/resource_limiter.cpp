/**
 * @file resource_limiter.cpp
 * @brief Implementation of rlimit ceilings, network detachment and private /tmp
 *
 * @date 2025
 */

#include "codecell/sandbox/resource_limiter.hpp"
#include "codecell/utils/string_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sched.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/stat.h>

namespace codecell {
namespace sandbox {

namespace {

rlim_t ToRlim(std::uint64_t value) {
    if (value >= static_cast<std::uint64_t>(RLIM_INFINITY)) {
        return RLIM_INFINITY - 1;
    }
    return static_cast<rlim_t>(value);
}

// path lies strictly below directory
bool IsBelow(const std::string& path, const std::string& directory) {
    return path.size() > directory.size() &&
           path.compare(0, directory.size(), directory) == 0 &&
           path[directory.size()] == '/';
}

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int Get() const { return fd_; }

private:
    int fd_;
};

// Recreate the directories between directory and workspace inside the new tmpfs
void MakeMountPoint(const std::string& directory, const std::string& workspace) {
    std::string path = directory;
    for (const auto& part : utils::StringUtils::Split(workspace.substr(directory.size() + 1), '/')) {
        path += "/" + part;
        if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST) {
            throw LimitSetupError("Cannot create mount point " + path + ": " + std::strerror(errno));
        }
    }
}

} // namespace

int LinuxRlimitSyscalls::SetLimit(int resource, const struct rlimit& limit) {
    return setrlimit(resource, &limit);
}

int LinuxRlimitSyscalls::GetLimit(int resource, struct rlimit* limit) {
    return getrlimit(resource, limit);
}

int LinuxRlimitSyscalls::UnshareNetwork() {
    return unshare(CLONE_NEWNET);
}

int LinuxRlimitSyscalls::UnshareMounts() {
    return unshare(CLONE_NEWNS);
}

int LinuxRlimitSyscalls::Mount(const char* source, const char* target, const char* fstype,
                               unsigned long flags, const char* data) {
    return mount(source, target, fstype, flags, data);
}

ResourceLimiter::ResourceLimiter()
    : syscalls_(std::make_shared<LinuxRlimitSyscalls>()) {
}

ResourceLimiter::ResourceLimiter(std::shared_ptr<RlimitSyscalls> syscalls)
    : syscalls_(std::move(syscalls)) {
    if (!syscalls_) {
        syscalls_ = std::make_shared<LinuxRlimitSyscalls>();
    }
}

std::vector<RlimitPlan> ResourceLimiter::Plan(const ExecutionLimits& limits,
                                              std::uint64_t baseline_tasks) {
    auto issues = limits.Validate();
    if (!issues.empty()) {
        throw LimitSetupError("Invalid limits: " + utils::StringUtils::Join(issues, "; "));
    }

    // SIGXCPU at the soft limit, SIGKILL one second later
    rlim_t cpu = static_cast<rlim_t>(std::ceil(limits.cpu_time_seconds));
    rlim_t nproc = ToRlim(baseline_tasks + limits.max_processes + 1);

    return {
        {RLIMIT_CPU, "RLIMIT_CPU", cpu, cpu + 1},
        {RLIMIT_AS, "RLIMIT_AS", ToRlim(limits.memory_bytes), ToRlim(limits.memory_bytes)},
        {RLIMIT_NPROC, "RLIMIT_NPROC", nproc, nproc},
        {RLIMIT_FSIZE, "RLIMIT_FSIZE", ToRlim(limits.max_file_bytes), ToRlim(limits.max_file_bytes)},
        {RLIMIT_NOFILE, "RLIMIT_NOFILE", ToRlim(limits.max_open_files), ToRlim(limits.max_open_files)},
        {RLIMIT_CORE, "RLIMIT_CORE", 0, 0},
    };
}

void ResourceLimiter::DetachNetwork(const SetupContext& context, const ExecutionLimits& limits) {
    (void)context;
    if (!limits.network_disabled) {
        return;
    }
    if (syscalls_->UnshareNetwork() != 0) {
        throw LimitSetupError(std::string("Cannot detach network (unshare CLONE_NEWNET): ") +
                              std::strerror(errno));
    }
}

void ResourceLimiter::IsolateTemporaryDirectories(const SetupContext& context,
                                                  const PrivateTempPlan& plan) {
    (void)context;
    if (plan.directories.empty()) {
        return;
    }

    if (syscalls_->UnshareMounts() != 0) {
        throw LimitSetupError(std::string("Cannot create mount namespace (unshare CLONE_NEWNS): ") +
                              std::strerror(errno));
    }
    if (syscalls_->Mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0) {
        throw LimitSetupError(std::string("Cannot make mounts private: ") + std::strerror(errno));
    }

    const std::string options = "mode=1777,size=" + std::to_string(plan.size_bytes);
    for (const auto& directory : plan.directories) {
        const bool holds_workspace = IsBelow(plan.workspace, directory);

        // Keep a handle on the workspace before the tmpfs hides it
        ScopedFd workspace_fd(holds_workspace
            ? ::open(plan.workspace.c_str(), O_PATH | O_DIRECTORY | O_CLOEXEC)
            : -1);
        if (holds_workspace && workspace_fd.Get() < 0) {
            throw LimitSetupError("Cannot open workspace " + plan.workspace + ": " +
                                  std::strerror(errno));
        }

        if (syscalls_->Mount("tmpfs", directory.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                             options.c_str()) != 0) {
            throw LimitSetupError("Cannot mount private tmpfs on " + directory + ": " +
                                  std::strerror(errno));
        }

        if (holds_workspace) {
            MakeMountPoint(directory, plan.workspace);
            const std::string source = "/proc/self/fd/" + std::to_string(workspace_fd.Get());
            if (syscalls_->Mount(source.c_str(), plan.workspace.c_str(), nullptr,
                                 MS_BIND | MS_REC, nullptr) != 0) {
                throw LimitSetupError("Cannot bind workspace into private " + directory + ": " +
                                      std::strerror(errno));
            }
        }
    }
}

void ResourceLimiter::Apply(const RestrictedContext& context, const ExecutionLimits& limits,
                            std::uint64_t baseline_tasks) {
    (void)context;
    for (const auto& plan : Plan(limits, baseline_tasks)) {
        struct rlimit wanted;
        wanted.rlim_cur = plan.soft;
        wanted.rlim_max = plan.hard;

        if (syscalls_->SetLimit(plan.resource, wanted) != 0) {
            throw LimitSetupError(std::string("setrlimit(") + plan.name + ") failed: " +
                                  std::strerror(errno));
        }

        struct rlimit actual;
        if (syscalls_->GetLimit(plan.resource, &actual) != 0) {
            throw LimitSetupError(std::string("getrlimit(") + plan.name + ") failed: " +
                                  std::strerror(errno));
        }
        if (actual.rlim_cur != wanted.rlim_cur || actual.rlim_max != wanted.rlim_max) {
            throw LimitSetupError(std::string(plan.name) + " not in effect: wanted " +
                                  std::to_string(wanted.rlim_cur) + "/" +
                                  std::to_string(wanted.rlim_max) + ", got " +
                                  std::to_string(actual.rlim_cur) + "/" +
                                  std::to_string(actual.rlim_max));
        }
    }
}

} // namespace sandbox
} // namespace codecell
