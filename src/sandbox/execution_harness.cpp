/**
 * @file execution_harness.cpp
 * @brief Implementation of the contained subprocess run
 *
 * **Child sequence** (after fork, before exec):
 * 1. Reset signal mask and dispositions
 * 2. setsid(): the runner leads its own session and process group
 * 3. stdin from /dev/null, stdout/stderr into the capture pipes
 * 4. Close every other inherited descriptor except the fault pipe
 * 5. Detach from the network (still privileged)
 * 6. Private mount namespace with fresh tmpfs scratch directories
 * 7. Drop privileges (verified)
 * 8. Apply rlimits (verified)
 * 9. chdir into the workspace and execve the runner
 *
 * A failure in steps 2-9 is written to the close-on-exec fault pipe as a
 * fixed-size record and the child exits with 127. A successful exec closes
 * the pipe, so the parent sees EOF with no record.
 *
 * **Parent loop**: poll the pipes, check for exit (without reaping, so the
 * pid and session stay reserved until the tree is dead), check
 * cancellation and the deadline, and sample the tree every
 * monitor_interval.
 *
 * @date 2025
 */

#include "codecell/sandbox/execution_harness.hpp"
#include "codecell/sandbox/output_buffer.hpp"
#include "codecell/sandbox/identity_pool.hpp"
#include "codecell/monitors/process_monitor.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <functional>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>

namespace codecell {
namespace sandbox {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kChildSetupExitCode = 127;
constexpr std::size_t kReadChunk = 64 * 1024;

/**
 * @struct FaultRecord
 * @brief Setup failure reported by the child over the fault pipe
 */
struct FaultRecord {
    std::int32_t kind;
    std::int32_t error_number;
    char message[504];
};

// ============================================================================
// RAII HELPERS
// ============================================================================

class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { Reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return fd_; }
    bool Valid() const { return fd_ >= 0; }

    void Reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

// Kills and reaps the child on every exit path of Run()
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : pid_(pid) {}

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    ~ChildGuard() {
        if (!reaped_) {
            ::kill(-pid_, SIGKILL);
            ::kill(pid_, SIGKILL);
            Reap();
        }
    }

    int Reap() {
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                break;
            }
        }
        reaped_ = true;
        return status;
    }

private:
    pid_t pid_;
    bool reaped_{false};
};

// Keeps the runner's process group on the token until just before the reap
class PublishedProcess {
public:
    PublishedProcess(core::CancellationToken& token, pid_t pgid) : token_(token) {
        token_.PublishProcess(pgid);
    }
    ~PublishedProcess() { Withdraw(); }

    PublishedProcess(const PublishedProcess&) = delete;
    PublishedProcess& operator=(const PublishedProcess&) = delete;

    void Withdraw() { token_.ClearProcess(); }

private:
    core::CancellationToken& token_;
};

// Non-blocking readers over the child's pipes
class PipeSet {
public:
    using Sink = std::function<void(const char*, std::size_t)>;

    void Add(int fd, Sink sink) {
        int flags = fcntl(fd, F_GETFL);
        if (flags >= 0) {
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
        entries_.push_back({fd, std::move(sink), true});
    }

    bool AnyOpen() const {
        return std::any_of(entries_.begin(), entries_.end(),
                           [](const Entry& e) { return e.open; });
    }

    // Wait up to timeout for data and drain what is ready
    void Pump(std::chrono::milliseconds timeout) {
        std::vector<pollfd> fds;
        std::vector<Entry*> owners;
        for (auto& entry : entries_) {
            if (entry.open) {
                fds.push_back({entry.fd, POLLIN, 0});
                owners.push_back(&entry);
            }
        }
        if (fds.empty()) {
            return;
        }

        int wait_ms = static_cast<int>(std::max<long long>(0, timeout.count()));
        int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready <= 0) {
            return;
        }

        char buffer[kReadChunk];
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            // Bounded number of reads per pump so one flooding stream
            // cannot starve the deadline checks
            for (int round = 0; round < 16; ++round) {
                ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    owners[i]->sink(buffer, static_cast<std::size_t>(n));
                    continue;
                }
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    break;
                }
                owners[i]->open = false;  // EOF or hard error
                break;
            }
        }
    }

private:
    struct Entry {
        int fd;
        Sink sink;
        bool open;
    };
    std::vector<Entry> entries_;
};

// ============================================================================
// CHILD SIDE (no logging, no locks)
// ============================================================================

/**
 * @struct ChildPlan
 * @brief Pointers prepared before fork so the child does no string work
 */
struct ChildPlan {
    const char* executable{nullptr};
    char* const* argv{nullptr};
    char* const* envp{nullptr};
    const char* workspace{nullptr};
    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
    int fault_fd{-1};
    std::uint64_t baseline_tasks{0};
};

void WriteFault(int fd, FaultKind kind, int error_number, const char* message) {
    FaultRecord record;
    std::memset(&record, 0, sizeof(record));
    record.kind = static_cast<std::int32_t>(kind);
    record.error_number = error_number;
    std::strncpy(record.message, message, sizeof(record.message) - 1);

    const char* cursor = reinterpret_cast<const char*>(&record);
    std::size_t remaining = sizeof(record);
    while (remaining > 0) {
        ssize_t n = ::write(fd, cursor, remaining);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return;
        }
        cursor += n;
        remaining -= static_cast<std::size_t>(n);
    }
}

[[noreturn]] void FailChild(int fault_fd, FaultKind kind, const char* message) {
    int saved = errno;
    WriteFault(fault_fd, kind, saved, message);
    _exit(kChildSetupExitCode);
}

void ResetSignals() {
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig != SIGKILL && sig != SIGSTOP) {
            signal(sig, SIG_DFL);
        }
    }
}

void CloseInheritedDescriptors(int keep_fd) {
    long max_fd = 4096;
    struct rlimit rl;
    if (getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<long>(std::min<rlim_t>(rl.rlim_cur, 65536));
    }
    for (long fd = 3; fd < max_fd; ++fd) {
        if (fd != keep_fd) {
            ::close(static_cast<int>(fd));
        }
    }
}

[[noreturn]] void RunChild(const ChildPlan& plan, SetupContext setup,
                           PrivilegeDeescalator& deescalator, ResourceLimiter& limiter,
                           const ExecutionLimits& limits, const PrivateTempPlan& private_tmp) {
    int fault_fd = plan.fault_fd;

    ResetSignals();

    if (setsid() < 0) {
        FailChild(fault_fd, FaultKind::EXECUTION_FAULT, "setsid failed");
    }

    if (dup2(plan.stdin_fd, STDIN_FILENO) < 0 ||
        dup2(plan.stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(plan.stderr_fd, STDERR_FILENO) < 0) {
        FailChild(fault_fd, FaultKind::EXECUTION_FAULT, "cannot redirect standard streams");
    }

    // Park the fault pipe on fd 3 so one contiguous range can be closed
    if (fault_fd != 3) {
        if (dup3(fault_fd, 3, O_CLOEXEC) < 0) {
            FailChild(fault_fd, FaultKind::EXECUTION_FAULT, "cannot move fault pipe");
        }
        fault_fd = 3;
    }
    CloseInheritedDescriptors(fault_fd);

    try {
        limiter.DetachNetwork(setup, limits);
        limiter.IsolateTemporaryDirectories(setup, private_tmp);
        RestrictedContext restricted = deescalator.Drop(std::move(setup));
        limiter.Apply(restricted, limits, plan.baseline_tasks);
    }
    catch (const SandboxError& e) {
        WriteFault(fault_fd, e.Kind(), 0, e.what());
        _exit(kChildSetupExitCode);
    }
    catch (const std::exception& e) {
        WriteFault(fault_fd, FaultKind::EXECUTION_FAULT, 0, e.what());
        _exit(kChildSetupExitCode);
    }

    if (chdir(plan.workspace) != 0) {
        FailChild(fault_fd, FaultKind::WORKSPACE_ERROR, "cannot enter workspace");
    }

    execve(plan.executable, plan.argv, plan.envp);
    FailChild(fault_fd, FaultKind::EXECUTION_FAULT, "execve of the runner failed");
}

// Canonical, existing and distinct scratch directories
PrivateTempPlan PlanPrivateTemp(const HarnessRun& run) {
    PrivateTempPlan plan;
    if (run.private_directories.empty()) {
        return plan;
    }

    std::error_code ec;
    auto workspace = std::filesystem::canonical(run.workspace, ec);
    if (ec) {
        throw WorkspaceError("Cannot resolve workspace " + run.workspace.string() + ": " + ec.message());
    }
    plan.workspace = workspace.string();
    plan.size_bytes = run.private_tmp_bytes;

    for (const auto& entry : run.private_directories) {
        auto directory = std::filesystem::canonical(entry, ec);
        if (ec || !std::filesystem::is_directory(directory, ec)) {
            spdlog::debug("{} No private {}: not a directory", run.label, entry);
            continue;
        }
        if (std::find(plan.directories.begin(), plan.directories.end(), directory.string()) ==
            plan.directories.end()) {
            plan.directories.push_back(directory.string());
        }
    }
    return plan;
}

std::vector<char*> ToCharArray(const std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (const auto& s : strings) {
        out.push_back(const_cast<char*>(s.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

std::string SignalName(int sig) {
    switch (sig) {
        case SIGXCPU: return "SIGXCPU";
        case SIGXFSZ: return "SIGXFSZ";
        case SIGKILL: return "SIGKILL";
        case SIGSEGV: return "SIGSEGV";
        case SIGABRT: return "SIGABRT";
        case SIGBUS:  return "SIGBUS";
        case SIGFPE:  return "SIGFPE";
        case SIGILL:  return "SIGILL";
        case SIGTERM: return "SIGTERM";
        default:      return "signal " + std::to_string(sig);
    }
}

std::string FormatSeconds(std::chrono::milliseconds ms) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3g", static_cast<double>(ms.count()) / 1000.0);
    return buffer;
}

} // namespace

// ============================================================================
// HARNESS
// ============================================================================

ExecutionHarness::ExecutionHarness()
    : identity_syscalls_(std::make_shared<LinuxIdentitySyscalls>()),
      rlimit_syscalls_(std::make_shared<LinuxRlimitSyscalls>()) {
}

ExecutionHarness::ExecutionHarness(std::shared_ptr<IdentitySyscalls> identity_syscalls,
                                   std::shared_ptr<RlimitSyscalls> rlimit_syscalls)
    : identity_syscalls_(identity_syscalls ? std::move(identity_syscalls)
                                           : std::make_shared<LinuxIdentitySyscalls>()),
      rlimit_syscalls_(rlimit_syscalls ? std::move(rlimit_syscalls)
                                       : std::make_shared<LinuxRlimitSyscalls>()) {
}

ExecutionStatus ExecutionHarness::ClassifyTermination(std::optional<int> exit_code,
                                                      std::optional<int> term_signal,
                                                      const std::vector<int>& completed_exit_codes,
                                                      std::string& reason) {
    if (exit_code) {
        bool completed = std::find(completed_exit_codes.begin(), completed_exit_codes.end(),
                                   *exit_code) != completed_exit_codes.end();
        if (completed) {
            reason = "runner exited with code " + std::to_string(*exit_code);
            return ExecutionStatus::COMPLETED;
        }
        reason = "runner exited with unexpected code " + std::to_string(*exit_code);
        return ExecutionStatus::CRASHED;
    }

    if (term_signal) {
        switch (*term_signal) {
            case SIGXCPU:
                reason = "terminated by SIGXCPU (CPU time limit)";
                return ExecutionStatus::RESOURCE_KILLED;
            case SIGXFSZ:
                reason = "terminated by SIGXFSZ (file size limit)";
                return ExecutionStatus::RESOURCE_KILLED;
            case SIGKILL:
                reason = "terminated by SIGKILL (kernel resource enforcement)";
                return ExecutionStatus::RESOURCE_KILLED;
            default:
                reason = "terminated by " + SignalName(*term_signal);
                return ExecutionStatus::CRASHED;
        }
    }

    reason = "runner ended without an exit status";
    return ExecutionStatus::CRASHED;
}

std::string ExecutionHarness::ResolveExecutable(const std::string& name,
                                                const std::vector<std::string>& search_path) {
    auto is_executable = [](const std::string& path) {
        struct stat st;
        return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
               ::access(path.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (!is_executable(name)) {
            throw ExecutionFault("Runner executable not found: " + name);
        }
        return name;
    }

    for (const auto& dir : search_path) {
        std::string candidate = (std::filesystem::path(dir) / name).string();
        if (is_executable(candidate)) {
            return candidate;
        }
    }

    throw ExecutionFault("Runner executable '" + name + "' not found in " +
                         utils::StringUtils::Join(search_path, ":"));
}

std::string ExecutionHarness::ReadReportFile(const std::filesystem::path& workspace,
                                             const std::string& relative_path,
                                             std::size_t max_bytes) {
    FileDescriptor dir(::open(workspace.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!dir.Valid()) {
        throw ReportParseError("Cannot open workspace: " + std::string(std::strerror(errno)));
    }

    auto components = utils::StringUtils::Split(relative_path, '/');
    if (components.empty()) {
        throw ReportParseError("Report file path is empty");
    }

    for (std::size_t i = 0; i + 1 < components.size(); ++i) {
        if (components[i] == "..") {
            throw ReportParseError("Report file path leaves the workspace");
        }
        int next = ::openat(dir.Get(), components[i].c_str(),
                            O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
        if (next < 0) {
            throw ReportParseError("Report directory '" + components[i] + "' unusable: " +
                                   std::strerror(errno));
        }
        dir.Reset(next);
    }

    // O_NONBLOCK: a FIFO planted under the report name must not hang us
    FileDescriptor file(::openat(dir.Get(), components.back().c_str(),
                                 O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC));
    if (!file.Valid()) {
        if (errno == ENOENT) {
            throw ReportParseError("Runner did not write its report file '" + relative_path + "'");
        }
        throw ReportParseError("Cannot open report file '" + relative_path + "': " +
                               std::strerror(errno));
    }

    struct stat st;
    if (::fstat(file.Get(), &st) != 0 || !S_ISREG(st.st_mode)) {
        throw ReportParseError("Report file '" + relative_path + "' is not a regular file");
    }
    if (static_cast<std::uint64_t>(st.st_size) > max_bytes) {
        throw ReportParseError("Report file is " + std::to_string(st.st_size) +
                               " bytes, limit is " + std::to_string(max_bytes));
    }

    std::string content;
    content.reserve(static_cast<std::size_t>(st.st_size));
    char buffer[kReadChunk];
    while (true) {
        ssize_t n = ::read(file.Get(), buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            throw ReportParseError("Cannot read report file: " + std::string(std::strerror(errno)));
        }
        if (n == 0) {
            break;
        }
        if (content.size() + static_cast<std::size_t>(n) > max_bytes) {
            throw ReportParseError("Report file grew past " + std::to_string(max_bytes) + " bytes");
        }
        content.append(buffer, static_cast<std::size_t>(n));
    }

    return content;
}

ExecutionOutcome ExecutionHarness::Run(const HarnessRun& run, core::CancellationToken& token) {
    ExecutionOutcome outcome;
    outcome.status = ExecutionStatus::PENDING;

    if (run.argv.empty() || run.argv.front().empty() || run.argv.front()[0] != '/') {
        throw ExecutionFault("Runner command must start with an absolute executable path");
    }

    // Validates the limits before anything is forked
    ResourceLimiter::Plan(run.limits, 0);

    monitors::ProcessMonitor monitor;
    const std::uint64_t baseline_tasks = monitor.CountTasksOfUser(static_cast<int>(run.identity.uid));

    // Everything the child touches is built here, before fork
    std::vector<char*> argv = ToCharArray(run.argv);
    std::vector<char*> envp = ToCharArray(run.environment);
    const std::string workspace = run.workspace.string();

    int out_pipe[2], err_pipe[2], fault_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw ExecutionFault("pipe2 failed: " + std::string(std::strerror(errno)));
    }
    FileDescriptor out_read(out_pipe[0]), out_write(out_pipe[1]);
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        throw ExecutionFault("pipe2 failed: " + std::string(std::strerror(errno)));
    }
    FileDescriptor err_read(err_pipe[0]), err_write(err_pipe[1]);
    if (pipe2(fault_pipe, O_CLOEXEC) != 0) {
        throw ExecutionFault("pipe2 failed: " + std::string(std::strerror(errno)));
    }
    FileDescriptor fault_read(fault_pipe[0]), fault_write(fault_pipe[1]);
    FileDescriptor dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!dev_null.Valid()) {
        throw ExecutionFault("Cannot open /dev/null: " + std::string(std::strerror(errno)));
    }

    ChildPlan plan;
    plan.executable = argv[0];
    plan.argv = argv.data();
    plan.envp = envp.data();
    plan.workspace = workspace.c_str();
    plan.stdin_fd = dev_null.Get();
    plan.stdout_fd = out_write.Get();
    plan.stderr_fd = err_write.Get();
    plan.fault_fd = fault_write.Get();
    plan.baseline_tasks = baseline_tasks;

    PrivilegeDeescalator deescalator(identity_syscalls_);
    ResourceLimiter limiter(rlimit_syscalls_);
    SetupContext setup(run.identity, run.require_identity_switch);
    const PrivateTempPlan private_tmp = PlanPrivateTemp(run);

    spdlog::debug("{} Starting runner: {}", run.label, utils::StringUtils::Join(run.argv, " "));

    const auto start = Clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        throw ExecutionFault("fork failed: " + std::string(std::strerror(errno)));
    }
    if (pid == 0) {
        RunChild(plan, std::move(setup), deescalator, limiter, run.limits, private_tmp);
    }

    ChildGuard guard(pid);
    PublishedProcess published(token, pid);
    outcome.status = ExecutionStatus::RUNNING;

    out_write.Reset();
    err_write.Reset();
    fault_write.Reset();
    dev_null.Reset();

    BoundedBuffer stdout_buffer(run.max_output_bytes);
    BoundedBuffer stderr_buffer(run.max_output_bytes);
    std::string fault_bytes;

    PipeSet pipes;
    pipes.Add(out_read.Get(), [&stdout_buffer](const char* d, std::size_t n) { stdout_buffer.Append(d, n); });
    pipes.Add(err_read.Get(), [&stderr_buffer](const char* d, std::size_t n) { stderr_buffer.Append(d, n); });
    pipes.Add(fault_read.Get(), [&fault_bytes](const char* d, std::size_t n) {
        if (fault_bytes.size() < sizeof(FaultRecord)) {
            fault_bytes.append(d, std::min(n, sizeof(FaultRecord) - fault_bytes.size()));
        }
    });

    std::optional<ExecutionStatus> forced_status;
    std::string forced_reason;
    bool exited = false;

    const auto deadline = start + run.deadline;
    auto next_sample = start;

    // ========================================================================
    // WATCH LOOP
    // ========================================================================
    while (true) {
        auto now = Clock::now();
        auto wait = std::min({deadline - now, next_sample - now,
                              Clock::duration(std::chrono::milliseconds(50))});
        pipes.Pump(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::max(wait, Clock::duration::zero())));

        siginfo_t info;
        std::memset(&info, 0, sizeof(info));
        if (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
            info.si_pid == pid) {
            exited = true;
            break;
        }

        now = Clock::now();

        if (token.IsCancelled()) {
            if (token.Cause() == core::CancelCause::DEADLINE) {
                forced_status = ExecutionStatus::TIMED_OUT;
                forced_reason = "overall watchdog expired";
            }
            else {
                forced_status = ExecutionStatus::CANCELLED;
                forced_reason = "cancelled by caller";
            }
            break;
        }

        if (now >= deadline) {
            forced_status = ExecutionStatus::TIMED_OUT;
            forced_reason = "wall-clock deadline of " +
                FormatSeconds(run.deadline) + "s elapsed";
            break;
        }

        if (now >= next_sample) {
            auto sample = monitor.SampleTree(pid, pid);
            if (sample.task_count > run.limits.max_processes) {
                forced_status = ExecutionStatus::RESOURCE_KILLED;
                forced_reason = "process limit exceeded (" + std::to_string(sample.task_count) +
                                " > " + std::to_string(run.limits.max_processes) + ")";
                break;
            }
            if (sample.rss_bytes > run.limits.memory_bytes) {
                forced_status = ExecutionStatus::RESOURCE_KILLED;
                forced_reason = "memory limit exceeded (" + std::to_string(sample.rss_bytes) +
                                " > " + std::to_string(run.limits.memory_bytes) + " bytes resident)";
                break;
            }
            next_sample = now + run.monitor_interval;
        }
    }

    const auto ended = Clock::now();

    if (forced_status) {
        spdlog::warn("{} ⚠ Killing runner tree: {}", run.label, forced_reason);
    }

    // Nothing of the run may outlive it, whether or not the runner exited
    ::kill(-pid, SIGKILL);
    if (!exited) {
        ::kill(pid, SIGKILL);
    }
    monitor.KillTree(pid, pid);
    if (run.sweep_identity) {
        KillAllProcessesOf(run.identity.uid);
    }

    published.Withdraw();
    int wait_status = guard.Reap();

    // The watchdog may have killed the tree before this loop saw the flag
    if (!forced_status && token.Cause() == core::CancelCause::DEADLINE &&
        WIFSIGNALED(wait_status)) {
        forced_status = ExecutionStatus::TIMED_OUT;
        forced_reason = "overall watchdog expired";
    }

    const auto drain_deadline = Clock::now() + run.drain_timeout;
    while (pipes.AnyOpen()) {
        auto remaining = drain_deadline - Clock::now();
        if (remaining <= Clock::duration::zero()) {
            spdlog::warn("{} Output pipes still open after drain timeout", run.label);
            break;
        }
        pipes.Pump(std::chrono::duration_cast<std::chrono::milliseconds>(remaining));
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(ended - start);
    outcome.stdout_output = stdout_buffer.Contents();
    outcome.stderr_output = stderr_buffer.Contents();
    outcome.stdout_truncated = stdout_buffer.Truncated();
    outcome.stderr_truncated = stderr_buffer.Truncated();

    if (WIFEXITED(wait_status)) {
        outcome.exit_code = WEXITSTATUS(wait_status);
    }
    else if (WIFSIGNALED(wait_status)) {
        outcome.term_signal = WTERMSIG(wait_status);
    }

    // ========================================================================
    // CLASSIFICATION
    // ========================================================================
    if (fault_bytes.size() == sizeof(FaultRecord)) {
        FaultRecord record;
        std::memcpy(&record, fault_bytes.data(), sizeof(record));
        record.message[sizeof(record.message) - 1] = '\0';

        outcome.status = ExecutionStatus::CRASHED;
        outcome.fault = static_cast<FaultKind>(record.kind);
        outcome.reason = record.message;
        if (record.error_number != 0) {
            outcome.reason += std::string(": ") + std::strerror(record.error_number);
        }
        spdlog::error("{} ✗ Runner setup failed ({}): {}", run.label,
                      ToString(outcome.fault), outcome.reason);
        return outcome;
    }

    if (forced_status) {
        outcome.status = *forced_status;
        outcome.reason = forced_reason;
        return outcome;
    }

    outcome.status = ClassifyTermination(outcome.exit_code, outcome.term_signal,
                                         run.completed_exit_codes, outcome.reason);

    if (outcome.status == ExecutionStatus::COMPLETED) {
        if (run.report_file.empty()) {
            if (!outcome.stdout_truncated) {
                outcome.report_payload = outcome.stdout_output;
            }
            else {
                outcome.reason += "; stdout truncated, report payload incomplete";
            }
        }
        else {
            try {
                outcome.report_payload = ReadReportFile(run.workspace, run.report_file,
                                                        run.max_report_bytes);
            }
            catch (const ReportParseError& e) {
                spdlog::warn("{} {}", run.label, e.what());
                outcome.reason += std::string("; ") + e.what();
            }
        }
    }

    spdlog::debug("{} Runner finished: {} ({}) in {} ms", run.label,
                  ToString(outcome.status), outcome.reason, outcome.elapsed.count());
    return outcome;
}

} // namespace sandbox
} // namespace codecell
