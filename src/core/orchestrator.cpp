/**
 * @file orchestrator.cpp
 * @brief Implementation of the run sequence, watchdog and cancellation registry
 *
 * @date 2025
 */

#include "codecell/core/orchestrator.hpp"
#include "codecell/core/cancellation.hpp"
#include "codecell/core/execution_context.hpp"
#include "codecell/core/request_codec.hpp"
#include "codecell/sandbox/execution_harness.hpp"
#include "codecell/sandbox/identity_pool.hpp"
#include "codecell/reporters/report_parser.hpp"
#include "codecell/reporters/result_reporter.hpp"
#include "codecell/reporters/json_reporter.hpp"
#include "codecell/utils/hash_utils.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <condition_variable>
#include <cmath>
#include <optional>

#include <unistd.h>

using json = nlohmann::json;

namespace codecell {
namespace core {

using Clock = std::chrono::steady_clock;

namespace {

/**
 * Overall watchdog of one run. If the run is still going at fire_at it
 * cancels the token with DEADLINE, kills the published process group and,
 * for a pooled identity, every process of the run's uid. Stopped and
 * joined on destruction.
 */
class Watchdog {
public:
    Watchdog(Clock::time_point fire_at,
             std::shared_ptr<CancellationToken> token,
             std::optional<uid_t> sweep_uid,
             std::string label)
        : thread_([this, fire_at, token, sweep_uid, label]() {
              std::unique_lock<std::mutex> lock(mutex_);
              if (cv_.wait_until(lock, fire_at, [this]() { return stopped_; })) {
                  return;
              }
              spdlog::warn("{} ⚠ Overall watchdog expired, forcing termination", label);
              token->Cancel(CancelCause::DEADLINE);
              if (token->KillProcessGroup()) {
                  spdlog::debug("{} Watchdog killed process group {}", label, token->Process());
              }
              if (sweep_uid && !sandbox::KillAllProcessesOf(*sweep_uid)) {
                  spdlog::error("{} ✗ Watchdog could not sweep uid {}", label, *sweep_uid);
              }
          }) {
    }

    ~Watchdog() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_{false};
    std::thread thread_;
};

std::string RunLabel(const std::string& request_id, const std::string& trace_id) {
    if (trace_id.empty()) {
        return "[RUN " + request_id + "]";
    }
    return "[RUN " + request_id + " " + trace_id + "]";
}

std::vector<std::string> BuildArgv(const std::vector<std::string>& command,
                                   const std::filesystem::path& workspace,
                                   const std::string& report_file) {
    std::vector<std::string> argv;
    argv.reserve(command.size());
    for (const auto& arg : command) {
        std::string expanded = utils::StringUtils::ReplaceAll(arg, "{workspace}", workspace.string());
        argv.push_back(utils::StringUtils::ReplaceAll(expanded, "{report_file}", report_file));
    }
    return argv;
}

std::vector<std::string> BuildEnvironment(const RunnerConfig& runner,
                                          const std::filesystem::path& workspace) {
    std::map<std::string, std::string> env{
        {"PATH", utils::StringUtils::Join(runner.search_path, ":")},
        {"HOME", workspace.string()},
        {"TMPDIR", workspace.string()},
        {"LANG", "C.UTF-8"},
        {"PYTHONDONTWRITEBYTECODE", "1"}
    };
    for (const auto& [key, value] : runner.environment) {
        env[key] = value;
    }

    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

} // namespace

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

class Orchestrator::Impl {
public:
    Impl(std::shared_ptr<sandbox::IdentitySyscalls> identity_syscalls,
         std::shared_ptr<sandbox::RlimitSyscalls> rlimit_syscalls)
        : harness(std::move(identity_syscalls), std::move(rlimit_syscalls)) {
    }

    sandbox::ExecutionHarness harness;
    std::unique_ptr<sandbox::IdentityPool> pool;
    std::unique_ptr<reporters::ResultReporter> reporter;
    std::string runner_path;

    std::atomic<bool> is_initialized{false};

    mutable std::mutex registry_mutex;
    std::map<std::string, std::shared_ptr<CancellationToken>> in_flight;
};

namespace {

/// Keeps a run's token in the cancellation registry for the run's lifetime
class Registration {
public:
    Registration(std::mutex& mutex,
                 std::map<std::string, std::shared_ptr<CancellationToken>>& registry,
                 const std::string& request_id)
        : mutex_(mutex), registry_(registry), request_id_(request_id),
          token_(std::make_shared<CancellationToken>()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!registry_.emplace(request_id_, token_).second) {
            throw ExecutionFault("A run with request_id " + request_id_ + " is already in flight");
        }
    }

    ~Registration() {
        std::lock_guard<std::mutex> lock(mutex_);
        registry_.erase(request_id_);
    }

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

    const std::shared_ptr<CancellationToken>& Token() const { return token_; }

private:
    std::mutex& mutex_;
    std::map<std::string, std::shared_ptr<CancellationToken>>& registry_;
    std::string request_id_;
    std::shared_ptr<CancellationToken> token_;
};

} // namespace

Orchestrator::Orchestrator(const SandboxConfig& config)
    : Orchestrator(config, nullptr, nullptr) {
}

Orchestrator::Orchestrator(const SandboxConfig& config,
                           std::shared_ptr<sandbox::IdentitySyscalls> identity_syscalls,
                           std::shared_ptr<sandbox::RlimitSyscalls> rlimit_syscalls)
    : config_(config),
      impl_(std::make_unique<Impl>(std::move(identity_syscalls), std::move(rlimit_syscalls))) {
}

Orchestrator::~Orchestrator() {
    std::size_t active = ActiveRuns();
    if (active > 0) {
        spdlog::warn("Orchestrator destroyed with {} run(s) in flight", active);
    }
}

bool Orchestrator::Initialize() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING CODECELL ORCHESTRATOR");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    auto issues = config_.Validate();
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            spdlog::error("Configuration: {}", issue);
        }
        return false;
    }

    try {
        spdlog::debug("Preparing workspace root {}...", config_.workspace_root.string());
        ExecutionContext::PrepareRoot(config_.workspace_root);

        impl_->runner_path = sandbox::ExecutionHarness::ResolveExecutable(
            config_.runner.command.front(), config_.runner.search_path);
        spdlog::debug("Test runner: {}", impl_->runner_path);

        impl_->pool = std::make_unique<sandbox::IdentityPool>(config_.identity);
        if (impl_->pool->Pooled()) {
            spdlog::info("Identity pool: uid {}..{}, gid {}..{}",
                         config_.identity.uid_base,
                         config_.identity.uid_base + config_.identity.pool_size - 1,
                         config_.identity.gid_base,
                         config_.identity.gid_base + config_.identity.pool_size - 1);
        }
        else if (config_.identity.require_identity_switch) {
            spdlog::error("Identity switch required, but {}",
                          config_.identity.use_pool ? "the identity pool needs root"
                                                    : "the identity pool is disabled");
            return false;
        }
        else if (geteuid() == 0) {
            spdlog::error("Refusing to run untrusted code as root without the identity pool");
            return false;
        }
        else {
            spdlog::warn("⚠ Development mode: runs keep uid {} (no identity switch)", getuid());
        }

        // unshare(CLONE_NEWNET) needs CAP_SYS_ADMIN; every run would fail setup
        if (config_.default_limits.network_disabled && geteuid() != 0) {
            spdlog::error("Network detachment needs root; set limits.network_disabled to false "
                          "in development mode");
            return false;
        }

        std::shared_ptr<reporters::ReportParser> parser =
            reporters::CreateParser(config_.runner.report_format);
        impl_->reporter = std::make_unique<reporters::ResultReporter>(
            parser, config_.max_detail_bytes);
    }
    catch (const SandboxError& e) {
        spdlog::error("Failed to initialize orchestrator ({}): {}", ToString(e.Kind()), e.what());
        return false;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to initialize orchestrator: {}", e.what());
        return false;
    }

    impl_->is_initialized = true;

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("✓ Orchestrator ready (parser: {}, network {})",
                 ToString(config_.runner.report_format),
                 config_.default_limits.network_disabled ? "disabled" : "enabled");
    spdlog::info("═══════════════════════════════════════════════════════════════");
    return true;
}

std::string Orchestrator::HealthCheck() const {
    json health;
    json issues = json::array();

    for (const auto& issue : config_.Validate()) {
        issues.push_back(issue);
    }

    std::error_code ec;
    bool root_ready = std::filesystem::is_directory(config_.workspace_root, ec) &&
                      ::access(config_.workspace_root.c_str(), W_OK | X_OK) == 0;
    if (!root_ready) {
        issues.push_back("workspace root is not a writable directory");
    }

    json runner = nullptr;
    if (!config_.runner.command.empty()) {
        try {
            runner = sandbox::ExecutionHarness::ResolveExecutable(
                config_.runner.command.front(), config_.runner.search_path);
        }
        catch (const ExecutionFault& e) {
            issues.push_back(e.what());
        }
    }

    bool pooled = config_.identity.use_pool && geteuid() == 0;
    if (config_.identity.require_identity_switch && !pooled) {
        issues.push_back("identity switch required but not possible as uid " +
                         std::to_string(geteuid()));
    }

    if (config_.default_limits.network_disabled && geteuid() != 0) {
        issues.push_back("network detachment needs root (uid " + std::to_string(geteuid()) + ")");
    }

    health["status"] = issues.empty() ? "healthy" : "unhealthy";
    health["initialized"] = impl_->is_initialized.load();
    health["workspace_root"] = config_.workspace_root.string();
    health["workspace_root_ready"] = root_ready;
    health["runner"] = runner;
    health["report_format"] = ToString(config_.runner.report_format);
    health["euid"] = geteuid();
    health["identity"] = {
        {"pooled", pooled},
        {"available", impl_->pool ? json(impl_->pool->Available()) : json(nullptr)},
        {"uid_base", config_.identity.uid_base},
        {"pool_size", config_.identity.pool_size},
        {"require_identity_switch", config_.identity.require_identity_switch}
    };
    health["network_disabled"] = config_.default_limits.network_disabled;
    health["active_runs"] = ActiveRuns();
    health["issues"] = issues;

    return health.dump(2, ' ', false, json::error_handler_t::replace);
}

ExecutionReport Orchestrator::Run(const ExecutionRequest& request) {
    return Run(request, config_.default_limits);
}

ExecutionReport Orchestrator::Run(const ExecutionRequest& request, const ExecutionLimits& limits) {
    const auto started = Clock::now();

    ExecutionReport report;
    report.request_id = request.request_id.empty()
        ? reporters::JsonReporter::GenerateUUID()
        : request.request_id;
    report.trace_id = request.trace_id;
    report.parser = impl_->reporter ? impl_->reporter->Parser().Name()
                                    : ToString(config_.runner.report_format);

    const std::string label = RunLabel(report.request_id, report.trace_id);

    spdlog::info("{} ═══ Run started ({} file(s))", label, request.files.size());

    ExecutionOutcome outcome;
    try {
        report.request_digest = utils::HashUtils::ComputeSHA256(CanonicalPayload(request));
        outcome = Execute(request, limits, report.request_id, label, started);
    }
    catch (const SandboxError& e) {
        spdlog::error("{} ✗ {}: {}", label, ToString(e.Kind()), e.what());
        outcome = ExecutionOutcome{};
        outcome.status = ExecutionStatus::CRASHED;
        outcome.fault = e.Kind();
        outcome.reason = e.what();
    }
    catch (const std::exception& e) {
        spdlog::error("{} ✗ Unexpected failure: {}", label, e.what());
        outcome = ExecutionOutcome{};
        outcome.status = ExecutionStatus::CRASHED;
        outcome.fault = FaultKind::EXECUTION_FAULT;
        outcome.reason = e.what();
    }

    // Faults before the runner started carry no elapsed time of their own
    if (outcome.elapsed.count() == 0) {
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    }

    if (impl_->reporter) {
        auto built = impl_->reporter->BuildResults(outcome);
        report.tests = std::move(built.tests);
        if (built.parse_error) {
            outcome.fault = FaultKind::REPORT_PARSE_ERROR;
            outcome.reason = outcome.reason.empty()
                ? *built.parse_error
                : outcome.reason + "; " + *built.parse_error;
        }
    }
    else {
        report.tests.push_back(reporters::ResultReporter::SyntheticError(
            outcome, "Test run did not complete"));
    }

    report.summary = reporters::ResultReporter::Summarize(report.tests, outcome);
    report.execution = std::move(outcome);

    const auto& summary = report.summary;
    if (summary.outcome == ExecutionStatus::COMPLETED && report.execution.fault == FaultKind::NONE) {
        spdlog::info("{} ✓ {}: {} passed, {} failed, {} error, {} skipped in {:.2f}s", label,
                     ToString(summary.outcome), summary.passed, summary.failed,
                     summary.error, summary.skipped, summary.duration.count());
    }
    else {
        spdlog::warn("{} ⚠ {}: {} ({:.2f}s)", label, ToString(summary.outcome),
                     report.execution.reason, summary.duration.count());
    }

    return report;
}

ExecutionOutcome Orchestrator::Execute(const ExecutionRequest& request,
                                       const ExecutionLimits& limits,
                                       const std::string& request_id,
                                       const std::string& label,
                                       Clock::time_point started) {
    if (!impl_->is_initialized) {
        throw ExecutionFault("Orchestrator is not initialized");
    }
    if (!IsValidRequestId(request_id)) {
        throw WorkspaceError("request_id must match [A-Za-z0-9_-]{1,64}");
    }

    // [1] Limits: invalid limits never reach the runner
    auto issues = limits.Validate();
    if (!issues.empty()) {
        throw LimitSetupError("Invalid limits: " + utils::StringUtils::Join(issues, "; "));
    }

    ExecutionLimits effective = limits;
    if (effective.wall_clock_seconds > config_.max_wall_clock_seconds) {
        spdlog::warn("{} Wall clock {}s capped to {}s", label,
                     effective.wall_clock_seconds, config_.max_wall_clock_seconds);
        effective.wall_clock_seconds = config_.max_wall_clock_seconds;
    }

    auto deadline = std::chrono::milliseconds(
        static_cast<long long>(std::llround(effective.wall_clock_seconds * 1000.0)));
    if (request.time_budget && *request.time_budget < deadline) {
        deadline = *request.time_budget;
        spdlog::debug("{} Deadline shortened to the request's time budget ({} ms)",
                      label, deadline.count());
    }

    Registration registration(impl_->registry_mutex, impl_->in_flight, request_id);

    // [2] Identity
    sandbox::IdentityLease lease = impl_->pool->Acquire();
    spdlog::debug("{} Run identity {}:{}{}", label, lease.Get().uid, lease.Get().gid,
                  lease.FromPool() ? "" : " (development mode)");

    // [3] Workspace
    std::optional<sandbox::Identity> owner;
    if (lease.FromPool()) {
        owner = lease.Get();
    }
    ExecutionContext context(config_.workspace_root, request_id, owner, config_.preserve_workspace);
    context.Materialize(request, config_.runner.manifest_filename);

    sandbox::HarnessRun run;
    run.label = label;
    run.workspace = context.Path();
    run.argv = BuildArgv(config_.runner.command, context.Path(), config_.runner.report_file);
    run.argv.front() = sandbox::ExecutionHarness::ResolveExecutable(
        run.argv.front(), config_.runner.search_path);
    run.environment = BuildEnvironment(config_.runner, context.Path());
    run.limits = effective;
    run.deadline = deadline;
    run.identity = lease.Get();
    run.require_identity_switch = lease.FromPool();
    run.sweep_identity = lease.FromPool();
    if (lease.FromPool()) {
        // A pooled uid is reused by later runs; its scratch files must not be
        run.private_directories = config_.private_directories;
        run.private_tmp_bytes = config_.private_tmp_bytes;
    }
    run.report_file = config_.runner.report_file;
    run.completed_exit_codes = config_.runner.completed_exit_codes;
    run.max_output_bytes = config_.max_output_bytes;
    run.max_report_bytes = config_.max_report_bytes;
    run.monitor_interval = config_.monitor_interval;
    run.drain_timeout = config_.drain_timeout;

    // [4] Overall watchdog, independent of the harness deadline
    std::optional<uid_t> sweep_uid;
    if (lease.FromPool()) {
        sweep_uid = lease.Get().uid;
    }
    Watchdog watchdog(started + deadline + config_.watchdog_grace, registration.Token(),
                      sweep_uid, label);

    // [5] Execute
    return impl_->harness.Run(run, *registration.Token());
}

bool Orchestrator::Cancel(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    auto it = impl_->in_flight.find(request_id);
    if (it == impl_->in_flight.end()) {
        spdlog::debug("Cancel: no run {} in flight", request_id);
        return false;
    }
    spdlog::info("[RUN {}] Cancellation requested", request_id);
    it->second->Cancel(CancelCause::CALLER);
    return true;
}

std::size_t Orchestrator::ActiveRuns() const {
    std::lock_guard<std::mutex> lock(impl_->registry_mutex);
    return impl_->in_flight.size();
}

} // namespace core
} // namespace codecell
