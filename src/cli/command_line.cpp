/**
 * @file command_line.cpp
 * @brief Implementation of the codecell-run program
 *
 * @date 2025
 */

#include "codecell/cli/command_line.hpp"
#include "codecell/core/orchestrator.hpp"
#include "codecell/core/request_codec.hpp"
#include "codecell/reporters/json_reporter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <signal.h>
#include <time.h>

using json = nlohmann::json;

namespace codecell {
namespace cli {

namespace {

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string ReadInput(const std::string& path, std::istream& in) {
    if (path != "-") {
        return ReadFile(path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/**
 * Turns SIGINT/SIGTERM into cancellation of the in-flight run. The signals
 * are blocked in every thread and collected here with sigtimedwait.
 */
class SignalCanceller {
public:
    SignalCanceller(core::Orchestrator& orchestrator, std::string request_id)
        : orchestrator_(orchestrator), request_id_(std::move(request_id)) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

        thread_ = std::thread([this]() {
            timespec tick{0, 200 * 1000 * 1000};
            while (!done_) {
                int sig = sigtimedwait(&signals_, nullptr, &tick);
                if (sig > 0) {
                    spdlog::warn("Received signal {}, cancelling run {}", sig, request_id_);
                    orchestrator_.Cancel(request_id_);
                }
            }
        });
    }

    ~SignalCanceller() {
        done_ = true;
        thread_.join();
        pthread_sigmask(SIG_UNBLOCK, &signals_, nullptr);
    }

    SignalCanceller(const SignalCanceller&) = delete;
    SignalCanceller& operator=(const SignalCanceller&) = delete;

private:
    core::Orchestrator& orchestrator_;
    std::string request_id_;
    sigset_t signals_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace

std::optional<int> ParseCommandLine(int argc, const char* const* argv, CommandLineOptions& options) {
    CLI::App app{"codecell-run - run an untrusted test suite in a sandbox"};

    app.add_option("-c,--config", options.config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-r,--request", options.request_path, "Request JSON file ('-' for stdin)")
        ->default_val("-");
    app.add_option("--limits", options.limits_path, "JSON file with per-run limits")
        ->check(CLI::ExistingFile);
    app.add_option("-o,--output", options.output_path, "Write the report to a file instead of stdout");
    app.add_option("--log-level", options.log_level, "trace, debug, info, warn, error, critical, off");
    app.add_option("--workspace-root", options.workspace_root, "Directory holding per-run workspaces");
    app.add_option("--report-format", options.report_format, "Runner report format")
        ->check(CLI::IsMember({"pytest-json", "tap"}));
    app.add_option("--wall-clock", options.wall_clock, "Wall-clock limit in seconds");
    app.add_option("--cpu-time", options.cpu_time, "CPU time limit in seconds");
    app.add_option("--memory", options.memory_bytes, "Memory limit in bytes");
    app.add_option("--max-processes", options.max_processes, "Process/thread limit");
    app.add_flag("--allow-network", options.allow_network, "Keep the run's network access");
    app.add_flag("--no-pool", options.no_pool, "Development mode: run as the invoking non-root user");
    app.add_flag("--preserve-workspace", options.preserve_workspace, "Keep workspaces for debugging");
    app.add_flag("--pretty", options.pretty, "Indent the JSON report");
    app.add_flag("-v,--verbose", options.verbose, "Enable verbose logging");
    app.add_flag("--health", options.health, "Print host readiness as JSON and exit");

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? kExitOk : kExitUsage;
    }

    options.wall_clock_set = app.count("--wall-clock") > 0;
    options.cpu_time_set = app.count("--cpu-time") > 0;
    options.memory_bytes_set = app.count("--memory") > 0;
    options.max_processes_set = app.count("--max-processes") > 0;
    return std::nullopt;
}

core::SandboxConfig BuildConfig(const CommandLineOptions& options,
                                const std::map<std::string, std::string>& env) {
    core::SandboxConfig config;
    if (!options.config_path.empty()) {
        config = core::LoadConfigFile(options.config_path);
    }
    core::ApplyEnvironmentOverrides(config, env);

    if (!options.log_level.empty()) config.log_level = options.log_level;
    if (options.verbose) config.log_level = "debug";
    if (!options.workspace_root.empty()) config.workspace_root = options.workspace_root;
    if (!options.report_format.empty()) {
        try {
            config.runner.report_format = core::ParseReportFormat(options.report_format);
        }
        catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("--report-format: ") + e.what());
        }
    }
    if (!options.limits_path.empty()) {
        config.default_limits = core::ParseLimits(ReadFile(options.limits_path), config.default_limits);
    }
    if (options.wall_clock_set) config.default_limits.wall_clock_seconds = options.wall_clock;
    if (options.cpu_time_set) config.default_limits.cpu_time_seconds = options.cpu_time;
    if (options.memory_bytes_set) config.default_limits.memory_bytes = options.memory_bytes;
    if (options.max_processes_set) config.default_limits.max_processes = options.max_processes;
    if (options.allow_network) config.default_limits.network_disabled = false;
    if (options.no_pool) {
        config.identity.use_pool = false;
        config.identity.require_identity_switch = false;
    }
    if (options.preserve_workspace) config.preserve_workspace = true;
    return config;
}

int RunCli(int argc, const char* const* argv,
           const std::map<std::string, std::string>& env,
           std::istream& in, std::ostream& out) {
    CommandLineOptions options;
    if (auto code = ParseCommandLine(argc, argv, options)) {
        return *code;
    }

    // ========================================================================
    // CONFIGURATION: defaults → file → environment → flags
    // ========================================================================
    core::SandboxConfig config;
    try {
        config = BuildConfig(options, env);
    }
    catch (const std::exception& e) {
        spdlog::error("Configuration error: {}", e.what());
        return kExitUsage;
    }

    auto issues = config.Validate();
    if (!issues.empty()) {
        for (const auto& issue : issues) {
            spdlog::error("Configuration: {}", issue);
        }
        return kExitUsage;
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    core::Orchestrator orchestrator(config);

    if (options.health) {
        std::string document = orchestrator.HealthCheck();
        out << document << std::endl;
        return json::parse(document).value("status", "") == "healthy" ? kExitOk : kExitHostError;
    }

    // ========================================================================
    // REQUEST
    // ========================================================================
    ExecutionRequest request;
    try {
        request = core::ParseRequest(ReadInput(options.request_path, in));
    }
    catch (const std::exception& e) {
        spdlog::error("Invalid request: {}", e.what());
        return kExitUsage;
    }
    if (request.request_id.empty()) {
        request.request_id = reporters::JsonReporter::GenerateUUID();
    }

    if (!orchestrator.Initialize()) {
        spdlog::error("Host is not ready to run untrusted code");
        return kExitHostError;
    }

    // ========================================================================
    // RUN
    // ========================================================================
    ExecutionReport report;
    {
        SignalCanceller canceller(orchestrator, request.request_id);
        report = orchestrator.Run(request);
    }

    reporters::JsonReporterConfig reporter_config;
    reporter_config.indent = options.pretty ? 2 : -1;
    reporters::JsonReporter json_reporter(reporter_config);

    if (options.output_path.empty()) {
        out << json_reporter.GenerateJsonString(report) << std::endl;
        return out ? kExitOk : kExitHostError;
    }

    return json_reporter.GenerateReport(report, options.output_path) ? kExitOk : kExitHostError;
}

} // namespace cli
} // namespace codecell
