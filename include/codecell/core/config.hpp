/**
 * @file config.hpp
 * @brief Sandbox configuration with file, environment and CLI layering
 *
 * SandboxConfig collects every knob of the execution core: where per-run
 * workspaces live, which test runner is invoked and how its report is read,
 * which identities runs are switched to, output caps, and the default
 * limits. Values are layered in this order: built-in defaults, optional JSON
 * file, CODECELL_* environment variables, command-line flags.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace codecell {
namespace core {

/**
 * @enum ReportFormat
 * @brief Structured report format emitted by the test runner
 */
enum class ReportFormat {
    PYTEST_JSON,  ///< pytest-json-report payload
    TAP           ///< Test Anything Protocol (version 13) on stdout
};

std::string ToString(ReportFormat format);

/**
 * @brief Parse a report format name ("pytest-json", "tap")
 * @throws std::invalid_argument for unknown names
 */
ReportFormat ParseReportFormat(const std::string& name);

/**
 * @struct RunnerConfig
 * @brief How the test runner is invoked inside the workspace
 *
 * Command arguments may contain the placeholders {workspace} and
 * {report_file}; they are substituted per run.
 */
struct RunnerConfig {
    std::vector<std::string> command{
        "python3", "-m", "pytest", "-q", "-p", "no:cacheprovider",
        "--json-report", "--json-report-file={report_file}"
    };
    std::string report_file{".codecell-report.json"};  ///< Empty: payload is stdout
    ReportFormat report_format{ReportFormat::PYTEST_JSON};
    std::vector<int> completed_exit_codes{0, 1};       ///< Exit codes that mean "tests ran"
    std::map<std::string, std::string> environment;    ///< Extra variables for the runner
    std::string manifest_filename{"requirements.txt"};
    std::vector<std::string> search_path{"/usr/local/bin", "/usr/bin", "/bin"};
};

/**
 * @struct IdentityConfig
 * @brief Non-privileged identities handed to runs
 *
 * With use_pool, each run leases its own uid/gid from
 * [uid_base, uid_base + pool_size). Without it, runs keep the invoking
 * identity, which is only accepted when require_identity_switch is false.
 */
struct IdentityConfig {
    bool use_pool{true};
    std::uint32_t uid_base{61000};
    std::uint32_t gid_base{61000};
    std::uint32_t pool_size{64};
    bool require_identity_switch{true};
};

/**
 * @struct SandboxConfig
 * @brief Complete configuration of the execution core
 */
struct SandboxConfig {
    std::string log_level{"info"};  ///< debug, info, warn, error, critical

    // Workspaces
    std::filesystem::path workspace_root{
        std::filesystem::temp_directory_path() / "codecell"};
    bool preserve_workspace{false};  ///< Keep workspaces for forensics (debug only)

    RunnerConfig runner;
    IdentityConfig identity;
    ExecutionLimits default_limits;
    double max_wall_clock_seconds{300.0};  ///< Upper bound on any run's wall clock

    // Shared scratch directories replaced by a fresh tmpfs in every pooled run
    std::vector<std::string> private_directories{"/tmp", "/var/tmp", "/dev/shm"};
    std::uint64_t private_tmp_bytes{64ULL * 1024 * 1024};  ///< Size of each tmpfs

    // Capture bounds
    std::size_t max_output_bytes{1024 * 1024};      ///< Per stream (1 MiB)
    std::size_t max_detail_bytes{16 * 1024};        ///< Per failure detail field
    std::size_t max_report_bytes{8 * 1024 * 1024};  ///< Report file size ceiling

    // Watchdog
    std::chrono::milliseconds monitor_interval{50};    ///< Tree sampling period
    std::chrono::milliseconds watchdog_grace{2000};    ///< Orchestrator deadline slack
    std::chrono::milliseconds drain_timeout{500};      ///< Pipe drain after exit

    /**
     * @brief List every configuration problem
     * @return Empty vector when the configuration is usable
     */
    std::vector<std::string> Validate() const;
};

/**
 * @brief Load configuration from a JSON file on top of defaults
 * @throws std::runtime_error if the file is unreadable or malformed
 */
SandboxConfig LoadConfigFile(const std::filesystem::path& path,
                             const SandboxConfig& base = SandboxConfig{});

/**
 * @brief Parse configuration from a JSON document on top of defaults
 * @throws std::runtime_error if the document is malformed
 */
SandboxConfig ParseConfig(const std::string& json_text,
                          const SandboxConfig& base = SandboxConfig{});

/**
 * @brief Apply CODECELL_* overrides from an environment snapshot
 *
 * Recognized: CODECELL_LOG_LEVEL, CODECELL_WORKSPACE_ROOT,
 * CODECELL_WALL_CLOCK_SECONDS, CODECELL_CPU_TIME_SECONDS,
 * CODECELL_MEMORY_BYTES, CODECELL_MAX_PROCESSES, CODECELL_NETWORK_DISABLED,
 * CODECELL_REPORT_FORMAT, CODECELL_UID_BASE, CODECELL_GID_BASE,
 * CODECELL_MAX_OUTPUT_BYTES.
 *
 * @throws std::runtime_error if a value cannot be parsed
 */
void ApplyEnvironmentOverrides(SandboxConfig& config,
                               const std::map<std::string, std::string>& env);

/// Snapshot of the process environment
std::map<std::string, std::string> CurrentEnvironment();

} // namespace core
} // namespace codecell
