/**
 * @file config.cpp
 * @brief Configuration loading, environment overrides and validation
 *
 * @date 2025
 */

#include "codecell/core/config.hpp"
#include "codecell/core/request_codec.hpp"
#include "codecell/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <cmath>
#include <set>

extern char** environ;

using json = nlohmann::json;

namespace codecell {
namespace core {

namespace {

const std::set<std::string> kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

std::uint64_t ParseUnsigned(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument("negative");
        }
        auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    }
    catch (const std::exception&) {
        throw std::runtime_error(name + " must be a non-negative integer (got '" + value + "')");
    }
}

double ParseSeconds(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    }
    catch (const std::exception&) {
        throw std::runtime_error(name + " must be a number of seconds (got '" + value + "')");
    }
}

bool ParseBool(const std::string& name, const std::string& value) {
    std::string lowered = utils::StringUtils::ToLower(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes") return true;
    if (lowered == "0" || lowered == "false" || lowered == "no") return false;
    throw std::runtime_error(name + " must be a boolean (got '" + value + "')");
}

std::chrono::milliseconds ReadMillis(const json& j, const char* key,
                                     std::chrono::milliseconds fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return std::chrono::milliseconds(j[key].get<long long>());
}

void ApplyRunner(const json& j, RunnerConfig& runner) {
    if (j.contains("command")) {
        runner.command = j["command"].get<std::vector<std::string>>();
    }
    runner.report_file = j.value("report_file", runner.report_file);
    if (j.contains("report_format")) {
        runner.report_format = ParseReportFormat(j["report_format"].get<std::string>());
    }
    if (j.contains("completed_exit_codes")) {
        runner.completed_exit_codes = j["completed_exit_codes"].get<std::vector<int>>();
    }
    if (j.contains("environment")) {
        runner.environment = j["environment"].get<std::map<std::string, std::string>>();
    }
    runner.manifest_filename = j.value("manifest_filename", runner.manifest_filename);
    if (j.contains("search_path")) {
        runner.search_path = j["search_path"].get<std::vector<std::string>>();
    }
}

void ApplyIdentity(const json& j, IdentityConfig& identity) {
    identity.use_pool = j.value("use_pool", identity.use_pool);
    identity.uid_base = j.value("uid_base", identity.uid_base);
    identity.gid_base = j.value("gid_base", identity.gid_base);
    identity.pool_size = j.value("pool_size", identity.pool_size);
    identity.require_identity_switch =
        j.value("require_identity_switch", identity.require_identity_switch);
}

} // namespace

std::string ToString(ReportFormat format) {
    switch (format) {
        case ReportFormat::PYTEST_JSON: return "pytest-json";
        case ReportFormat::TAP:         return "tap";
    }
    return "unknown";
}

ReportFormat ParseReportFormat(const std::string& name) {
    if (name == "pytest-json" || name == "pytest_json") {
        return ReportFormat::PYTEST_JSON;
    }
    if (name == "tap") {
        return ReportFormat::TAP;
    }
    throw std::invalid_argument("Unknown report format: " + name);
}

std::vector<std::string> SandboxConfig::Validate() const {
    std::vector<std::string> issues;

    if (kLogLevels.count(log_level) == 0) {
        issues.push_back("log_level must be one of trace, debug, info, warn, error, critical, off");
    }

    if (workspace_root.empty() || !workspace_root.is_absolute()) {
        issues.push_back("workspace_root must be an absolute path");
    }

    if (runner.command.empty() || runner.command.front().empty()) {
        issues.push_back("runner.command must name an executable");
    }
    if (runner.completed_exit_codes.empty()) {
        issues.push_back("runner.completed_exit_codes must not be empty");
    }
    if (!runner.report_file.empty()) {
        std::filesystem::path report(runner.report_file);
        if (report.is_absolute() || report.lexically_normal().string().rfind("..", 0) == 0) {
            issues.push_back("runner.report_file must be relative to the workspace");
        }
    }
    if (runner.manifest_filename.empty() ||
        std::filesystem::path(runner.manifest_filename).has_parent_path()) {
        issues.push_back("runner.manifest_filename must be a plain file name");
    }

    if (identity.use_pool) {
        if (identity.uid_base == 0 || identity.gid_base == 0) {
            issues.push_back("identity pool must not include uid 0 or gid 0");
        }
        if (identity.pool_size == 0) {
            issues.push_back("identity.pool_size must be positive");
        }
    }

    for (const auto& issue : default_limits.Validate()) {
        issues.push_back("default_limits: " + issue);
    }
    if (!std::isfinite(max_wall_clock_seconds) || max_wall_clock_seconds <= 0.0) {
        issues.push_back("max_wall_clock_seconds must be positive and finite");
    }
    else if (default_limits.wall_clock_seconds > max_wall_clock_seconds) {
        issues.push_back("default_limits.wall_clock_seconds exceeds max_wall_clock_seconds");
    }

    for (const auto& directory : private_directories) {
        if (directory.empty() || directory[0] != '/' || directory == "/") {
            issues.push_back("private_directories entries must be absolute and not /");
            break;
        }
    }
    if (!private_directories.empty() && private_tmp_bytes == 0) {
        issues.push_back("private_tmp_bytes must be positive");
    }

    // The truncation marker has to fit inside every bounded field
    if (max_output_bytes < 256) {
        issues.push_back("max_output_bytes must be at least 256");
    }
    if (max_detail_bytes < 256) {
        issues.push_back("max_detail_bytes must be at least 256");
    }
    if (max_report_bytes == 0) {
        issues.push_back("max_report_bytes must be positive");
    }

    if (monitor_interval.count() <= 0) {
        issues.push_back("monitor_interval must be positive");
    }
    if (watchdog_grace.count() < 0 || drain_timeout.count() < 0) {
        issues.push_back("watchdog_grace and drain_timeout must not be negative");
    }

    return issues;
}

SandboxConfig ParseConfig(const std::string& json_text, const SandboxConfig& base) {
    json j;
    try {
        j = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed configuration JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    SandboxConfig config = base;

    try {
        config.log_level = j.value("log_level", config.log_level);
        if (j.contains("workspace_root")) {
            config.workspace_root = j["workspace_root"].get<std::string>();
        }
        config.preserve_workspace = j.value("preserve_workspace", config.preserve_workspace);

        if (j.contains("runner")) {
            ApplyRunner(j["runner"], config.runner);
        }
        if (j.contains("identity")) {
            ApplyIdentity(j["identity"], config.identity);
        }
        if (j.contains("limits")) {
            config.default_limits = ParseLimits(j["limits"].dump(), config.default_limits);
        }

        config.max_wall_clock_seconds = j.value("max_wall_clock_seconds", config.max_wall_clock_seconds);
        config.private_directories = j.value("private_directories", config.private_directories);
        config.private_tmp_bytes = j.value("private_tmp_bytes", config.private_tmp_bytes);
        config.max_output_bytes = j.value("max_output_bytes", config.max_output_bytes);
        config.max_detail_bytes = j.value("max_detail_bytes", config.max_detail_bytes);
        config.max_report_bytes = j.value("max_report_bytes", config.max_report_bytes);

        config.monitor_interval = ReadMillis(j, "monitor_interval_ms", config.monitor_interval);
        config.watchdog_grace = ReadMillis(j, "watchdog_grace_ms", config.watchdog_grace);
        config.drain_timeout = ReadMillis(j, "drain_timeout_ms", config.drain_timeout);
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid configuration field: ") + e.what());
    }
    catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
}

SandboxConfig LoadConfigFile(const std::filesystem::path& path, const SandboxConfig& base) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loading configuration from {}", path.string());
    return ParseConfig(buffer.str(), base);
}

void ApplyEnvironmentOverrides(SandboxConfig& config,
                               const std::map<std::string, std::string>& env) {
    auto lookup = [&env](const char* name) -> const std::string* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : &it->second;
    };

    if (auto v = lookup("CODECELL_LOG_LEVEL")) {
        config.log_level = utils::StringUtils::ToLower(*v);
    }
    if (auto v = lookup("CODECELL_WORKSPACE_ROOT")) {
        config.workspace_root = *v;
    }
    if (auto v = lookup("CODECELL_WALL_CLOCK_SECONDS")) {
        config.default_limits.wall_clock_seconds = ParseSeconds("CODECELL_WALL_CLOCK_SECONDS", *v);
    }
    if (auto v = lookup("CODECELL_CPU_TIME_SECONDS")) {
        config.default_limits.cpu_time_seconds = ParseSeconds("CODECELL_CPU_TIME_SECONDS", *v);
    }
    if (auto v = lookup("CODECELL_MEMORY_BYTES")) {
        config.default_limits.memory_bytes = ParseUnsigned("CODECELL_MEMORY_BYTES", *v);
    }
    if (auto v = lookup("CODECELL_MAX_PROCESSES")) {
        config.default_limits.max_processes = ParseUnsigned("CODECELL_MAX_PROCESSES", *v);
    }
    if (auto v = lookup("CODECELL_NETWORK_DISABLED")) {
        config.default_limits.network_disabled = ParseBool("CODECELL_NETWORK_DISABLED", *v);
    }
    if (auto v = lookup("CODECELL_REPORT_FORMAT")) {
        try {
            config.runner.report_format = ParseReportFormat(*v);
        }
        catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string("CODECELL_REPORT_FORMAT: ") + e.what());
        }
    }
    if (auto v = lookup("CODECELL_UID_BASE")) {
        config.identity.uid_base = static_cast<std::uint32_t>(ParseUnsigned("CODECELL_UID_BASE", *v));
    }
    if (auto v = lookup("CODECELL_GID_BASE")) {
        config.identity.gid_base = static_cast<std::uint32_t>(ParseUnsigned("CODECELL_GID_BASE", *v));
    }
    if (auto v = lookup("CODECELL_MAX_OUTPUT_BYTES")) {
        config.max_output_bytes = static_cast<std::size_t>(ParseUnsigned("CODECELL_MAX_OUTPUT_BYTES", *v));
    }
}

std::map<std::string, std::string> CurrentEnvironment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string line(*entry);
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            env.emplace(line.substr(0, eq), line.substr(eq + 1));
        }
    }
    return env;
}

} // namespace core
} // namespace codecell
