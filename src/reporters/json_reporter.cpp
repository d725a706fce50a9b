/**
 * @file json_reporter.cpp
 * @brief Implementation of ExecutionReport serialization
 *
 * Field order inside objects follows nlohmann::json's sorted keys; test
 * order is discovery order. Numbers for durations are seconds as doubles.
 *
 * @date 2025
 */

#include "codecell/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <random>

using json = nlohmann::json;

namespace codecell {
namespace reporters {

const char* const JsonReporter::kSchemaVersion = "1.0";

namespace {

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json TestToJson(const TestResult& test) {
    json j;
    j["id"] = test.id;
    j["status"] = ToString(test.status);
    j["duration_seconds"] = test.duration.count();
    if (test.detail) {
        j["detail"] = {
            {"message", test.detail->message},
            {"trace", test.detail->trace}
        };
    }
    return j;
}

} // namespace

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

std::string JsonReporter::GenerateJsonString(const ExecutionReport& report) const {
    const auto& execution = report.execution;

    json root;
    root["schema_version"] = kSchemaVersion;
    root["request_id"] = report.request_id;
    root["trace_id"] = report.trace_id;
    root["request_digest"] = report.request_digest;
    root["parser"] = report.parser;
    if (config_.include_timestamp) {
        root["generated_at"] = FormatTimestamp(std::chrono::system_clock::now());
    }

    root["summary"] = {
        {"passed", report.summary.passed},
        {"failed", report.summary.failed},
        {"error", report.summary.error},
        {"skipped", report.summary.skipped},
        {"duration_seconds", report.summary.duration.count()},
        {"outcome", ToString(report.summary.outcome)}
    };

    json tests = json::array();
    for (const auto& test : report.tests) {
        tests.push_back(TestToJson(test));
    }
    root["tests"] = tests;

    root["execution"] = {
        {"status", ToString(execution.status)},
        {"exit_code", OptionalToJson(execution.exit_code)},
        {"signal", OptionalToJson(execution.term_signal)},
        {"elapsed_seconds", std::chrono::duration<double>(execution.elapsed).count()},
        {"reason", execution.reason},
        {"stdout_truncated", execution.stdout_truncated},
        {"stderr_truncated", execution.stderr_truncated}
    };

    if (config_.include_streams) {
        root["stdout"] = execution.stdout_output;
        root["stderr"] = execution.stderr_output;
    }

    if (execution.fault != FaultKind::NONE) {
        root["error"] = {
            {"kind", ToString(execution.fault)},
            {"message", execution.reason}
        };
    }

    return root.dump(config_.indent, ' ', false, json::error_handler_t::replace);
}

bool JsonReporter::GenerateReport(const ExecutionReport& report,
                                  const std::filesystem::path& output_path) const {
    try {
        if (output_path.has_parent_path() && !std::filesystem::exists(output_path.parent_path())) {
            std::filesystem::create_directories(output_path.parent_path());
        }

        std::string json_content = GenerateJsonString(report);
        if (!ValidateSyntax(json_content)) {
            spdlog::error("Generated JSON is invalid");
            return false;
        }

        if (!SaveJson(json_content, output_path)) {
            spdlog::error("Failed to save JSON report");
            return false;
        }

        spdlog::info("✓ Report written to {} ({} bytes)", output_path.string(), json_content.size());
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to generate JSON report: {}", e.what());
        return false;
    }
}

bool JsonReporter::SaveJson(const std::string& json_content,
                            const std::filesystem::path& output_path) const {
    std::ofstream file(output_path);
    if (!file) {
        spdlog::error("Failed to open file for writing: {}", output_path.string());
        return false;
    }

    file << json_content << '\n';
    file.close();

    return static_cast<bool>(file);
}

bool JsonReporter::ValidateSyntax(const std::string& json_str) {
    try {
        json::parse(json_str);
        return true;
    }
    catch (const json::parse_error& e) {
        spdlog::error("JSON validation failed: {}", e.what());
        return false;
    }
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm utc;
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string JsonReporter::GenerateUUID() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::ostringstream oss;
    oss << std::hex;

    for (int i = 0; i < 8; i++) oss << dis(gen);
    oss << "-";
    for (int i = 0; i < 4; i++) oss << dis(gen);
    oss << "-4";
    for (int i = 0; i < 3; i++) oss << dis(gen);
    oss << "-";
    oss << dis2(gen);
    for (int i = 0; i < 3; i++) oss << dis(gen);
    oss << "-";
    for (int i = 0; i < 12; i++) oss << dis(gen);

    return oss.str();
}

} // namespace reporters
} // namespace codecell
