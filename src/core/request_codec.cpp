/**
 * @file request_codec.cpp
 * @brief JSON decoding of execution requests and limits
 *
 * @date 2025
 */

#include "codecell/core/request_codec.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cmath>
#include <cstdint>

using json = nlohmann::json;

namespace codecell {
namespace core {

namespace {

std::chrono::milliseconds SecondsToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

// Negative JSON integers would wrap when read as unsigned
std::uint64_t ReadCount(const json& j, const char* key, std::uint64_t fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    const auto& value = j[key];
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<std::uint64_t>(value.get<std::int64_t>());
    }
    throw std::runtime_error(std::string(key) + " must be a non-negative integer");
}

} // namespace

ExecutionRequest ParseRequest(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed request JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Request must be a JSON object");
    }

    ExecutionRequest request;

    try {
        request.request_id = j.value("request_id", "");
        request.trace_id = j.value("trace_id", "");

        if (!j.contains("files") || !j["files"].is_object()) {
            throw std::runtime_error("Request field 'files' must be an object of path → content");
        }
        for (const auto& [path, content] : j["files"].items()) {
            if (!content.is_string()) {
                throw std::runtime_error("Content of '" + path + "' must be a string");
            }
            request.files[path] = content.get<std::string>();
        }

        if (j.contains("manifest") && !j["manifest"].is_null()) {
            request.manifest = j["manifest"].get<std::string>();
        }

        if (j.contains("time_budget_seconds") && !j["time_budget_seconds"].is_null()) {
            double budget = j["time_budget_seconds"].get<double>();
            if (!std::isfinite(budget) || budget <= 0.0) {
                throw std::runtime_error("time_budget_seconds must be positive and finite");
            }
            request.time_budget = SecondsToMillis(budget);
        }
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid request field: ") + e.what());
    }

    if (!request.request_id.empty() && !IsValidRequestId(request.request_id)) {
        throw std::runtime_error("request_id must match [A-Za-z0-9_-]{1,64}");
    }

    return request;
}

ExecutionLimits ParseLimits(const std::string& json_text, const ExecutionLimits& base) {
    json j;
    try {
        j = json::parse(json_text);
    }
    catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed limits JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw std::runtime_error("Limits must be a JSON object");
    }

    ExecutionLimits limits = base;
    try {
        limits.cpu_time_seconds = j.value("cpu_time_seconds", limits.cpu_time_seconds);
        limits.wall_clock_seconds = j.value("wall_clock_seconds", limits.wall_clock_seconds);
        limits.memory_bytes = ReadCount(j, "memory_bytes", limits.memory_bytes);
        limits.max_processes = ReadCount(j, "max_processes", limits.max_processes);
        limits.network_disabled = j.value("network_disabled", limits.network_disabled);
        limits.max_file_bytes = ReadCount(j, "max_file_bytes", limits.max_file_bytes);
        limits.max_open_files = ReadCount(j, "max_open_files", limits.max_open_files);
    }
    catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid limits field: ") + e.what());
    }

    return limits;
}

bool IsValidRequestId(const std::string& id) {
    if (id.empty() || id.length() > 64) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

std::string CanonicalPayload(const ExecutionRequest& request) {
    // std::map keeps files sorted, and nlohmann::json objects are sorted,
    // so the dump is deterministic.
    json j;
    j["files"] = request.files;
    j["manifest"] = request.manifest ? json(*request.manifest) : json(nullptr);
    j["time_budget_ms"] = request.time_budget ? json(request.time_budget->count()) : json(nullptr);
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace core
} // namespace codecell
