/**
 * @file report_parser.cpp
 * @brief pytest-json-report and TAP parsers
 *
 * @date 2025
 */

#include "codecell/reporters/report_parser.hpp"
#include "codecell/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <charconv>
#include <optional>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace codecell {
namespace reporters {

using utils::StringUtils;

namespace {

// ============================================================================
// PYTEST-JSON-REPORT
// ============================================================================

TestStatus MapPytestOutcome(const std::string& outcome, const std::string& nodeid) {
    if (outcome == "passed" || outcome == "xpassed") return TestStatus::PASSED;
    if (outcome == "failed") return TestStatus::FAILED;
    if (outcome == "error") return TestStatus::ERROR;
    if (outcome == "skipped" || outcome == "xfailed") return TestStatus::SKIPPED;
    throw ReportParseError("Unknown outcome '" + outcome + "' for test " + nodeid);
}

constexpr int kMaxLongreprDepth = 64;

// Structured longrepr: the string leaves in document order, one per line
void AppendLongrepr(const json& value, int depth, std::string& out) {
    if (depth > kMaxLongreprDepth) {
        throw ReportParseError("longrepr nested deeper than " +
                               std::to_string(kMaxLongreprDepth) + " levels");
    }
    if (value.is_string()) {
        out += value.get<std::string>();
        out += '\n';
    }
    else if (value.is_array() || value.is_object()) {
        for (const auto& element : value) {
            AppendLongrepr(element, depth + 1, out);
        }
    }
    else if (!value.is_null()) {
        out += value.dump();
        out += '\n';
    }
}

std::string LongreprText(const json& stage) {
    if (!stage.contains("longrepr")) {
        return "";
    }
    const auto& longrepr = stage["longrepr"];
    if (longrepr.is_string()) {
        return longrepr.get<std::string>();
    }
    std::string text;
    AppendLongrepr(longrepr, 0, text);
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

// First stage that did not pass carries the failure
std::optional<FailureDetail> PytestDetail(const json& test, std::size_t max_detail_bytes) {
    for (const char* stage_name : {"setup", "call", "teardown"}) {
        if (!test.contains(stage_name) || !test[stage_name].is_object()) {
            continue;
        }
        const auto& stage = test[stage_name];
        std::string stage_outcome = stage.value("outcome", "passed");
        if (stage_outcome == "passed") {
            continue;
        }

        FailureDetail detail;
        std::string trace = LongreprText(stage);
        if (stage.contains("crash") && stage["crash"].is_object() &&
            stage["crash"].contains("message") && stage["crash"]["message"].is_string()) {
            detail.message = stage["crash"]["message"].get<std::string>();
        }
        else {
            detail.message = StringUtils::LastNonEmptyLine(trace);
        }
        if (detail.message.empty()) {
            detail.message = std::string(stage_name) + " " + stage_outcome;
        }
        detail.message = StringUtils::Truncate(detail.message, max_detail_bytes);
        detail.trace = StringUtils::Truncate(trace, max_detail_bytes);
        return detail;
    }
    return std::nullopt;
}

double StageDuration(const json& test, const char* stage_name) {
    if (!test.contains(stage_name) || !test[stage_name].is_object()) {
        return 0.0;
    }
    const auto& stage = test[stage_name];
    if (!stage.contains("duration") || !stage["duration"].is_number()) {
        return 0.0;
    }
    return stage["duration"].get<double>();
}

// ============================================================================
// TAP
// ============================================================================

// Leading decimal digits of text; out of range for int is a parse error
int ParseTapNumber(const std::string& digits, const char* what) {
    int value = 0;
    auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (result.ec == std::errc::result_out_of_range) {
        throw ReportParseError(std::string("TAP ") + what + " out of range: " + digits);
    }
    if (result.ec != std::errc() || result.ptr != digits.data() + digits.size()) {
        throw ReportParseError(std::string("Malformed TAP ") + what + ": " + digits);
    }
    return value;
}

struct TapLine {
    bool ok{false};
    int number{0};
    std::string description;
    std::string directive;      // "SKIP", "TODO" or empty
    std::string directive_text;
};

bool ParseTestLine(const std::string& line, TapLine& out) {
    std::string rest;
    if (StringUtils::StartsWith(line, "ok")) {
        out.ok = true;
        rest = line.substr(2);
    }
    else if (StringUtils::StartsWith(line, "not ok")) {
        out.ok = false;
        rest = line.substr(6);
    }
    else {
        return false;
    }
    if (!rest.empty() && rest[0] != ' ') {
        return false;  // e.g. "okay"
    }
    rest = StringUtils::Trim(rest);

    std::size_t digits = 0;
    while (digits < rest.size() && std::isdigit(static_cast<unsigned char>(rest[digits]))) {
        ++digits;
    }
    if (digits > 0) {
        out.number = ParseTapNumber(rest.substr(0, digits), "test number");
        rest = StringUtils::Trim(rest.substr(digits));
    }

    // Directive: unescaped '#' followed by SKIP or TODO
    std::size_t hash = std::string::npos;
    for (std::size_t i = 0; i < rest.size(); ++i) {
        if (rest[i] == '#' && (i == 0 || rest[i - 1] != '\\')) {
            hash = i;
            break;
        }
    }
    if (hash != std::string::npos) {
        std::string directive = StringUtils::Trim(rest.substr(hash + 1));
        std::string keyword = StringUtils::ToLower(directive.substr(0, 4));
        if (keyword == "skip" || keyword == "todo") {
            out.directive = keyword == "skip" ? "SKIP" : "TODO";
            out.directive_text = StringUtils::Trim(directive.substr(4));
        }
        rest = StringUtils::Trim(rest.substr(0, hash));
    }

    if (StringUtils::StartsWith(rest, "- ")) {
        rest = rest.substr(2);
    }
    else if (rest == "-") {
        rest.clear();
    }
    out.description = StringUtils::ReplaceAll(rest, "\\#", "#");
    return true;
}

} // namespace

std::vector<TestResult> PytestJsonParser::Parse(const std::string& payload,
                                                std::size_t max_detail_bytes) const {
    json report;
    try {
        report = json::parse(payload);
    }
    catch (const json::parse_error& e) {
        throw ReportParseError(std::string("Report is not valid JSON: ") + e.what());
    }

    if (!report.is_object() || !report.contains("tests") || !report["tests"].is_array()) {
        throw ReportParseError("Report has no 'tests' array");
    }

    std::vector<TestResult> results;

    try {
        // Collection failures come first, as pytest reports them before running
        if (report.contains("collectors") && report["collectors"].is_array()) {
            for (const auto& collector : report["collectors"]) {
                if (collector.value("outcome", "passed") != "failed") {
                    continue;
                }
                TestResult result;
                std::string nodeid = collector.value("nodeid", "");
                result.id = nodeid.empty() ? "collection" : nodeid;
                result.status = TestStatus::ERROR;

                FailureDetail detail;
                std::string trace = LongreprText(collector);
                detail.message = StringUtils::Truncate(
                    "collection failed: " + StringUtils::LastNonEmptyLine(trace), max_detail_bytes);
                detail.trace = StringUtils::Truncate(trace, max_detail_bytes);
                result.detail = detail;
                results.push_back(std::move(result));
            }
        }

        for (const auto& test : report["tests"]) {
            if (!test.is_object() || !test.contains("nodeid") || !test["nodeid"].is_string() ||
                !test.contains("outcome") || !test["outcome"].is_string()) {
                throw ReportParseError("Test entry without nodeid/outcome");
            }

            TestResult result;
            result.id = test["nodeid"].get<std::string>();
            result.status = MapPytestOutcome(test["outcome"].get<std::string>(), result.id);
            result.duration = std::chrono::duration<double>(
                StageDuration(test, "setup") + StageDuration(test, "call") +
                StageDuration(test, "teardown"));

            if (result.status == TestStatus::FAILED || result.status == TestStatus::ERROR) {
                result.detail = PytestDetail(test, max_detail_bytes);
            }
            else if (result.status == TestStatus::SKIPPED) {
                // Skip reason, when pytest recorded one
                if (auto detail = PytestDetail(test, max_detail_bytes)) {
                    result.detail = detail;
                }
            }

            results.push_back(std::move(result));
        }
    }
    catch (const json::exception& e) {
        throw ReportParseError(std::string("Malformed test entry: ") + e.what());
    }

    return results;
}

std::vector<TestResult> TapParser::Parse(const std::string& payload,
                                         std::size_t max_detail_bytes) const {
    std::vector<TestResult> results;
    std::vector<std::string> traces;
    std::optional<int> planned;
    bool bailed_out = false;
    bool in_yaml = false;

    auto lines = StringUtils::Split(payload, '\n', true);

    for (const auto& raw : lines) {
        std::string line = raw;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::string trimmed = StringUtils::Trim(line);

        // YAML diagnostic block attached to the previous test
        if (in_yaml) {
            if (trimmed == "...") {
                in_yaml = false;
            }
            else if (!traces.empty()) {
                traces.back() += line + "\n";
            }
            continue;
        }
        if (trimmed == "---" && !results.empty() && line.size() > trimmed.size()) {
            in_yaml = true;
            continue;
        }

        if (trimmed.empty() || StringUtils::StartsWith(trimmed, "TAP version")) {
            continue;
        }

        if (StringUtils::StartsWith(trimmed, "Bail out!")) {
            TestResult result;
            result.id = "bail out";
            result.status = TestStatus::ERROR;
            std::string why = StringUtils::Trim(trimmed.substr(9));
            result.detail = FailureDetail{
                StringUtils::Truncate(why.empty() ? "Bail out!" : why, max_detail_bytes), ""};
            results.push_back(std::move(result));
            traces.emplace_back();
            bailed_out = true;
            break;
        }

        if (StringUtils::StartsWith(trimmed, "1..")) {
            std::string count = trimmed.substr(3);
            std::size_t digits = 0;
            while (digits < count.size() && std::isdigit(static_cast<unsigned char>(count[digits]))) {
                ++digits;
            }
            if (digits == 0) {
                throw ReportParseError("Malformed TAP plan: " + trimmed);
            }
            if (planned) {
                throw ReportParseError("TAP stream has more than one plan");
            }
            planned = ParseTapNumber(count.substr(0, digits), "plan");
            continue;
        }

        if (trimmed[0] == '#') {
            if (!traces.empty()) {
                traces.back() += trimmed.substr(1) + "\n";
            }
            continue;
        }

        TapLine tap;
        if (!ParseTestLine(trimmed, tap)) {
            // Free-form output between tests is allowed and ignored
            continue;
        }

        TestResult result;
        int number = static_cast<int>(results.size()) + 1;
        result.id = tap.description.empty()
            ? "test " + std::to_string(tap.number > 0 ? tap.number : number)
            : tap.description;

        if (tap.directive == "SKIP") {
            result.status = TestStatus::SKIPPED;
        }
        else if (tap.directive == "TODO") {
            result.status = tap.ok ? TestStatus::PASSED : TestStatus::SKIPPED;
        }
        else {
            result.status = tap.ok ? TestStatus::PASSED : TestStatus::FAILED;
        }

        if (result.status == TestStatus::FAILED) {
            result.detail = FailureDetail{
                StringUtils::Truncate(tap.description.empty() ? "not ok" : tap.description,
                                      max_detail_bytes), ""};
        }
        else if (result.status == TestStatus::SKIPPED && !tap.directive_text.empty()) {
            result.detail = FailureDetail{
                StringUtils::Truncate(tap.directive_text, max_detail_bytes), ""};
        }

        results.push_back(std::move(result));
        traces.emplace_back();
    }

    // Diagnostics are only kept for tests that carry a detail
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (results[i].detail && !traces[i].empty()) {
            std::string trace = traces[i];
            if (!trace.empty() && trace.back() == '\n') {
                trace.pop_back();
            }
            results[i].detail->trace = StringUtils::Truncate(trace, max_detail_bytes);
        }
    }

    if (!planned && results.empty()) {
        throw ReportParseError("No TAP plan or test lines in runner output");
    }
    if (planned && !bailed_out && static_cast<std::size_t>(*planned) != results.size()) {
        throw ReportParseError("TAP plan announced " + std::to_string(*planned) +
                               " tests but " + std::to_string(results.size()) + " ran");
    }

    return results;
}

std::unique_ptr<ReportParser> CreateParser(core::ReportFormat format) {
    switch (format) {
        case core::ReportFormat::PYTEST_JSON:
            return std::make_unique<PytestJsonParser>();
        case core::ReportFormat::TAP:
            return std::make_unique<TapParser>();
    }
    throw std::invalid_argument("Unsupported report format");
}

} // namespace reporters
} // namespace codecell
