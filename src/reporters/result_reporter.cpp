/**
 * @file result_reporter.cpp
 * @brief Implementation of the synthetic-error policy
 *
 * @date 2025
 */

#include "codecell/reporters/result_reporter.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <utility>

namespace codecell {
namespace reporters {

const std::string ResultReporter::kSyntheticTestId = "codecell::harness";

ResultReporter::ResultReporter(std::shared_ptr<ReportParser> parser, std::size_t max_detail_bytes)
    : parser_(std::move(parser)), max_detail_bytes_(max_detail_bytes) {
    if (!parser_) {
        throw std::invalid_argument("ResultReporter needs a parser");
    }
}

TestResult ResultReporter::SyntheticError(const ExecutionOutcome& outcome, const std::string& why) {
    TestResult result;
    result.id = kSyntheticTestId;
    result.status = TestStatus::ERROR;
    result.duration = std::chrono::duration<double>(outcome.elapsed);

    std::ostringstream message;
    message << why << " (outcome: " << ToString(outcome.status);
    if (outcome.exit_code) {
        message << ", exit code " << *outcome.exit_code;
    }
    if (outcome.term_signal) {
        message << ", signal " << *outcome.term_signal;
    }
    if (!outcome.reason.empty()) {
        message << ", " << outcome.reason;
    }
    message << ")";

    // Streams are already bounded by the capture cap
    std::ostringstream trace;
    trace << "--- stdout ---\n" << outcome.stdout_output << "\n"
          << "--- stderr ---\n" << outcome.stderr_output;

    result.detail = FailureDetail{message.str(), trace.str()};
    return result;
}

ReporterResult ResultReporter::BuildResults(const ExecutionOutcome& outcome) const {
    ReporterResult built;

    if (outcome.status != ExecutionStatus::COMPLETED) {
        built.tests.push_back(SyntheticError(outcome, "Test run did not complete"));
        return built;
    }

    if (!outcome.report_payload) {
        built.parse_error = "runner produced no " + parser_->Name() + " report";
        built.tests.push_back(SyntheticError(outcome, "Structured test report is missing"));
        return built;
    }

    try {
        built.tests = parser_->Parse(*outcome.report_payload, max_detail_bytes_);
    }
    catch (const ReportParseError& e) {
        spdlog::warn("Discarding {} report: {}", parser_->Name(), e.what());
        built.tests.clear();
        built.parse_error = e.what();
        built.tests.push_back(SyntheticError(outcome, std::string("Structured test report is malformed: ") + e.what()));
    }

    return built;
}

ReportSummary ResultReporter::Summarize(const std::vector<TestResult>& tests,
                                        const ExecutionOutcome& outcome) {
    ReportSummary summary;
    for (const auto& test : tests) {
        switch (test.status) {
            case TestStatus::PASSED:  ++summary.passed;  break;
            case TestStatus::FAILED:  ++summary.failed;  break;
            case TestStatus::ERROR:   ++summary.error;   break;
            case TestStatus::SKIPPED: ++summary.skipped; break;
        }
    }
    summary.duration = std::chrono::duration<double>(outcome.elapsed);
    summary.outcome = outcome.status;
    return summary;
}

} // namespace reporters
} // namespace codecell
