/**
 * @file result_reporter.hpp
 * @brief Turns a harness outcome into TestResults and a summary
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"
#include "codecell/reporters/report_parser.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

namespace codecell {
namespace reporters {

/**
 * @struct ReporterResult
 * @brief Parsed tests plus the parse failure, if the payload was unusable
 */
struct ReporterResult {
    std::vector<TestResult> tests;
    std::optional<std::string> parse_error;
};

/**
 * @class ResultReporter
 * @brief Applies the synthetic-error policy around a ReportParser
 *
 * Tests are only taken from the payload when the outcome is COMPLETED and
 * the payload parses. In every other case the result is exactly one
 * synthetic ERROR test carrying the raw outcome and the captured streams;
 * nothing is salvaged from partial output.
 */
class ResultReporter {
public:
    /// Id of the synthetic result
    static const std::string kSyntheticTestId;

    ResultReporter(std::shared_ptr<ReportParser> parser, std::size_t max_detail_bytes);

    ReporterResult BuildResults(const ExecutionOutcome& outcome) const;

    /// Counts per status, overall duration and the outcome
    static ReportSummary Summarize(const std::vector<TestResult>& tests,
                                   const ExecutionOutcome& outcome);

    /**
     * @brief The single error result standing in for a run without results
     * @param outcome Raw harness outcome
     * @param why First line of the detail message
     */
    static TestResult SyntheticError(const ExecutionOutcome& outcome, const std::string& why);

    const ReportParser& Parser() const { return *parser_; }

private:
    std::shared_ptr<ReportParser> parser_;
    std::size_t max_detail_bytes_;
};

} // namespace reporters
} // namespace codecell
