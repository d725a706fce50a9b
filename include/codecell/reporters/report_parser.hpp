/**
 * @file report_parser.hpp
 * @brief Pluggable parsers for test-runner report payloads
 *
 * Each supported runner output convention is one ReportParser. The result
 * reporter only sees the interface, so adding a runner means adding a
 * parser and a ReportFormat value.
 *
 * @date 2025
 */

#pragma once

#include "codecell/core/types.hpp"
#include "codecell/core/config.hpp"

#include <memory>
#include <string>
#include <vector>
#include <cstddef>

namespace codecell {
namespace reporters {

/**
 * @class ReportParser
 * @brief Turns a structured payload into TestResults in discovery order
 */
class ReportParser {
public:
    virtual ~ReportParser() = default;

    /// Stable name written into the report ("pytest-json", "tap")
    virtual std::string Name() const = 0;

    /**
     * @brief Parse a complete payload
     * @param payload Report file contents or captured stdout
     * @param max_detail_bytes Bound on each failure message and trace
     * @throws ReportParseError if the payload does not follow the format
     */
    virtual std::vector<TestResult> Parse(const std::string& payload,
                                          std::size_t max_detail_bytes) const = 0;
};

/**
 * @class PytestJsonParser
 * @brief pytest-json-report payloads
 *
 * **Outcome mapping**: passed, failed, error and skipped map to themselves;
 * xfailed → skipped; xpassed → passed. Failed collectors become error
 * results. Duration is setup + call + teardown.
 */
class PytestJsonParser : public ReportParser {
public:
    std::string Name() const override { return "pytest-json"; }
    std::vector<TestResult> Parse(const std::string& payload,
                                  std::size_t max_detail_bytes) const override;
};

/**
 * @class TapParser
 * @brief Test Anything Protocol (version 12/13) streams
 *
 * `ok` → passed, `not ok` → failed, `# SKIP` → skipped, `not ok ... # TODO`
 * → skipped, `Bail out!` → error. Diagnostics (`#` lines and YAML blocks)
 * following a test become its trace. A plan that disagrees with the number
 * of tests seen is a parse error.
 */
class TapParser : public ReportParser {
public:
    std::string Name() const override { return "tap"; }
    std::vector<TestResult> Parse(const std::string& payload,
                                  std::size_t max_detail_bytes) const override;
};

/// Parser for a configured report format
std::unique_ptr<ReportParser> CreateParser(core::ReportFormat format);

} // namespace reporters
} // namespace codecell
