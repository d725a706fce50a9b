/**
 * @file test_result_reporter.cpp
 * @brief Unit tests for the synthetic-error policy and summaries
 */

#include "codecell/reporters/result_reporter.hpp"

#include <gtest/gtest.h>

using namespace codecell;
using namespace codecell::reporters;

class ResultReporterTest : public ::testing::Test {
protected:
    ResultReporter reporter_{std::make_shared<TapParser>(), 4096};

    static ExecutionOutcome Completed(const std::string& payload) {
        ExecutionOutcome outcome;
        outcome.status = ExecutionStatus::COMPLETED;
        outcome.exit_code = 1;
        outcome.stdout_output = payload;
        outcome.report_payload = payload;
        outcome.elapsed = std::chrono::milliseconds(420);
        return outcome;
    }
};

TEST_F(ResultReporterTest, CompletedRunKeepsParsedTests) {
    auto built = reporter_.BuildResults(Completed("1..2\nok 1 - a\nnot ok 2 - b\n"));

    EXPECT_FALSE(built.parse_error.has_value());
    ASSERT_EQ(built.tests.size(), 2u);
    EXPECT_EQ(built.tests[0].status, TestStatus::PASSED);
    EXPECT_EQ(built.tests[1].status, TestStatus::FAILED);
}

TEST_F(ResultReporterTest, TimedOutRunIgnoresPartialOutput) {
    auto outcome = Completed("1..3\nok 1 - a\n");
    outcome.status = ExecutionStatus::TIMED_OUT;
    outcome.exit_code.reset();
    outcome.term_signal = 9;
    outcome.reason = "wall-clock deadline of 5s elapsed";
    outcome.stderr_output = "still running";

    auto built = reporter_.BuildResults(outcome);

    EXPECT_FALSE(built.parse_error.has_value());
    ASSERT_EQ(built.tests.size(), 1u);
    const auto& synthetic = built.tests[0];
    EXPECT_EQ(synthetic.id, ResultReporter::kSyntheticTestId);
    EXPECT_EQ(synthetic.status, TestStatus::ERROR);
    ASSERT_TRUE(synthetic.detail.has_value());
    EXPECT_EQ(synthetic.detail->message,
              "Test run did not complete (outcome: timed_out, signal 9, "
              "wall-clock deadline of 5s elapsed)");
    EXPECT_EQ(synthetic.detail->trace,
              "--- stdout ---\n1..3\nok 1 - a\n\n--- stderr ---\nstill running");
    EXPECT_DOUBLE_EQ(synthetic.duration.count(), 0.42);
}

TEST_F(ResultReporterTest, MissingPayloadIsAParseError) {
    auto outcome = Completed("");
    outcome.report_payload.reset();

    auto built = reporter_.BuildResults(outcome);

    ASSERT_TRUE(built.parse_error.has_value());
    EXPECT_EQ(*built.parse_error, "runner produced no tap report");
    ASSERT_EQ(built.tests.size(), 1u);
    EXPECT_EQ(built.tests[0].status, TestStatus::ERROR);
    EXPECT_EQ(built.tests[0].detail->message.rfind("Structured test report is missing (outcome: completed, exit code 1", 0), 0u);
}

TEST_F(ResultReporterTest, MalformedPayloadYieldsOnlyTheSyntheticError) {
    auto built = reporter_.BuildResults(Completed("1..3\nok 1 - a\nok 2 - b\n"));

    ASSERT_TRUE(built.parse_error.has_value());
    ASSERT_EQ(built.tests.size(), 1u);
    EXPECT_EQ(built.tests[0].id, ResultReporter::kSyntheticTestId);
    EXPECT_EQ(built.tests[0].detail->message.rfind("Structured test report is malformed: ", 0), 0u);
}

TEST_F(ResultReporterTest, SummarizeCountsEveryStatus) {
    std::vector<TestResult> tests(5);
    tests[0].status = TestStatus::PASSED;
    tests[1].status = TestStatus::PASSED;
    tests[2].status = TestStatus::FAILED;
    tests[3].status = TestStatus::ERROR;
    tests[4].status = TestStatus::SKIPPED;

    auto outcome = Completed("");
    auto summary = ResultReporter::Summarize(tests, outcome);

    EXPECT_EQ(summary.passed, 2);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.error, 1);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_EQ(summary.outcome, ExecutionStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(summary.duration.count(), 0.42);
}

TEST(ResultReporterConstructionTest, RequiresParser) {
    EXPECT_THROW(ResultReporter(nullptr, 1024), std::invalid_argument);
}
