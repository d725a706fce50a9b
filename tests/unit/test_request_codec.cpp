/**
 * @file test_request_codec.cpp
 * @brief Unit tests for request and limits decoding
 */

#include "codecell/core/request_codec.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace codecell;
using namespace codecell::core;

TEST(RequestCodecTest, ParsesFullRequest) {
    auto request = ParseRequest(R"({
        "request_id": "job-42",
        "trace_id": "4bf92f3577b34da6",
        "files": {"solution.py": "x = 1\n", "tests/test_solution.py": "def test(): pass\n"},
        "manifest": "pytest==8.2\n",
        "time_budget_seconds": 2.5
    })");

    EXPECT_EQ(request.request_id, "job-42");
    EXPECT_EQ(request.trace_id, "4bf92f3577b34da6");
    ASSERT_EQ(request.files.size(), 2u);
    EXPECT_EQ(request.files.at("solution.py"), "x = 1\n");
    ASSERT_TRUE(request.manifest.has_value());
    ASSERT_TRUE(request.time_budget.has_value());
    EXPECT_EQ(request.time_budget->count(), 2500);
}

TEST(RequestCodecTest, OptionalFieldsMayBeAbsent) {
    auto request = ParseRequest(R"({"files": {}})");
    EXPECT_TRUE(request.request_id.empty());
    EXPECT_FALSE(request.manifest.has_value());
    EXPECT_FALSE(request.time_budget.has_value());
}

TEST(RequestCodecTest, RejectsMalformedRequests) {
    EXPECT_THROW(ParseRequest("[]"), std::runtime_error);
    EXPECT_THROW(ParseRequest("{"), std::runtime_error);
    EXPECT_THROW(ParseRequest(R"({"request_id": "x"})"), std::runtime_error);
    EXPECT_THROW(ParseRequest(R"({"files": {"a.py": 3}})"), std::runtime_error);
    EXPECT_THROW(ParseRequest(R"({"files": {}, "time_budget_seconds": 0})"), std::runtime_error);
    EXPECT_THROW(ParseRequest(R"({"files": {}, "request_id": "../etc"})"), std::runtime_error);
}

TEST(RequestCodecTest, LimitsOverlayBase) {
    ExecutionLimits base;
    base.max_processes = 50;

    auto limits = ParseLimits(R"({"wall_clock_seconds": 5, "network_disabled": false})", base);
    EXPECT_DOUBLE_EQ(limits.wall_clock_seconds, 5.0);
    EXPECT_FALSE(limits.network_disabled);
    EXPECT_EQ(limits.max_processes, 50u);

    EXPECT_THROW(ParseLimits(R"({"memory_bytes": -1})"), std::runtime_error);
    EXPECT_THROW(ParseLimits(R"({"cpu_time_seconds": "fast"})"), std::runtime_error);
}

TEST(RequestCodecTest, RequestIdCharset) {
    EXPECT_TRUE(IsValidRequestId("job_42-A"));
    EXPECT_FALSE(IsValidRequestId(""));
    EXPECT_FALSE(IsValidRequestId("a/b"));
    EXPECT_FALSE(IsValidRequestId(std::string(65, 'a')));
}

TEST(RequestCodecTest, CanonicalPayloadIgnoresIds) {
    ExecutionRequest a;
    a.request_id = "one";
    a.files["b.py"] = "2";
    a.files["a.py"] = "1";

    ExecutionRequest b = a;
    b.request_id = "two";
    b.trace_id = "trace";

    EXPECT_EQ(CanonicalPayload(a), CanonicalPayload(b));

    b.files["a.py"] = "changed";
    EXPECT_NE(CanonicalPayload(a), CanonicalPayload(b));
}

TEST(LimitsTest, ValidateListsEveryViolation) {
    ExecutionLimits limits;
    EXPECT_TRUE(limits.Validate().empty());

    limits.cpu_time_seconds = 0.0;
    limits.wall_clock_seconds = std::numeric_limits<double>::infinity();
    limits.max_processes = 0;
    EXPECT_EQ(limits.Validate().size(), 3u);
}
