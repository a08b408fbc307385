#include <doctest/doctest.h>
#include <testbed/aggregate.hpp>

using namespace testbed;

namespace {

TestCase make_case(const std::string& name, TestStatus status) {
    TestCase tc;
    tc.name = name;
    tc.status = status;
    return tc;
}

TestRunResult make_result(const std::string& runner, bool success,
                          std::vector<TestCase> tests) {
    TestRunResult r;
    r.runner = runner;
    r.success = success;
    r.tests = std::move(tests);
    r.summary = summarize(r.tests);
    return r;
}

} // namespace

TEST_CASE("summarize counts errors as failures") {
    auto s = summarize({
        make_case("a", TestStatus::Passed),
        make_case("b", TestStatus::Failed),
        make_case("c", TestStatus::Error),
        make_case("d", TestStatus::Skipped),
    });
    CHECK(s.total == 4);
    CHECK(s.passed == 1);
    CHECK(s.failed == 2);
    CHECK(s.skipped == 1);
}

TEST_CASE("aggregate_results of nothing reports no frameworks") {
    auto merged = aggregate_results({});
    CHECK(merged.runner == "none");
    CHECK_FALSE(merged.success);
    CHECK(merged.summary == TestSummary{});
    CHECK(merged.error.value_or("") == "No test frameworks detected");
}

TEST_CASE("aggregate_results of one result keeps it") {
    auto single = make_result("pytest", true, {make_case("t", TestStatus::Passed)});
    auto merged = aggregate_results({single});
    CHECK(merged.runner == "pytest");
    CHECK(merged.success);
    CHECK(merged.summary.total == 1);
    CHECK_FALSE(merged.error.has_value());
}

TEST_CASE("aggregate_results merges runners, tests and summaries") {
    auto a = make_result("pytest", true,
                         {make_case("a1", TestStatus::Passed), make_case("a2", TestStatus::Skipped)});
    auto b = make_result("unittest", false, {make_case("b1", TestStatus::Failed)});
    auto c = make_result("pytest", true, {make_case("c1", TestStatus::Passed)});

    auto merged = aggregate_results({a, b, c});
    CHECK(merged.runner == "pytest,unittest");
    CHECK_FALSE(merged.success);
    REQUIRE(merged.tests.size() == 4);
    CHECK(merged.tests[0].name == "a1");
    CHECK(merged.tests[2].name == "b1");
    CHECK(merged.tests[3].name == "c1");
    CHECK(merged.summary.total == 4);
    CHECK(merged.summary.passed == 2);
    CHECK(merged.summary.failed == 1);
    CHECK(merged.summary.skipped == 1);
}

TEST_CASE("aggregate_results keeps the first coverage and joins errors") {
    auto a = make_result("jest", true, {});
    auto b = make_error_result("vitest", "vitest not found in environment");
    auto c = make_result("jest", true, {});
    CoverageResult cov;
    cov.lines = 42.0;
    c.coverage = cov;
    auto d = make_result("jest", true, {});
    CoverageResult later;
    later.lines = 99.0;
    d.coverage = later;
    auto e = make_error_result("jest", "jest timed out");

    auto merged = aggregate_results({a, b, c, d, e});
    CHECK_FALSE(merged.success);
    CHECK(merged.runner == "jest,vitest");
    REQUIRE(merged.coverage.has_value());
    CHECK(merged.coverage->lines == 42.0);
    CHECK(merged.error.value_or("") == "vitest not found in environment; jest timed out");
}
