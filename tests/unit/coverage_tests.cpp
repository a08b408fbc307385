#include <doctest/doctest.h>
#include <testbed/coverage.hpp>

using namespace testbed;

TEST_CASE("coverage_percent") {
    CHECK(coverage_percent(80, 100) == doctest::Approx(80.0));
    CHECK(coverage_percent(1, 3) == doctest::Approx(33.3333).epsilon(0.001));
    CHECK(coverage_percent(0, 0) == 0.0);
    CHECK(coverage_percent(5, -1) == 0.0);
    CHECK(coverage_percent(120, 100) == 100.0);
}

TEST_CASE("parse_istanbul_summary reads totals and per-file lines") {
    const std::string summary = R"({
        "total": {
            "lines": {"total": 100, "covered": 80, "skipped": 0, "pct": 80},
            "statements": {"total": 120, "covered": 90, "skipped": 0, "pct": 75},
            "functions": {"total": 10, "covered": 10, "skipped": 0, "pct": 100},
            "branches": {"total": 0, "covered": 0, "skipped": 0, "pct": "Unknown"}
        },
        "/sb/work/src/sum.js": {
            "lines": {"total": 4, "covered": 3, "skipped": 0, "pct": 75}
        }
    })";

    auto parsed = parse_istanbul_summary(summary, "/sb/work");
    REQUIRE(parsed.ok);
    CHECK(parsed.coverage.lines == doctest::Approx(80.0));
    CHECK(parsed.coverage.statements == doctest::Approx(75.0));
    CHECK(parsed.coverage.functions == doctest::Approx(100.0));
    CHECK(parsed.coverage.branches == 0.0);
    REQUIRE(parsed.coverage.files.count("src/sum.js") == 1);
    CHECK(parsed.coverage.files.at("src/sum.js") == doctest::Approx(75.0));
}

TEST_CASE("parse_istanbul_summary rejects reports without totals") {
    CHECK_FALSE(parse_istanbul_summary("{}").ok);
    CHECK_FALSE(parse_istanbul_summary("[1, 2").ok);
}

TEST_CASE("parse_coverage_py reads totals and files") {
    const std::string report = R"({
        "meta": {"version": "7.4.0"},
        "files": {
            "calc/ops.py": {"summary": {"covered_lines": 9, "num_statements": 10}},
            "calc/__init__.py": {"summary": {"covered_lines": 0, "num_statements": 0}}
        },
        "totals": {"covered_lines": 80, "num_statements": 100,
                   "covered_branches": 3, "num_branches": 4, "percent_covered": 80.0}
    })";

    auto parsed = parse_coverage_py(report);
    REQUIRE(parsed.ok);
    CHECK(parsed.coverage.lines == doctest::Approx(80.0));
    CHECK(parsed.coverage.statements == doctest::Approx(80.0));
    CHECK(parsed.coverage.branches == doctest::Approx(75.0));
    CHECK(parsed.coverage.files.at("calc/ops.py") == doctest::Approx(90.0));
    CHECK(parsed.coverage.files.at("calc/__init__.py") == 0.0);
}

TEST_CASE("parse_coverage_py rejects reports without totals") {
    CHECK_FALSE(parse_coverage_py(R"({"files": {}})").ok);
    CHECK_FALSE(parse_coverage_py("not json").ok);
}
