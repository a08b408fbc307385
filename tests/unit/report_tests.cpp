#include <doctest/doctest.h>
#include <testbed/report.hpp>

using namespace testbed;

namespace {

TestRunResult sample_result() {
    TestRunResult r;
    r.runner = "jest";
    r.success = false;

    TestCase ok;
    ok.name = "src/sum.test.js::sum adds";
    ok.status = TestStatus::Passed;
    ok.duration = 0.005;

    TestCase bad;
    bad.name = "src/sum.test.js::sum subtracts";
    bad.status = TestStatus::Failed;
    bad.failure_message = "Expected: 1\nReceived: 2";

    TestCase skipped;
    skipped.name = "src/sum.test.js::later";
    skipped.status = TestStatus::Skipped;

    r.tests = {ok, bad, skipped};
    r.summary = summarize(r.tests);
    return r;
}

} // namespace

// ============================================================================
// JSON
// ============================================================================

TEST_CASE("result_to_json produces the unified result shape") {
    auto j = result_to_json(sample_result());

    CHECK(j["runner"] == "jest");
    CHECK(j["success"] == false);
    CHECK(j["summary"]["total"] == 3);
    CHECK(j["summary"]["passed"] == 1);
    CHECK(j["summary"]["failed"] == 1);
    CHECK(j["summary"]["skipped"] == 1);

    REQUIRE(j["tests"].size() == 3);
    CHECK(j["tests"][0]["outcome"] == "passed");
    CHECK(j["tests"][0]["duration"].get<double>() == doctest::Approx(0.005));
    CHECK_FALSE(j["tests"][0].contains("message"));
    CHECK(j["tests"][1]["message"] == "Expected: 1\nReceived: 2");
    CHECK_FALSE(j["tests"][2].contains("duration"));

    CHECK_FALSE(j.contains("coverage"));
    CHECK_FALSE(j.contains("error"));
}

TEST_CASE("result JSON survives tool output that is not UTF-8") {
    TestRunResult r;
    r.runner = "pytest";
    TestCase tc;
    tc.name = "tests/test_text.py::test_accent";
    tc.status = TestStatus::Failed;
    tc.failure_message = std::string("AssertionError: caf\xe9 != cafe");
    r.tests = {tc};
    r.summary = summarize(r.tests);
    r.error = std::string("Failed to install dependencies: \xff\xfe");

    std::string out;
    CHECK_NOTHROW(out = serialize_result_json(r));
    CHECK_NOTHROW(result_to_json(r).dump(2));

    auto j = nlohmann::json::parse(out);
    CHECK(j["tests"][0]["message"] == "AssertionError: caf\xef\xbf\xbd != cafe");
    CHECK(j["error"] == "Failed to install dependencies: \xef\xbf\xbd\xef\xbf\xbd");
}

TEST_CASE("to_valid_utf8 keeps valid text and replaces invalid bytes") {
    CHECK(to_valid_utf8("plain ascii") == "plain ascii");
    CHECK(to_valid_utf8("caf\xc3\xa9") == "caf\xc3\xa9");
    CHECK(to_valid_utf8("caf\xe9") == "caf\xef\xbf\xbd");
    CHECK(to_valid_utf8("") == "");
}

TEST_CASE("dump_json does not throw on invalid UTF-8") {
    nlohmann::json j = {{"error", std::string("bad \x80 byte")}};
    CHECK_THROWS(j.dump());
    CHECK(dump_json(j, -1) == "{\"error\":\"bad \xef\xbf\xbd" " byte\"}");
}

TEST_CASE("result_to_json includes coverage and error when present") {
    auto r = make_error_result("none", "Unknown environment: abc");
    CoverageResult cov;
    cov.lines = 80.0;
    cov.files["src/a.js"] = 50.0;
    r.coverage = cov;

    auto j = result_to_json(r);
    CHECK(j["error"] == "Unknown environment: abc");
    CHECK(j["coverage"]["lines"].get<double>() == doctest::Approx(80.0));
    CHECK(j["coverage"]["files"]["src/a.js"].get<double>() == doctest::Approx(50.0));
    CHECK(j["tests"].is_array());
    CHECK(j["tests"].empty());
}

TEST_CASE("parse_result_json reads serialized results") {
    auto parsed = parse_result_json(serialize_result_json(sample_result()));
    REQUIRE(parsed.ok);
    CHECK(parsed.result.runner == "jest");
    CHECK_FALSE(parsed.result.success);
    REQUIRE(parsed.result.tests.size() == 3);
    CHECK(parsed.result.tests[1].failure_message.value_or("") == "Expected: 1\nReceived: 2");
    CHECK(parsed.result.summary == sample_result().summary);
}

TEST_CASE("parse_result_json recomputes the summary from tests") {
    auto parsed = parse_result_json(R"({
        "runner": "pytest", "success": true,
        "summary": {"total": 99, "passed": 99, "failed": 0, "skipped": 0},
        "tests": [{"name": "t", "outcome": "error"}]
    })");
    REQUIRE(parsed.ok);
    CHECK(parsed.result.summary.total == 1);
    CHECK(parsed.result.summary.failed == 1);
}

TEST_CASE("parse_result_json validates required fields") {
    CHECK(parse_result_json(R"({"success": true})").error == "runner missing");
    CHECK(parse_result_json(R"({"runner": "jest"})").error == "success missing");
    CHECK(parse_result_json(R"({"runner": "jest", "success": true, "tests": [{"name": "x"}]})")
              .error == "test entry requires name and outcome");
    CHECK(parse_result_json(
              R"({"runner": "jest", "success": true, "tests": [{"name": "x", "outcome": "meh"}]})")
              .error == "unknown outcome: meh");
    CHECK_FALSE(parse_result_json("[]").ok);
    CHECK_FALSE(parse_result_json("{").ok);
}

// ============================================================================
// Text
// ============================================================================

TEST_CASE("format_result_text lists failures and a summary line") {
    auto text = format_result_text(sample_result());

    CHECK(text.find("sum adds") == std::string::npos);
    CHECK(text.find("FAIL  src/sum.test.js::sum subtracts") != std::string::npos);
    CHECK(text.find("        Received: 2\n") != std::string::npos);
    CHECK(text.find("SKIP  src/sum.test.js::later") != std::string::npos);
    CHECK(text.find("FAILED [jest] 3 total, 1 passed, 1 failed, 1 skipped\n") != std::string::npos);
    CHECK(text.find("Coverage:") == std::string::npos);
}

TEST_CASE("format_result_text verbose mode shows passing tests") {
    auto text = format_result_text(sample_result(), true);
    CHECK(text.find("PASS  src/sum.test.js::sum adds (0.005s)") != std::string::npos);
}

TEST_CASE("format_result_text prints coverage and errors") {
    TestRunResult r;
    r.runner = "pytest";
    r.success = true;
    CoverageResult cov;
    cov.lines = 80.0;
    cov.statements = 66.666;
    r.coverage = cov;
    r.error = "something odd";

    auto text = format_result_text(r);
    CHECK(text.find("PASSED [pytest] 0 total") != std::string::npos);
    CHECK(text.find("Coverage: lines 80.0%, statements 66.7%, branches 0.0%, functions 0.0%") !=
          std::string::npos);
    CHECK(text.find("Error: something odd\n") != std::string::npos);
}
