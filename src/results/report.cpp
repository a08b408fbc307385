#include "testbed/report.hpp"

#include <iomanip>
#include <sstream>

namespace testbed {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<double> get_number(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

nlohmann::json coverage_to_json(const CoverageResult& cov) {
    nlohmann::json j;
    j["lines"] = cov.lines;
    j["statements"] = cov.statements;
    j["branches"] = cov.branches;
    j["functions"] = cov.functions;
    j["files"] = nlohmann::json::object();
    for (const auto& [path, pct] : cov.files) {
        j["files"][to_valid_utf8(path)] = pct;
    }
    return j;
}

CoverageResult coverage_from_json(const nlohmann::json& j) {
    CoverageResult cov;
    cov.lines = get_number(j, "lines").value_or(0.0);
    cov.statements = get_number(j, "statements").value_or(0.0);
    cov.branches = get_number(j, "branches").value_or(0.0);
    cov.functions = get_number(j, "functions").value_or(0.0);
    if (j.contains("files") && j["files"].is_object()) {
        for (auto& [path, val] : j["files"].items()) {
            if (val.is_number()) {
                cov.files[path] = val.get<double>();
            }
        }
    }
    return cov;
}

std::string format_percent(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << "%";
    return ss.str();
}

const char* status_label(TestStatus status) {
    switch (status) {
        case TestStatus::Passed: return "PASS";
        case TestStatus::Failed: return "FAIL";
        case TestStatus::Skipped: return "SKIP";
        case TestStatus::Error: return "ERROR";
    }
    return "?";
}

} // namespace

std::string dump_json(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string to_valid_utf8(const std::string& text) {
    return nlohmann::json::parse(dump_json(nlohmann::json(text), -1)).get<std::string>();
}

nlohmann::json result_to_json(const TestRunResult& result) {
    nlohmann::json j;
    j["runner"] = to_valid_utf8(result.runner);
    j["success"] = result.success;
    j["summary"] = {
        {"total", result.summary.total},
        {"passed", result.summary.passed},
        {"failed", result.summary.failed},
        {"skipped", result.summary.skipped},
    };

    nlohmann::json tests = nlohmann::json::array();
    for (const auto& tc : result.tests) {
        nlohmann::json t;
        t["name"] = to_valid_utf8(tc.name);
        t["outcome"] = test_status_name(tc.status);
        if (tc.duration) t["duration"] = *tc.duration;
        if (tc.failure_message) t["message"] = to_valid_utf8(*tc.failure_message);
        tests.push_back(t);
    }
    j["tests"] = tests;

    if (result.coverage) {
        j["coverage"] = coverage_to_json(*result.coverage);
    }
    if (result.error) {
        j["error"] = to_valid_utf8(*result.error);
    }
    return j;
}

std::string serialize_result_json(const TestRunResult& result, int indent) {
    return dump_json(result_to_json(result), indent);
}

ResultParseResult parse_result_json(const std::string& json_str) {
    ResultParseResult out;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            out.error = "JSON must be an object";
            return out;
        }

        if (auto runner = get_string(j, "runner")) {
            out.result.runner = *runner;
        } else {
            out.error = "runner missing";
            return out;
        }

        if (!j.contains("success") || !j["success"].is_boolean()) {
            out.error = "success missing";
            return out;
        }
        out.result.success = j["success"].get<bool>();

        if (j.contains("tests") && j["tests"].is_array()) {
            for (const auto& t : j["tests"]) {
                auto name = get_string(t, "name");
                auto outcome = get_string(t, "outcome");
                if (!name || !outcome) {
                    out.error = "test entry requires name and outcome";
                    return out;
                }
                auto status = parse_test_status(*outcome);
                if (!status) {
                    out.error = "unknown outcome: " + *outcome;
                    return out;
                }

                TestCase tc;
                tc.name = *name;
                tc.status = *status;
                tc.duration = get_number(t, "duration");
                tc.failure_message = get_string(t, "message");
                out.result.tests.push_back(std::move(tc));
            }
        }
        out.result.summary = summarize(out.result.tests);

        if (j.contains("coverage") && j["coverage"].is_object()) {
            out.result.coverage = coverage_from_json(j["coverage"]);
        }
        out.result.error = get_string(j, "error");

        out.ok = true;
        return out;

    } catch (const nlohmann::json::parse_error& e) {
        out.error = std::string("parse error: ") + e.what();
        return out;
    } catch (const nlohmann::json::exception& e) {
        out.error = std::string("JSON error: ") + e.what();
        return out;
    }
}

std::string format_result_text(const TestRunResult& result, bool verbose) {
    std::ostringstream ss;

    for (const auto& tc : result.tests) {
        if (!verbose && tc.status == TestStatus::Passed) continue;
        ss << "  " << std::left << std::setw(6) << status_label(tc.status) << tc.name;
        if (tc.duration) {
            ss << " (" << std::fixed << std::setprecision(3) << *tc.duration << "s)";
        }
        ss << "\n";
        if (tc.failure_message && tc.status != TestStatus::Passed) {
            std::istringstream lines(*tc.failure_message);
            std::string line;
            while (std::getline(lines, line)) {
                ss << "        " << line << "\n";
            }
        }
    }

    const auto& s = result.summary;
    ss << (result.success ? "PASSED" : "FAILED") << " [" << result.runner << "] "
       << s.total << " total, " << s.passed << " passed, " << s.failed << " failed, "
       << s.skipped << " skipped\n";

    if (result.coverage) {
        const auto& c = *result.coverage;
        ss << "Coverage: lines " << format_percent(c.lines)
           << ", statements " << format_percent(c.statements)
           << ", branches " << format_percent(c.branches)
           << ", functions " << format_percent(c.functions) << "\n";
    }

    if (result.error) {
        ss << "Error: " << *result.error << "\n";
    }
    return ss.str();
}

} // namespace testbed
