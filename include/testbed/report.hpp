#pragma once

#include "testbed/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace testbed {

// ============================================================================
// Unified Result JSON
// ============================================================================

// Invalid UTF-8 sequences in captured tool output become U+FFFD
std::string to_valid_utf8(const std::string& text);

// dump() that replaces invalid UTF-8 instead of throwing
std::string dump_json(const nlohmann::json& j, int indent = 2);

/**
 * Shape:
 * {
 *   "runner": "pytest",
 *   "success": true,
 *   "summary": {"total": 2, "passed": 2, "failed": 0, "skipped": 0},
 *   "tests": [{"name": "...", "outcome": "passed", "duration": 0.01, "message": "..."}],
 *   "coverage": {"lines": 80.0, "statements": 80.0, "branches": 50.0,
 *                "functions": 100.0, "files": {"src/a.py": 80.0}},
 *   "error": "..."
 * }
 * "coverage" and "error" are omitted when absent, as are per-test
 * "duration" and "message".
 */
nlohmann::json result_to_json(const TestRunResult& result);

std::string serialize_result_json(const TestRunResult& result, int indent = 2);

struct ResultParseResult {
    bool ok = false;
    std::string error;
    TestRunResult result;
};

// The summary is recomputed from "tests"; a stored summary is ignored
ResultParseResult parse_result_json(const std::string& json_str);

// Human-readable rendering for terminals
std::string format_result_text(const TestRunResult& result, bool verbose = false);

} // namespace testbed
