#pragma once

#include "testbed/types.hpp"

#include <string>

namespace testbed {

// covered / total * 100, clamped to [0, 100]; 0 when total is not positive
double coverage_percent(double covered, double total);

struct CoverageParseResult {
    bool ok = false;
    std::string error;
    CoverageResult coverage;
};

/**
 * Parse an istanbul "json-summary" report (jest, vitest).
 *
 * The "total" entry supplies the aggregate metrics; every other key is a
 * file. File paths under strip_prefix are reported relative to it.
 */
CoverageParseResult parse_istanbul_summary(const std::string& json,
                                           const std::string& strip_prefix = "");

/**
 * Parse a coverage.py JSON report (pytest-cov "json" output).
 *
 * Lines and statements both come from covered_lines / num_statements;
 * branches are reported when branch coverage was measured. coverage.py
 * has no function metric, so functions stays 0.
 */
CoverageParseResult parse_coverage_py(const std::string& json);

} // namespace testbed
