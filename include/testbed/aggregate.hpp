#pragma once

#include "testbed/types.hpp"

#include <vector>

namespace testbed {

/**
 * Merge per-directory or per-framework results into one.
 *
 * - success is the AND of every input (false for no inputs)
 * - tests are concatenated in input order and the summary is recounted
 * - runner is the common name, or the distinct names joined with ","
 * - coverage comes from the first input that has it
 * - errors are joined with "; "
 *
 * No inputs yields runner "none" with error "No test frameworks detected".
 */
TestRunResult aggregate_results(const std::vector<TestRunResult>& results);

} // namespace testbed
