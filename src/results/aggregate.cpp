#include "testbed/aggregate.hpp"

#include <algorithm>

namespace testbed {

TestRunResult aggregate_results(const std::vector<TestRunResult>& results) {
    if (results.empty()) {
        return make_error_result("none", "No test frameworks detected");
    }

    TestRunResult merged;
    merged.success = true;

    std::vector<std::string> runners;
    std::string errors;

    for (const auto& r : results) {
        merged.success = merged.success && r.success;

        if (std::find(runners.begin(), runners.end(), r.runner) == runners.end()) {
            runners.push_back(r.runner);
        }

        merged.tests.insert(merged.tests.end(), r.tests.begin(), r.tests.end());

        if (!merged.coverage && r.coverage) {
            merged.coverage = r.coverage;
        }

        if (r.error && !r.error->empty()) {
            if (!errors.empty()) errors += "; ";
            errors += *r.error;
        }
    }

    for (size_t i = 0; i < runners.size(); ++i) {
        if (i > 0) merged.runner += ",";
        merged.runner += runners[i];
    }

    merged.summary = summarize(merged.tests);
    if (!errors.empty()) {
        merged.error = errors;
    }
    return merged;
}

} // namespace testbed
