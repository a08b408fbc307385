#pragma once

#include "testbed/types.hpp"

#include <string>
#include <vector>

namespace testbed {

// ============================================================================
// Test Framework Detection
// ============================================================================

// True for files whose name marks them as tests for the runtime
// (test_*.py, *_test.py, *.test.ts, *.spec.js, ...)
bool is_test_file(const std::string& filename, Runtime runtime);

/**
 * Find test directories, relative to project_dir.
 *
 * A directory qualifies when its name is a conventional test directory
 * name (tests, test, testing, unit_tests, integration_tests, __tests__)
 * or when it directly contains a test file. Nested hits collapse into
 * the outermost qualifying directory. Dependency and VCS directories are
 * never searched. Results are sorted.
 */
std::vector<std::string> find_test_dirs(const std::string& project_dir, Runtime runtime);

/**
 * Detect the test frameworks a project uses.
 *
 * Signals, strongest first: framework config files, imports in test
 * files, manifest declarations. Structural patterns are consulted only
 * when nothing else fired. Only frameworks that run on the runtime are
 * returned; an empty result is not an error.
 */
std::vector<Framework> detect_frameworks(const std::string& project_dir, Runtime runtime);

// True when a source line imports the module ("import x", "from x ...")
bool python_imports(const std::string& content, const std::string& module);

// True when JS/TS source imports or requires the package
bool js_imports(const std::string& content, const std::string& package);

} // namespace testbed
