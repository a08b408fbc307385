#pragma once

#include "testbed/result.hpp"
#include "testbed/types.hpp"

#include <string>
#include <vector>

namespace testbed {

// Static configuration for a runtime
const RuntimeConfig& get_runtime_config(Runtime runtime);

// Runtimes in detection priority order, most specific first
const std::vector<Runtime>& runtime_detection_order();

// True when path is the marker itself or ends with "/" + marker
bool path_matches_marker(const std::string& path, const std::string& marker);

// True when every marker of the runtime occurs in the file listing
bool runtime_matches(const RuntimeConfig& config, const std::vector<std::string>& files);

/**
 * Detect the runtime of a project tree.
 *
 * Runtimes are tried in priority order (Bun, Node, Python); the first
 * whose markers are all present anywhere under the tree wins. Fails with
 * NO_RUNTIME_DETECTED when nothing matches.
 */
Result<RuntimeConfig> detect_runtime(const std::string& project_dir);

// Same, over an already collected file listing
Result<RuntimeConfig> detect_runtime(const std::vector<std::string>& files);

// Directories never descended into while scanning a project
const std::vector<std::string>& ignored_project_dirs();

} // namespace testbed
