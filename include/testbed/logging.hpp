#pragma once

#include <optional>
#include <string>

namespace testbed {

// Accepted names: trace, debug, info, warn, error, off
bool is_valid_log_level(const std::string& level);

/**
 * Install a colour stderr logger named "testbed" as the spdlog default.
 * stdout stays free for JSON output. TESTBED_LOG_LEVEL, when set to a
 * valid level, overrides the given one. Safe to call more than once.
 */
void init_logging(const std::string& level = "info");

// The level actually in effect after environment overrides
std::string effective_log_level(const std::string& configured);

} // namespace testbed
