#pragma once

/**
 * @file semver.hpp
 * @brief Version handling for the binary cache
 *
 * Cached runtime binaries live in per-version directories. Versions are
 * SemVer 2.0.0 strings, optionally written with a leading "v" as release
 * tags usually are ("v20.10.0").
 *
 * @example
 * ```cpp
 * auto pinned = testbed::parse_version("1.0.21");
 * auto cached = testbed::parse_version("v1.0.3");
 * if (pinned && cached && *cached < *pinned) {
 *     // stale
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace testbed {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/**
 * @brief Parse a version string, accepting a leading "v"
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/// True when candidate parses and is strictly lower than reference
bool is_older_version(const std::string& candidate, const std::string& reference);

/// Sort version strings ascending. Unparseable strings sort first, by name.
std::vector<std::string> sort_versions(std::vector<std::string> versions);

} // namespace testbed
