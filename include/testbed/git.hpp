#pragma once

#include "testbed/result.hpp"
#include "testbed/sandbox.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace testbed {

/**
 * Normalize a repository reference to an https://github.com URL.
 *
 * Accepted forms: "owner/repo", "github.com/owner/repo",
 * "https://github.com/owner/repo" and "git@github.com:owner/repo.git".
 * Plain http:// and every other host are rejected with INVALID_SOURCE.
 */
Result<std::string> normalize_github_url(const std::string& url);

// Branch names are limited to [A-Za-z0-9._/-] and may not start with '-'
bool is_valid_branch_name(const std::string& branch);

/**
 * Clone a repository into the sandbox work directory.
 *
 * The URL and branch are validated before any process is spawned.
 * A non-zero git exit is CLONE_FAILED carrying git's stderr.
 */
Result<std::string> clone_repository(const Sandbox& sandbox, const std::string& url,
                                     const std::optional<std::string>& branch,
                                     std::chrono::seconds timeout = std::chrono::seconds(0));

} // namespace testbed
