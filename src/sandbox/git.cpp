#include "testbed/git.hpp"
#include "testbed/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace testbed {

namespace {

constexpr const char* kGithubPrefix = "https://github.com/";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

Result<std::string> invalid(const std::string& message) {
    return Result<std::string>::err(Error(ErrorCode::INVALID_SOURCE, message));
}

} // namespace

Result<std::string> normalize_github_url(const std::string& input) {
    std::string url = input;
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.back()))) url.pop_back();
    while (!url.empty() && std::isspace(static_cast<unsigned char>(url.front()))) url.erase(0, 1);

    if (url.empty()) {
        return invalid("repository URL cannot be empty");
    }

    if (starts_with(url, "http://")) {
        return invalid("HTTP URLs are not supported, use HTTPS: " + url);
    }

    if (starts_with(url, "git@")) {
        auto colon = url.find(':');
        if (colon == std::string::npos) {
            return invalid("malformed SSH URL: " + url);
        }
        std::string host = url.substr(4, colon - 4);
        url = "https://" + host + "/" + url.substr(colon + 1);
    } else if (!starts_with(url, "https://")) {
        auto slash = url.find('/');
        std::string first = url.substr(0, slash);
        if (slash != std::string::npos && first.find('.') == std::string::npos &&
            first.find(':') == std::string::npos) {
            url = kGithubPrefix + url;  // owner/repo shorthand
        } else {
            url = "https://" + url;
        }
    }

    if (!starts_with(url, kGithubPrefix)) {
        return invalid("only GitHub repositories are supported: " + input);
    }

    if (url.size() > 4 && url.compare(url.size() - 4, 4, ".git") == 0) {
        url.erase(url.size() - 4);
    }
    while (!url.empty() && url.back() == '/') url.pop_back();

    // Expect exactly owner/repo after the host
    std::string path = url.substr(std::string(kGithubPrefix).size());
    auto slash = path.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= path.size() ||
        path.find('/', slash + 1) != std::string::npos) {
        return invalid("expected owner/repo in GitHub URL: " + input);
    }

    bool safe = std::all_of(path.begin(), path.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '/';
    });
    if (!safe) {
        return invalid("unexpected characters in repository path: " + input);
    }

    return Result<std::string>::ok(url);
}

bool is_valid_branch_name(const std::string& branch) {
    if (branch.empty() || branch[0] == '-') return false;
    if (branch.find("..") != std::string::npos) return false;
    return std::all_of(branch.begin(), branch.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '/' || c == '-';
    });
}

Result<std::string> clone_repository(const Sandbox& sandbox, const std::string& url,
                                     const std::optional<std::string>& branch,
                                     std::chrono::seconds timeout) {
    auto normalized = normalize_github_url(url);
    if (normalized.isErr()) {
        return normalized;
    }

    if (branch && !is_valid_branch_name(*branch)) {
        return invalid("invalid branch name: " + *branch);
    }

    std::vector<std::string> args = {"git", "clone", "--quiet"};
    if (branch) {
        args.push_back("--branch");
        args.push_back(*branch);
    }
    args.push_back(normalized.value());
    args.push_back(sandbox.work_dir);

    spdlog::info("cloning {}{}", normalized.value(), branch ? " (" + *branch + ")" : "");

    auto run = run_sandboxed_command(sandbox, shell_join(args),
                                     {{"GIT_TERMINAL_PROMPT", "0"}}, timeout);
    if (run.isErr()) {
        return Result<std::string>::err(
            Error(ErrorCode::CLONE_FAILED, run.error().message()));
    }

    const auto& out = run.value();
    if (out.timed_out) {
        return Result<std::string>::err(
            Error(ErrorCode::CLONE_FAILED, "git clone timed out: " + normalized.value()));
    }
    if (out.exit_code != 0) {
        spdlog::error("git clone exited with {}: {}", out.exit_code, out.stderr_data);
        return Result<std::string>::err(
            Error(ErrorCode::CLONE_FAILED, "failed to clone repository: " + out.stderr_data));
    }

    return Result<std::string>::ok(sandbox.work_dir);
}

} // namespace testbed
