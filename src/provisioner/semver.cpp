#include "testbed/semver.hpp"

#include <algorithm>
#include <cctype>

namespace testbed {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

} // namespace

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) s.erase(0, 1);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

bool is_older_version(const std::string& candidate, const std::string& reference) {
    auto c = parse_version(candidate);
    auto r = parse_version(reference);
    if (!c || !r) return false;
    return *c < *r;
}

std::vector<std::string> sort_versions(std::vector<std::string> versions) {
    std::stable_sort(versions.begin(), versions.end(),
                     [](const std::string& a, const std::string& b) {
                         auto va = parse_version(a);
                         auto vb = parse_version(b);
                         if (va && vb) return *va < *vb;
                         if (!va && !vb) return a < b;
                         return !va;
                     });
    return versions;
}

} // namespace testbed
