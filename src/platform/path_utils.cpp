#include "testbed/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace testbed {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

std::vector<std::string> split_components(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (is_separator(c)) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

} // namespace

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    bool absolute = !relative_path.empty() && is_separator(relative_path[0]);
    if (absolute && !allow_absolute) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_components(relative_path)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::filesystem::path p(root);
    for (const auto& c : normalized) {
        p /= c;
    }
    std::string out = to_portable_path(p.lexically_normal().string());

    if (!is_path_within(root, out)) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

} // namespace testbed
