#include "testbed/frameworks.hpp"
#include "testbed/platform.hpp"
#include "testbed/runtime.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <functional>
#include <optional>
#include <cctype>
#include <set>
#include <sstream>

namespace testbed {

namespace {

constexpr size_t kMaxScannedFileSize = 1024 * 1024;

const std::vector<std::string>& test_dir_names() {
    static const std::vector<std::string> names = {
        "tests", "test", "testing", "unit_tests", "integration_tests", "__tests__",
    };
    return names;
}

const std::vector<std::string>& js_extensions() {
    static const std::vector<std::string> exts = {
        "js", "jsx", "ts", "tsx", "mjs", "cjs", "mts", "cts",
    };
    return exts;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_js_family(Runtime runtime) {
    return runtime == Runtime::Node || runtime == Runtime::Bun;
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(path);
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

bool is_within_dir(const std::string& path, const std::string& dir) {
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == '/';
}

bool has_js_extension(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return false;
    std::string ext = filename.substr(dot + 1);
    return std::find(js_extensions().begin(), js_extensions().end(), ext) != js_extensions().end();
}

// Does the extension-less base name carry a ".test"/".spec" segment?
bool has_js_test_infix(const std::string& filename) {
    if (!has_js_extension(filename)) return false;
    std::string stem = filename.substr(0, filename.rfind('.'));
    return ends_with(stem, ".test") || ends_with(stem, ".spec");
}

struct ProjectScan {
    std::string root;
    std::vector<std::string> files;      // relative
    std::vector<std::string> test_dirs;  // relative
};

std::optional<std::string> read_small_file(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size > kMaxScannedFileSize) return std::nullopt;
    return read_file(path);
}

// Files under the test dirs, filtered
std::vector<std::string> files_in_test_dirs(const ProjectScan& scan,
                                            const std::function<bool(const std::string&)>& keep) {
    std::vector<std::string> out;
    for (const auto& f : scan.files) {
        bool inside = std::any_of(scan.test_dirs.begin(), scan.test_dirs.end(),
                                  [&](const std::string& d) { return is_within_dir(f, d); });
        if (inside && keep(f)) out.push_back(f);
    }
    return out;
}

void add_unique(std::vector<Framework>& list, Framework f) {
    if (std::find(list.begin(), list.end(), f) == list.end()) list.push_back(f);
}

bool root_file_contains(const ProjectScan& scan, const std::string& name,
                        const std::string& needle) {
    auto content = read_small_file(join_path(scan.root, name));
    return content && content->find(needle) != std::string::npos;
}

// ----------------------------------------------------------------------------
// Python
// ----------------------------------------------------------------------------

std::vector<Framework> detect_python(const ProjectScan& scan) {
    std::vector<Framework> found;

    // (a) configuration files
    bool conftest = std::any_of(scan.files.begin(), scan.files.end(), [&](const std::string& f) {
        if (f == "conftest.py") return true;
        if (get_filename(f) != "conftest.py") return false;
        return std::any_of(scan.test_dirs.begin(), scan.test_dirs.end(),
                           [&](const std::string& d) { return is_within_dir(f, d); });
    });
    bool pytest_ini = is_regular_file(join_path(scan.root, "pytest.ini"));
    bool setup_cfg = root_file_contains(scan, "setup.cfg", "[tool:pytest]");
    bool tox_ini = root_file_contains(scan, "tox.ini", "[pytest]");
    if (conftest || pytest_ini || setup_cfg || tox_ini) {
        spdlog::debug("pytest configuration found");
        add_unique(found, Framework::Pytest);
    }

    // (b) imports in test directories
    auto py_files = files_in_test_dirs(scan, [](const std::string& f) { return ends_with(f, ".py"); });
    for (const auto& f : py_files) {
        auto content = read_small_file(join_path(scan.root, f));
        if (!content) continue;
        if (python_imports(*content, "pytest")) {
            spdlog::debug("pytest import in {}", f);
            add_unique(found, Framework::Pytest);
        }
        if (python_imports(*content, "unittest")) {
            spdlog::debug("unittest import in {}", f);
            add_unique(found, Framework::Unittest);
        }
    }

    // (c) manifest
    if (root_file_contains(scan, "pyproject.toml", "pytest")) {
        spdlog::debug("pytest declared in pyproject.toml");
        add_unique(found, Framework::Pytest);
    }

    // (d) structural fallback
    if (found.empty()) {
        for (const auto& f : py_files) {
            if (!is_test_file(get_filename(f), Runtime::Python)) continue;
            auto content = read_small_file(join_path(scan.root, f));
            if (content && content->find("class Test") != std::string::npos &&
                content->find("TestCase") != std::string::npos) {
                spdlog::debug("TestCase class pattern in {}", f);
                add_unique(found, Framework::Unittest);
                break;
            }
        }
    }

    // pytest first: it also collects unittest-style tests
    std::stable_sort(found.begin(), found.end(), [](Framework a, Framework b) {
        return a == Framework::Pytest && b != Framework::Pytest;
    });
    return found;
}

// ----------------------------------------------------------------------------
// JavaScript / TypeScript
// ----------------------------------------------------------------------------

bool is_config_file(const std::string& path, const std::string& stem) {
    std::string name = get_filename(path);
    if (name.rfind(stem + ".", 0) != 0) return false;
    std::string ext = name.substr(stem.size() + 1);
    return std::find(js_extensions().begin(), js_extensions().end(), ext) != js_extensions().end();
}

void detect_from_package_json(const ProjectScan& scan, std::vector<Framework>& found) {
    auto content = read_small_file(join_path(scan.root, "package.json"));
    if (!content) return;

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) return;

        for (const char* section : {"dependencies", "devDependencies"}) {
            if (!j.contains(section) || !j[section].is_object()) continue;
            if (j[section].contains("vitest")) add_unique(found, Framework::Vitest);
            if (j[section].contains("jest")) add_unique(found, Framework::Jest);
        }
        if (j.contains("jest")) add_unique(found, Framework::Jest);

        if (j.contains("scripts") && j["scripts"].is_object() &&
            j["scripts"].contains("test") && j["scripts"]["test"].is_string()) {
            auto script = j["scripts"]["test"].get<std::string>();
            if (script.find("vitest") != std::string::npos) add_unique(found, Framework::Vitest);
            else if (script.find("jest") != std::string::npos) add_unique(found, Framework::Jest);
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("could not parse package.json: {}", e.what());
    }
}

std::vector<Framework> detect_js(const ProjectScan& scan) {
    std::vector<Framework> found;

    // (a) configuration files
    for (const auto& f : scan.files) {
        if (is_config_file(f, "vitest.config") || is_config_file(f, "vite.config")) {
            spdlog::debug("vitest configuration found: {}", f);
            add_unique(found, Framework::Vitest);
        }
        if (is_config_file(f, "jest.config")) {
            spdlog::debug("jest configuration found: {}", f);
            add_unique(found, Framework::Jest);
        }
    }

    // (b) imports in test files
    std::vector<std::string> test_files;
    for (const auto& f : scan.files) {
        std::string name = get_filename(f);
        bool in_test_dir = std::any_of(scan.test_dirs.begin(), scan.test_dirs.end(),
                                       [&](const std::string& d) { return is_within_dir(f, d); });
        if (is_test_file(name, Runtime::Node) || (in_test_dir && has_js_extension(name))) {
            test_files.push_back(f);
        }
    }
    for (const auto& f : test_files) {
        auto content = read_small_file(join_path(scan.root, f));
        if (!content) continue;
        if (js_imports(*content, "vitest")) add_unique(found, Framework::Vitest);
        if (js_imports(*content, "@jest/globals")) add_unique(found, Framework::Jest);
    }

    // (c) manifest
    detect_from_package_json(scan, found);

    // (d) structural fallback: bare globals are the jest convention
    if (found.empty()) {
        for (const auto& f : test_files) {
            auto content = read_small_file(join_path(scan.root, f));
            if (!content) continue;
            if (content->find("describe(") != std::string::npos ||
                content->find("it(") != std::string::npos ||
                content->find("test(") != std::string::npos) {
                spdlog::debug("test globals in {}", f);
                add_unique(found, Framework::Jest);
                break;
            }
        }
    }

    return found;
}

} // namespace

bool is_test_file(const std::string& filename, Runtime runtime) {
    if (runtime == Runtime::Python) {
        if (!ends_with(filename, ".py")) return false;
        return filename.rfind("test_", 0) == 0 || ends_with(filename, "_test.py");
    }
    return has_js_test_infix(filename);
}

bool python_imports(const std::string& content, const std::string& module) {
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        std::string t = trim(line);
        for (const char* keyword : {"import ", "from "}) {
            std::string prefix = std::string(keyword) + module;
            if (t.rfind(prefix, 0) != 0) continue;
            if (t.size() == prefix.size()) return true;
            char next = t[prefix.size()];
            if (next == ' ' || next == '.' || next == ',' || next == '\t') return true;
        }
    }
    return false;
}

bool js_imports(const std::string& content, const std::string& package) {
    for (const char quote : {'\'', '"'}) {
        std::string quoted = quote + package + quote;
        if (content.find("from " + quoted) != std::string::npos) return true;
        if (content.find("require(" + quoted + ")") != std::string::npos) return true;
        if (content.find("import " + quoted) != std::string::npos) return true;
        if (content.find("import(" + quoted + ")") != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> find_test_dirs(const std::string& project_dir, Runtime runtime) {
    auto files = list_files_recursive(project_dir, ignored_project_dirs());
    const auto& names = test_dir_names();

    std::set<std::string> candidates;
    for (const auto& f : files) {
        auto parts = split_path(f);
        if (parts.size() < 2) continue;

        std::string prefix;
        for (size_t i = 0; i + 1 < parts.size(); ++i) {
            prefix = prefix.empty() ? parts[i] : prefix + "/" + parts[i];
            if (std::find(names.begin(), names.end(), to_lower(parts[i])) != names.end()) {
                candidates.insert(prefix);
                break;
            }
        }

        if (is_test_file(parts.back(), runtime)) {
            candidates.insert(get_parent_directory(f));
        }
    }

    // Keep only outermost directories; std::set order puts parents first
    std::vector<std::string> dirs;
    for (const auto& c : candidates) {
        bool nested = std::any_of(dirs.begin(), dirs.end(),
                                  [&](const std::string& d) { return is_within_dir(c, d); });
        if (!nested) dirs.push_back(c);
    }
    return dirs;
}

std::vector<Framework> detect_frameworks(const std::string& project_dir, Runtime runtime) {
    ProjectScan scan;
    scan.root = project_dir;
    scan.files = list_files_recursive(project_dir, ignored_project_dirs());
    scan.test_dirs = find_test_dirs(project_dir, runtime);

    std::vector<Framework> found = is_js_family(runtime) ? detect_js(scan) : detect_python(scan);

    found.erase(std::remove_if(found.begin(), found.end(),
                               [&](Framework f) { return !framework_supports(f, runtime); }),
                found.end());

    if (found.empty()) {
        spdlog::warn("no test framework detected in {}", project_dir);
    } else {
        std::string names;
        for (auto f : found) {
            if (!names.empty()) names += ", ";
            names += framework_name(f);
        }
        spdlog::info("detected test frameworks: {}", names);
    }
    return found;
}

} // namespace testbed
