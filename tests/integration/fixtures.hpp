#pragma once

#include <testbed/environment.hpp>

#include "test_helpers.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace testbed_test {

// Stand-in toolchain: fake executables are written to a directory that is
// prepended to the host PATH, so the manager borrows them like real tools.
// Sandbox PATH holds only the sandbox bin directory, so the scripts stick
// to shell builtins.
class FakeToolchain {
public:
    FakeToolchain() : path_guard_(tools_.path()) {
        std::filesystem::create_directories(sandboxes_dir());
    }

    void add(const std::string& name, const std::string& body) {
        write_script(tools_.file(name), body);
    }

    std::string sandboxes_dir() const { return base_.file("sandboxes"); }

    bool no_sandboxes_left() const { return std::filesystem::is_empty(sandboxes_dir()); }

    // Tools the sandbox must borrow up front, beyond the installer-managed ones
    testbed::TestbedConfig config(const std::vector<std::string>& borrowed = {}) const {
        testbed::TestbedConfig config;
        config.runtime_source = testbed::RuntimeSource::System;
        config.cache_dir = base_.file("cache");
        config.sandbox.base_dir = sandboxes_dir();
        config.sandbox.borrowed_binaries = {"sh"};
        config.sandbox.borrowed_binaries.insert(config.sandbox.borrowed_binaries.end(),
                                                borrowed.begin(), borrowed.end());
        return config;
    }

private:
    TempDir base_;
    TempDir tools_;
    ScopedPathPrepend path_guard_;
};

// A unittest project whose fake interpreter reports three passing tests
inline void make_unittest_project(const TempDir& project, FakeToolchain& tools) {
    write_file(project.file("pyproject.toml"), "[project]\nname = \"calc\"\nversion = \"0.1.0\"\n");
    write_file(project.file("calc/__init__.py"), "");
    write_file(project.file("tests/test_math.py"),
               "import unittest\n\n"
               "class TestMath(unittest.TestCase):\n"
               "    def test_add(self):\n        self.assertEqual(1 + 1, 2)\n\n"
               "    def test_sub(self):\n        self.assertEqual(2 - 1, 1)\n\n"
               "    def test_mul(self):\n        self.assertEqual(2 * 3, 6)\n");

    tools.add("uv", "exit 0\n");
    tools.add("python3",
              "{\n"
              "printf '%s\\n' 'test_add (tests.test_math.TestMath.test_add) ... ok'\n"
              "printf '%s\\n' 'test_mul (tests.test_math.TestMath.test_mul) ... ok'\n"
              "printf '%s\\n' 'test_sub (tests.test_math.TestMath.test_sub) ... ok'\n"
              "printf '\\n%s\\n' '----------------------------------------------------------------------'\n"
              "printf '%s\\n\\n%s\\n' 'Ran 3 tests in 0.001s' 'OK'\n"
              "} >&2\n"
              "exit 0\n");
}

} // namespace testbed_test
