#include <doctest/doctest.h>
#include <testbed/semver.hpp>

using namespace testbed;

TEST_CASE("parse_version accepts plain and v-prefixed versions") {
    auto plain = parse_version("20.10.0");
    REQUIRE(plain.has_value());
    CHECK(plain->major() == 20);
    CHECK(plain->minor() == 10);
    CHECK(plain->patch() == 0);

    auto tagged = parse_version("v1.0.21");
    REQUIRE(tagged.has_value());
    CHECK(tagged->patch() == 21);

    CHECK(parse_version(" 0.1.13\n").has_value());
}

TEST_CASE("parse_version rejects non-versions") {
    CHECK_FALSE(parse_version("").has_value());
    CHECK_FALSE(parse_version("v").has_value());
    CHECK_FALSE(parse_version("latest").has_value());
    CHECK_FALSE(parse_version("1.2").has_value());
}

TEST_CASE("is_older_version compares numerically") {
    CHECK(is_older_version("1.0.3", "1.0.21"));
    CHECK(is_older_version("v18.19.0", "20.10.0"));
    CHECK_FALSE(is_older_version("20.10.0", "20.10.0"));
    CHECK_FALSE(is_older_version("1.1.0", "1.0.21"));
    CHECK_FALSE(is_older_version("tmp", "1.0.0"));
}

TEST_CASE("is_older_version orders prereleases before releases") {
    CHECK(is_older_version("1.0.0-beta.1", "1.0.0"));
}

TEST_CASE("sort_versions puts unparseable names first") {
    auto sorted = sort_versions({"1.10.0", "garbage", "1.2.0", "v1.9.9"});
    REQUIRE(sorted.size() == 4);
    CHECK(sorted[0] == "garbage");
    CHECK(sorted[1] == "1.2.0");
    CHECK(sorted[2] == "v1.9.9");
    CHECK(sorted[3] == "1.10.0");
}
