#include "path/IgnoreMatcher.hpp"
#include <doctest/doctest.h>

using namespace RFS;

TEST_SUITE("path.ignore") {

TEST_CASE("Default patterns exclude version control and dependency trees") {
    IgnoreMatcher matcher(defaultIgnorePatterns());

    CHECK(matcher.matches(".git"));
    CHECK(matcher.matches(".git/objects/ab/cdef"));
    CHECK(matcher.matches("web/node_modules/react/index.js"));
    CHECK(matcher.matches("assets/.DS_Store"));
    CHECK(matcher.matches("Thumbs.db"));

    CHECK_FALSE(matcher.matches("src/main.cpp"));
    CHECK_FALSE(matcher.matches("docs/.gitignore"));
    CHECK_FALSE(matcher.matches(""));
}

TEST_CASE("Pattern forms") {
    SUBCASE("Bare glob names match any component") {
        IgnoreMatcher matcher({"*.tmp"});
        CHECK(matcher.matches("a.tmp"));
        CHECK(matcher.matches("build.tmp/output.o"));
        CHECK_FALSE(matcher.matches("a.tmpx"));
    }
    SUBCASE("Double-star prefix matches only the final component") {
        IgnoreMatcher matcher({"**/*.swp"});
        CHECK(matcher.matches("src/.main.cpp.swp"));
        CHECK_FALSE(matcher.matches("dir.swp/file.txt"));
    }
    SUBCASE("Anchored patterns match from the root and cover subtrees") {
        IgnoreMatcher matcher({"build/out"});
        CHECK(matcher.matches("build/out"));
        CHECK(matcher.matches("build/out/obj/a.o"));
        CHECK_FALSE(matcher.matches("src/build/out"));
        CHECK_FALSE(matcher.matches("build"));
    }
    SUBCASE("Leading separators are ignored") {
        IgnoreMatcher matcher({"/cache/*"});
        CHECK(matcher.matches("cache/entry"));
        CHECK_FALSE(matcher.matches("cache"));
    }
}

TEST_CASE("Empty matcher excludes nothing and keeps the raw patterns") {
    IgnoreMatcher empty;
    CHECK_FALSE(empty.matches("anything/at/all"));

    IgnoreMatcher matcher({"", "/", "logs"});
    CHECK(matcher.patterns().size() == 3);
    CHECK(matcher.matches("logs/today.log"));
    CHECK_FALSE(matcher.matches("src/a.cpp"));
}

}
