#include "config/Config.hpp"
#include "ReactiveFsTestHelpers.hpp"
#include <doctest/doctest.h>

using namespace RFS;
using namespace std::chrono_literals;
using RFS::Test::EnvGuard;

TEST_SUITE("config") {

TEST_CASE("An empty object keeps every default") {
    auto config = parseConfig("{}");
    REQUIRE(config.has_value());
    CHECK(config->rootDir.empty());
    CHECK(config->watcher.debounce == 50ms);
    CHECK(config->watcher.recoveryInterval == 3000ms);
    CHECK(config->watcher.livenessInterval == 3000ms);
    CHECK(config->watcher.ignore == defaultIgnorePatterns());
}

TEST_CASE("Every key is read") {
    auto config = parseConfig(R"({
        "rootDir": "/srv/project",
        "debounceMs": 25,
        "recoveryIntervalMs": 500,
        "livenessIntervalMs": 0,
        "ignore": ["build", "**/*.swp"],
        "comment": "unknown keys are fine"
    })");
    REQUIRE(config.has_value());
    CHECK(config->rootDir == "/srv/project");
    CHECK(config->watcher.debounce == 25ms);
    CHECK(config->watcher.recoveryInterval == 500ms);
    CHECK(config->watcher.livenessInterval == 0ms);
    CHECK(config->watcher.ignore == std::vector<std::string>{"build", "**/*.swp"});
}

TEST_CASE("An empty ignore list disables the defaults") {
    auto config = parseConfig(R"({"ignore": []})");
    REQUIRE(config.has_value());
    CHECK(config->watcher.ignore.empty());
}

TEST_CASE("Malformed documents are rejected") {
    auto expectMalformed = [](std::string_view text) {
        auto config = parseConfig(text);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().code == Error::Code::MalformedInput);
    };

    SUBCASE("invalid JSON") { expectMalformed("{ rootDir: "); }
    SUBCASE("not an object") { expectMalformed("[1, 2, 3]"); }
    SUBCASE("rootDir type") { expectMalformed(R"({"rootDir": 7})"); }
    SUBCASE("interval type") { expectMalformed(R"({"debounceMs": "fast"})"); }
    SUBCASE("fractional interval") { expectMalformed(R"({"debounceMs": 1.5})"); }
    SUBCASE("negative interval") { expectMalformed(R"({"recoveryIntervalMs": -1})"); }
    SUBCASE("ignore type") { expectMalformed(R"({"ignore": ".git"})"); }
    SUBCASE("ignore entry type") { expectMalformed(R"({"ignore": [".git", 3]})"); }
}

TEST_CASE("loadConfig reads files and names them in errors") {
    Test::TempDir dir;

    auto good   = dir.write("good.json", R"({"rootDir": "/data", "debounceMs": 5})");
    auto loaded = loadConfig(good);
    REQUIRE(loaded.has_value());
    CHECK(loaded->rootDir == "/data");
    CHECK(loaded->watcher.debounce == 5ms);

    auto bad    = dir.write("bad.json", "not json");
    auto broken = loadConfig(bad);
    REQUIRE_FALSE(broken.has_value());
    CHECK(broken.error().code == Error::Code::MalformedInput);
    REQUIRE(broken.error().message.has_value());
    CHECK(broken.error().message->find(bad) == 0);

    auto missing = loadConfig(dir.path("missing.json"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
}

TEST_CASE("Environment overrides") {
    EnvGuard root("REACTIVEFS_ROOT", nullptr);
    EnvGuard debounce("REACTIVEFS_DEBOUNCE_MS", nullptr);
    EnvGuard ignore("REACTIVEFS_IGNORE", nullptr);

    ReactiveFsConfig config;
    config.rootDir        = "/from/file";
    config.watcher.ignore = {"keep"};

    SUBCASE("unset variables change nothing") {
        REQUIRE(applyEnvironmentOverrides(config).has_value());
        CHECK(config.rootDir == "/from/file");
        CHECK(config.watcher.debounce == 50ms);
        CHECK(config.watcher.ignore == std::vector<std::string>{"keep"});
    }

    SUBCASE("set variables win") {
        EnvGuard rootSet("REACTIVEFS_ROOT", "/from/env");
        EnvGuard debounceSet("REACTIVEFS_DEBOUNCE_MS", " 120 ");
        EnvGuard ignoreSet("REACTIVEFS_IGNORE", "dist, .cache ,,*.log");
        REQUIRE(applyEnvironmentOverrides(config).has_value());
        CHECK(config.rootDir == "/from/env");
        CHECK(config.watcher.debounce == 120ms);
        CHECK(config.watcher.ignore == std::vector<std::string>{"dist", ".cache", "*.log"});
    }

    SUBCASE("empty variables are treated as unset") {
        EnvGuard rootSet("REACTIVEFS_ROOT", "");
        REQUIRE(applyEnvironmentOverrides(config).has_value());
        CHECK(config.rootDir == "/from/file");
    }

    SUBCASE("a bad debounce value is rejected") {
        for (char const* value : {"soon", "-5", "12ms"}) {
            CAPTURE(value);
            EnvGuard debounceSet("REACTIVEFS_DEBOUNCE_MS", value);
            auto     applied = applyEnvironmentOverrides(config);
            REQUIRE_FALSE(applied.has_value());
            CHECK(applied.error().code == Error::Code::MalformedInput);
        }
    }
}

}
