#include "watch/InotifyBackend.hpp"
#include "ReactiveFsTestHelpers.hpp"
#include <doctest/doctest.h>

#include <filesystem>
#include <mutex>

using namespace RFS;
using namespace std::chrono_literals;

namespace {

struct Sinks {
    auto events() -> WatchBackend::EventSink {
        return [this](std::vector<WatchEvent> batch) {
            std::lock_guard<std::mutex> lock(this->mutex);
            this->received.insert(this->received.end(), batch.begin(), batch.end());
        };
    }
    auto errors() -> WatchBackend::ErrorSink {
        return [this](WatchError error) {
            std::lock_guard<std::mutex> lock(this->mutex);
            this->failures.push_back(error);
        };
    }
    auto saw(WatchEventKind kind, std::string const& path) -> bool {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto const& event : this->received)
            if (event.kind == kind && event.path == path)
                return true;
        return false;
    }
    auto sawPath(std::string const& path) -> bool {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto const& event : this->received)
            if (event.path == path)
                return true;
        return false;
    }
    auto errorCount() -> std::size_t {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->failures.size();
    }
    auto lastError() -> WatchError {
        std::lock_guard<std::mutex> lock(this->mutex);
        return this->failures.back();
    }

    std::mutex              mutex;
    std::vector<WatchEvent> received;
    std::vector<WatchError> failures;
};

} // namespace

TEST_SUITE("watch.inotify") {

TEST_CASE("Reports creations, updates and deletions below the root") {
    Test::TempDir  dir;
    Sinks          sinks;
    InotifyBackend backend;
    dir.mkdir("src");

    auto subscription = backend.subscribe(dir.path(), IgnoreMatcher{}, sinks.events(), sinks.errors());
    REQUIRE(subscription.has_value());

    auto file = dir.write("src/main.cpp", "int main() {}");
    CHECK(Test::waitUntil([&] { return sinks.saw(WatchEventKind::Create, file); }));

    dir.write("src/main.cpp", "int main() { return 1; }");
    CHECK(Test::waitUntil([&] { return sinks.saw(WatchEventKind::Update, file); }));

    dir.remove("src/main.cpp");
    CHECK(Test::waitUntil([&] { return sinks.saw(WatchEventKind::Delete, file); }));
    CHECK(sinks.errorCount() == 0);
}

TEST_CASE("Renames are a deletion plus a creation") {
    Test::TempDir  dir;
    Sinks          sinks;
    InotifyBackend backend;
    auto           from = dir.write("old.txt", "x");

    auto subscription = backend.subscribe(dir.path(), IgnoreMatcher{}, sinks.events(), sinks.errors());
    REQUIRE(subscription.has_value());

    auto to = dir.path("new.txt");
    std::filesystem::rename(from, to);
    CHECK(Test::waitUntil([&] { return sinks.saw(WatchEventKind::Delete, from) && sinks.saw(WatchEventKind::Create, to); }));
}

TEST_CASE("Directories created later are watched too") {
    Test::TempDir  dir;
    Sinks          sinks;
    InotifyBackend backend;

    auto subscription = backend.subscribe(dir.path(), IgnoreMatcher{}, sinks.events(), sinks.errors());
    REQUIRE(subscription.has_value());

    auto nested = dir.mkdir("a/b");
    CHECK(Test::waitUntil([&] { return sinks.saw(WatchEventKind::Create, nested); }));

    auto file = dir.write("a/b/deep.txt", "deep");
    CHECK(Test::waitUntil([&] { return sinks.sawPath(file); }));
}

TEST_CASE("Ignored subtrees produce no events") {
    Test::TempDir  dir;
    Sinks          sinks;
    InotifyBackend backend;
    dir.mkdir("node_modules");

    auto subscription = backend.subscribe(dir.path(), IgnoreMatcher({"node_modules", "*.tmp"}), sinks.events(), sinks.errors());
    REQUIRE(subscription.has_value());

    auto ignoredFile = dir.write("node_modules/pkg.json", "{}");
    auto scratch     = dir.write("scratch.tmp", "junk");
    auto marker      = dir.write("kept.txt", "kept");
    REQUIRE(Test::waitUntil([&] { return sinks.sawPath(marker); }));
    std::this_thread::sleep_for(50ms);
    CHECK_FALSE(sinks.sawPath(ignoredFile));
    CHECK_FALSE(sinks.sawPath(scratch));
}

TEST_CASE("Removing the root reports a failure") {
    Test::TempDir  parent;
    Sinks          sinks;
    InotifyBackend backend;
    auto           root = parent.mkdir("project");

    auto subscription = backend.subscribe(root, IgnoreMatcher{}, sinks.events(), sinks.errors());
    REQUIRE(subscription.has_value());

    parent.remove("project");
    REQUIRE(Test::waitUntil([&] { return sinks.errorCount() > 0; }));
    CHECK(sinks.lastError().kind == WatchError::Kind::Failure);
}

TEST_CASE("A missing root cannot be subscribed") {
    Test::TempDir  dir;
    Sinks          sinks;
    InotifyBackend backend;

    auto subscription = backend.subscribe(dir.path("absent"), IgnoreMatcher{}, sinks.events(), sinks.errors());
    REQUIRE_FALSE(subscription.has_value());
    CHECK(subscription.error().code == Error::Code::NotFound);

    auto file   = dir.write("plain.txt", "x");
    auto onFile = backend.subscribe(file, IgnoreMatcher{}, sinks.events(), sinks.errors());
    REQUIRE_FALSE(onFile.has_value());
    CHECK(onFile.error().code == Error::Code::NotFound);
}

TEST_CASE("No events arrive after the subscription is destroyed") {
    Test::TempDir  dir;
    Sinks          sinks;
    InotifyBackend backend;

    auto subscription = backend.subscribe(dir.path(), IgnoreMatcher{}, sinks.events(), sinks.errors());
    REQUIRE(subscription.has_value());
    subscription->reset();

    auto file = dir.write("late.txt", "late");
    std::this_thread::sleep_for(50ms);
    CHECK_FALSE(sinks.sawPath(file));
}

TEST_CASE("Backend names") {
    CHECK(InotifyBackend{}.name() == "inotify");
    auto backend = makeDefaultWatchBackend();
    REQUIRE(backend);
    CHECK(backend->name() == "inotify");
}

}
