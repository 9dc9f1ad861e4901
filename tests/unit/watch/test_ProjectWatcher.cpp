#include "watch/ProjectWatcher.hpp"
#include "ReactiveFsTestHelpers.hpp"
#include <doctest/doctest.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace RFS;
using namespace std::chrono_literals;

namespace {

struct WatcherFixture {
    explicit WatcherFixture(ProjectWatcherOptions options = Test::fastWatcherOptions()) {
        this->root    = this->parent.mkdir("project");
        this->backend = std::make_shared<Test::FakeWatchBackend>();
        this->watcher = ProjectWatcher::Create(this->root, this->backend, std::move(options));
    }

    auto path(std::string const& relative) const -> std::string { return this->root + "/" + relative; }

    Test::TempDir                           parent;
    std::string                             root;
    Test::EventRecorder                     recorder;
    Test::EventRecorder                     other;
    std::shared_ptr<Test::FakeWatchBackend> backend;
    std::shared_ptr<ProjectWatcher>         watcher;
};

auto slowFlush() -> ProjectWatcherOptions {
    auto options     = Test::fastWatcherOptions();
    options.debounce = 10000ms;
    return options;
}

} // namespace

TEST_SUITE("watch.project_watcher") {

TEST_CASE("init is idempotent and bumps the generation once") {
    WatcherFixture f;
    CHECK(f.watcher->state() == ProjectWatcher::State::Uninitialized);
    CHECK(f.watcher->generation() == 0);

    REQUIRE(f.watcher->init().has_value());
    REQUIRE(f.watcher->init().has_value());
    CHECK(f.watcher->isInitialized());
    CHECK(f.watcher->generation() == 1);
    CHECK(f.backend->subscribeCount() == 1);
    CHECK(f.backend->subscribedRoots().front() == f.root);
}

TEST_CASE("Concurrent init calls share one attempt") {
    WatcherFixture           f;
    std::atomic<int>         succeeded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (f.watcher->init())
                ++succeeded;
        });
    }
    for (auto& thread : threads)
        thread.join();
    CHECK(succeeded.load() == 8);
    CHECK(f.backend->subscribeCount() == 1);
    CHECK(f.watcher->generation() == 1);
}

TEST_CASE("A failed init is reported and can be retried") {
    WatcherFixture f;
    f.backend->failWith(Error{Error::Code::CapacityExceeded, "watch limit reached"});

    auto failed = f.watcher->init();
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::CapacityExceeded);
    CHECK(f.watcher->state() == ProjectWatcher::State::Uninitialized);
    CHECK(f.watcher->runtimeStatus().counters.lastError.has_value());

    f.backend->failWith(std::nullopt);
    REQUIRE(f.watcher->init().has_value());
    CHECK(f.watcher->generation() == 1);
}

TEST_CASE("subscribeSync requires an initialized watcher, subscribe initializes") {
    WatcherFixture f;
    auto           early = f.watcher->subscribeSync(f.root, f.recorder.callback());
    REQUIRE_FALSE(early.has_value());
    CHECK(early.error().code == Error::Code::NotInitialized);

    auto cancel = f.watcher->subscribe(f.root, f.recorder.callback());
    REQUIRE(cancel.has_value());
    CHECK(f.watcher->isInitialized());
    CHECK(f.watcher->subscriptionCount() == 1);

    (*cancel)();
    CHECK(f.watcher->subscriptionCount() == 0);
    // Cancelling twice is harmless.
    (*cancel)();
}

TEST_CASE("Events are debounced into one batch per subscription") {
    auto options     = Test::fastWatcherOptions();
    options.debounce = 150ms;
    WatcherFixture f(options);
    REQUIRE(f.watcher->subscribe(f.root, f.recorder.callback()).has_value());

    f.backend->emit(WatchEventKind::Create, f.path("a.txt"));
    f.backend->emit(WatchEventKind::Update, f.path("a.txt"));
    f.backend->emit(WatchEventKind::Create, f.path("b.txt"));

    REQUIRE(Test::waitUntil([&] { return f.recorder.batchCount() >= 1; }));
    std::this_thread::sleep_for(50ms);
    CHECK(f.recorder.batchCount() == 1);
    CHECK(f.recorder.events()
          == std::vector<WatchEvent>{{WatchEventKind::Create, f.path("a.txt")},
                                     {WatchEventKind::Update, f.path("a.txt")},
                                     {WatchEventKind::Create, f.path("b.txt")}});
}

TEST_CASE("Subscriptions see their path and children, or the whole subtree") {
    WatcherFixture f(slowFlush());
    REQUIRE(f.watcher->init().has_value());
    f.parent.mkdir("project/src/deep");
    REQUIRE(f.watcher->subscribeSync(f.path("src"), f.recorder.callback()).has_value());
    REQUIRE(f.watcher->subscribeSync(f.path("src"), f.other.callback(), {.watchChildren = true}).has_value());

    f.backend->emit({{WatchEventKind::Update, f.path("src")},
                     {WatchEventKind::Create, f.path("src/main.cpp")},
                     {WatchEventKind::Create, f.path("src/deep/nested.cpp")},
                     {WatchEventKind::Create, f.path("srcs/elsewhere.cpp")},
                     {WatchEventKind::Create, f.path("README.md")}});
    CHECK(f.watcher->runtimeStatus().pendingEventCount == 5);
    f.watcher->flushNow();

    CHECK(f.recorder.saw(f.path("src")));
    CHECK(f.recorder.saw(f.path("src/main.cpp")));
    CHECK_FALSE(f.recorder.saw(f.path("src/deep/nested.cpp")));
    CHECK_FALSE(f.recorder.saw(f.path("srcs/elsewhere.cpp")));

    CHECK(f.other.saw(f.path("src/deep/nested.cpp")));
    CHECK(f.other.events().size() == 3);
}

TEST_CASE("Ignored paths are never buffered") {
    auto options   = slowFlush();
    options.ignore = {".git", "**/*.swp"};
    WatcherFixture f(options);
    REQUIRE(f.watcher->subscribe(f.root, f.recorder.callback(), {.watchChildren = true}).has_value());

    f.backend->emit({{WatchEventKind::Update, f.path(".git/index")},
                     {WatchEventKind::Create, f.path("src/.main.cpp.swp")},
                     {WatchEventKind::Update, f.path("src/main.cpp")}});
    CHECK(f.watcher->runtimeStatus().pendingEventCount == 1);
    f.watcher->flushNow();
    CHECK(f.recorder.events() == std::vector<WatchEvent>{{WatchEventKind::Update, f.path("src/main.cpp")}});
}

TEST_CASE("A throwing callback is counted and does not starve the others") {
    WatcherFixture f(slowFlush());
    REQUIRE(f.watcher->subscribe(f.root, [](std::vector<WatchEvent> const&) { throw std::runtime_error("subscriber bug"); })
                    .has_value());
    REQUIRE(f.watcher->subscribe(f.root, f.recorder.callback()).has_value());

    f.backend->emit(WatchEventKind::Create, f.path("x"));
    f.watcher->flushNow();

    CHECK(f.recorder.batchCount() == 1);
    auto counters = f.watcher->runtimeStatus().counters;
    CHECK(counters.callbackFailures == 1);
    CHECK(counters.lastError.value_or("") == "subscriber bug");
}

TEST_CASE("Cancelled subscriptions receive nothing further") {
    WatcherFixture f(slowFlush());
    auto           cancel = f.watcher->subscribe(f.root, f.recorder.callback());
    REQUIRE(cancel.has_value());
    f.backend->emit(WatchEventKind::Create, f.path("x"));
    (*cancel)();
    f.watcher->flushNow();
    CHECK(f.recorder.batchCount() == 0);
}

TEST_CASE("Backend errors trigger a rebuild that keeps subscriptions") {
    WatcherFixture f;
    std::mutex                                                hookMutex;
    std::vector<std::pair<ReinitializeReason, std::uint64_t>> hookCalls;
    f.watcher->setReinitializeHook([&](ReinitializeReason reason, std::uint64_t generation) {
        std::lock_guard<std::mutex> lock(hookMutex);
        hookCalls.emplace_back(reason, generation);
    });
    REQUIRE(f.watcher->subscribe(f.root, f.recorder.callback()).has_value());

    ReinitializeReason expected = ReinitializeReason::WatcherError;
    SUBCASE("failure") {
        f.backend->emitError(WatchError{WatchError::Kind::Failure, "inotify went away"});
        expected = ReinitializeReason::WatcherError;
    }
    SUBCASE("dropped events") {
        f.backend->emitError(WatchError{WatchError::Kind::EventsDropped, "queue overflow"});
        expected = ReinitializeReason::DropEvents;
    }

    // The hook runs after the rebuild has been published, so wait for it rather than the generation.
    REQUIRE(Test::waitUntil([&] {
        std::lock_guard<std::mutex> lock(hookMutex);
        return !hookCalls.empty();
    }));
    CHECK(f.watcher->isInitialized());
    {
        std::lock_guard<std::mutex> lock(hookMutex);
        REQUIRE(hookCalls.size() == 1);
        CHECK(hookCalls.front().first == expected);
        CHECK(hookCalls.front().second == 2);
    }
    auto counters = f.watcher->runtimeStatus().counters;
    CHECK(counters.reinitializeCount == 1);
    CHECK(counters.lastReinitializeReason == expected);
    CHECK(counters.reinitializeReasonCounts[static_cast<std::size_t>(expected)] == 1);
    CHECK(f.backend->subscribeCount() == 2);
    CHECK(f.backend->liveCount() == 1);
    CHECK(f.watcher->subscriptionCount() == 1);

    f.backend->emit(WatchEventKind::Create, f.path("after-rebuild.txt"));
    CHECK(Test::waitUntil([&] { return f.recorder.saw(f.path("after-rebuild.txt")); }));
}

TEST_CASE("Errors that arrive before the rebuild coalesce into one") {
    auto options             = Test::fastWatcherOptions();
    options.recoveryInterval = 100ms;
    WatcherFixture f(options);
    REQUIRE(f.watcher->init().has_value());

    f.backend->emitError(WatchError{WatchError::Kind::Failure, "first"});
    f.backend->emitError(WatchError{WatchError::Kind::EventsDropped, "overflow"});
    f.backend->emitError(WatchError{WatchError::Kind::Failure, "second"});

    REQUIRE(Test::waitUntil([&] { return f.watcher->generation() == 2; }));
    std::this_thread::sleep_for(150ms);
    auto counters = f.watcher->runtimeStatus().counters;
    CHECK(counters.reinitializeCount == 1);
    // Dropped-event reports never displace an error that is already pending.
    CHECK(counters.lastReinitializeReason == ReinitializeReason::WatcherError);
    CHECK(counters.lastError.value_or("") == "second");
}

TEST_CASE("Manual reinitialize rebuilds synchronously") {
    WatcherFixture f;
    REQUIRE(f.watcher->init().has_value());
    REQUIRE(f.watcher->reinitialize(ReinitializeReason::Manual).has_value());
    CHECK(f.watcher->generation() == 2);
    CHECK(f.watcher->runtimeStatus().counters.lastReinitializeReason == ReinitializeReason::Manual);
    CHECK(f.backend->liveCount() == 1);
}

TEST_CASE("reinitialize before init is refused") {
    WatcherFixture f;
    auto           result = f.watcher->reinitialize(ReinitializeReason::Manual);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::NotInitialized);
}

TEST_CASE("A missing project directory is polled until it returns") {
    WatcherFixture f;
    REQUIRE(f.watcher->subscribe(f.root, f.recorder.callback()).has_value());
    std::filesystem::remove_all(f.root);

    auto result = f.watcher->reinitialize(ReinitializeReason::Manual);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::NotFound);
    auto status = f.watcher->runtimeStatus();
    CHECK(status.recovering);
    CHECK_FALSE(status.initialized);

    // Subscriptions can still be registered while recovering.
    CHECK(f.watcher->subscribeSync(f.root, f.other.callback()).has_value());

    std::this_thread::sleep_for(60ms);
    CHECK(f.watcher->generation() == 1);

    std::filesystem::create_directories(f.root);
    REQUIRE(Test::waitUntil([&] { return f.watcher->isInitialized(); }));
    CHECK(f.watcher->generation() == 2);
    CHECK(f.watcher->runtimeStatus().counters.lastReinitializeReason == ReinitializeReason::MissingProjectDirectory);
    CHECK(f.watcher->subscriptionCount() == 2);
}

TEST_CASE("Liveness checks notice a replaced project directory") {
    auto options             = Test::fastWatcherOptions();
    options.livenessInterval = 200ms;
    WatcherFixture f(options);
    REQUIRE(f.watcher->init().has_value());

    auto replacement = f.parent.mkdir("replacement");
    std::filesystem::rename(f.root, f.parent.path("original"));
    std::filesystem::rename(replacement, f.root);

    REQUIRE(Test::waitUntil([&] { return f.watcher->generation() == 2; }));
    CHECK(f.watcher->runtimeStatus().counters.lastReinitializeReason == ReinitializeReason::ProjectDirectoryReplaced);
}

TEST_CASE("close() drops everything and allows a fresh init") {
    WatcherFixture f(slowFlush());
    REQUIRE(f.watcher->subscribe(f.root, f.recorder.callback()).has_value());
    f.backend->emit(WatchEventKind::Create, f.path("pending.txt"));

    f.watcher->close();
    CHECK(f.watcher->state() == ProjectWatcher::State::Uninitialized);
    CHECK(f.watcher->subscriptionCount() == 0);
    CHECK(f.watcher->runtimeStatus().pendingEventCount == 0);
    CHECK(f.backend->liveCount() == 0);

    f.watcher->flushNow();
    CHECK(f.recorder.batchCount() == 0);
    CHECK(f.watcher->subscribeSync(f.root, f.recorder.callback()).error().code == Error::Code::NotInitialized);

    REQUIRE(f.watcher->init().has_value());
    CHECK(f.watcher->generation() == 2);
}

TEST_CASE("matches() implements direct-child and subtree scopes") {
    WatchEvent child{WatchEventKind::Create, "/p/dir/file"};
    WatchEvent self{WatchEventKind::Update, "/p/dir"};
    WatchEvent deep{WatchEventKind::Delete, "/p/dir/a/b"};
    WatchEvent sibling{WatchEventKind::Create, "/p/dirx/file"};

    CHECK(ProjectWatcher::matches(child, "/p/dir", false));
    CHECK(ProjectWatcher::matches(self, "/p/dir", false));
    CHECK_FALSE(ProjectWatcher::matches(deep, "/p/dir", false));
    CHECK_FALSE(ProjectWatcher::matches(sibling, "/p/dir", false));

    CHECK(ProjectWatcher::matches(deep, "/p/dir", true));
    CHECK(ProjectWatcher::matches(self, "/p/dir", true));
    CHECK_FALSE(ProjectWatcher::matches(sibling, "/p/dir", true));
}

TEST_CASE("State and reason names") {
    CHECK(projectWatcherStateName(ProjectWatcher::State::Initialized) == "initialized");
    CHECK(projectWatcherStateName(ProjectWatcher::State::Closed) == "closed");
    CHECK(reinitializeReasonName(ReinitializeReason::DropEvents) == "drop-events");
    CHECK(reinitializeReasonName(ReinitializeReason::MissingProjectDirectory) == "missing-project-dir");
    CHECK(reinitializeReasonName(ReinitializeReason::ProjectDirectoryReplaced) == "project-dir-replaced");
    CHECK(watchEventKindName(WatchEventKind::Delete) == "delete");
}

}
