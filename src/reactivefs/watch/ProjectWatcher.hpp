#pragma once
#include "core/Error.hpp"
#include "path/IgnoreMatcher.hpp"
#include "watch/WatchBackend.hpp"
#include "watch/WatchEvent.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace RFS {

struct WatchSubscribeOptions {
    bool watchChildren = false;
};

struct ProjectWatcherOptions {
    // Quiet period after the last raw event before pending events are delivered.
    std::chrono::milliseconds debounce{50};
    std::vector<std::string>  ignore = defaultIgnorePatterns();
    // Delay before an error-driven rebuild, and the poll period while the root is missing.
    std::chrono::milliseconds recoveryInterval{3000};
    // How often the root's (device, inode) identity is re-checked.
    std::chrono::milliseconds livenessInterval{3000};
};

// Counters that survive reinitialization, and replacement of the watcher by the pool.
struct WatcherCounters {
    std::uint64_t                     generation        = 0;
    std::uint64_t                     reinitializeCount = 0;
    std::optional<ReinitializeReason> lastReinitializeReason;
    ReinitializeReasonCounts          reinitializeReasonCounts{};
    std::uint64_t                     callbackFailures = 0;
    std::optional<std::string>        lastError;

    auto markReinitialized(ReinitializeReason reason) -> void;
};

/**
 * ProjectWatcher - one OS subscription for a root directory, fanned out to
 * path subscriptions.
 *
 * Lifecycle: Uninitialized -> Initializing -> Initialized. close() returns to
 * Uninitialized (the watcher may be initialized again); destruction is final.
 * init() is idempotent and concurrent callers share one attempt. Every
 * successful initialization bumps the generation.
 *
 * Raw events are buffered; each event re-arms the debounce deadline, and when
 * it passes the buffer is matched against every subscription and delivered on
 * the watcher's worker thread:
 * - watchChildren: the subscribed path itself or anything below it.
 * - otherwise:     the subscribed path itself or its direct children.
 * A callback that throws is logged and counted; delivery to the remaining
 * subscriptions continues.
 *
 * Recovery
 * --------
 * Backend errors and failed liveness checks schedule a rebuild after
 * recoveryInterval; reasons arriving before it runs coalesce into the latest
 * one, and dropped-event reports never override a pending reason. While the
 * root is missing the rebuild is re-polled every recoveryInterval.
 * Subscriptions survive rebuilds. After a successful rebuild the reinitialize
 * hook runs so owners can invalidate whatever the gap may have hidden.
 *
 * Callbacks and the hook must not call close() or destroy the watcher.
 */
class ProjectWatcher : public std::enable_shared_from_this<ProjectWatcher> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    enum class State { Uninitialized, Initializing, Initialized, Closed };

    using Callback         = std::function<void(std::vector<WatchEvent> const&)>;
    using CancelFn         = std::function<void()>;
    using ReinitializeHook = std::function<void(ReinitializeReason reason, std::uint64_t generation)>;

    using SubscribeOptions = WatchSubscribeOptions;

    struct RuntimeStatus {
        std::string     root;
        State           state       = State::Uninitialized;
        bool            initialized = false;
        bool            recovering  = false;
        std::size_t     subscriptionCount = 0;
        std::size_t     pendingEventCount = 0;
        WatcherCounters counters;
    };

    // root is used as given; callers pass a normalized, symlink-resolved path.
    static auto Create(std::string root,
                       std::shared_ptr<WatchBackend> backend,
                       ProjectWatcherOptions options              = {},
                       WatcherCounters carried                    = {},
                       std::optional<ReinitializeReason> onFirstInit = std::nullopt) -> std::shared_ptr<ProjectWatcher>;

    ProjectWatcher(PrivateTag,
                   std::string root,
                   std::shared_ptr<WatchBackend> backend,
                   ProjectWatcherOptions options,
                   WatcherCounters carried,
                   std::optional<ReinitializeReason> onFirstInit);
    ~ProjectWatcher();

    ProjectWatcher(ProjectWatcher const&)            = delete;
    ProjectWatcher& operator=(ProjectWatcher const&) = delete;

    auto init() -> Expected<void>;

    // Initializes on demand, then registers.
    auto subscribe(std::string_view path, Callback callback, SubscribeOptions options = {}) -> Expected<CancelFn>;
    // Registers only when already initialized (or rebuilding after an error); never initializes.
    auto subscribeSync(std::string_view path, Callback callback, SubscribeOptions options = {}) -> Expected<CancelFn>;

    // Drops the OS subscription, subscriptions, pending events and timers.
    auto close() -> void;

    // Rebuilds the OS subscription now on the calling thread.
    auto reinitialize(ReinitializeReason reason) -> Expected<void>;
    // Rebuilds after recoveryInterval on the worker thread.
    auto scheduleReinitialize(ReinitializeReason reason) -> void;

    auto setReinitializeHook(ReinitializeHook hook) -> void;

    // Backend entry points; public so tests can inject raw traffic.
    auto handleEvents(std::vector<WatchEvent> events) -> void;
    auto handleError(WatchError error) -> void;

    // Delivers buffered events immediately on the calling thread.
    auto flushNow() -> void;

    [[nodiscard]] auto root() const noexcept -> std::string const& { return this->rootPath; }
    [[nodiscard]] auto state() const -> State;
    [[nodiscard]] auto isInitialized() const -> bool;
    [[nodiscard]] auto generation() const -> std::uint64_t;
    [[nodiscard]] auto subscriptionCount() const -> std::size_t;
    [[nodiscard]] auto runtimeStatus() const -> RuntimeStatus;
    [[nodiscard]] auto options() const noexcept -> ProjectWatcherOptions const& { return this->config; }

    static auto matches(WatchEvent const& event, std::string_view subscribedPath, bool watchChildren) -> bool;

private:
    struct Subscription {
        std::string path;
        bool        watchChildren = false;
        Callback    callback;
    };

    // (device, inode) of the root, or nullopt when it does not exist.
    struct Fingerprint {
        std::uint64_t device = 0;
        std::uint64_t inode  = 0;
        auto operator==(Fingerprint const&) const -> bool = default;
    };

    auto fingerprintRoot() const -> std::optional<Fingerprint>;
    auto openBackend() -> Expected<std::unique_ptr<WatchSubscription>>;
    auto startWorkerLocked() -> void;
    auto stopWorker() -> void;
    auto teardown(State finalState) -> void;
    auto workerLoop(std::stop_token token) -> void;
    auto scheduleReinitializeLocked(ReinitializeReason reason) -> void;
    auto performReinitialize(ReinitializeReason reason) -> Expected<void>;
    auto checkLiveness() -> void;
    auto deliver(std::vector<WatchEvent> events) -> void;
    auto wakeWorkerLocked() -> void;

    std::string                   rootPath;
    std::shared_ptr<WatchBackend> backend;
    ProjectWatcherOptions         config;
    IgnoreMatcher                 ignore;

    mutable std::mutex          mutex;
    std::condition_variable_any cv;
    State                       currentState = State::Uninitialized;
    bool                        recovering   = false;
    std::uint64_t               initAttempt  = 0;
    std::optional<Error>        lastInitError;

    std::unique_ptr<WatchSubscription> osSubscription;
    std::optional<Fingerprint>         fingerprint;

    phmap::flat_hash_map<std::uint64_t, Subscription> subscriptions;
    std::uint64_t                                     nextSubscriptionId = 1;

    std::vector<WatchEvent>                              pending;
    std::optional<std::chrono::steady_clock::time_point> flushDeadline;
    std::optional<std::chrono::steady_clock::time_point> reinitializeDeadline;
    std::optional<ReinitializeReason>                    pendingReason;
    bool                                                 waitingForRoot = false;
    std::chrono::steady_clock::time_point                nextLivenessCheck;
    bool                                                 wake = false;

    WatcherCounters                   counters;
    std::optional<ReinitializeReason> reasonOnFirstInit;
    ReinitializeHook                  reinitializeHook;

    // Serializes rebuilds between reinitialize() and the worker.
    std::mutex   rebuildMutex;
    std::jthread worker;
};

[[nodiscard]] auto projectWatcherStateName(ProjectWatcher::State state) -> std::string_view;

} // namespace RFS
