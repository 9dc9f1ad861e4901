#include "watch/ProjectWatcher.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#include <sys/stat.h>

namespace RFS {

auto WatcherCounters::markReinitialized(ReinitializeReason reason) -> void {
    ++this->reinitializeCount;
    this->lastReinitializeReason = reason;
    ++this->reinitializeReasonCounts[static_cast<std::size_t>(reason)];
}

auto ProjectWatcher::Create(std::string root,
                            std::shared_ptr<WatchBackend> backend,
                            ProjectWatcherOptions options,
                            WatcherCounters carried,
                            std::optional<ReinitializeReason> onFirstInit) -> std::shared_ptr<ProjectWatcher> {
    return std::make_shared<ProjectWatcher>(PrivateTag{},
                                            std::move(root),
                                            std::move(backend),
                                            std::move(options),
                                            std::move(carried),
                                            onFirstInit);
}

ProjectWatcher::ProjectWatcher(PrivateTag,
                               std::string root,
                               std::shared_ptr<WatchBackend> backend,
                               ProjectWatcherOptions options,
                               WatcherCounters carried,
                               std::optional<ReinitializeReason> onFirstInit)
    : rootPath(std::move(root)),
      backend(backend ? std::move(backend) : makeDefaultWatchBackend()),
      config(std::move(options)),
      ignore(this->config.ignore),
      counters(std::move(carried)),
      reasonOnFirstInit(onFirstInit) {}

ProjectWatcher::~ProjectWatcher() {
    this->teardown(State::Closed);
}

auto ProjectWatcher::init() -> Expected<void> {
    std::unique_lock<std::mutex> lock(this->mutex);
    while (this->currentState != State::Uninitialized) {
        if (this->currentState == State::Initialized)
            return {};
        if (this->currentState == State::Closed)
            return std::unexpected(Error{Error::Code::AlreadyClosed, "ProjectWatcher closed: " + this->rootPath});
        if (this->recovering)
            return std::unexpected(Error{Error::Code::NotInitialized, "ProjectWatcher is rebuilding: " + this->rootPath});

        // Another caller is initializing; share its outcome.
        auto const attempt = this->initAttempt;
        this->cv.wait(lock, [&] { return this->initAttempt != attempt; });
        if (this->currentState == State::Initialized)
            return {};
        return std::unexpected(
                this->lastInitError.value_or(Error{Error::Code::NotInitialized, "ProjectWatcher initialization abandoned"}));
    }

    this->currentState = State::Initializing;
    lock.unlock();

    auto opened = this->openBackend();
    auto print  = this->fingerprintRoot();

    std::unique_ptr<WatchSubscription> discard;
    lock.lock();
    ++this->initAttempt;
    this->cv.notify_all();
    if (this->currentState != State::Initializing) {
        if (opened)
            discard = std::move(*opened);
        lock.unlock();
        return std::unexpected(Error{Error::Code::AlreadyClosed, "ProjectWatcher closed during initialization"});
    }
    if (!opened) {
        this->currentState      = State::Uninitialized;
        this->lastInitError     = opened.error();
        this->counters.lastError = describeError(opened.error());
        rfs_log("Failed to watch " + this->rootPath + ": " + describeError(opened.error()), "ProjectWatcher", "ERROR");
        return std::unexpected(opened.error());
    }

    this->osSubscription = std::move(*opened);
    this->fingerprint    = print;
    this->currentState   = State::Initialized;
    this->lastInitError.reset();
    ++this->counters.generation;
    if (this->reasonOnFirstInit) {
        this->counters.markReinitialized(*this->reasonOnFirstInit);
        this->reasonOnFirstInit.reset();
    }
    this->nextLivenessCheck = std::chrono::steady_clock::now() + this->config.livenessInterval;
    this->startWorkerLocked();
    rfs_log("Watching " + this->rootPath + " (generation " + std::to_string(this->counters.generation) + ")",
            "ProjectWatcher");
    return {};
}

auto ProjectWatcher::subscribe(std::string_view path, Callback callback, SubscribeOptions options) -> Expected<CancelFn> {
    if (auto ready = this->init(); !ready)
        return std::unexpected(ready.error());
    return this->subscribeSync(path, std::move(callback), options);
}

auto ProjectWatcher::subscribeSync(std::string_view path, Callback callback, SubscribeOptions options) -> Expected<CancelFn> {
    auto resolved = resolve_real_path(path);
    if (!resolved)
        return std::unexpected(resolved.error());

    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->currentState == State::Closed)
        return std::unexpected(Error{Error::Code::AlreadyClosed, "ProjectWatcher closed: " + this->rootPath});
    if (this->currentState != State::Initialized && !this->recovering)
        return std::unexpected(
                Error{Error::Code::NotInitialized, "ProjectWatcher not initialized; call init() first: " + this->rootPath});

    auto const id = this->nextSubscriptionId++;
    this->subscriptions.emplace(id, Subscription{std::move(*resolved), options.watchChildren, std::move(callback)});

    std::weak_ptr<ProjectWatcher> weakSelf = this->weak_from_this();
    return CancelFn([weakSelf, id]() {
        if (auto self = weakSelf.lock()) {
            std::lock_guard<std::mutex> lock(self->mutex);
            self->subscriptions.erase(id);
        }
    });
}

auto ProjectWatcher::close() -> void {
    this->teardown(State::Uninitialized);
    rfs_log("Closed watcher for " + this->rootPath, "ProjectWatcher");
}

auto ProjectWatcher::teardown(State finalState) -> void {
    this->stopWorker();
    std::unique_ptr<WatchSubscription> subscription;
    {
        std::lock_guard<std::mutex> rebuild(this->rebuildMutex);
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->currentState == State::Closed)
            return;
        subscription = std::move(this->osSubscription);
        this->subscriptions.clear();
        this->pending.clear();
        this->flushDeadline.reset();
        this->reinitializeDeadline.reset();
        this->pendingReason.reset();
        this->fingerprint.reset();
        this->waitingForRoot = false;
        this->recovering     = false;
        this->currentState   = finalState;
        ++this->initAttempt;
        this->cv.notify_all();
    }
    // A rebuild that finished between the first stop and the rebuild lock may have restarted it.
    this->stopWorker();
    subscription.reset();
}

auto ProjectWatcher::reinitialize(ReinitializeReason reason) -> Expected<void> {
    return this->performReinitialize(reason);
}

auto ProjectWatcher::scheduleReinitialize(ReinitializeReason reason) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->currentState == State::Closed || (this->currentState == State::Uninitialized && !this->recovering))
        return;
    this->scheduleReinitializeLocked(reason);
}

auto ProjectWatcher::setReinitializeHook(ReinitializeHook hook) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->reinitializeHook = std::move(hook);
}

auto ProjectWatcher::handleEvents(std::vector<WatchEvent> events) -> void {
    std::vector<WatchEvent> kept;
    kept.reserve(events.size());
    for (auto& event : events) {
        auto relative = relative_path(this->rootPath, event.path);
        if (!relative.empty() && this->ignore.matches(relative))
            continue;
        kept.push_back(std::move(event));
    }
    if (kept.empty())
        return;

    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->currentState == State::Closed || (this->currentState == State::Uninitialized && !this->recovering))
        return;
    this->pending.insert(this->pending.end(), std::make_move_iterator(kept.begin()), std::make_move_iterator(kept.end()));
    this->flushDeadline = std::chrono::steady_clock::now() + this->config.debounce;
    this->wakeWorkerLocked();
}

auto ProjectWatcher::handleError(WatchError error) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->currentState == State::Closed || (this->currentState == State::Uninitialized && !this->recovering))
        return;
    if (error.kind == WatchError::Kind::EventsDropped) {
        if (this->pendingReason)
            return;
        rfs_log("Events dropped under " + this->rootPath + ", scheduling rebuild", "ProjectWatcher", "WARN");
        this->scheduleReinitializeLocked(ReinitializeReason::DropEvents);
        return;
    }
    rfs_log("Watcher error under " + this->rootPath + ": " + error.message + ", scheduling rebuild", "ProjectWatcher", "ERROR");
    this->counters.lastError = error.message;
    this->scheduleReinitializeLocked(ReinitializeReason::WatcherError);
}

auto ProjectWatcher::flushNow() -> void {
    std::vector<WatchEvent> batch;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->flushDeadline.reset();
        batch = std::exchange(this->pending, {});
    }
    this->deliver(std::move(batch));
}

auto ProjectWatcher::state() const -> State {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->currentState;
}

auto ProjectWatcher::isInitialized() const -> bool {
    return this->state() == State::Initialized;
}

auto ProjectWatcher::generation() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->counters.generation;
}

auto ProjectWatcher::subscriptionCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->subscriptions.size();
}

auto ProjectWatcher::runtimeStatus() const -> RuntimeStatus {
    std::lock_guard<std::mutex> lock(this->mutex);
    RuntimeStatus status;
    status.root              = this->rootPath;
    status.state             = this->currentState;
    status.initialized       = this->currentState == State::Initialized;
    status.recovering        = this->recovering;
    status.subscriptionCount = this->subscriptions.size();
    status.pendingEventCount = this->pending.size();
    status.counters          = this->counters;
    return status;
}

auto ProjectWatcher::matches(WatchEvent const& event, std::string_view subscribedPath, bool watchChildren) -> bool {
    if (watchChildren)
        return is_path_prefix(subscribedPath, event.path);
    return event.path == subscribedPath || parent_path(event.path) == subscribedPath;
}

auto ProjectWatcher::fingerprintRoot() const -> std::optional<Fingerprint> {
    struct ::stat st{};
    if (::lstat(this->rootPath.c_str(), &st) != 0)
        return std::nullopt;
    return Fingerprint{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};
}

auto ProjectWatcher::openBackend() -> Expected<std::unique_ptr<WatchSubscription>> {
    return this->backend->subscribe(
            this->rootPath,
            this->ignore,
            [this](std::vector<WatchEvent> events) { this->handleEvents(std::move(events)); },
            [this](WatchError error) { this->handleError(std::move(error)); });
}

auto ProjectWatcher::startWorkerLocked() -> void {
    if (this->worker.joinable())
        return;
    this->worker = std::jthread([this](std::stop_token token) { this->workerLoop(token); });
}

auto ProjectWatcher::stopWorker() -> void {
    std::jthread toJoin;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        toJoin = std::move(this->worker);
    }
    if (toJoin.joinable()) {
        toJoin.request_stop();
        toJoin.join();
    }
}

auto ProjectWatcher::wakeWorkerLocked() -> void {
    this->wake = true;
    this->cv.notify_all();
}

auto ProjectWatcher::scheduleReinitializeLocked(ReinitializeReason reason) -> void {
    this->pendingReason = reason;
    if (this->reinitializeDeadline)
        return;
    this->reinitializeDeadline = std::chrono::steady_clock::now() + this->config.recoveryInterval;
    this->startWorkerLocked();
    this->wakeWorkerLocked();
}

auto ProjectWatcher::workerLoop(std::stop_token token) -> void {
    using Clock = std::chrono::steady_clock;
    std::unique_lock<std::mutex> lock(this->mutex);
    while (!token.stop_requested()) {
        auto const now = Clock::now();
        if (this->flushDeadline && now >= *this->flushDeadline) {
            this->flushDeadline.reset();
            auto batch = std::exchange(this->pending, {});
            lock.unlock();
            this->deliver(std::move(batch));
            lock.lock();
            continue;
        }
        if (this->reinitializeDeadline && now >= *this->reinitializeDeadline) {
            this->reinitializeDeadline.reset();
            auto const reason = this->pendingReason.value_or(ReinitializeReason::WatcherError);
            this->pendingReason.reset();
            lock.unlock();
            if (auto rebuilt = this->performReinitialize(reason); !rebuilt)
                rfs_log("Rebuild of " + this->rootPath + " failed: " + describeError(rebuilt.error()), "ProjectWatcher", "WARN");
            lock.lock();
            continue;
        }
        bool const livenessDue = this->currentState == State::Initialized && !this->reinitializeDeadline;
        if (livenessDue && now >= this->nextLivenessCheck) {
            this->nextLivenessCheck = now + this->config.livenessInterval;
            lock.unlock();
            this->checkLiveness();
            lock.lock();
            continue;
        }

        std::optional<Clock::time_point> next;
        auto consider = [&](Clock::time_point candidate) {
            if (!next || candidate < *next)
                next = candidate;
        };
        if (this->flushDeadline)
            consider(*this->flushDeadline);
        if (this->reinitializeDeadline)
            consider(*this->reinitializeDeadline);
        if (livenessDue)
            consider(this->nextLivenessCheck);

        this->wake = false;
        if (next)
            this->cv.wait_until(lock, token, *next, [this] { return this->wake; });
        else
            this->cv.wait(lock, token, [this] { return this->wake; });
    }
}

auto ProjectWatcher::performReinitialize(ReinitializeReason reason) -> Expected<void> {
    std::lock_guard<std::mutex> rebuild(this->rebuildMutex);

    std::unique_ptr<WatchSubscription> old;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->currentState == State::Closed)
            return std::unexpected(Error{Error::Code::AlreadyClosed, "ProjectWatcher closed: " + this->rootPath});
        if (this->currentState == State::Uninitialized && !this->recovering)
            return std::unexpected(Error{Error::Code::NotInitialized, "ProjectWatcher not initialized: " + this->rootPath});
        old                = std::move(this->osSubscription);
        this->currentState = State::Initializing;
        this->recovering   = true;
        this->fingerprint.reset();
    }
    old.reset();

    std::error_code ec;
    if (!std::filesystem::exists(this->rootPath, ec)) {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->waitingForRoot)
            rfs_log("Project directory missing, waiting for " + this->rootPath, "ProjectWatcher", "WARN");
        this->waitingForRoot = true;
        this->scheduleReinitializeLocked(ReinitializeReason::MissingProjectDirectory);
        return std::unexpected(Error{Error::Code::NotFound, "Project directory missing: " + this->rootPath});
    }

    auto opened = this->openBackend();
    auto print  = this->fingerprintRoot();

    ReinitializeHook hook;
    std::uint64_t    generation = 0;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!opened) {
            this->counters.lastError = describeError(opened.error());
            this->scheduleReinitializeLocked(reason);
            return std::unexpected(opened.error());
        }
        this->osSubscription = std::move(*opened);
        this->fingerprint    = print;
        this->currentState   = State::Initialized;
        this->recovering     = false;
        this->waitingForRoot = false;
        ++this->counters.generation;
        this->counters.markReinitialized(reason);
        this->nextLivenessCheck = std::chrono::steady_clock::now() + this->config.livenessInterval;
        this->startWorkerLocked();
        this->wakeWorkerLocked();
        hook       = this->reinitializeHook;
        generation = this->counters.generation;
    }
    rfs_log("Rebuilt watcher for " + this->rootPath + " (reason " + std::string(reinitializeReasonName(reason))
                    + ", generation " + std::to_string(generation) + ")",
            "ProjectWatcher");
    if (hook)
        hook(reason, generation);
    return {};
}

auto ProjectWatcher::checkLiveness() -> void {
    auto current = this->fingerprintRoot();
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->currentState != State::Initialized || this->reinitializeDeadline)
        return;
    if (!current) {
        rfs_log("Project directory missing: " + this->rootPath, "ProjectWatcher", "WARN");
        this->scheduleReinitializeLocked(ReinitializeReason::MissingProjectDirectory);
        return;
    }
    if (!this->fingerprint) {
        this->fingerprint = current;
        return;
    }
    if (*current != *this->fingerprint) {
        rfs_log("Project directory replaced: " + this->rootPath, "ProjectWatcher", "WARN");
        this->scheduleReinitializeLocked(ReinitializeReason::ProjectDirectoryReplaced);
    }
}

auto ProjectWatcher::deliver(std::vector<WatchEvent> events) -> void {
    if (events.empty())
        return;

    std::vector<std::pair<std::uint64_t, Subscription>> targets;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        targets.reserve(this->subscriptions.size());
        for (auto const& [id, subscription] : this->subscriptions)
            targets.emplace_back(id, subscription);
    }
    rfs_log("Flushing " + std::to_string(events.size()) + " events to " + std::to_string(targets.size())
                    + " subscriptions",
            "ProjectWatcher");

    for (auto& [id, subscription] : targets) {
        std::vector<WatchEvent> matched;
        for (auto const& event : events) {
            if (matches(event, subscription.path, subscription.watchChildren))
                matched.push_back(event);
        }
        if (matched.empty())
            continue;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            if (!this->subscriptions.contains(id))
                continue;
        }
        try {
            subscription.callback(matched);
        } catch (std::exception const& ex) {
            rfs_log("Callback error for " + subscription.path + ": " + ex.what(), "ProjectWatcher", "ERROR");
            std::lock_guard<std::mutex> lock(this->mutex);
            ++this->counters.callbackFailures;
            this->counters.lastError = ex.what();
        }
    }
}

auto projectWatcherStateName(ProjectWatcher::State state) -> std::string_view {
    switch (state) {
    case ProjectWatcher::State::Uninitialized:
        return "uninitialized";
    case ProjectWatcher::State::Initializing:
        return "initializing";
    case ProjectWatcher::State::Initialized:
        return "initialized";
    case ProjectWatcher::State::Closed:
        return "closed";
    }
    return "uninitialized";
}

} // namespace RFS
