#include "watch/WatcherPool.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <utility>

#include <parallel_hashmap/phmap.h>

namespace RFS {

namespace {

// Moves path from under `from` to the same place under `to`.
auto rebase(std::string_view from, std::string_view to, std::string_view path) -> std::string {
    auto relative = relative_path(from, path);
    if (relative.empty())
        return std::string(to);
    std::string out(to);
    if (out != "/")
        out.push_back('/');
    out.append(relative);
    return out;
}

} // namespace

namespace detail {

struct RegistrationKey {
    std::string path;
    bool        recursive = false;

    auto operator==(RegistrationKey const&) const -> bool = default;

    friend auto hash_value(RegistrationKey const& key) -> std::size_t {
        return phmap::HashState().combine(0, key.path, key.recursive);
    }
};

struct RootEntry {
    std::string                     root;
    std::string                     resolvedRoot;
    std::shared_ptr<ProjectWatcher> watcher;
    std::optional<Error>            initError;
    // Failures of acquisition callbacks dispatched by the pool.
    std::uint64_t              callbackFailures = 0;
    std::optional<std::string> lastCallbackError;
    // Set when the watcher was replaced and the replacement has not started yet.
    bool replacementPending = false;
};

struct Registration {
    std::string                                                root;
    std::string                                                watchPath;
    // watchPath with every symlink resolved; the form events arrive in.
    std::string                                                resolvedPath;
    phmap::flat_hash_map<std::uint64_t, WatcherPool::ChangeCallback> listeners;
    // Empty while the governing watcher is down.
    ProjectWatcher::CancelFn cancel;
};

struct WatcherPoolState : std::enable_shared_from_this<WatcherPoolState> {
    explicit WatcherPoolState(WatcherPoolOptions options)
        : options(std::move(options)) {
        if (!this->options.backend)
            this->options.backend = makeDefaultWatchBackend();
    }

    WatcherPoolOptions options;

    mutable std::mutex                                                        mutex;
    phmap::flat_hash_map<std::string, RootEntry>                              roots;
    phmap::flat_hash_map<RegistrationKey, Registration>                       registrations;
    phmap::flat_hash_map<WatcherPool::ListenerId, WatcherPool::ReinitializeListener> reinitializeListeners;
    std::uint64_t                                                             nextId = 1;

    // Innermost root whose requested or resolved path contains path.
    auto governingRootLocked(std::string_view path) -> RootEntry* {
        RootEntry*  best       = nullptr;
        std::size_t bestLength = 0;
        for (auto& [key, entry] : this->roots) {
            for (auto const* candidate : {&entry.root, &entry.resolvedRoot}) {
                if (is_path_prefix(*candidate, path) && (!best || candidate->size() > bestLength)) {
                    best       = &entry;
                    bestLength = candidate->size();
                }
            }
        }
        return best;
    }

    auto toWatchPath(RootEntry const& entry, std::string const& path) const -> std::string {
        if (entry.root != entry.resolvedRoot && is_path_prefix(entry.root, path))
            return rebase(entry.root, entry.resolvedRoot, path);
        return path;
    }

    auto subscribeLocked(RootEntry& entry, RegistrationKey const& key, Registration& registration) -> Expected<void> {
        registration.watchPath = this->toWatchPath(entry, key.path);
        auto resolved          = resolve_real_path(registration.watchPath);
        if (!resolved)
            return std::unexpected(resolved.error());
        std::weak_ptr<WatcherPoolState> weakSelf = this->weak_from_this();
        auto cancel = entry.watcher->subscribeSync(
                *resolved,
                [weakSelf, key](std::vector<WatchEvent> const& events) {
                    if (auto self = weakSelf.lock())
                        self->dispatch(key, events);
                },
                ProjectWatcher::SubscribeOptions{.watchChildren = key.recursive});
        if (!cancel)
            return std::unexpected(cancel.error());
        registration.cancel       = std::move(*cancel);
        registration.resolvedPath = std::move(*resolved);
        return {};
    }

    auto resubscribeRootLocked(RootEntry& entry) -> void {
        for (auto& [key, registration] : this->registrations) {
            if (registration.root != entry.root || registration.cancel)
                continue;
            if (auto subscribed = this->subscribeLocked(entry, key, registration); !subscribed)
                rfs_log("Resubscribe of " + key.path + " failed: " + describeError(subscribed.error()), "WatcherPool", "WARN");
        }
    }

    auto installHook(std::shared_ptr<ProjectWatcher> const& watcher, std::string root) -> void {
        std::weak_ptr<WatcherPoolState> weakSelf = this->weak_from_this();
        watcher->setReinitializeHook([weakSelf, root = std::move(root)](ReinitializeReason reason, std::uint64_t generation) {
            if (auto self = weakSelf.lock())
                self->announce(root, reason, generation);
        });
    }

    auto dispatch(RegistrationKey const& key, std::vector<WatchEvent> const& events) -> void {
        std::vector<WatcherPool::ChangeCallback> callbacks;
        std::vector<WatchEvent>                  translated;
        std::string                              rootKey;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            auto                        found = this->registrations.find(key);
            if (found == this->registrations.end())
                return;
            rootKey    = found->second.root;
            translated = events;
            // Report under the path the caller asked for, not its symlink target.
            auto const& resolvedPath = found->second.resolvedPath;
            if (!resolvedPath.empty() && resolvedPath != key.path) {
                for (auto& event : translated) {
                    if (is_path_prefix(resolvedPath, event.path))
                        event.path = rebase(resolvedPath, key.path, event.path);
                }
            }
            callbacks.reserve(found->second.listeners.size());
            for (auto const& [id, callback] : found->second.listeners)
                callbacks.push_back(callback);
        }

        for (auto const& callback : callbacks) {
            try {
                callback(translated);
            } catch (std::exception const& ex) {
                rfs_log("Watch callback for " + key.path + " failed: " + ex.what(), "WatcherPool", "ERROR");
                std::lock_guard<std::mutex> lock(this->mutex);
                if (auto entry = this->roots.find(rootKey); entry != this->roots.end()) {
                    ++entry->second.callbackFailures;
                    entry->second.lastCallbackError = ex.what();
                }
            }
        }
    }

    auto announce(std::string const& root, ReinitializeReason reason, std::uint64_t generation) -> void {
        std::vector<WatcherPool::ReinitializeListener> listeners;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            listeners.reserve(this->reinitializeListeners.size());
            for (auto const& [id, listener] : this->reinitializeListeners)
                listeners.push_back(listener);
        }
        rfs_log("Root " + root + " reinitialized (" + std::string(reinitializeReasonName(reason)) + ", generation "
                        + std::to_string(generation) + ")",
                "WatcherPool");
        for (auto const& listener : listeners) {
            try {
                listener(root, reason, generation);
            } catch (std::exception const& ex) {
                rfs_log("Reinitialize listener failed: " + std::string(ex.what()), "WatcherPool", "ERROR");
            }
        }
    }

    // The acquisition still exists and its subscription is attached to a watcher.
    auto isLive(std::string const& path, bool recursive, std::uint64_t listenerId) const -> bool {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto                        found = this->registrations.find(RegistrationKey{path, recursive});
        return found != this->registrations.end() && found->second.listeners.contains(listenerId)
               && static_cast<bool>(found->second.cancel);
    }

    auto release(std::string const& path, bool recursive, std::uint64_t listenerId) -> void {
        ProjectWatcher::CancelFn cancel;
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            auto                        found = this->registrations.find(RegistrationKey{path, recursive});
            if (found == this->registrations.end())
                return;
            found->second.listeners.erase(listenerId);
            if (found->second.listeners.empty()) {
                cancel = std::move(found->second.cancel);
                this->registrations.erase(found);
            }
        }
        if (cancel)
            cancel();
    }
};

} // namespace detail

WatchHandle::WatchHandle(std::weak_ptr<detail::WatcherPoolState> pool, std::string path, bool recursive, std::uint64_t listenerId)
    : pool(std::move(pool)), watchedPath(std::move(path)), recursive(recursive), listenerId(listenerId) {}

WatchHandle::~WatchHandle() {
    this->release();
}

WatchHandle::WatchHandle(WatchHandle&& other) noexcept
    : pool(std::move(other.pool)),
      watchedPath(std::move(other.watchedPath)),
      recursive(other.recursive),
      listenerId(std::exchange(other.listenerId, 0)) {}

WatchHandle& WatchHandle::operator=(WatchHandle&& other) noexcept {
    if (this != &other) {
        this->release();
        this->pool        = std::move(other.pool);
        this->watchedPath = std::move(other.watchedPath);
        this->recursive   = other.recursive;
        this->listenerId  = std::exchange(other.listenerId, 0);
    }
    return *this;
}

auto WatchHandle::live() const -> bool {
    if (this->listenerId == 0)
        return false;
    auto state = this->pool.lock();
    return state && state->isLive(this->watchedPath, this->recursive, this->listenerId);
}

auto WatchHandle::release() -> void {
    auto const id = std::exchange(this->listenerId, 0);
    if (id == 0)
        return;
    if (auto state = this->pool.lock())
        state->release(this->watchedPath, this->recursive, id);
    this->pool.reset();
}

WatcherPool::WatcherPool(WatcherPoolOptions options)
    : state(std::make_shared<detail::WatcherPoolState>(std::move(options))) {}

WatcherPool::~WatcherPool() {
    this->closeAllWatchers();
}

auto WatcherPool::init(std::string_view rootDir) -> Expected<void> {
    auto normalized = normalize_path(rootDir);
    if (!normalized)
        return std::unexpected(normalized.error());
    auto resolved = resolve_real_path(*normalized);
    if (!resolved)
        return std::unexpected(resolved.error());

    std::shared_ptr<ProjectWatcher> watcher;
    std::shared_ptr<ProjectWatcher> replaced;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        auto                        found = this->state->roots.find(*normalized);
        if (found != this->state->roots.end() && found->second.resolvedRoot == *resolved) {
            watcher = found->second.watcher;
        } else {
            WatcherCounters                   carried;
            std::optional<ReinitializeReason> reason;
            if (found != this->state->roots.end()) {
                carried = found->second.watcher->runtimeStatus().counters;
                reason  = ReinitializeReason::ProjectDirectoryReplaced;
            }
            watcher = ProjectWatcher::Create(*resolved, this->state->options.backend, this->state->options.watcher, carried, reason);
            this->state->installHook(watcher, *normalized);
            if (found == this->state->roots.end()) {
                this->state->roots.emplace(*normalized, detail::RootEntry{*normalized, *resolved, watcher, std::nullopt});
            } else {
                rfs_log("Root " + *normalized + " moved from " + found->second.resolvedRoot + " to " + *resolved, "WatcherPool", "WARN");
                replaced                         = std::exchange(found->second.watcher, watcher);
                found->second.resolvedRoot       = *resolved;
                found->second.replacementPending = true;
                for (auto& [key, registration] : this->state->registrations) {
                    if (registration.root == *normalized)
                        registration.cancel = {};
                }
            }
        }
    }
    if (replaced)
        replaced->close();

    if (watcher->isInitialized())
        return {};
    auto result = watcher->init();

    bool announceReplacement = false;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        auto                        found = this->state->roots.find(*normalized);
        if (found == this->state->roots.end() || found->second.watcher != watcher)
            return result;
        if (!result) {
            found->second.initError = result.error();
            rfs_log("Watcher for " + *normalized + " failed to start: " + describeError(result.error()), "WatcherPool", "ERROR");
            return result;
        }
        found->second.initError.reset();
        this->state->resubscribeRootLocked(found->second);
        announceReplacement = std::exchange(found->second.replacementPending, false);
    }
    if (announceReplacement)
        this->state->announce(*normalized, ReinitializeReason::ProjectDirectoryReplaced, watcher->generation());
    return result;
}

auto WatcherPool::isInitialized() const -> bool {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    return std::any_of(this->state->roots.begin(), this->state->roots.end(), [](auto const& item) {
        return item.second.watcher->isInitialized();
    });
}

auto WatcherPool::isInitialized(std::string_view rootDir) const -> bool {
    auto normalized = normalize_path(rootDir);
    if (!normalized)
        return false;
    std::lock_guard<std::mutex> lock(this->state->mutex);
    auto                        found = this->state->roots.find(*normalized);
    return found != this->state->roots.end() && found->second.watcher->isInitialized();
}

auto WatcherPool::acquireWatcher(std::string_view path, ChangeCallback onChange, AcquireOptions options) -> Expected<WatchHandle> {
    auto normalized = normalize_path(path);
    if (!normalized)
        return std::unexpected(normalized.error());

    std::lock_guard<std::mutex> lock(this->state->mutex);
    auto*                       entry = this->state->governingRootLocked(*normalized);
    if (!entry)
        return std::unexpected(Error{Error::Code::NotInitialized, "No watched root governs " + *normalized});

    detail::RegistrationKey key{*normalized, options.recursive};
    auto                    found = this->state->registrations.find(key);
    if (found == this->state->registrations.end()) {
        detail::Registration registration;
        registration.root = entry->root;
        if (auto subscribed = this->state->subscribeLocked(*entry, key, registration); !subscribed)
            return std::unexpected(subscribed.error());
        found = this->state->registrations.emplace(key, std::move(registration)).first;
        rfs_log("Watching " + *normalized + (options.recursive ? " recursively" : ""), "WatcherPool");
    } else if (!found->second.cancel) {
        // Detached from a replaced watcher; a handle on it would never see an event.
        if (auto subscribed = this->state->subscribeLocked(*entry, key, found->second); !subscribed)
            return std::unexpected(subscribed.error());
    }

    auto const id = this->state->nextId++;
    found->second.listeners.emplace(id, std::move(onChange));
    return WatchHandle(this->state, *normalized, options.recursive, id);
}

auto WatcherPool::activeWatcherCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    return this->state->registrations.size();
}

auto WatcherPool::closeAllWatchers() -> void {
    std::vector<std::shared_ptr<ProjectWatcher>> watchers;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        for (auto& [root, entry] : this->state->roots)
            watchers.push_back(std::move(entry.watcher));
        this->state->roots.clear();
        this->state->registrations.clear();
    }
    for (auto& watcher : watchers)
        watcher->close();
    if (!watchers.empty())
        rfs_log("Closed " + std::to_string(watchers.size()) + " watchers", "WatcherPool");
}

auto WatcherPool::reinitialize(std::string_view rootDir, ReinitializeReason reason) -> Expected<void> {
    auto normalized = normalize_path(rootDir);
    if (!normalized)
        return std::unexpected(normalized.error());
    std::shared_ptr<ProjectWatcher> watcher;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        auto                        found = this->state->roots.find(*normalized);
        if (found == this->state->roots.end())
            return std::unexpected(Error{Error::Code::NotFound, "Root not watched: " + *normalized});
        watcher = found->second.watcher;
    }
    return watcher->reinitialize(reason);
}

auto WatcherPool::addReinitializeListener(ReinitializeListener listener) -> ListenerId {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    auto const                  id = this->state->nextId++;
    this->state->reinitializeListeners.emplace(id, std::move(listener));
    return id;
}

auto WatcherPool::removeReinitializeListener(ListenerId id) -> bool {
    std::lock_guard<std::mutex> lock(this->state->mutex);
    return this->state->reinitializeListeners.erase(id) > 0;
}

auto WatcherPool::watchedRoots() const -> std::vector<std::string> {
    std::vector<std::string> roots;
    {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        for (auto const& [root, entry] : this->state->roots)
            roots.push_back(root);
    }
    std::sort(roots.begin(), roots.end());
    return roots;
}

auto WatcherPool::generation(std::string_view rootDir) const -> Expected<std::uint64_t> {
    auto normalized = normalize_path(rootDir);
    if (!normalized)
        return std::unexpected(normalized.error());
    std::lock_guard<std::mutex> lock(this->state->mutex);
    auto                        found = this->state->roots.find(*normalized);
    if (found == this->state->roots.end())
        return std::unexpected(Error{Error::Code::NotFound, "Root not watched: " + *normalized});
    return found->second.watcher->generation();
}

auto WatcherPool::runtimeStatus() const -> PoolStatus {
    PoolStatus                  status;
    std::lock_guard<std::mutex> lock(this->state->mutex);
    status.activeWatcherCount = this->state->registrations.size();
    for (auto const& [root, entry] : this->state->roots) {
        RootStatus rootStatus;
        rootStatus.root         = entry.root;
        rootStatus.resolvedRoot = entry.resolvedRoot;
        rootStatus.watcher      = entry.watcher->runtimeStatus();
        rootStatus.watcher.counters.callbackFailures += entry.callbackFailures;
        if (entry.lastCallbackError)
            rootStatus.watcher.counters.lastError = entry.lastCallbackError;
        if (entry.initError)
            rootStatus.initError = describeError(*entry.initError);
        for (auto const& [key, registration] : this->state->registrations) {
            if (registration.root == root)
                ++rootStatus.activeWatcherCount;
        }
        status.initialized = status.initialized || rootStatus.watcher.initialized;
        status.roots.push_back(std::move(rootStatus));
    }
    std::sort(status.roots.begin(), status.roots.end(), [](RootStatus const& a, RootStatus const& b) { return a.root < b.root; });
    return status;
}

auto WatcherPool::options() const -> WatcherPoolOptions const& {
    return this->state->options;
}

} // namespace RFS
