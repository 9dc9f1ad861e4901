#pragma once
#include "core/Error.hpp"
#include "watch/ProjectWatcher.hpp"
#include "watch/WatchBackend.hpp"
#include "watch/WatchEvent.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RFS {

struct WatcherPoolOptions {
    ProjectWatcherOptions watcher;
    // nullptr selects makeDefaultWatchBackend().
    std::shared_ptr<WatchBackend> backend;
};

struct WatchAcquireOptions {
    // Also report changes anywhere below the path, not only direct children.
    bool recursive = false;
};

namespace detail {
struct WatcherPoolState;
}

/**
 * WatchHandle - one acquisition of a pooled path subscription.
 *
 * Releasing the last handle for a path cancels the underlying subscription.
 * release() is idempotent and the destructor releases. A handle that outlives
 * its pool is inert.
 */
class WatchHandle {
public:
    WatchHandle() = default;
    ~WatchHandle();

    WatchHandle(WatchHandle&& other) noexcept;
    WatchHandle& operator=(WatchHandle&& other) noexcept;
    WatchHandle(WatchHandle const&)            = delete;
    WatchHandle& operator=(WatchHandle const&) = delete;

    auto release() -> void;

    [[nodiscard]] auto active() const noexcept -> bool { return this->listenerId != 0; }
    // Active, and the pool still delivers events for it. False once the pool
    // has closed its root or lost its watcher to a failed replacement.
    [[nodiscard]] auto live() const -> bool;
    [[nodiscard]] auto path() const noexcept -> std::string const& { return this->watchedPath; }
    explicit operator bool() const noexcept { return this->active(); }

private:
    friend class WatcherPool;
    WatchHandle(std::weak_ptr<detail::WatcherPoolState> pool, std::string path, bool recursive, std::uint64_t listenerId);

    std::weak_ptr<detail::WatcherPoolState> pool;
    std::string                             watchedPath;
    bool                                    recursive  = false;
    std::uint64_t                           listenerId = 0;
};

/**
 * WatcherPool - owns the ProjectWatcher of every watched root.
 *
 * Roots are keyed by their normalized path and watched at their
 * symlink-resolved location. acquireWatcher() finds the innermost root that
 * governs a path and shares one subscription between all acquisitions of the
 * same (path, recursive) pair; events are reported in the caller's path
 * namespace even when the root is reached through a symlink.
 *
 * Re-initializing a root that now resolves somewhere else replaces its
 * watcher: the old one is closed, the generation moves on with reason
 * project-dir-replaced and live acquisitions are moved to the new watcher.
 * Every rebuild, internal or replacement, is announced to reinitialize
 * listeners so caches can drop what the gap may have hidden.
 */
class WatcherPool {
public:
    using ChangeCallback       = std::function<void(std::vector<WatchEvent> const&)>;
    using ReinitializeListener = std::function<void(std::string const& root, ReinitializeReason reason, std::uint64_t generation)>;
    using ListenerId           = std::uint64_t;

    using AcquireOptions = WatchAcquireOptions;

    struct RootStatus {
        std::string                   root;
        std::string                   resolvedRoot;
        ProjectWatcher::RuntimeStatus watcher;
        // Acquisitions currently routed through this root.
        std::size_t                   activeWatcherCount = 0;
        std::optional<std::string>    initError;
    };

    struct PoolStatus {
        bool                    initialized        = false;
        std::size_t             activeWatcherCount = 0;
        std::vector<RootStatus> roots;
    };

    explicit WatcherPool(WatcherPoolOptions options = {});
    ~WatcherPool();

    WatcherPool(WatcherPool const&)            = delete;
    WatcherPool& operator=(WatcherPool const&) = delete;

    // Creates, retries or replaces the watcher for rootDir. A failed attempt is
    // recorded in runtimeStatus() and returned.
    auto init(std::string_view rootDir) -> Expected<void>;

    // True when at least one root has an initialized watcher.
    [[nodiscard]] auto isInitialized() const -> bool;
    [[nodiscard]] auto isInitialized(std::string_view rootDir) const -> bool;

    // Fails with NotInitialized when no initialized root governs path.
    auto acquireWatcher(std::string_view path, ChangeCallback onChange, AcquireOptions options = {}) -> Expected<WatchHandle>;

    // Distinct pooled subscriptions, not acquisitions.
    [[nodiscard]] auto activeWatcherCount() const -> std::size_t;

    // Closes every watcher and forgets every root; outstanding handles become inert.
    auto closeAllWatchers() -> void;

    auto reinitialize(std::string_view rootDir, ReinitializeReason reason = ReinitializeReason::Manual) -> Expected<void>;

    auto addReinitializeListener(ReinitializeListener listener) -> ListenerId;
    auto removeReinitializeListener(ListenerId id) -> bool;

    [[nodiscard]] auto watchedRoots() const -> std::vector<std::string>;
    [[nodiscard]] auto generation(std::string_view rootDir) const -> Expected<std::uint64_t>;
    [[nodiscard]] auto runtimeStatus() const -> PoolStatus;
    [[nodiscard]] auto options() const -> WatcherPoolOptions const&;

private:
    std::shared_ptr<detail::WatcherPoolState> state;
};

} // namespace RFS
