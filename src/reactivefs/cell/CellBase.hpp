#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include <parallel_hashmap/phmap.h>

namespace RFS {

/**
 * CellBase - type-erased half of an invalidatable cell
 *
 * Holds the identity, the version counter and the listener registry that
 * every Cell<T> shares, so trackers and change signals can work with cells of
 * any value type.
 *
 * Invariants
 * ----------
 * - The version starts at 0 and increases by one on every invalidate() or
 *   set(); reading never changes it.
 * - Listeners are invoked after the version has been bumped and without any
 *   cell lock held, so a listener may read or invalidate the cell again.
 * - Listener ids are never reused.
 */
class CellBase : public std::enable_shared_from_this<CellBase> {
public:
    using ListenerId = std::uint64_t;
    using Listener   = std::function<void()>;

    CellBase();
    virtual ~CellBase() = default;

    CellBase(CellBase const&)            = delete;
    CellBase& operator=(CellBase const&) = delete;

    [[nodiscard]] auto id() const noexcept -> std::uint64_t { return this->identity; }
    [[nodiscard]] auto version() const noexcept -> std::uint64_t {
        return this->versionCounter.load(std::memory_order_acquire);
    }

    // Discards the cached value and bumps the version. Does not recompute.
    auto invalidate() -> void;

    auto addListener(Listener listener) -> ListenerId;
    auto removeListener(ListenerId listenerId) -> bool;
    [[nodiscard]] auto listenerCount() const -> std::size_t;

protected:
    virtual auto discardValueLocked() -> void = 0;

    // Caller holds valueMutex.
    auto bumpVersionLocked() -> void;
    auto notifyListeners() -> void;
    // Reports the read to the tracker installed on the calling thread, if any.
    auto recordRead(std::uint64_t observedVersion) -> void;

    mutable std::mutex valueMutex;

private:
    std::uint64_t              identity;
    std::atomic<std::uint64_t> versionCounter{0};

    mutable std::mutex                         listenerMutex;
    phmap::flat_hash_map<ListenerId, Listener> listeners;
    ListenerId                                 nextListenerId = 1;
};

} // namespace RFS
