#include "cell/CellBase.hpp"
#include "log/TaggedLogger.hpp"
#include "track/Tracker.hpp"

#include <string>
#include <vector>

namespace RFS {

namespace {
std::atomic<std::uint64_t> nextCellIdentity{1};
} // namespace

CellBase::CellBase()
    : identity(nextCellIdentity.fetch_add(1, std::memory_order_relaxed)) {}

auto CellBase::invalidate() -> void {
    {
        std::lock_guard<std::mutex> lock(this->valueMutex);
        this->discardValueLocked();
        this->bumpVersionLocked();
    }
    rfs_log("Cell " + std::to_string(this->identity) + " invalidated, version=" + std::to_string(this->version()), "Cell");
    this->notifyListeners();
}

auto CellBase::addListener(Listener listener) -> ListenerId {
    std::lock_guard<std::mutex> lock(this->listenerMutex);
    auto const                  listenerId = this->nextListenerId++;
    this->listeners.emplace(listenerId, std::move(listener));
    return listenerId;
}

auto CellBase::removeListener(ListenerId listenerId) -> bool {
    std::lock_guard<std::mutex> lock(this->listenerMutex);
    return this->listeners.erase(listenerId) > 0;
}

auto CellBase::listenerCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->listenerMutex);
    return this->listeners.size();
}

auto CellBase::bumpVersionLocked() -> void {
    this->versionCounter.fetch_add(1, std::memory_order_acq_rel);
}

auto CellBase::notifyListeners() -> void {
    std::vector<Listener> toNotify;
    {
        std::lock_guard<std::mutex> lock(this->listenerMutex);
        toNotify.reserve(this->listeners.size());
        for (auto const& [_, listener] : this->listeners)
            toNotify.push_back(listener);
    }
    for (auto const& listener : toNotify)
        listener();
}

auto CellBase::recordRead(std::uint64_t observedVersion) -> void {
    auto* tracker = Tracker::current();
    if (tracker == nullptr)
        return;
    if (auto self = this->weak_from_this().lock())
        tracker->record(std::move(self), observedVersion);
}

} // namespace RFS
