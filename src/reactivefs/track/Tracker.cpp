#include "track/Tracker.hpp"
#include "cell/CellBase.hpp"
#include "log/TaggedLogger.hpp"

namespace RFS {

namespace {
thread_local Tracker* currentTracker = nullptr;
} // namespace

auto Tracker::record(std::shared_ptr<CellBase> cell, std::uint64_t version) -> void {
    Tracker* enclosing = nullptr;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->dependencies.add(cell, version);
        enclosing = this->parent;
    }
    if (enclosing != nullptr)
        enclosing->record(std::move(cell), version);
}

auto Tracker::takeDependencies() -> DependencySet {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        taken = std::move(this->dependencies);
    this->dependencies.clear();
    rfs_log("Tracker collected " + std::to_string(taken.size()) + " dependencies", "Tracker");
    return taken;
}

auto Tracker::dependencyCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->dependencies.size();
}

auto Tracker::current() noexcept -> Tracker* {
    return currentTracker;
}

TrackingScope::TrackingScope(Tracker& tracker)
    : previous(currentTracker) {
    if (this->previous != nullptr && this->previous != &tracker) {
        std::lock_guard<std::mutex> lock(tracker.mutex);
        if (tracker.parent == nullptr)
            tracker.parent = this->previous;
    }
    currentTracker = &tracker;
}

TrackingScope::~TrackingScope() {
    currentTracker = this->previous;
}

} // namespace RFS
