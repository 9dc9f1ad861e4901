#include "track/DependencySet.hpp"
#include "cell/CellBase.hpp"

#include <algorithm>

namespace RFS {

auto DependencySet::add(std::shared_ptr<CellBase> cell, std::uint64_t version) -> void {
    if (!cell)
        return;
    auto const cellId = cell->id();
    if (auto it = this->indexById.find(cellId); it != this->indexById.end()) {
        auto& entry   = this->items[it->second];
        entry.version = std::min(entry.version, version);
        return;
    }
    this->indexById.emplace(cellId, this->items.size());
    this->items.push_back(Entry{std::move(cell), version});
}

auto DependencySet::isStale() const -> bool {
    return std::any_of(this->items.begin(), this->items.end(), [](Entry const& entry) {
        return entry.cell->version() != entry.version;
    });
}

auto DependencySet::contains(CellBase const& cell) const -> bool {
    return this->indexById.contains(cell.id());
}

auto DependencySet::clear() -> void {
    this->items.clear();
    this->indexById.clear();
}

} // namespace RFS
