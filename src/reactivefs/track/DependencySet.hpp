#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace RFS {

class CellBase;

/**
 * DependencySet - the cells one tracked execution read, with the version each
 * had when it was read. A cell read several times keeps its earliest observed
 * version, so any change during the execution leaves the set stale.
 */
class DependencySet {
public:
    struct Entry {
        std::shared_ptr<CellBase> cell;
        std::uint64_t             version = 0;
    };

    auto add(std::shared_ptr<CellBase> cell, std::uint64_t version) -> void;

    // True if any member's current version differs from the recorded one.
    [[nodiscard]] auto isStale() const -> bool;
    [[nodiscard]] auto contains(CellBase const& cell) const -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return this->items.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return this->items.empty(); }
    [[nodiscard]] auto entries() const noexcept -> std::vector<Entry> const& { return this->items; }

    auto clear() -> void;

private:
    std::vector<Entry>                               items;
    phmap::flat_hash_map<std::uint64_t, std::size_t> indexById;
};

} // namespace RFS
