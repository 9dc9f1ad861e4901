#include "cache/PathCache.hpp"
#include "cell/Cell.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"
#include "watch/WatcherPool.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <span>
#include <utility>

#include <parallel_hashmap/phmap.h>

namespace RFS {

namespace {

constexpr CacheOp AllOps[]      = {CacheOp::ReadFile, CacheOp::ReadDir, CacheOp::Stat, CacheOp::Exists};
constexpr CacheOp ListingOps[]  = {CacheOp::ReadDir, CacheOp::Stat};
constexpr CacheOp MetadataOps[] = {CacheOp::Stat, CacheOp::Exists};

struct CellKey {
    std::string path;
    CacheOp     op = CacheOp::ReadFile;

    auto operator==(CellKey const&) const -> bool = default;

    friend auto hash_value(CellKey const& key) -> std::size_t {
        return phmap::HashState().combine(0, key.path, static_cast<std::uint8_t>(key.op));
    }
};

using CellMap = phmap::parallel_flat_hash_map<CellKey,
                                              std::shared_ptr<CellBase>,
                                              phmap::Hash<CellKey>,
                                              std::equal_to<CellKey>,
                                              std::allocator<std::pair<const CellKey, std::shared_ptr<CellBase>>>,
                                              4,
                                              std::mutex>;

auto filterListing(std::vector<DirEntry> const& entries, ReadDirOptions const& options) -> std::vector<DirEntry> {
    std::vector<DirEntry> out;
    out.reserve(entries.size());
    for (auto const& entry : entries) {
        if (!options.includeHidden && !entry.name.empty() && entry.name.front() == '.')
            continue;
        if (std::find(options.exclude.begin(), options.exclude.end(), entry.name) != options.exclude.end())
            continue;
        if (options.directoriesOnly && entry.kind != EntryKind::Directory)
            continue;
        if (options.filesOnly && entry.kind != EntryKind::File)
            continue;
        out.push_back(entry);
    }
    return out;
}

} // namespace

auto cacheOpName(CacheOp op) -> std::string_view {
    switch (op) {
    case CacheOp::ReadFile:
        return "readFile";
    case CacheOp::ReadDir:
        return "readDir";
    case CacheOp::Stat:
        return "stat";
    case CacheOp::Exists:
        return "exists";
    }
    return "readFile";
}

struct PathCache::State : std::enable_shared_from_this<PathCache::State> {
    std::shared_ptr<WatcherPool> pool;
    std::shared_ptr<FileSystem>  fs;
    CellMap                      cells;

    // Guards watched; may call into the pool, which never calls back while locked.
    std::mutex                                   watchMutex;
    phmap::flat_hash_map<std::string, WatchHandle> watched;

    std::uint64_t reinitializeListener = 0;

    std::atomic<std::uint64_t> reads{0};
    std::atomic<std::uint64_t> loads{0};
    std::atomic<std::uint64_t> invalidations{0};
    std::atomic<std::uint64_t> unwatchedReads{0};

    auto ensureWatched(std::string const& path) -> bool {
        if (!this->pool)
            return false;
        // Released once watchMutex is dropped.
        WatchHandle stale;
        bool        lostWatch = false;
        bool        acquired  = false;
        {
            std::lock_guard<std::mutex> lock(this->watchMutex);
            if (auto found = this->watched.find(path); found != this->watched.end()) {
                if (found->second.live())
                    return true;
                // The pool dropped this subscription (root closed or replaced by a
                // watcher that failed to start). Events missed since then are gone.
                stale = std::move(found->second);
                this->watched.erase(found);
                lostWatch = true;
            }

            std::weak_ptr<State> weakSelf = this->weak_from_this();
            auto handle = this->pool->acquireWatcher(path, [weakSelf, path](std::vector<WatchEvent> const& events) {
                if (auto self = weakSelf.lock())
                    self->onEvents(path, events);
            });
            if (handle) {
                this->watched.emplace(path, std::move(*handle));
                acquired = true;
            } else {
                rfs_log("Unwatched read of " + path + ": " + describeError(handle.error()), "PathCache");
            }
        }
        if (lostWatch) {
            rfs_log("Watch on " + path + " was lost, dropping its cached values", "PathCache");
            this->invalidate(path, AllOps);
        }
        return acquired;
    }

    auto onEvents(std::string const& path, std::vector<WatchEvent> const& events) -> void {
        bool selfChanged     = false;
        bool childrenChanged = false;
        for (auto const& event : events) {
            if (event.path == path)
                selfChanged = true;
            else if (event.kind != WatchEventKind::Update)
                childrenChanged = true;
        }
        if (selfChanged)
            this->invalidate(path, AllOps);
        else if (childrenChanged)
            this->invalidate(path, ListingOps);
    }

    auto find(CellKey const& key) -> std::shared_ptr<CellBase> {
        std::shared_ptr<CellBase> cell;
        this->cells.if_contains(key, [&](auto const& item) { cell = item.second; });
        return cell;
    }

    auto invalidate(std::string const& path, std::span<CacheOp const> ops) -> std::size_t {
        std::size_t count = 0;
        for (auto op : ops) {
            if (auto cell = this->find(CellKey{path, op})) {
                cell->invalidate();
                ++count;
            }
        }
        this->invalidations += count;
        if (count > 0)
            rfs_log("Invalidated " + std::to_string(count) + " cells of " + path, "PathCache");
        return count;
    }

    template <typename Pred>
    auto collect(Pred&& pred) -> std::vector<std::pair<CellKey, std::shared_ptr<CellBase>>> {
        std::vector<std::pair<CellKey, std::shared_ptr<CellBase>>> out;
        this->cells.for_each([&](auto const& item) {
            if (pred(item.first))
                out.emplace_back(item.first, item.second);
        });
        return out;
    }

    auto invalidateUnder(std::string const& root) -> std::size_t {
        auto matched = this->collect([&](CellKey const& key) { return is_path_prefix(root, key.path); });
        for (auto& [key, cell] : matched)
            cell->invalidate();
        this->invalidations += matched.size();
        return matched.size();
    }

    template <typename T>
    auto read(std::string const& path, CacheOp op, std::function<Expected<T>(FileSystem&)> load) -> Expected<T> {
        ++this->reads;
        if (!this->ensureWatched(path)) {
            ++this->unwatchedReads;
            return load(*this->fs);
        }

        CellKey                   key{path, op};
        std::shared_ptr<CellBase> cell;
        std::weak_ptr<State>      weakSelf  = this->weak_from_this();
        auto                      candidate = Cell<T>::Create([weakSelf, load]() -> Expected<T> {
            auto self = weakSelf.lock();
            if (!self)
                return std::unexpected(Error{Error::Code::AlreadyClosed, "PathCache destroyed"});
            ++self->loads;
            return load(*self->fs);
        });
        bool const inserted = this->cells.try_emplace_l(key, [&](auto& item) { cell = item.second; }, candidate);
        if (inserted)
            cell = candidate;
        return std::static_pointer_cast<Cell<T>>(cell)->read();
    }
};

PathCache::PathCache(std::shared_ptr<WatcherPool> pool, std::shared_ptr<FileSystem> fs)
    : state(std::make_shared<State>()) {
    this->state->pool = std::move(pool);
    this->state->fs   = fs ? std::move(fs) : std::make_shared<LocalFileSystem>();
    if (this->state->pool) {
        std::weak_ptr<State> weakState = this->state;
        this->state->reinitializeListener = this->state->pool->addReinitializeListener(
                [weakState](std::string const& root, ReinitializeReason reason, std::uint64_t generation) {
                    auto self = weakState.lock();
                    if (!self)
                        return;
                    auto count = self->invalidateUnder(root);
                    if (auto resolved = resolve_real_path(root); resolved && *resolved != root)
                        count += self->invalidateUnder(*resolved);
                    rfs_log("Watcher for " + root + " rebuilt (" + std::string(reinitializeReasonName(reason)) + ", generation "
                                    + std::to_string(generation) + "), invalidated " + std::to_string(count) + " cells",
                            "PathCache");
                });
    }
}

PathCache::~PathCache() {
    if (this->state->pool)
        this->state->pool->removeReinitializeListener(this->state->reinitializeListener);
    this->unwatchAll();
}

auto PathCache::unwatchAll() -> void {
    phmap::flat_hash_map<std::string, WatchHandle> handles;
    {
        std::lock_guard<std::mutex> lock(this->state->watchMutex);
        handles.swap(this->state->watched);
    }
    handles.clear();
}

auto PathCache::readFile(std::string_view path) -> Expected<FileContent> {
    auto normalized = normalize_path(path);
    if (!normalized)
        return std::unexpected(normalized.error());
    std::string target = *normalized;
    return this->state->read<FileContent>(target, CacheOp::ReadFile, [target](FileSystem& fs) { return fs.readFile(target); });
}

auto PathCache::readDir(std::string_view path, ReadDirOptions const& options) -> Expected<DirListing> {
    auto normalized = normalize_path(path);
    if (!normalized)
        return std::unexpected(normalized.error());
    std::string target  = *normalized;
    auto        listing = this->state->read<DirListing>(target, CacheOp::ReadDir, [target](FileSystem& fs) { return fs.readDir(target); });
    if (!listing || !*listing)
        return listing;
    return DirListing{filterListing(**listing, options)};
}

auto PathCache::exists(std::string_view path) -> Expected<bool> {
    auto normalized = normalize_path(path);
    if (!normalized)
        return std::unexpected(normalized.error());
    std::string target = *normalized;
    return this->state->read<bool>(target, CacheOp::Exists, [target](FileSystem& fs) { return fs.exists(target); });
}

auto PathCache::stat(std::string_view path) -> Expected<StatResult> {
    auto normalized = normalize_path(path);
    if (!normalized)
        return std::unexpected(normalized.error());
    std::string target = *normalized;
    return this->state->read<StatResult>(target, CacheOp::Stat, [target](FileSystem& fs) { return fs.stat(target); });
}

auto PathCache::updateFileCache(std::string_view path, std::string content) -> Expected<void> {
    auto normalized = normalize_path(path);
    if (!normalized)
        return std::unexpected(normalized.error());
    if (auto cell = this->state->find(CellKey{*normalized, CacheOp::ReadFile}))
        std::static_pointer_cast<Cell<FileContent>>(cell)->set(FileContent{std::move(content)});
    this->state->invalidate(*normalized, MetadataOps);
    return {};
}

auto PathCache::invalidatePath(std::string_view path) -> std::size_t {
    auto normalized = normalize_path(path);
    if (!normalized)
        return 0;
    return this->state->invalidate(*normalized, AllOps);
}

auto PathCache::invalidateUnder(std::string_view root) -> std::size_t {
    auto normalized = normalize_path(root);
    if (!normalized)
        return 0;
    return this->state->invalidateUnder(*normalized);
}

auto PathCache::clearCache() -> void {
    auto all = this->state->collect([](CellKey const&) { return true; });
    this->state->cells.clear();
    for (auto& [key, cell] : all)
        cell->invalidate();
    rfs_log("Cleared " + std::to_string(all.size()) + " cells", "PathCache");
}

auto PathCache::clearCache(std::string_view prefix) -> std::size_t {
    auto normalized = normalize_path(prefix);
    if (!normalized)
        return 0;
    auto matched = this->state->collect([&](CellKey const& key) { return is_path_prefix(*normalized, key.path); });
    for (auto& [key, cell] : matched) {
        this->state->cells.erase(key);
        cell->invalidate();
    }
    return matched.size();
}

auto PathCache::getCacheSize() const -> std::size_t {
    return this->state->cells.size();
}

auto PathCache::watchedPathCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->state->watchMutex);
    return this->state->watched.size();
}

auto PathCache::stats() const -> CacheStats {
    CacheStats stats;
    stats.cellCount        = this->getCacheSize();
    stats.watchedPathCount = this->watchedPathCount();
    stats.reads            = this->state->reads.load();
    stats.loads            = this->state->loads.load();
    stats.invalidations    = this->state->invalidations.load();
    stats.unwatchedReads   = this->state->unwatchedReads.load();
    return stats;
}

auto PathCache::fileSystem() const -> std::shared_ptr<FileSystem> const& {
    return this->state->fs;
}

} // namespace RFS
