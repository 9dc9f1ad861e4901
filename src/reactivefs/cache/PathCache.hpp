#pragma once
#include "cache/FileSystem.hpp"
#include "core/Error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace RFS {

class WatcherPool;

enum class CacheOp : std::uint8_t { ReadFile, ReadDir, Stat, Exists };

[[nodiscard]] auto cacheOpName(CacheOp op) -> std::string_view;

// Filters applied to a cached listing; every combination shares one cell per directory.
struct ReadDirOptions {
    bool                     directoriesOnly = false;
    bool                     filesOnly       = false;
    bool                     includeHidden   = true;
    std::vector<std::string> exclude;
};

struct CacheStats {
    std::size_t   cellCount        = 0;
    std::size_t   watchedPathCount = 0;
    std::uint64_t reads            = 0;
    // I/O performed to fill cells.
    std::uint64_t loads          = 0;
    std::uint64_t invalidations  = 0;
    std::uint64_t unwatchedReads = 0;
};

/**
 * PathCache - file reads, listings, stats and existence checks as cells.
 *
 * Each operation is keyed by (normalized path, operation). The first read of
 * a path asks the watcher pool to watch it, then serves the value from a cell
 * that is loaded lazily and reloaded only after an invalidation. Called
 * inside runTracked() or a stream, the read becomes a dependency.
 *
 * Invalidation
 * ------------
 * - An event on a watched path invalidates every cell of that path.
 * - Creating or deleting a direct child invalidates the path's listing and
 *   stat cells; updates to a child's content do not.
 * - A rebuild of a root's watcher invalidates every cell below that root.
 *
 * When no watcher governs a path the read goes straight to the file system:
 * the value is correct at read time, no cell is created, nothing is tracked.
 */
class PathCache {
public:
    // pool may be null (every read is then one-shot). fs defaults to LocalFileSystem.
    explicit PathCache(std::shared_ptr<WatcherPool> pool, std::shared_ptr<FileSystem> fs = nullptr);
    ~PathCache();

    PathCache(PathCache const&)            = delete;
    PathCache& operator=(PathCache const&) = delete;

    auto readFile(std::string_view path) -> Expected<FileContent>;
    auto readDir(std::string_view path, ReadDirOptions const& options = {}) -> Expected<DirListing>;
    auto exists(std::string_view path) -> Expected<bool>;
    auto stat(std::string_view path) -> Expected<StatResult>;

    // Write-through for content this process just wrote: replaces a cached
    // read value and invalidates the path's stat and exists cells.
    auto updateFileCache(std::string_view path, std::string content) -> Expected<void>;

    // Both return the number of cells invalidated.
    auto invalidatePath(std::string_view path) -> std::size_t;
    auto invalidateUnder(std::string_view root) -> std::size_t;

    // Discards cells (invalidating them first) but keeps watching their paths.
    auto clearCache() -> void;
    auto clearCache(std::string_view prefix) -> std::size_t;

    // Releases every watch acquired by this cache; later reads acquire afresh.
    auto unwatchAll() -> void;

    [[nodiscard]] auto getCacheSize() const -> std::size_t;
    [[nodiscard]] auto watchedPathCount() const -> std::size_t;
    [[nodiscard]] auto stats() const -> CacheStats;

    [[nodiscard]] auto fileSystem() const -> std::shared_ptr<FileSystem> const&;

    struct State;

private:
    std::shared_ptr<State> state;
};

} // namespace RFS
