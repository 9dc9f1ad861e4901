#pragma once

#include "cache/FileSystem.hpp"
#include "cache/PathCache.hpp"
#include "cell/Cell.hpp"
#include "config/Config.hpp"
#include "core/Error.hpp"
#include "track/Stream.hpp"
#include "track/Tracker.hpp"
#include "watch/WatchBackend.hpp"
#include "watch/WatcherPool.hpp"

#include <memory>
#include <stop_token>
#include <string_view>

#include <nlohmann/json.hpp>

namespace RFS {

/**
 * ReactiveFS - a watcher pool and a path cache wired together.
 *
 *   RFS::ReactiveFS fs({.rootDir = "/srv/project"});
 *   if (auto ok = fs.init(); !ok) ...
 *   auto readme = fs.stream([&] { return fs.cache().readFile("/srv/project/README.md"); });
 *   while (auto next = readme.next()) ...
 *
 * init() failing is not fatal: reads still work, they just never refresh.
 */
class ReactiveFS {
public:
    explicit ReactiveFS(ReactiveFsConfig config = {},
                        std::shared_ptr<WatchBackend> backend = nullptr,
                        std::shared_ptr<FileSystem> fileSystem = nullptr);
    ~ReactiveFS();

    ReactiveFS(ReactiveFS const&)            = delete;
    ReactiveFS& operator=(ReactiveFS const&) = delete;

    // Watches config().rootDir.
    auto init() -> Expected<void>;
    // Watches an additional root.
    auto init(std::string_view rootDir) -> Expected<void>;

    template <typename F>
    auto stream(F computation, std::stop_token token = {}) -> Stream<TrackedValueType<F>> {
        return RFS::stream(std::move(computation), std::move(token));
    }

    [[nodiscard]] auto cache() noexcept -> PathCache& { return *this->pathCache; }
    [[nodiscard]] auto pool() noexcept -> WatcherPool& { return *this->watcherPool; }
    [[nodiscard]] auto config() const noexcept -> ReactiveFsConfig const& { return this->settings; }

    // {"pool": ..., "cache": ...}
    [[nodiscard]] auto status() const -> nlohmann::json;

    // Closes every watcher and drops every cell. Reads afterwards are one-shot until init() runs again.
    auto shutdown() -> void;

private:
    ReactiveFsConfig             settings;
    std::shared_ptr<WatcherPool> watcherPool;
    std::unique_ptr<PathCache>   pathCache;
};

} // namespace RFS
