#include "ReactiveFS.hpp"
#include "diag/StatusJson.hpp"
#include "log/TaggedLogger.hpp"

namespace RFS {

ReactiveFS::ReactiveFS(ReactiveFsConfig config, std::shared_ptr<WatchBackend> backend, std::shared_ptr<FileSystem> fileSystem)
    : settings(std::move(config)) {
    WatcherPoolOptions options;
    options.watcher   = this->settings.watcher;
    options.backend   = std::move(backend);
    this->watcherPool = std::make_shared<WatcherPool>(std::move(options));
    this->pathCache   = std::make_unique<PathCache>(this->watcherPool, std::move(fileSystem));
}

ReactiveFS::~ReactiveFS() {
    this->shutdown();
}

auto ReactiveFS::init() -> Expected<void> {
    if (this->settings.rootDir.empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "No root directory configured"});
    return this->init(this->settings.rootDir);
}

auto ReactiveFS::init(std::string_view rootDir) -> Expected<void> {
    auto result = this->watcherPool->init(rootDir);
    if (!result)
        rfs_log("Watching " + std::string(rootDir) + " failed, reads will not refresh: " + describeError(result.error()),
                "WARN");
    return result;
}

auto ReactiveFS::status() const -> nlohmann::json {
    return nlohmann::json{{"pool", toJson(this->watcherPool->runtimeStatus())}, {"cache", toJson(this->pathCache->stats())}};
}

auto ReactiveFS::shutdown() -> void {
    this->pathCache->unwatchAll();
    this->watcherPool->closeAllWatchers();
    this->pathCache->clearCache();
}

} // namespace RFS
