#include "diag/StatusJson.hpp"

namespace RFS {

using json = nlohmann::json;

auto toJson(WatcherCounters const& counters) -> json {
    json reasons = json::object();
    for (std::size_t i = 0; i < ReinitializeReasonCount; ++i)
        reasons[std::string(reinitializeReasonName(static_cast<ReinitializeReason>(i)))] = counters.reinitializeReasonCounts[i];

    json out{{"generation", counters.generation},
             {"reinitializeCount", counters.reinitializeCount},
             {"reinitializeReasonCounts", std::move(reasons)},
             {"callbackFailures", counters.callbackFailures}};
    out["lastReinitializeReason"] = counters.lastReinitializeReason
                                            ? json(std::string(reinitializeReasonName(*counters.lastReinitializeReason)))
                                            : json(nullptr);
    out["lastError"] = counters.lastError ? json(*counters.lastError) : json(nullptr);
    return out;
}

auto toJson(WatcherPool::RootStatus const& status) -> json {
    json out = toJson(status.watcher.counters);
    out["root"]               = status.root;
    out["resolvedRoot"]       = status.resolvedRoot;
    out["state"]              = std::string(projectWatcherStateName(status.watcher.state));
    out["initialized"]        = status.watcher.initialized;
    out["recovering"]         = status.watcher.recovering;
    out["subscriptionCount"]  = status.watcher.subscriptionCount;
    out["pendingEventCount"]  = status.watcher.pendingEventCount;
    out["activeWatcherCount"] = status.activeWatcherCount;
    out["initError"]          = status.initError ? json(*status.initError) : json(nullptr);
    return out;
}

auto toJson(WatcherPool::PoolStatus const& status) -> json {
    json roots = json::array();
    for (auto const& root : status.roots)
        roots.push_back(toJson(root));
    return json{{"initialized", status.initialized}, {"activeWatcherCount", status.activeWatcherCount}, {"roots", std::move(roots)}};
}

auto toJson(CacheStats const& stats) -> json {
    return json{{"cellCount", stats.cellCount},
                {"watchedPathCount", stats.watchedPathCount},
                {"reads", stats.reads},
                {"loads", stats.loads},
                {"invalidations", stats.invalidations},
                {"unwatchedReads", stats.unwatchedReads}};
}

} // namespace RFS
