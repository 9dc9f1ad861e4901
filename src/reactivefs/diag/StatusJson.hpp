#pragma once
#include "cache/PathCache.hpp"
#include "watch/WatcherPool.hpp"

#include <nlohmann/json.hpp>

namespace RFS {

// Read-only telemetry for an operational status endpoint.
auto toJson(WatcherCounters const& counters) -> nlohmann::json;
auto toJson(WatcherPool::RootStatus const& status) -> nlohmann::json;
auto toJson(WatcherPool::PoolStatus const& status) -> nlohmann::json;
auto toJson(CacheStats const& stats) -> nlohmann::json;

} // namespace RFS
