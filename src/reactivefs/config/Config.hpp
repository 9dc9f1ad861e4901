#pragma once
#include "core/Error.hpp"
#include "watch/ProjectWatcher.hpp"

#include <string>
#include <string_view>

namespace RFS {

struct ReactiveFsConfig {
    // Directory handed to WatcherPool::init(); empty means none.
    std::string           rootDir;
    ProjectWatcherOptions watcher;
};

/**
 * Parses a JSON configuration document.
 *
 *   {
 *     "rootDir": "/srv/project",
 *     "debounceMs": 50,
 *     "ignore": [".git", "node_modules", "** /.DS_Store"],
 *     "recoveryIntervalMs": 3000,
 *     "livenessIntervalMs": 3000
 *   }
 *
 * Every key is optional; missing keys keep their defaults. Unknown keys are
 * ignored. Wrong types, negative intervals or invalid JSON yield MalformedInput.
 */
auto parseConfig(std::string_view json) -> Expected<ReactiveFsConfig>;

// Reads and parses file. A missing file is NotFound.
auto loadConfig(std::string const& file) -> Expected<ReactiveFsConfig>;

/**
 * Applies REACTIVEFS_ROOT, REACTIVEFS_DEBOUNCE_MS and REACTIVEFS_IGNORE
 * (comma separated, replaces the list) on top of config. Unset or empty
 * variables leave the value alone.
 */
auto applyEnvironmentOverrides(ReactiveFsConfig& config) -> Expected<void>;

} // namespace RFS
