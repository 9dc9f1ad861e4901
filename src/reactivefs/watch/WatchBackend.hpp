#pragma once
#include "core/Error.hpp"
#include "path/IgnoreMatcher.hpp"
#include "watch/WatchEvent.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace RFS {

struct WatchError {
    enum class Kind {
        EventsDropped, // the OS queue overflowed; coverage has a gap
        Failure        // the subscription is no longer reliable
    };
    Kind        kind = Kind::Failure;
    std::string message;
};

// Live OS subscription. Destroying it stops delivery; no sink runs afterwards.
class WatchSubscription {
public:
    virtual ~WatchSubscription() = default;
};

/**
 * WatchBackend - the OS change-notification primitive.
 *
 * subscribe() watches the directory tree at root (an absolute, resolved
 * path) and delivers batches of events on a backend-owned thread. Subtrees
 * matched by ignore are not watched. Sinks must be thread-safe and must not
 * destroy the subscription that is calling them.
 */
class WatchBackend {
public:
    using EventSink = std::function<void(std::vector<WatchEvent>)>;
    using ErrorSink = std::function<void(WatchError)>;

    virtual ~WatchBackend() = default;

    virtual auto subscribe(std::string const& root, IgnoreMatcher const& ignore, EventSink onEvents, ErrorSink onError)
            -> Expected<std::unique_ptr<WatchSubscription>>
            = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

// inotify on Linux.
auto makeDefaultWatchBackend() -> std::shared_ptr<WatchBackend>;

} // namespace RFS
