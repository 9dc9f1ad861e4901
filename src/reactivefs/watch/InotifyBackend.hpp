#pragma once
#include "watch/WatchBackend.hpp"

namespace RFS {

/**
 * InotifyBackend - recursive directory watching on top of Linux inotify.
 *
 * Each subscription owns one inotify instance and one reader thread. inotify
 * is not recursive, so every directory of the tree gets its own watch;
 * directories created or moved in later are added as they appear and their
 * current contents are reported as creations, covering files written before
 * the new watch was in place.
 *
 * Event mapping
 * -------------
 * IN_CREATE, IN_MOVED_TO      -> Create
 * IN_DELETE, IN_MOVED_FROM    -> Delete
 * IN_MODIFY, IN_CLOSE_WRITE,
 * IN_ATTRIB                   -> Update
 * IN_Q_OVERFLOW               -> WatchError::EventsDropped
 * root deleted or moved away  -> WatchError::Failure
 */
class InotifyBackend final : public WatchBackend {
public:
    auto subscribe(std::string const& root, IgnoreMatcher const& ignore, EventSink onEvents, ErrorSink onError)
            -> Expected<std::unique_ptr<WatchSubscription>> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "inotify"; }
};

} // namespace RFS
