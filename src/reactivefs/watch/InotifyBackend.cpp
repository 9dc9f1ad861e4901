#include "watch/InotifyBackend.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <thread>

#include <parallel_hashmap/phmap.h>

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace RFS {

namespace {

constexpr std::uint32_t DirectoryMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB | IN_MOVED_FROM
                                        | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

auto errnoMessage(int err) -> std::string {
    return std::error_code(err, std::generic_category()).message();
}

auto joinPath(std::string const& dir, std::string_view name) -> std::string {
    std::string out = dir;
    if (out.empty() || out.back() != '/')
        out.push_back('/');
    out.append(name);
    return out;
}

class InotifySubscription final : public WatchSubscription {
public:
    InotifySubscription(std::string root, IgnoreMatcher ignore, WatchBackend::EventSink onEvents, WatchBackend::ErrorSink onError)
        : root(std::move(root)), ignore(std::move(ignore)), onEvents(std::move(onEvents)), onError(std::move(onError)) {}

    ~InotifySubscription() override {
        if (this->reader.joinable()) {
            this->reader.request_stop();
            std::uint64_t one = 1;
            if (::write(this->wakeFd, &one, sizeof(one)) < 0)
                rfs_log("Failed to wake inotify reader: " + errnoMessage(errno), "Inotify", "WARN");
            this->reader.join();
        }
        if (this->wakeFd >= 0)
            ::close(this->wakeFd);
        if (this->inotifyFd >= 0)
            ::close(this->inotifyFd);
    }

    auto start() -> Expected<void> {
        std::error_code ec;
        if (!std::filesystem::is_directory(this->root, ec))
            return std::unexpected(Error{Error::Code::NotFound, "Watch root is not a directory: " + this->root});

        this->inotifyFd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (this->inotifyFd < 0) {
            auto const err = errno;
            auto const code = (err == EMFILE || err == ENFILE) ? Error::Code::CapacityExceeded : Error::Code::WatcherFailure;
            return std::unexpected(Error{code, "inotify_init1 failed: " + errnoMessage(err)});
        }
        this->wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (this->wakeFd < 0)
            return std::unexpected(Error{Error::Code::WatcherFailure, "eventfd failed: " + errnoMessage(errno)});

        if (auto added = this->addTree(this->root, nullptr); !added)
            return std::unexpected(added.error());

        rfs_log("Watching " + this->root + " with " + std::to_string(this->directories.size()) + " directory watches",
                "Inotify");
        this->reader = std::jthread([this](std::stop_token token) { this->run(token); });
        return {};
    }

private:
    auto isIgnored(std::string const& path) const -> bool {
        auto relative = relative_path(this->root, path);
        return !relative.empty() && this->ignore.matches(relative);
    }

    auto addWatch(std::string const& dir) -> Expected<void> {
        int wd = ::inotify_add_watch(this->inotifyFd, dir.c_str(), DirectoryMask);
        if (wd < 0) {
            auto const err = errno;
            if (err == ENOSPC)
                return std::unexpected(Error{Error::Code::CapacityExceeded, "inotify watch limit reached at " + dir});
            if (err == ENOENT || err == ENOTDIR)
                return std::unexpected(Error{Error::Code::NotFound, dir});
            return std::unexpected(Error{Error::Code::IoError, "inotify_add_watch(" + dir + "): " + errnoMessage(err)});
        }
        this->directories[wd] = dir;
        return {};
    }

    // Watches dir and every non-ignored directory below it. When discovered is
    // set, entries found during the scan are appended to it as creations.
    auto addTree(std::string const& dir, std::vector<WatchEvent>* discovered) -> Expected<void> {
        if (auto added = this->addWatch(dir); !added) {
            // Deleted before we got to it.
            if (added.error().code == Error::Code::NotFound && dir != this->root)
                return {};
            return added;
        }
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
        for (std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
            auto path = it->path().string();
            if (this->isIgnored(path))
                continue;
            if (discovered)
                discovered->push_back(WatchEvent{WatchEventKind::Create, path});
            std::error_code typeEc;
            if (it->is_directory(typeEc) && !it->is_symlink(typeEc)) {
                if (auto nested = this->addTree(path, discovered); !nested)
                    return nested;
            }
        }
        return {};
    }

    auto removeTree(std::string const& dir) -> void {
        std::vector<int> stale;
        for (auto const& [wd, path] : this->directories) {
            if (is_path_prefix(dir, path))
                stale.push_back(wd);
        }
        for (int wd : stale) {
            ::inotify_rm_watch(this->inotifyFd, wd);
            this->directories.erase(wd);
        }
    }

    auto run(std::stop_token token) -> void {
        pollfd fds[2] = {{this->inotifyFd, POLLIN, 0}, {this->wakeFd, POLLIN, 0}};
        while (!token.stop_requested()) {
            int ready = ::poll(fds, 2, -1);
            if (ready < 0) {
                if (errno == EINTR)
                    continue;
                this->onError(WatchError{WatchError::Kind::Failure, "poll failed: " + errnoMessage(errno)});
                return;
            }
            if (token.stop_requested())
                return;
            if ((fds[0].revents & POLLIN) == 0)
                continue;

            std::vector<WatchEvent> batch;
            bool const fatal = this->drain(batch);
            if (!batch.empty() && !token.stop_requested())
                this->onEvents(std::move(batch));
            if (fatal)
                return;
        }
    }

    // Reads every queued event. Returns true when the subscription is dead.
    auto drain(std::vector<WatchEvent>& batch) -> bool {
        alignas(inotify_event) char buffer[64 * 1024];
        bool                        fatal = false;
        for (;;) {
            auto length = ::read(this->inotifyFd, buffer, sizeof(buffer));
            if (length < 0) {
                if (errno == EINTR)
                    continue;
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    this->onError(WatchError{WatchError::Kind::Failure, "inotify read failed: " + errnoMessage(errno)});
                    return true;
                }
                return fatal;
            }
            if (length == 0)
                return fatal;

            for (char* ptr = buffer; ptr < buffer + length;) {
                auto const* event = reinterpret_cast<inotify_event const*>(ptr);
                ptr += sizeof(inotify_event) + event->len;
                if (this->handle(*event, batch))
                    fatal = true;
            }
        }
    }

    auto handle(inotify_event const& event, std::vector<WatchEvent>& batch) -> bool {
        if (event.mask & IN_Q_OVERFLOW) {
            rfs_log("inotify queue overflow under " + this->root, "Inotify", "WARN");
            this->onError(WatchError{WatchError::Kind::EventsDropped, "inotify queue overflow"});
            return false;
        }
        auto found = this->directories.find(event.wd);
        if (found == this->directories.end())
            return false;
        std::string const dir = found->second;

        if (event.mask & IN_IGNORED) {
            this->directories.erase(found);
            return false;
        }
        if (event.mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
            if (dir != this->root)
                return false;
            this->onError(WatchError{WatchError::Kind::Failure, "Watch root removed: " + this->root});
            return true;
        }

        std::string path = event.len > 0 ? joinPath(dir, std::string_view(event.name)) : dir;
        if (this->isIgnored(path))
            return false;

        bool const isDirectory = (event.mask & IN_ISDIR) != 0;
        auto       push        = [&](WatchEventKind kind, std::string const& p) {
            if (!batch.empty() && batch.back().kind == kind && batch.back().path == p)
                return;
            batch.push_back(WatchEvent{kind, p});
        };

        if (event.mask & (IN_CREATE | IN_MOVED_TO)) {
            push(WatchEventKind::Create, path);
            if (isDirectory) {
                if (auto added = this->addTree(path, &batch); !added) {
                    this->onError(WatchError{WatchError::Kind::Failure, describeError(added.error())});
                    return true;
                }
            }
        } else if (event.mask & (IN_DELETE | IN_MOVED_FROM)) {
            if (isDirectory && (event.mask & IN_MOVED_FROM))
                this->removeTree(path);
            push(WatchEventKind::Delete, path);
        } else if (event.mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) {
            push(WatchEventKind::Update, path);
        }
        return false;
    }

    std::string             root;
    IgnoreMatcher           ignore;
    WatchBackend::EventSink onEvents;
    WatchBackend::ErrorSink onError;
    int                     inotifyFd = -1;
    int                     wakeFd    = -1;
    // Owned by the reader thread once it has started.
    phmap::flat_hash_map<int, std::string> directories;
    std::jthread                           reader;
};

} // namespace

auto InotifyBackend::subscribe(std::string const& root, IgnoreMatcher const& ignore, EventSink onEvents, ErrorSink onError)
        -> Expected<std::unique_ptr<WatchSubscription>> {
    auto subscription = std::make_unique<InotifySubscription>(root, ignore, std::move(onEvents), std::move(onError));
    if (auto started = subscription->start(); !started)
        return std::unexpected(started.error());
    return std::unique_ptr<WatchSubscription>(std::move(subscription));
}

auto makeDefaultWatchBackend() -> std::shared_ptr<WatchBackend> {
    return std::make_shared<InotifyBackend>();
}

} // namespace RFS
