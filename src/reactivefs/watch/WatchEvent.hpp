#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace RFS {

enum class WatchEventKind { Create, Update, Delete };

// A change reported for an absolute, symlink-resolved path.
struct WatchEvent {
    WatchEventKind kind = WatchEventKind::Update;
    std::string    path;

    auto operator==(WatchEvent const&) const -> bool = default;
};

[[nodiscard]] inline auto watchEventKindName(WatchEventKind kind) -> std::string_view {
    switch (kind) {
    case WatchEventKind::Create:
        return "create";
    case WatchEventKind::Update:
        return "update";
    case WatchEventKind::Delete:
        return "delete";
    }
    return "update";
}

enum class ReinitializeReason : std::uint8_t {
    DropEvents = 0,
    WatcherError,
    MissingProjectDirectory,
    ProjectDirectoryReplaced,
    Manual
};

inline constexpr std::size_t ReinitializeReasonCount = 5;

using ReinitializeReasonCounts = std::array<std::uint64_t, ReinitializeReasonCount>;

[[nodiscard]] inline auto reinitializeReasonName(ReinitializeReason reason) -> std::string_view {
    switch (reason) {
    case ReinitializeReason::DropEvents:
        return "drop-events";
    case ReinitializeReason::WatcherError:
        return "watcher-error";
    case ReinitializeReason::MissingProjectDirectory:
        return "missing-project-dir";
    case ReinitializeReason::ProjectDirectoryReplaced:
        return "project-dir-replaced";
    case ReinitializeReason::Manual:
        return "manual";
    }
    return "manual";
}

} // namespace RFS
