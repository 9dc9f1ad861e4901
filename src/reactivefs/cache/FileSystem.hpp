#pragma once
#include "core/Error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace RFS {

enum class EntryKind { File, Directory, Symlink, Other };

[[nodiscard]] auto entryKindName(EntryKind kind) -> std::string_view;

struct DirEntry {
    std::string name;
    EntryKind   kind = EntryKind::File;

    auto operator==(DirEntry const&) const -> bool = default;
};

struct FileStat {
    std::uint64_t                   size = 0;
    std::filesystem::file_time_type modifiedTime{};
    EntryKind                       kind = EntryKind::File;

    auto operator==(FileStat const&) const -> bool = default;
};

// std::nullopt means the path does not exist.
using FileContent = std::optional<std::string>;
using DirListing  = std::optional<std::vector<DirEntry>>;
using StatResult  = std::optional<FileStat>;

/**
 * FileSystem - the raw, uncached I/O behind the path cache.
 *
 * A missing path is reported as an absent value; only failures unrelated to
 * existence (permissions, reading a directory as a file) are errors.
 * Listings are sorted by name.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    virtual auto readFile(std::string const& path) -> Expected<FileContent> = 0;
    virtual auto readDir(std::string const& path) -> Expected<DirListing>   = 0;
    virtual auto stat(std::string const& path) -> Expected<StatResult>      = 0;
    virtual auto exists(std::string const& path) -> Expected<bool>          = 0;
};

class LocalFileSystem final : public FileSystem {
public:
    auto readFile(std::string const& path) -> Expected<FileContent> override;
    auto readDir(std::string const& path) -> Expected<DirListing> override;
    auto stat(std::string const& path) -> Expected<StatResult> override;
    auto exists(std::string const& path) -> Expected<bool> override;
};

} // namespace RFS
