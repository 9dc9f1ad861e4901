#include "cache/FileSystem.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace RFS {

namespace {

auto isMissing(std::error_code const& ec) -> bool {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

auto ioError(std::string const& what, std::string const& path, std::error_code const& ec) -> Error {
    return Error{Error::Code::IoError, what + " " + path + ": " + ec.message()};
}

auto kindOf(std::filesystem::file_type type) -> EntryKind {
    switch (type) {
    case std::filesystem::file_type::regular:
        return EntryKind::File;
    case std::filesystem::file_type::directory:
        return EntryKind::Directory;
    case std::filesystem::file_type::symlink:
        return EntryKind::Symlink;
    default:
        return EntryKind::Other;
    }
}

} // namespace

auto entryKindName(EntryKind kind) -> std::string_view {
    switch (kind) {
    case EntryKind::File:
        return "file";
    case EntryKind::Directory:
        return "directory";
    case EntryKind::Symlink:
        return "symlink";
    case EntryKind::Other:
        return "other";
    }
    return "other";
}

auto LocalFileSystem::readFile(std::string const& path) -> Expected<FileContent> {
    std::error_code ec;
    auto            status = std::filesystem::status(path, ec);
    if (ec) {
        if (isMissing(ec))
            return FileContent{};
        return std::unexpected(ioError("stat", path, ec));
    }
    if (!std::filesystem::exists(status))
        return FileContent{};
    if (std::filesystem::is_directory(status))
        return std::unexpected(Error{Error::Code::IoError, "Is a directory: " + path});

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        // Deleted between the stat and the open.
        if (!std::filesystem::exists(path, ec))
            return FileContent{};
        return std::unexpected(Error{Error::Code::IoError, "Cannot open " + path});
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
        return std::unexpected(Error{Error::Code::IoError, "Read failed: " + path});
    return FileContent{std::move(content)};
}

auto LocalFileSystem::readDir(std::string const& path) -> Expected<DirListing> {
    std::error_code                     ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        if (isMissing(ec))
            return DirListing{};
        return std::unexpected(ioError("opendir", path, ec));
    }

    std::vector<DirEntry> entries;
    for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            return std::unexpected(ioError("readdir", path, ec));
        std::error_code typeEc;
        auto            type = it->symlink_status(typeEc).type();
        entries.push_back(DirEntry{it->path().filename().string(), typeEc ? EntryKind::Other : kindOf(type)});
    }
    if (ec) {
        if (isMissing(ec))
            return DirListing{};
        return std::unexpected(ioError("readdir", path, ec));
    }
    std::sort(entries.begin(), entries.end(), [](DirEntry const& a, DirEntry const& b) { return a.name < b.name; });
    return DirListing{std::move(entries)};
}

auto LocalFileSystem::stat(std::string const& path) -> Expected<StatResult> {
    std::error_code ec;
    auto            status = std::filesystem::status(path, ec);
    if (ec) {
        if (isMissing(ec))
            return StatResult{};
        return std::unexpected(ioError("stat", path, ec));
    }
    if (!std::filesystem::exists(status))
        return StatResult{};

    FileStat result;
    result.kind = kindOf(status.type());
    if (std::filesystem::is_regular_file(status)) {
        result.size = std::filesystem::file_size(path, ec);
        if (ec && isMissing(ec))
            return StatResult{};
        if (ec)
            return std::unexpected(ioError("file_size", path, ec));
    }
    result.modifiedTime = std::filesystem::last_write_time(path, ec);
    if (ec && isMissing(ec))
        return StatResult{};
    if (ec)
        return std::unexpected(ioError("last_write_time", path, ec));
    return StatResult{result};
}

auto LocalFileSystem::exists(std::string const& path) -> Expected<bool> {
    std::error_code ec;
    auto            status = std::filesystem::status(path, ec);
    if (ec) {
        if (isMissing(ec))
            return false;
        return std::unexpected(ioError("stat", path, ec));
    }
    return std::filesystem::exists(status);
}

} // namespace RFS
