#include "path/PathUtils.hpp"

#include <filesystem>
#include <system_error>

namespace RFS {

namespace {

auto stripTrailingSeparators(std::string path) -> std::string {
    while (path.size() > 1 && path.back() == '/')
        path.pop_back();
    return path;
}

// Matches one bracket expression starting at pattern[idx] == '['.
// On success advances idx past the closing bracket and returns whether ch is in the set.
auto matchBracket(std::string_view pattern, std::size_t& idx, char ch, bool& wellFormed) -> bool {
    std::size_t cursor = idx + 1;
    bool        invert = false;
    if (cursor < pattern.size() && (pattern[cursor] == '!' || pattern[cursor] == '^')) {
        invert = true;
        ++cursor;
    }

    bool matched = false;
    bool first   = true;
    while (cursor < pattern.size() && (first || pattern[cursor] != ']')) {
        first     = false;
        char low  = pattern[cursor];
        if (low == '\\' && cursor + 1 < pattern.size())
            low = pattern[++cursor];
        if (cursor + 2 < pattern.size() && pattern[cursor + 1] == '-' && pattern[cursor + 2] != ']') {
            char high = pattern[cursor + 2];
            if (ch >= low && ch <= high)
                matched = true;
            cursor += 3;
        } else {
            if (ch == low)
                matched = true;
            ++cursor;
        }
    }

    if (cursor >= pattern.size()) {
        wellFormed = false;
        return false;
    }
    wellFormed = true;
    idx        = cursor + 1;
    return invert ? !matched : matched;
}

} // namespace

auto normalize_path(std::string_view path) -> Expected<std::string> {
    if (path.empty())
        return std::unexpected(Error{Error::Code::InvalidPath, "Empty path"});

    std::error_code ec;
    auto            absolute = std::filesystem::absolute(std::filesystem::path(path), ec);
    if (ec)
        return std::unexpected(Error{Error::Code::InvalidPath, std::string(path) + ": " + ec.message()});
    return stripTrailingSeparators(absolute.lexically_normal().string());
}

auto resolve_real_path(std::string_view path) -> Expected<std::string> {
    auto normalized = normalize_path(path);
    if (!normalized)
        return normalized;

    std::error_code ec;
    auto            canonical = std::filesystem::weakly_canonical(std::filesystem::path(*normalized), ec);
    if (ec)
        return normalized;
    return stripTrailingSeparators(canonical.lexically_normal().string());
}

auto parent_path(std::string_view path) -> std::string_view {
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos)
        return path;
    if (slash == 0)
        return path.substr(0, 1);
    return path.substr(0, slash);
}

auto base_name(std::string_view path) -> std::string_view {
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos)
        return path;
    return path.substr(slash + 1);
}

auto is_path_prefix(std::string_view prefix, std::string_view path) -> bool {
    if (prefix == "/")
        return !path.empty() && path.front() == '/';
    if (path.size() < prefix.size())
        return false;
    if (path.compare(0, prefix.size(), prefix) != 0)
        return false;
    if (path.size() == prefix.size())
        return true;
    return path[prefix.size()] == '/';
}

auto is_strict_path_prefix(std::string_view prefix, std::string_view path) -> bool {
    return path != prefix && is_path_prefix(prefix, path);
}

auto relative_path(std::string_view root, std::string_view path) -> std::string_view {
    if (!is_path_prefix(root, path) || path.size() == root.size())
        return {};
    auto rest = path.substr(root == "/" ? 1 : root.size() + 1);
    return rest;
}

auto match_names(std::string_view pattern, std::string_view name) -> bool {
    std::size_t patternIdx = 0;
    std::size_t nameIdx    = 0;
    // Backtrack point for the most recent '*'.
    std::size_t starIdx    = std::string_view::npos;
    std::size_t starName   = 0;

    while (nameIdx < name.size()) {
        if (patternIdx < pattern.size()) {
            char const pc = pattern[patternIdx];
            if (pc == '*') {
                starIdx  = patternIdx++;
                starName = nameIdx;
                continue;
            }
            if (pc == '?') {
                ++patternIdx;
                ++nameIdx;
                continue;
            }
            if (pc == '[') {
                bool        wellFormed = false;
                std::size_t next       = patternIdx;
                if (matchBracket(pattern, next, name[nameIdx], wellFormed)) {
                    patternIdx = next;
                    ++nameIdx;
                    continue;
                }
                if (!wellFormed)
                    return false;
            } else if (pc == '\\' && patternIdx + 1 < pattern.size()) {
                if (pattern[patternIdx + 1] == name[nameIdx]) {
                    patternIdx += 2;
                    ++nameIdx;
                    continue;
                }
            } else if (pc == name[nameIdx]) {
                ++patternIdx;
                ++nameIdx;
                continue;
            }
        }
        if (starIdx == std::string_view::npos)
            return false;
        patternIdx = starIdx + 1;
        nameIdx    = ++starName;
    }

    while (patternIdx < pattern.size() && pattern[patternIdx] == '*')
        ++patternIdx;
    return patternIdx == pattern.size();
}

auto is_glob(std::string_view pattern) -> bool {
    bool escaped = false;
    for (char ch : pattern) {
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
            continue;
        }
        if (ch == '*' || ch == '?' || ch == '[')
            return true;
    }
    return false;
}

} // namespace RFS
