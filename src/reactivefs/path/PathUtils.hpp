#pragma once
#include "core/Error.hpp"

#include <string>
#include <string_view>

namespace RFS {

// Absolute, lexically normalized form without a trailing separator. Does not touch the disk.
auto normalize_path(std::string_view path) -> Expected<std::string>;

// normalize_path followed by symlink resolution of the longest existing prefix.
// Falls back to the normalized form when resolution fails.
auto resolve_real_path(std::string_view path) -> Expected<std::string>;

// Parent directory of a normalized path; "/" is its own parent.
auto parent_path(std::string_view path) -> std::string_view;

// Final component of a normalized path.
auto base_name(std::string_view path) -> std::string_view;

// True when path equals prefix or lies below it.
auto is_path_prefix(std::string_view prefix, std::string_view path) -> bool;

// True when path lies strictly below prefix.
auto is_strict_path_prefix(std::string_view prefix, std::string_view path) -> bool;

// Path relative to root without a leading separator; empty when path == root.
auto relative_path(std::string_view root, std::string_view path) -> std::string_view;

// Shell-style match of a single name: '*', '?', '[...]', '[!...]' and '\' escapes.
auto match_names(std::string_view pattern, std::string_view name) -> bool;

auto is_glob(std::string_view pattern) -> bool;

} // namespace RFS
