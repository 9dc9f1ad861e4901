#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace RFS {

// Version-control and dependency directories plus OS metadata files.
auto defaultIgnorePatterns() -> std::vector<std::string>;

/**
 * IgnoreMatcher - decides which watched paths are excluded from event delivery.
 *
 * Pattern forms
 * -------------
 * - "name"       a bare (possibly glob) name; matches any component of the
 *                root-relative path, so ".git" excludes the repository
 *                directory and everything under it.
 * - "** /glob"   (without the space) matches the final component at any depth.
 * - "a/b/*.tmp"  matched component by component against the root-relative
 *                path; matching a leading run of components excludes the
 *                whole subtree.
 */
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;
    explicit IgnoreMatcher(std::vector<std::string> patterns);

    // relativePath is relative to the watched root, without a leading '/'.
    auto matches(std::string_view relativePath) const -> bool;

    auto patterns() const -> std::vector<std::string> const& { return this->raw; }

private:
    enum class Kind { AnyComponent, Basename, Anchored };
    struct Rule {
        Kind                     kind;
        std::vector<std::string> components;
    };

    std::vector<std::string> raw;
    std::vector<Rule>        rules;
};

} // namespace RFS
