#include "path/IgnoreMatcher.hpp"
#include "path/PathUtils.hpp"

namespace RFS {

namespace {

auto splitComponents(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    std::size_t                   start = 0;
    while (start <= path.size()) {
        auto end  = path.find('/', start);
        auto name = path.substr(start, (end == std::string_view::npos ? path.size() : end) - start);
        if (!name.empty())
            out.push_back(name);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return out;
}

} // namespace

auto defaultIgnorePatterns() -> std::vector<std::string> {
    return {".git", ".hg", ".svn", "node_modules", "**/.DS_Store", "**/Thumbs.db"};
}

IgnoreMatcher::IgnoreMatcher(std::vector<std::string> patterns)
    : raw(std::move(patterns)) {
    for (auto const& pattern : this->raw) {
        std::string_view view{pattern};
        while (!view.empty() && view.front() == '/')
            view.remove_prefix(1);
        if (view.empty())
            continue;

        Rule rule;
        if (view.starts_with("**/")) {
            rule.kind = Kind::Basename;
            view.remove_prefix(3);
        } else if (view.find('/') == std::string_view::npos) {
            rule.kind = Kind::AnyComponent;
        } else {
            rule.kind = Kind::Anchored;
        }
        for (auto component : splitComponents(view))
            rule.components.emplace_back(component);
        if (!rule.components.empty())
            this->rules.push_back(std::move(rule));
    }
}

auto IgnoreMatcher::matches(std::string_view relativePath) const -> bool {
    auto const components = splitComponents(relativePath);
    if (components.empty())
        return false;

    for (auto const& rule : this->rules) {
        switch (rule.kind) {
        case Kind::AnyComponent:
            for (auto component : components)
                if (match_names(rule.components.front(), component))
                    return true;
            break;
        case Kind::Basename:
            if (match_names(rule.components.back(), components.back()))
                return true;
            break;
        case Kind::Anchored: {
            if (components.size() < rule.components.size())
                break;
            bool all = true;
            for (std::size_t i = 0; i < rule.components.size(); ++i) {
                if (!match_names(rule.components[i], components[i])) {
                    all = false;
                    break;
                }
            }
            if (all)
                return true;
            break;
        }
        }
    }
    return false;
}

} // namespace RFS
