#include "config/Config.hpp"
#include "log/TaggedLogger.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

namespace RFS {

namespace {

using json = nlohmann::json;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto readInterval(json const& payload, char const* key, std::chrono::milliseconds& target) -> Expected<void> {
    if (!payload.contains(key))
        return {};
    auto const& value = payload[key];
    if (!value.is_number_integer())
        return std::unexpected(malformed(std::string(key) + " must be an integer"));
    auto const ms = value.get<std::int64_t>();
    if (ms < 0)
        return std::unexpected(malformed(std::string(key) + " must not be negative"));
    target = std::chrono::milliseconds{ms};
    return {};
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

auto environment(char const* name) -> std::string_view {
    auto const* value = std::getenv(name);
    return value ? trim(value) : std::string_view{};
}

} // namespace

auto parseConfig(std::string_view text) -> Expected<ReactiveFsConfig> {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded())
        return std::unexpected(malformed("Configuration is not valid JSON"));
    if (!payload.is_object())
        return std::unexpected(malformed("Configuration must be a JSON object"));

    ReactiveFsConfig config;
    if (payload.contains("rootDir")) {
        if (!payload["rootDir"].is_string())
            return std::unexpected(malformed("rootDir must be a string"));
        config.rootDir = payload["rootDir"].get<std::string>();
    }
    if (auto ok = readInterval(payload, "debounceMs", config.watcher.debounce); !ok)
        return std::unexpected(ok.error());
    if (auto ok = readInterval(payload, "recoveryIntervalMs", config.watcher.recoveryInterval); !ok)
        return std::unexpected(ok.error());
    if (auto ok = readInterval(payload, "livenessIntervalMs", config.watcher.livenessInterval); !ok)
        return std::unexpected(ok.error());
    if (payload.contains("ignore")) {
        auto const& ignore = payload["ignore"];
        if (!ignore.is_array())
            return std::unexpected(malformed("ignore must be an array of strings"));
        config.watcher.ignore.clear();
        for (auto const& pattern : ignore) {
            if (!pattern.is_string())
                return std::unexpected(malformed("ignore must be an array of strings"));
            config.watcher.ignore.push_back(pattern.get<std::string>());
        }
    }
    return config;
}

auto loadConfig(std::string const& file) -> Expected<ReactiveFsConfig> {
    std::ifstream in(file, std::ios::binary);
    if (!in)
        return std::unexpected(Error{Error::Code::NotFound, "Cannot open configuration " + file});
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    auto        config = parseConfig(text);
    if (!config)
        return std::unexpected(Error{config.error().code, file + ": " + config.error().message.value_or("")});
    rfs_log("Loaded configuration from " + file, "Config");
    return config;
}

auto applyEnvironmentOverrides(ReactiveFsConfig& config) -> Expected<void> {
    if (auto root = environment("REACTIVEFS_ROOT"); !root.empty())
        config.rootDir = std::string(root);

    if (auto debounce = environment("REACTIVEFS_DEBOUNCE_MS"); !debounce.empty()) {
        std::int64_t ms  = 0;
        auto [end, code] = std::from_chars(debounce.data(), debounce.data() + debounce.size(), ms);
        if (code != std::errc{} || end != debounce.data() + debounce.size() || ms < 0)
            return std::unexpected(malformed("REACTIVEFS_DEBOUNCE_MS must be a non-negative integer"));
        config.watcher.debounce = std::chrono::milliseconds{ms};
    }

    if (auto ignore = environment("REACTIVEFS_IGNORE"); !ignore.empty()) {
        std::vector<std::string> patterns;
        while (!ignore.empty()) {
            auto comma = ignore.find(',');
            auto piece = trim(ignore.substr(0, comma));
            if (!piece.empty())
                patterns.emplace_back(piece);
            if (comma == std::string_view::npos)
                break;
            ignore.remove_prefix(comma + 1);
        }
        config.watcher.ignore = std::move(patterns);
    }
    return {};
}

} // namespace RFS
