#include <reactivefs/ReactiveFS.hpp>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace std::chrono_literals;

namespace {

struct TailOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> root;
    std::string                file;
    std::size_t                max_updates{0};
    bool                       show_status{false};
};

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted.store(true);
}

void print_usage() {
    std::cout << "Usage: reactivefs_tail [options] <file>\n\n"
              << "Prints <file> and prints it again every time it changes on disk.\n"
              << "Options:\n"
              << "  --config=<file>       JSON configuration (rootDir, debounceMs, ignore, ...)\n"
              << "  --root=<dir>          Directory to watch (default: the file's directory)\n"
              << "  --max-updates=<int>   Exit after this many changes (default: run until Ctrl-C)\n"
              << "  --status              Print watcher and cache status as JSON on exit\n"
              << "Environment: REACTIVEFS_ROOT, REACTIVEFS_DEBOUNCE_MS, REACTIVEFS_IGNORE\n";
}

auto value_of(std::string_view arg, std::string_view name) -> std::optional<std::string_view> {
    if (arg.size() <= name.size() + 1 || arg.substr(0, name.size()) != name || arg[name.size()] != '=')
        return std::nullopt;
    return arg.substr(name.size() + 1);
}

auto parse_args(int argc, char** argv) -> std::optional<TailOptions> {
    TailOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--status") {
            options.show_status = true;
        } else if (auto config = value_of(arg, "--config")) {
            options.config_file = std::string(*config);
        } else if (auto root = value_of(arg, "--root")) {
            options.root = std::string(*root);
        } else if (auto max = value_of(arg, "--max-updates")) {
            auto [end, ec] = std::from_chars(max->data(), max->data() + max->size(), options.max_updates);
            if (ec != std::errc{} || end != max->data() + max->size()) {
                std::cerr << "reactivefs_tail: invalid --max-updates value '" << *max << "'\n";
                return std::nullopt;
            }
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "reactivefs_tail: unknown option '" << arg << "'\n";
            return std::nullopt;
        } else if (options.file.empty()) {
            options.file = std::string(arg);
        } else {
            std::cerr << "reactivefs_tail: only one file may be given\n";
            return std::nullopt;
        }
    }
    if (options.file.empty())
        return std::nullopt;
    return options;
}

auto load_settings(TailOptions const& options) -> RFS::Expected<RFS::ReactiveFsConfig> {
    RFS::ReactiveFsConfig config;
    if (options.config_file) {
        auto loaded = RFS::loadConfig(*options.config_file);
        if (!loaded)
            return std::unexpected(loaded.error());
        config = std::move(*loaded);
    }
    if (auto applied = RFS::applyEnvironmentOverrides(config); !applied)
        return std::unexpected(applied.error());
    if (options.root)
        config.rootDir = *options.root;
    if (config.rootDir.empty())
        config.rootDir = std::filesystem::absolute(options.file).parent_path().string();
    return config;
}

} // namespace

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return 2;
    }

    auto settings = load_settings(*options);
    if (!settings) {
        std::cerr << "reactivefs_tail: " << RFS::describeError(settings.error()) << '\n';
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    RFS::ReactiveFS fs(std::move(*settings));
    if (auto ok = fs.init(); !ok) {
        std::cerr << "reactivefs_tail: not watching " << fs.config().rootDir << ": " << RFS::describeError(ok.error())
                  << '\n';
    }

    auto const file    = std::filesystem::absolute(options->file).lexically_normal().string();
    auto       content = fs.stream([&] { return fs.cache().readFile(file); });

    std::size_t updates = 0;
    while (!g_interrupted.load()) {
        auto next = content.nextFor(200ms);
        if (!next)
            break;
        if (!*next) {
            if (next->error().code == RFS::Error::Code::Timeout)
                continue;
            std::cerr << "reactivefs_tail: " << RFS::describeError(next->error()) << '\n';
            return 1;
        }

        if (content.runCount() > 1)
            ++updates;
        std::cout << "==> " << file << " (update " << updates << ") <==\n";
        if (**next)
            std::cout << ***next;
        else
            std::cout << "[absent]\n";
        std::cout.flush();

        if (content.watchedDependencyCount() == 0) {
            std::cerr << "reactivefs_tail: " << file << " is not under a watched root, nothing to follow\n";
            break;
        }
        if (options->max_updates != 0 && updates >= options->max_updates)
            break;
    }
    content.cancel();

    if (options->show_status)
        std::cout << fs.status().dump(2) << '\n';
    return 0;
}
