#include "engine/Engine.hpp"
#include "engine/errors.hpp"
#include "progress/Tracker.hpp"
#include "progress/Reporter.hpp"
#include "concurrency/Context.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/cmdLineHelpers.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <optional>
#include <ranges>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace fileops;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::config;
using namespace fileops::log;

#ifndef FILEOPS_VERSION
#define FILEOPS_VERSION "0.0.0"
#endif

namespace {

std::atomic<bool> interrupted = false;

void signalHandler(int) { interrupted = true; }

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_INTERRUPTED = 130;

struct CliOptions {
    std::string command;
    std::vector<std::string> paths;
    std::vector<std::string> excludes;
    std::optional<std::string> user, group, configPath;
    bool dryRun = false, recursive = true, json = false, quiet = false;
};

// Split --key=value so every option is followed by its value as a separate token
std::vector<std::string> normalize_args(const int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));
                out.emplace_back(a.substr(eq + 1));
                continue;
            }
        }
        out.emplace_back(std::move(a));
    }
    return out;
}

void print_usage() {
    fmt::print(
        "usage: fileops <command> [options] <path>...\n"
        "\n"
        "commands:\n"
        "  clean     remove empty directories below each path\n"
        "  chown     change ownership of everything below each path\n"
        "  version   print the version\n"
        "\n"
        "options:\n"
        "  --dry-run            report what would change without changing it\n"
        "  --exclude <pattern>  skip matching paths (repeatable)\n"
        "  --no-recursive       chown: only the path and its direct children\n"
        "  --user <name|uid>    chown: target owner\n"
        "  --group <name|gid>   chown: target group (default: the user's primary group)\n"
        "  --json               print the result as JSON\n"
        "  --quiet              no progress output, warnings only\n"
        "  --config <file>      configuration file\n");
}

CliOptions parse_args(const int argc, char** argv) {
    CliOptions opts;
    opts.command = argc >= 2 && argv[1] && argv[1][0] != '\0' ? argv[1] : "help";

    const auto args = normalize_args(argc, argv);
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        const auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) throw std::invalid_argument("missing value for " + a);
            return args[++i];
        };

        if (a == "--dry-run" || a == "-n") opts.dryRun = true;
        else if (a == "--no-recursive") opts.recursive = false;
        else if (a == "--json") opts.json = true;
        else if (a == "--quiet" || a == "-q") opts.quiet = true;
        else if (a == "--exclude" || a == "-e") opts.excludes.push_back(value());
        else if (a == "--user" || a == "-u") opts.user = value();
        else if (a == "--group" || a == "-g") opts.group = value();
        else if (a == "--config" || a == "-c") opts.configPath = value();
        else if (a == "--") {
            opts.paths.insert(opts.paths.end(), args.begin() + static_cast<long>(i) + 1, args.end());
            break;
        }
        else if (a.size() > 1 && a[0] == '-') throw std::invalid_argument("unknown option " + a);
        else opts.paths.push_back(a);
    }

    return opts;
}

OperationConfig build_config(const CliOptions& opts) {
    OperationConfig cfg;
    cfg.dry_run = opts.dryRun;
    cfg.recursive = opts.recursive;
    cfg.include_patterns = opts.paths;
    cfg.exclude_patterns = opts.excludes;
    cfg.backup_before_delete = ConfigRegistry::get().operations.backup_before_delete;

    if (opts.command == "clean")
        for (const auto& p : ConfigRegistry::get().operations.default_exclude_patterns)
            if (std::ranges::find(cfg.exclude_patterns, p) == cfg.exclude_patterns.end())
                cfg.exclude_patterns.push_back(p);

    if (opts.user) cfg.custom_settings["target_user"] = *opts.user;
    if (opts.group) cfg.custom_settings["target_group"] = *opts.group;
    return cfg;
}

std::string render_progress(const ProgressInfo& p) {
    std::string line = fmt::format("[{}/{}] {}", p.steps_completed, p.total_steps, p.current_step);
    if (p.total_items > 0) line += fmt::format("  {:5.1f}%  {}/{}", p.percent(), p.items_processed, p.total_items);
    else line += fmt::format("  {} items", p.items_processed);
    if (p.bytes_processed > 0) line += "  " + util::human_bytes(static_cast<uint64_t>(p.bytes_processed));
    if (p.speed > 0.0) line += fmt::format("  {:.1f}/s", p.speed);
    if (p.eta) line += fmt::format("  eta {}s", (p.eta->count() + 999) / 1000);
    if (!p.errors.empty()) line += fmt::format("  {} errors", p.errors.size());
    return util::ellipsize_middle(line, static_cast<size_t>(std::max(20, util::term_width() - 1)));
}

// Drains the subscription until it is closed. Also turns SIGINT into cancellation.
void watch_progress(const progress::Subscription& sub, const std::shared_ptr<Context>& ctx, const bool render) {
    const bool tty = render && ::isatty(STDERR_FILENO) == 1;
    bool drawn = false;

    while (true) {
        if (interrupted.exchange(false)) {
            Registry::fileops()->warn("[CLI] Interrupt received, cancelling");
            ctx->cancel();
        }

        const auto info = sub->receiveFor(std::chrono::milliseconds(100));
        if (!info) {
            if (sub->closed()) break;
            continue;
        }

        if (!render) continue;
        if (tty) {
            fmt::print(stderr, "\r\033[K{}", render_progress(*info));
            drawn = true;
        } else if (isTerminal(info->status)) {
            fmt::print(stderr, "{}\n", render_progress(*info));
        }
        std::fflush(stderr);
    }

    if (drawn) fmt::print(stderr, "\n");
}

void print_result(const OperationResult& result, const bool json) {
    if (json) {
        fmt::print("{}\n", nlohmann::json(result).dump(2));
        return;
    }

    fmt::print("{}\n", result.summary);

    const bool dryRun = result.details.value("dry_run", false);
    for (const auto& f : result.files_affected) fmt::print("  {} {}\n", dryRun ? "would change" : "changed", f);

    if (!result.errors.empty()) {
        fmt::print("{} errors:\n", result.errors.size());
        for (const auto& e : result.errors) fmt::print("  {}\n", e.error);
    }

    fmt::print("finished in {} ms\n", result.duration.count());
}

int run_operation(const CliOptions& opts) {
    OperationType type;
    if (opts.command == "clean") type = OperationType::Cleanup;
    else if (opts.command == "chown") type = OperationType::Ownership;
    else {
        fmt::print(stderr, "unknown command '{}'\n\n", opts.command);
        print_usage();
        return EXIT_USAGE;
    }

    if (opts.paths.empty()) {
        fmt::print(stderr, "{}: at least one path is required\n", opts.command);
        return EXIT_USAGE;
    }

    if (type == OperationType::Ownership && !opts.user) {
        fmt::print(stderr, "chown: --user is required\n");
        return EXIT_USAGE;
    }

    const auto engine = std::make_shared<engine::Engine>();
    const auto& tracker = engine->progressTracker();

    progress::Reporter reporter(tracker, ConfigRegistry::get().progress);
    reporter.start();

    const auto ctx = Context::withCancel(Context::background());
    const auto sub = tracker->subscribe(progress::Tracker::ALL_OPERATIONS);
    const bool render = !opts.quiet && !opts.json && ConfigRegistry::get().operations.enable_progress_bar;

    std::thread watcher(watch_progress, sub, ctx, render);

    int exitCode = 0;
    try {
        const auto result = engine->executeOperation(*ctx, type, build_config(opts));
        tracker->unsubscribe(progress::Tracker::ALL_OPERATIONS);
        watcher.join();
        print_result(result, opts.json);
        exitCode = result.errors.empty() ? 0 : 1;
    } catch (const Cancelled& e) {
        tracker->unsubscribe(progress::Tracker::ALL_OPERATIONS);
        watcher.join();
        fmt::print(stderr, "{}: cancelled ({})\n", opts.command, e.what());
        exitCode = EXIT_INTERRUPTED;
    } catch (const engine::InvalidConfiguration& e) {
        tracker->unsubscribe(progress::Tracker::ALL_OPERATIONS);
        watcher.join();
        fmt::print(stderr, "{}: {}\n", opts.command, e.what());
        exitCode = EXIT_USAGE;
    } catch (const std::exception& e) {
        tracker->unsubscribe(progress::Tracker::ALL_OPERATIONS);
        watcher.join();
        fmt::print(stderr, "{}: failed: {}\n", opts.command, e.what());
        exitCode = 1;
    }

    reporter.stop();
    return exitCode;
}

}

int main(const int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "{}\n", e.what());
        print_usage();
        return EXIT_USAGE;
    }

    if (opts.command == "help" || opts.command == "--help" || opts.command == "-h") {
        print_usage();
        return 0;
    }

    if (opts.command == "version" || opts.command == "--version") {
        fmt::print("fileops {}\n", FILEOPS_VERSION);
        return 0;
    }

    try {
        ConfigRegistry::init(opts.configPath ? std::filesystem::path(*opts.configPath) : paths::getConfigPath());
        Registry::init();
    } catch (const std::exception& e) {
        fmt::print(stderr, "fileops: startup failed: {}\n", e.what());
        return 1;
    }

    if (opts.json) Registry::setConsoleLevel(spdlog::level::off);
    else if (opts.quiet) Registry::setConsoleLevel(spdlog::level::warn);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const int rc = run_operation(opts);
    spdlog::shutdown();
    return rc;
}
