#include "engine/ops/Cleanup.hpp"
#include "engine/errors.hpp"
#include "fs/Filesystem.hpp"
#include "concurrency/Context.hpp"
#include "util/glob.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <ranges>
#include <fmt/format.h>

using namespace fileops::engine::ops;
using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::util;
using namespace fileops::log;

namespace {

constexpr std::array<std::string_view, 6> SYSTEM_DIRS = {
    ".git", ".svn", ".hg", "node_modules", "__pycache__", ".DS_Store"
};

size_t depthOf(const std::filesystem::path& p) {
    return static_cast<size_t>(std::distance(p.begin(), p.end()));
}

}

CleanupOperation::CleanupOperation(std::string id, OperationConfig config, std::shared_ptr<fs::Filesystem> fs)
    : BaseOperation(std::move(id), OperationType::Cleanup, std::move(config), std::move(fs)) {}

OperationResult CleanupOperation::execute(const Context& ctx, const OperationConfig& config) {
    updateStep("Scanning directories");
    countDirectories(ctx, config);

    updateStep("Identifying empty directories");
    setTotals(2 * scannedEntries_, 0);

    std::vector<std::filesystem::path> emptyDirs;
    for (const auto& root : config.include_patterns) {
        auto found = findEmptyDirectories(ctx, trimTrailingSeparator(root), config);
        emptyDirs.insert(emptyDirs.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }

    updateStep("Processing empty directories");
    setTotals(2 * scannedEntries_ + static_cast<int64_t>(emptyDirs.size()), 0);
    processEmptyDirectories(ctx, config, emptyDirs);

    updateStep("Completing cleanup");

    nlohmann::json details = {
        {"removed_directories", removedDirs_},
        {"skipped_directories", skippedDirs_},
        {"total_directories", totalDirs_},
        {"dry_run", config.dry_run}
    };

    const auto summary = config.dry_run
        ? fmt::format("Cleanup (dry run): {} directories would be removed, {} skipped", removedDirs_.size(), skippedDirs_.size())
        : fmt::format("Cleanup completed: {} directories removed, {} skipped", removedDirs_.size(), skippedDirs_.size());

    return createResult(OperationStatus::Completed, summary, std::move(details), removedDirs_);
}

ProgressInfo CleanupOperation::estimateProgress(const OperationConfig&) const {
    return pendingEstimate(TOTAL_STEPS, 100);
}

void CleanupOperation::countDirectories(const Context& ctx, const OperationConfig& config) {
    for (const auto& rootPattern : config.include_patterns) {
        checkContext(ctx);
        const auto root = trimTrailingSeparator(rootPattern);

        fs_->walk(ctx, root, [&](const std::filesystem::path& path, const fs::model::FileInfo* info,
                                 const std::error_code& ec) {
            if (ec || !info) return; // reported by the detection pass

            checkContext(ctx);

            if (info->is_dir && path != root && shouldProcessDirectory(path, config)) ++totalDirs_;

            ++scannedEntries_;
            incrementProgress(1, 0);
        });
    }
}

std::vector<std::filesystem::path> CleanupOperation::findEmptyDirectories(const Context& ctx,
                                                                          const std::filesystem::path& root,
                                                                          const OperationConfig& config) {
    // directory -> direct children seen during the walk
    std::map<std::filesystem::path, std::vector<std::filesystem::path>> dirContents;

    fs_->walk(ctx, root, [&](const std::filesystem::path& path, const fs::model::FileInfo* info,
                             const std::error_code& ec) {
        if (ec) {
            addError(fmt::format("error accessing {}: {}", path.string(), ec.message()));
            return;
        }

        checkContext(ctx);

        if (info) {
            if (path != root) dirContents[path.parent_path()].push_back(path);
            if (info->is_dir) dirContents.try_emplace(path);
        }

        incrementProgress(1, 0);
    });

    // Deepest directories first so a parent sees the verdict of every child directory.
    std::vector<std::filesystem::path> dirs;
    dirs.reserve(dirContents.size());
    for (const auto& dir : dirContents | std::views::keys) dirs.push_back(dir);
    std::ranges::stable_sort(dirs, [](const auto& a, const auto& b) { return depthOf(a) > depthOf(b); });

    std::map<std::filesystem::path, bool> removable;
    std::vector<std::filesystem::path> emptyDirs;

    for (const auto& dir : dirs) {
        if (dir == root || !shouldProcessDirectory(dir, config)) {
            removable[dir] = false;
            continue;
        }

        const auto& children = dirContents[dir];
        bool candidate;

        if (children.empty()) {
            // Authoritative re-check; the map is a single snapshot
            try {
                candidate = fs_->exists(dir) && fs_->isEmpty(dir);
            } catch (const std::exception& e) {
                Registry::fs()->debug("[Cleanup] Emptiness check failed for {}: {}", dir.string(), e.what());
                candidate = false;
            }
        } else {
            candidate = std::ranges::all_of(children, [&](const auto& child) {
                const auto it = removable.find(child);
                return it != removable.end() && it->second;
            });
        }

        removable[dir] = candidate;
        if (candidate) emptyDirs.push_back(dir);
    }

    return emptyDirs;
}

void CleanupOperation::processEmptyDirectories(const Context& ctx, const OperationConfig& config,
                                               const std::vector<std::filesystem::path>& emptyDirs) {
    for (const auto& dir : emptyDirs) {
        checkContext(ctx);

        if (config.dry_run) {
            removedDirs_.push_back(dir.string());
            Registry::engine()->info("[Cleanup] Would remove empty directory {}", dir.string());
            incrementProgress(1, 0);
            continue;
        }

        if (config.backup_before_delete && !config.backup_directory.empty())
            Registry::engine()->info("[Cleanup] Empty directory marked for removal {}", dir.string());

        try {
            if (!fs_->isEmpty(dir)) {
                Registry::engine()->debug("[Cleanup] {} is no longer empty, leaving it", dir.string());
                skippedDirs_.push_back(dir.string());
                incrementProgress(1, 0);
                continue;
            }

            fs_->remove(dir);
            removedDirs_.push_back(dir.string());
            Registry::engine()->info("[Cleanup] Removed empty directory {}", dir.string());
            Registry::audit()->info("[{}] rmdir {}", id_, dir.string());
        } catch (const std::exception& e) {
            addError(fmt::format("failed to remove directory {}: {}", dir.string(), e.what()));
            skippedDirs_.push_back(dir.string());
        }

        incrementProgress(1, 0);
    }
}

bool CleanupOperation::shouldProcessDirectory(const std::filesystem::path& dir, const OperationConfig& config) {
    const auto name = baseName(dir);

    for (const auto& pattern : config.exclude_patterns) {
        if (pattern.empty()) continue;
        if (globMatch(pattern, name)) return false;
        if (containsIgnoreCase(dir.string(), pattern)) return false;
    }

    if (std::ranges::find(SYSTEM_DIRS, name) != SYSTEM_DIRS.end()) return false;

    if (isHiddenName(name) && !anyGlobMatch(config.include_patterns, name)) return false;

    return true;
}

void CleanupFactory::validate(const OperationConfig& config) const {
    OperationFactory::validate(config);
    if (config.include_patterns.empty()) throw InvalidConfiguration("no paths specified for cleanup");
}

std::shared_ptr<Operation> CleanupFactory::create(const std::string& id, const OperationConfig& config) {
    return std::make_shared<CleanupOperation>(id, config, fs_);
}
