#include "engine/ops/Ownership.hpp"
#include "engine/errors.hpp"
#include "fs/Filesystem.hpp"
#include "concurrency/Context.hpp"
#include "util/accounts.hpp"
#include "util/glob.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace fileops::engine::ops;
using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::util;
using namespace fileops::log;

namespace {

size_t relativeDepth(const std::filesystem::path& path, const std::filesystem::path& root) {
    const auto rel = path.lexically_relative(root);
    if (rel.empty() || rel == ".") return 0;
    return static_cast<size_t>(std::distance(rel.begin(), rel.end()));
}

}

OwnershipOperation::OwnershipOperation(std::string id, OperationConfig config, std::shared_ptr<fs::Filesystem> fs)
    : BaseOperation(std::move(id), OperationType::Ownership, std::move(config), std::move(fs)) {}

OwnershipTarget OwnershipOperation::resolveTarget(const OperationConfig& config) {
    const auto user = config.setting("target_user");
    if (!user || user->empty()) throw InvalidConfiguration("target_user parameter is required");

    const auto uidOverride = config.setting("uid");
    const auto uid = uidOverride ? uid_for_user(*uidOverride) : uid_for_user(*user);
    if (!uid) throw InvalidConfiguration("unknown user: " + (uidOverride ? *uidOverride : *user));

    std::optional<gid_t> gid;
    if (const auto gidOverride = config.setting("gid")) {
        gid = gid_for_group(*gidOverride);
        if (!gid) throw InvalidConfiguration("invalid gid: " + *gidOverride);
    } else if (const auto group = config.setting("target_group"); group && !group->empty()) {
        gid = gid_for_group(*group);
        if (!gid) throw InvalidConfiguration("unknown group: " + *group);
    } else {
        gid = primary_gid_for_user(*user);
        if (!gid) throw InvalidConfiguration("cannot determine primary group of " + *user + ", set target_group");
    }

    return {*uid, *gid};
}

OperationResult OwnershipOperation::execute(const Context& ctx, const OperationConfig& config) {
    const auto target = resolveTarget(config);

    updateStep("Scanning paths");
    const auto paths = collectPaths(ctx, config);

    // items keep counting from the scan so they never go backwards
    const auto total = scanned_ + static_cast<int64_t>(paths.size());
    updateProgress(scanned_, total, 0, 0);

    updateStep("Changing ownership");

    int64_t processed = scanned_;
    for (const auto& path : paths) {
        checkContext(ctx);

        try {
            if (!config.dry_run) {
                fs_->chown(path, target.uid, target.gid);
                Registry::audit()->info("[{}] chown {}:{} {}", id_, target.uid, target.gid, path.string());
            }
            changedItems_.push_back(path.string());
        } catch (const std::exception& e) {
            const auto err = fmt::format("{}: {}", path.string(), e.what());
            errors_.push_back(err);
            skippedItems_.push_back(path.string());
            addError(err);
        }

        updateProgress(++processed, total, 0, 0);
    }

    updateStep("Finalizing");

    const auto summary = fmt::format("Ownership change ({}): {} items changed, {} skipped, {} errors",
                                     config.dry_run ? "dry run" : "completed",
                                     changedItems_.size(), skippedItems_.size(), errors_.size());

    Registry::engine()->info("[Ownership] {}", summary);

    nlohmann::json details = {
        {"changed_items", changedItems_},
        {"skipped_items", skippedItems_},
        {"errors", errors_},
        {"uid", target.uid},
        {"gid", target.gid},
        {"dry_run", config.dry_run}
    };

    return createResult(OperationStatus::Completed, summary, std::move(details), changedItems_);
}

std::vector<std::filesystem::path> OwnershipOperation::collectPaths(const Context& ctx, const OperationConfig& config) {
    std::vector<std::filesystem::path> paths;

    for (const auto& pattern : config.include_patterns) {
        const auto root = trimTrailingSeparator(pattern);

        fs_->walk(ctx, root, [&](const std::filesystem::path& path, const fs::model::FileInfo* info,
                                 const std::error_code& ec) {
            if (ec) {
                const auto err = fmt::format("error walking {}: {}", path.string(), ec.message());
                errors_.push_back(err);
                addError(err);
                return;
            }

            checkContext(ctx);

            if (info && !isExcluded(path, config) && (config.recursive || relativeDepth(path, root) <= 1))
                paths.push_back(path);

            if (++scanned_ % 100 == 0 || scanned_ < 100) updateProgress(scanned_, 0, 0, 0);
        });
    }

    return paths;
}

bool OwnershipOperation::isExcluded(const std::filesystem::path& path, const OperationConfig& config) {
    const auto name = baseName(path);
    for (const auto& pattern : config.exclude_patterns) {
        if (pattern.empty()) continue;
        if (globMatch(pattern, path.string()) || globMatch(pattern, name)) return true;
    }
    return false;
}

ProgressInfo OwnershipOperation::estimateProgress(const OperationConfig&) const {
    return pendingEstimate(TOTAL_STEPS, 100);
}

void OwnershipFactory::validate(const OperationConfig& config) const {
    OperationFactory::validate(config);
    if (config.include_patterns.empty()) throw InvalidConfiguration("no paths specified for ownership change");
    (void) OwnershipOperation::resolveTarget(config);
}

std::shared_ptr<Operation> OwnershipFactory::create(const std::string& id, const OperationConfig& config) {
    return std::make_shared<OwnershipOperation>(id, config, fs_);
}
