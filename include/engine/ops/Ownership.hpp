#pragma once

#include "engine/BaseOperation.hpp"
#include "engine/OperationFactory.hpp"

#include <filesystem>
#include <string>
#include <sys/types.h>
#include <vector>

namespace fileops::engine::ops {

struct OwnershipTarget {
    uid_t uid;
    gid_t gid;
};

// Changes the owner of every path under the include_patterns roots.
//
// Target comes from custom_settings: target_user (name or uid), optional target_group,
// optional numeric uid/gid overrides. Without a group the user's primary group is used.
class OwnershipOperation final : public BaseOperation {
public:
    static constexpr int TOTAL_STEPS = 3;

    OwnershipOperation(std::string id, types::OperationConfig config, std::shared_ptr<fs::Filesystem> fs);

    [[nodiscard]] int totalSteps() const override { return TOTAL_STEPS; }

    types::OperationResult execute(const concurrency::Context& ctx, const types::OperationConfig& config) override;
    [[nodiscard]] types::ProgressInfo estimateProgress(const types::OperationConfig& config) const override;

    // Throws InvalidConfiguration when the user or group cannot be resolved.
    static OwnershipTarget resolveTarget(const types::OperationConfig& config);

private:
    std::vector<std::string> changedItems_, skippedItems_, errors_;
    int64_t scanned_{0};

    std::vector<std::filesystem::path> collectPaths(const concurrency::Context& ctx, const types::OperationConfig& config);
    static bool isExcluded(const std::filesystem::path& path, const types::OperationConfig& config);
};

class OwnershipFactory final : public OperationFactory {
public:
    using OperationFactory::OperationFactory;

    void validate(const types::OperationConfig& config) const override;
    std::shared_ptr<Operation> create(const std::string& id, const types::OperationConfig& config) override;
};

}
