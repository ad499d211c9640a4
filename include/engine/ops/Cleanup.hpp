#pragma once

#include "engine/BaseOperation.hpp"
#include "engine/OperationFactory.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fileops::engine::ops {

// Removes empty directories below each root in include_patterns. Chains of
// directories that only contain empty directories collapse in a single run.
class CleanupOperation final : public BaseOperation {
public:
    static constexpr int TOTAL_STEPS = 4;

    CleanupOperation(std::string id, types::OperationConfig config, std::shared_ptr<fs::Filesystem> fs);

    [[nodiscard]] int totalSteps() const override { return TOTAL_STEPS; }

    types::OperationResult execute(const concurrency::Context& ctx, const types::OperationConfig& config) override;
    [[nodiscard]] types::ProgressInfo estimateProgress(const types::OperationConfig& config) const override;

    static bool shouldProcessDirectory(const std::filesystem::path& dir, const types::OperationConfig& config);

    // Directories that would be removed under root, deepest first.
    std::vector<std::filesystem::path> findEmptyDirectories(const concurrency::Context& ctx,
                                                            const std::filesystem::path& root,
                                                            const types::OperationConfig& config);

private:
    std::vector<std::string> removedDirs_, skippedDirs_;
    int64_t totalDirs_{0};
    int64_t scannedEntries_{0};

    void countDirectories(const concurrency::Context& ctx, const types::OperationConfig& config);
    void processEmptyDirectories(const concurrency::Context& ctx, const types::OperationConfig& config,
                                 const std::vector<std::filesystem::path>& emptyDirs);
};

class CleanupFactory final : public OperationFactory {
public:
    using OperationFactory::OperationFactory;

    void validate(const types::OperationConfig& config) const override;
    std::shared_ptr<Operation> create(const std::string& id, const types::OperationConfig& config) override;
};

}
