#pragma once

#include "engine/BaseOperation.hpp"
#include "engine/OperationFactory.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fileops::engine::ops {

struct DuplicateGroup {
    std::string hash;
    uintmax_t size;
    std::vector<std::string> files;
};

void to_json(nlohmann::json& j, const DuplicateGroup& g);

// Report-only: finds files with identical content, never deletes or links them.
class DeduplicationOperation final : public BaseOperation {
public:
    static constexpr int TOTAL_STEPS = 5;

    DeduplicationOperation(std::string id, types::OperationConfig config, std::shared_ptr<fs::Filesystem> fs);

    [[nodiscard]] int totalSteps() const override { return TOTAL_STEPS; }

    types::OperationResult execute(const concurrency::Context& ctx, const types::OperationConfig& config) override;
    [[nodiscard]] types::ProgressInfo estimateProgress(const types::OperationConfig& config) const override;

private:
    std::vector<DuplicateGroup> duplicateGroups_;
    uintmax_t totalSize_{0}, saveableSize_{0};
};

class DeduplicationFactory final : public OperationFactory {
public:
    using OperationFactory::OperationFactory;

    std::shared_ptr<Operation> create(const std::string& id, const types::OperationConfig& config) override;
};

}
