#pragma once

#include "engine/BaseOperation.hpp"
#include "engine/OperationFactory.hpp"

#include <string>
#include <vector>

namespace fileops::engine::ops {

// Placeholder. Plans nothing yet, moves nothing, reports an empty result.
class ConsolidationOperation final : public BaseOperation {
public:
    static constexpr int TOTAL_STEPS = 4;

    ConsolidationOperation(std::string id, types::OperationConfig config, std::shared_ptr<fs::Filesystem> fs);

    [[nodiscard]] int totalSteps() const override { return TOTAL_STEPS; }

    types::OperationResult execute(const concurrency::Context& ctx, const types::OperationConfig& config) override;
    [[nodiscard]] types::ProgressInfo estimateProgress(const types::OperationConfig& config) const override;

private:
    std::vector<std::string> movedFiles_, copiedFiles_;
};

class ConsolidationFactory final : public OperationFactory {
public:
    using OperationFactory::OperationFactory;

    std::shared_ptr<Operation> create(const std::string& id, const types::OperationConfig& config) override;
};

}
