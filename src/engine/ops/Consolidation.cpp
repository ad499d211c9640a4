#include "engine/ops/Consolidation.hpp"
#include "concurrency/Context.hpp"

using namespace fileops::engine::ops;
using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;

ConsolidationOperation::ConsolidationOperation(std::string id, OperationConfig config, std::shared_ptr<fs::Filesystem> fs)
    : BaseOperation(std::move(id), OperationType::Consolidation, std::move(config), std::move(fs)) {}

OperationResult ConsolidationOperation::execute(const Context& ctx, const OperationConfig& config) {
    updateStep("Planning consolidation");
    checkContext(ctx);

    nlohmann::json details = {
        {"moved_files", movedFiles_},
        {"copied_files", copiedFiles_},
        {"dry_run", config.dry_run}
    };

    return createResult(OperationStatus::Completed,
                        "Consolidation operation completed (placeholder implementation)",
                        std::move(details));
}

ProgressInfo ConsolidationOperation::estimateProgress(const OperationConfig&) const {
    return pendingEstimate(TOTAL_STEPS, 500);
}

std::shared_ptr<Operation> ConsolidationFactory::create(const std::string& id, const OperationConfig& config) {
    return std::make_shared<ConsolidationOperation>(id, config, fs_);
}
