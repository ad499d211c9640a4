#pragma once

#include "types/OperationConfig.hpp"
#include "types/OperationResult.hpp"
#include "types/ProgressInfo.hpp"

#include <memory>
#include <string>

namespace fileops::concurrency { class Context; }
namespace fileops::progress { class OperationTracker; }

namespace fileops::engine {

class Operation {
public:
    virtual ~Operation() = default;

    [[nodiscard]] virtual const std::string& id() const = 0;
    [[nodiscard]] virtual types::OperationType type() const = 0;

    // Number of phases reported through the tracker
    [[nodiscard]] virtual int totalSteps() const = 0;

    // Runs to completion. Throws concurrency::Cancelled when cancelled or when ctx is
    // done; any other exception is a hard failure. Per-item problems land in the result.
    virtual types::OperationResult execute(const concurrency::Context& ctx, const types::OperationConfig& config) = 0;

    virtual void validate(const types::OperationConfig& config) const = 0;
    [[nodiscard]] virtual types::ProgressInfo estimateProgress(const types::OperationConfig& config) const = 0;

    virtual void bindTracker(std::shared_ptr<progress::OperationTracker> tracker) = 0;

    virtual void cancel() = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
};

}
