#pragma once

#include "engine/BaseOperation.hpp"
#include "engine/OperationFactory.hpp"
#include "concurrency/Context.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace fileops::test {

// Spins at check points until released, so tests control when an operation ends.
struct Gate {
    std::atomic<bool> released{false};
    std::atomic<int> started{0};
    std::atomic<int> iterations{0};
};

class BlockingOperation final : public engine::BaseOperation {
public:
    BlockingOperation(std::string id, types::OperationConfig config, std::shared_ptr<Gate> gate)
        : BaseOperation(std::move(id), types::OperationType::Pipeline, std::move(config), nullptr),
          gate_(std::move(gate)) {}

    [[nodiscard]] int totalSteps() const override { return 2; }

    types::OperationResult execute(const concurrency::Context& ctx, const types::OperationConfig&) override {
        updateStep("Waiting");
        ++gate_->started;

        while (!gate_->released.load()) {
            checkContext(ctx);
            incrementProgress(1, 0);
            ++gate_->iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }

        updateStep("Done");
        return createResult(types::OperationStatus::Completed, "released", nlohmann::json::object());
    }

    [[nodiscard]] types::ProgressInfo estimateProgress(const types::OperationConfig&) const override {
        return pendingEstimate(2, 0);
    }

private:
    std::shared_ptr<Gate> gate_;
};

class BlockingFactory final : public engine::OperationFactory {
public:
    explicit BlockingFactory(std::shared_ptr<Gate> gate) : OperationFactory(nullptr), gate_(std::move(gate)) {}

    std::shared_ptr<engine::Operation> create(const std::string& id, const types::OperationConfig& config) override {
        return std::make_shared<BlockingOperation>(id, config, gate_);
    }

private:
    std::shared_ptr<Gate> gate_;
};

// Polls pred for up to timeout
template<typename Pred>
bool eventually(Pred pred, const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

}
