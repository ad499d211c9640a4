#pragma once

#include "engine/Operation.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fileops::fs { class Filesystem; }

namespace fileops::engine {

// Lifecycle shared by every concrete operation: tracker binding, cancel/pause/resume,
// the cooperative check point and result assembly.
class BaseOperation : public Operation {
public:
    BaseOperation(std::string id, types::OperationType type, types::OperationConfig config,
                  std::shared_ptr<fs::Filesystem> fs);

    [[nodiscard]] const std::string& id() const override { return id_; }
    [[nodiscard]] types::OperationType type() const override { return type_; }

    void validate(const types::OperationConfig& config) const override;

    void bindTracker(std::shared_ptr<progress::OperationTracker> tracker) override;
    [[nodiscard]] std::shared_ptr<progress::OperationTracker> tracker() const;

    void cancel() override;
    void pause() override;
    void resume() override;

    [[nodiscard]] bool isCancelled() const { return cancelled_.load(); }

protected:
    const std::string id_;
    const types::OperationType type_;
    const types::OperationConfig config_;
    std::shared_ptr<fs::Filesystem> fs_;
    std::chrono::system_clock::time_point startTime_;

    // Call at iteration boundaries. Throws concurrency::Cancelled (or DeadlineExceeded)
    // and blocks for as long as the operation is paused.
    void checkContext(const concurrency::Context& ctx) const;

    void updateStep(const std::string& step) const;
    void incrementProgress(int64_t items, int64_t bytes) const;
    void updateProgress(int64_t items, int64_t totalItems, int64_t bytes, int64_t totalBytes) const;
    void setTotals(int64_t totalItems, int64_t totalBytes) const;
    void addError(const std::string& err) const;

    [[nodiscard]] types::OperationResult createResult(types::OperationStatus status,
                                                      std::string summary,
                                                      nlohmann::json details,
                                                      std::vector<std::string> filesAffected = {}) const;

    [[nodiscard]] types::ProgressInfo pendingEstimate(int totalSteps, int64_t totalItems) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex trackerMutex_;
    bool paused_{false}; // guarded by trackerMutex_
    std::shared_ptr<progress::OperationTracker> tracker_;
};

}
