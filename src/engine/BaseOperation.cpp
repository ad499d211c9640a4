#include "engine/BaseOperation.hpp"
#include "engine/errors.hpp"
#include "progress/OperationTracker.hpp"
#include "concurrency/Context.hpp"
#include "log/Registry.hpp"

using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::log;

BaseOperation::BaseOperation(std::string id, const OperationType type, OperationConfig config,
                             std::shared_ptr<fs::Filesystem> fs)
    : id_(std::move(id)),
      type_(type),
      config_(std::move(config)),
      fs_(std::move(fs)),
      startTime_(std::chrono::system_clock::now()) {}

void BaseOperation::validate(const OperationConfig& config) const {
    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        throw InvalidConfiguration(e.what());
    }
}

void BaseOperation::bindTracker(std::shared_ptr<progress::OperationTracker> tracker) {
    {
        std::scoped_lock lock(trackerMutex_);
        tracker_ = std::move(tracker);
        // pause() and cancel() may have landed before the tracker existed
        if (tracker_ && paused_) tracker_->pause();
    }
    if (const auto t = this->tracker(); t && isCancelled()) t->cancel();
}

std::shared_ptr<fileops::progress::OperationTracker> BaseOperation::tracker() const {
    std::scoped_lock lock(trackerMutex_);
    return tracker_;
}

void BaseOperation::cancel() {
    cancelled_.store(true);
    if (const auto t = tracker()) t->cancel();
}

void BaseOperation::pause() {
    std::scoped_lock lock(trackerMutex_);
    paused_ = true;
    if (tracker_) tracker_->pause();
}

void BaseOperation::resume() {
    std::scoped_lock lock(trackerMutex_);
    paused_ = false;
    if (tracker_) tracker_->resume();
}

void BaseOperation::checkContext(const Context& ctx) const {
    ctx.throwIfDone();
    if (isCancelled()) throw Cancelled("operation cancelled");

    const auto t = tracker();
    if (!t || !t->isPaused()) return;

    t->waitForResume(&ctx);

    ctx.throwIfDone();
    if (isCancelled() || t->context()->done()) throw Cancelled("operation cancelled");
}

void BaseOperation::updateStep(const std::string& step) const {
    if (const auto t = tracker()) t->updateStep(step);
}

void BaseOperation::incrementProgress(const int64_t items, const int64_t bytes) const {
    if (const auto t = tracker()) t->incrementProgress(items, bytes);
}

void BaseOperation::updateProgress(const int64_t items, const int64_t totalItems,
                                   const int64_t bytes, const int64_t totalBytes) const {
    if (const auto t = tracker()) t->updateProgress(items, totalItems, bytes, totalBytes);
}

void BaseOperation::setTotals(const int64_t totalItems, const int64_t totalBytes) const {
    if (const auto t = tracker()) t->setTotals(totalItems, totalBytes);
}

void BaseOperation::addError(const std::string& err) const {
    if (const auto t = tracker()) t->addError(err);
    Registry::engine()->warn("[{}] {}", id_, err);
}

OperationResult BaseOperation::createResult(const OperationStatus status, std::string summary,
                                            nlohmann::json details,
                                            std::vector<std::string> filesAffected) const {
    OperationResult result;
    result.id = id_;
    result.operation_type = type_;
    result.status = status;
    result.start_time = startTime_;
    result.end_time = std::chrono::system_clock::now();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(result.end_time - result.start_time);
    result.summary = std::move(summary);
    result.details = std::move(details);
    result.files_affected = std::move(filesAffected);

    if (const auto t = tracker()) {
        result.items_processed = t->itemsProcessed();
        result.bytes_processed = t->bytesProcessed();

        const auto kind = to_string(type_);
        for (const auto& err : t->errors())
            result.errors.push_back({
                .file = {},
                .operation = kind,
                .error = err,
                .timestamp = result.end_time,
                .recoverable = true
            });
    }

    return result;
}

ProgressInfo BaseOperation::pendingEstimate(const int totalSteps, const int64_t totalItems) const {
    ProgressInfo info;
    info.id = id_;
    info.operation_type = type_;
    info.status = OperationStatus::Pending;
    info.start_time = startTime_;
    info.total_steps = totalSteps;
    info.total_items = totalItems;
    return info;
}
