#include "progress/OperationTracker.hpp"
#include "concurrency/Context.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

using namespace fileops::progress;
using namespace fileops::types;
using namespace fileops::concurrency;

OperationTracker::OperationTracker(std::string id, const OperationType type, const int totalSteps,
                                   const config::ProgressConfig& cfg, ClockFn clock)
    : id_(std::move(id)),
      type_(type),
      maxSpeedSamples_(std::max(2u, cfg.speed_samples)),
      pausePoll_(cfg.pause_poll_interval),
      clock_(std::move(clock)),
      ctx_(Context::withCancel(Context::background())),
      startTime_(std::chrono::system_clock::now()),
      totalSteps_(totalSteps),
      lastUpdate_(clock_()) {}

void OperationTracker::updateStep(const std::string& step) {
    {
        std::unique_lock lock(mu_);
        currentStep_ = step;
        ++stepsCompleted_;
        lastUpdate_ = clock_();
    }
    notify();
}

void OperationTracker::updateProgress(const int64_t itemsProcessed, const int64_t totalItems,
                                      const int64_t bytesProcessed, const int64_t totalBytes) {
    std::unique_lock lock(mu_);
    itemsProcessed_ = itemsProcessed;
    totalItems_ = totalItems;
    bytesProcessed_ = bytesProcessed;
    totalBytes_ = totalBytes;
    addSampleLocked(clock_());
}

void OperationTracker::incrementProgress(const int64_t items, const int64_t bytes) {
    std::unique_lock lock(mu_);
    itemsProcessed_ += items;
    bytesProcessed_ += bytes;
    addSampleLocked(clock_());
}

void OperationTracker::setTotals(const int64_t totalItems, const int64_t totalBytes) {
    std::unique_lock lock(mu_);
    totalItems_ = totalItems;
    totalBytes_ = totalBytes;
}

void OperationTracker::setDetail(const std::string& key, nlohmann::json value) {
    std::unique_lock lock(mu_);
    details_[key] = std::move(value);
}

void OperationTracker::addError(const std::string& err) {
    std::unique_lock lock(mu_);
    errors_.push_back(err);
}

void OperationTracker::complete() {
    bool changed;
    {
        std::unique_lock lock(mu_);
        changed = finishLocked(OperationStatus::Completed);
    }
    if (changed) notify();
}

void OperationTracker::fail(const std::string& err) {
    bool changed;
    {
        std::unique_lock lock(mu_);
        errors_.push_back(err);
        changed = finishLocked(OperationStatus::Failed);
    }
    if (changed) notify();
}

void OperationTracker::cancel() {
    bool changed;
    {
        std::unique_lock lock(mu_);
        changed = finishLocked(OperationStatus::Cancelled);
    }
    ctx_->cancel();
    cv_.notify_all();
    if (changed) notify();
}

bool OperationTracker::finishLocked(const OperationStatus terminal) {
    if (isTerminal(status_)) return false;
    status_ = terminal;
    endTime_ = std::chrono::system_clock::now();
    cv_.notify_all();
    return true;
}

void OperationTracker::pause() {
    {
        std::unique_lock lock(mu_);
        if (status_ != OperationStatus::Running) return;
        status_ = OperationStatus::Paused;
    }
    notify();
}

void OperationTracker::resume() {
    {
        std::unique_lock lock(mu_);
        if (status_ != OperationStatus::Paused) return;
        status_ = OperationStatus::Running;
    }
    cv_.notify_all();
    notify();
}

void OperationTracker::waitForResume(const Context* external) {
    std::unique_lock lock(mu_);
    while (status_ == OperationStatus::Paused) {
        if (ctx_->done() || (external && external->done())) return;
        cv_.wait_for(lock, pausePoll_);
    }
}

bool OperationTracker::isPaused() const {
    std::shared_lock lock(mu_);
    return status_ == OperationStatus::Paused;
}

OperationStatus OperationTracker::status() const {
    std::shared_lock lock(mu_);
    return status_;
}

double OperationTracker::speed() const {
    std::shared_lock lock(mu_);
    return speedLocked();
}

std::optional<std::chrono::milliseconds> OperationTracker::eta() const {
    std::shared_lock lock(mu_);
    return etaLocked();
}

std::vector<std::string> OperationTracker::errors() const {
    std::shared_lock lock(mu_);
    return errors_;
}

int64_t OperationTracker::itemsProcessed() const {
    std::shared_lock lock(mu_);
    return itemsProcessed_;
}

int64_t OperationTracker::bytesProcessed() const {
    std::shared_lock lock(mu_);
    return bytesProcessed_;
}

std::optional<std::chrono::system_clock::time_point> OperationTracker::endTime() const {
    std::shared_lock lock(mu_);
    return endTime_;
}

ProgressInfo OperationTracker::getProgressInfo() const {
    std::shared_lock lock(mu_);
    return snapshotLocked();
}

void OperationTracker::setListener(Listener listener) {
    std::unique_lock lock(mu_);
    listener_ = std::move(listener);
}

void OperationTracker::addSampleLocked(const Clock::time_point now) {
    speedSamples_.push_back({now, itemsProcessed_, bytesProcessed_});
    while (speedSamples_.size() > maxSpeedSamples_) speedSamples_.pop_front();
    lastUpdate_ = now;
}

double OperationTracker::speedLocked() const {
    if (speedSamples_.size() < 2) return 0.0;

    const auto& oldest = speedSamples_.front();
    const auto& newest = speedSamples_.back();

    const std::chrono::duration<double> elapsed = newest.timestamp - oldest.timestamp;
    if (elapsed.count() <= 0.0) return 0.0;

    return static_cast<double>(newest.items - oldest.items) / elapsed.count();
}

std::optional<std::chrono::milliseconds> OperationTracker::etaLocked() const {
    if (totalItems_ <= 0 || itemsProcessed_ >= totalItems_) return std::nullopt;

    const auto s = speedLocked();
    if (s <= 0.0 || !std::isfinite(s)) return std::nullopt;

    const auto remaining = static_cast<double>(totalItems_ - itemsProcessed_);
    const auto ms = remaining / s * 1000.0;
    if (!std::isfinite(ms)) return std::nullopt;

    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(ms)));
}

ProgressInfo OperationTracker::snapshotLocked() const {
    ProgressInfo info;
    info.id = id_;
    info.operation_type = type_;
    info.status = status_;
    info.start_time = startTime_;
    info.end_time = endTime_;
    info.current_step = currentStep_;
    info.steps_completed = stepsCompleted_;
    info.total_steps = totalSteps_;
    info.items_processed = itemsProcessed_;
    info.total_items = totalItems_;
    info.bytes_processed = bytesProcessed_;
    info.total_bytes = totalBytes_;
    info.speed = speedLocked();
    info.eta = etaLocked();
    info.details = details_;
    info.errors = errors_;

    if (!errors_.empty()) {
        info.error = errors_.back();
        info.details["error_count"] = errors_.size();
    }

    return info;
}

void OperationTracker::notify() {
    Listener listener;
    ProgressInfo info;
    {
        std::shared_lock lock(mu_);
        if (!listener_) return;
        listener = listener_;
        info = snapshotLocked();
    }
    listener(info);
}
