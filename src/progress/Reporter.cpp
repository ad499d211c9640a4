#include "progress/Reporter.hpp"
#include "progress/Tracker.hpp"
#include "log/Registry.hpp"

using namespace fileops::progress;
using namespace fileops::log;

Reporter::Reporter(std::shared_ptr<Tracker> tracker, const config::ProgressConfig& cfg)
    : AsyncService("ProgressReporter"),
      tracker_(std::move(tracker)),
      interval_(cfg.report_interval),
      retention_(cfg.retention) {}

Reporter::~Reporter() {
    // runLoop touches members of this class, stop before they are destroyed
    stop();
}

void Reporter::runLoop() {
    while (!shouldStop()) {
        lazySleep(interval_);
        if (shouldStop()) break;

        try {
            tracker_->reportRunning();
            tracker_->cleanupCompleted(retention_);
        } catch (const std::exception& e) {
            Registry::progress()->warn("[ProgressReporter] Tick failed: {}", e.what());
        }
    }
}
