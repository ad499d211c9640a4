#pragma once

#include "types/ProgressInfo.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileops::concurrency { class Context; }

namespace fileops::progress {

// Mutable progress state for exactly one operation. Written by the operation's own
// thread (and by cancel/pause/resume from outside), read through snapshots.
class OperationTracker {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using Listener = std::function<void(const types::ProgressInfo&)>;

    OperationTracker(std::string id, types::OperationType type, int totalSteps,
                     const config::ProgressConfig& cfg = {}, ClockFn clock = Clock::now);

    OperationTracker(const OperationTracker&) = delete;
    OperationTracker& operator=(const OperationTracker&) = delete;

    void updateStep(const std::string& step);

    // Absolute set of all four counters
    void updateProgress(int64_t itemsProcessed, int64_t totalItems, int64_t bytesProcessed, int64_t totalBytes);
    void incrementProgress(int64_t items, int64_t bytes);
    void setTotals(int64_t totalItems, int64_t totalBytes);
    void setDetail(const std::string& key, nlohmann::json value);
    void addError(const std::string& err);

    // Terminal transitions. Only the first one wins.
    void complete();
    void fail(const std::string& err);
    void cancel();

    // Running -> Paused and Paused -> Running; no-ops from any other status.
    void pause();
    void resume();

    // Blocks while paused. Returns on resume, on cancel(), or once external is done.
    void waitForResume(const concurrency::Context* external = nullptr);

    [[nodiscard]] bool isPaused() const;
    [[nodiscard]] types::OperationStatus status() const;
    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] types::OperationType type() const { return type_; }
    [[nodiscard]] const std::shared_ptr<concurrency::Context>& context() const { return ctx_; }

    [[nodiscard]] double speed() const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> eta() const;
    [[nodiscard]] std::vector<std::string> errors() const;
    [[nodiscard]] int64_t itemsProcessed() const;
    [[nodiscard]] int64_t bytesProcessed() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> endTime() const;

    [[nodiscard]] types::ProgressInfo getProgressInfo() const;

    // Invoked with a fresh snapshot after step changes, pause/resume and terminal transitions.
    void setListener(Listener listener);

private:
    struct SpeedSample {
        Clock::time_point timestamp;
        int64_t items;
        int64_t bytes;
    };

    const std::string id_;
    const types::OperationType type_;
    const size_t maxSpeedSamples_;
    const std::chrono::milliseconds pausePoll_;
    const ClockFn clock_;
    const std::shared_ptr<concurrency::Context> ctx_;

    mutable std::shared_mutex mu_;
    std::condition_variable_any cv_;

    types::OperationStatus status_{types::OperationStatus::Running};
    std::chrono::system_clock::time_point startTime_;
    std::optional<std::chrono::system_clock::time_point> endTime_;
    std::string currentStep_{"Initializing"};
    int stepsCompleted_{0};
    int totalSteps_;
    int64_t itemsProcessed_{0}, totalItems_{0};
    int64_t bytesProcessed_{0}, totalBytes_{0};
    Clock::time_point lastUpdate_;
    std::deque<SpeedSample> speedSamples_;
    nlohmann::json details_ = nlohmann::json::object();
    std::vector<std::string> errors_;

    Listener listener_;

    void addSampleLocked(Clock::time_point now);
    [[nodiscard]] double speedLocked() const;
    [[nodiscard]] std::optional<std::chrono::milliseconds> etaLocked() const;
    [[nodiscard]] types::ProgressInfo snapshotLocked() const;
    bool finishLocked(types::OperationStatus terminal);
    void notify();
};

}
