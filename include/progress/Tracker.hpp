#pragma once

#include "progress/OperationTracker.hpp"
#include "concurrency/Channel.hpp"
#include "config/Config.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace fileops::progress {

using Subscription = std::shared_ptr<concurrency::Channel<types::ProgressInfo>>;

// Registry of per-operation trackers plus subscriber fan-out. Must be owned by a
// std::shared_ptr; trackers it starts report back through a weak reference.
class Tracker : public std::enable_shared_from_this<Tracker> {
public:
    static constexpr const char* ALL_OPERATIONS = "*";

    explicit Tracker(const config::ProgressConfig& cfg = {});

    // Throws std::invalid_argument if id is already tracked.
    std::shared_ptr<OperationTracker> startOperation(const std::string& id, types::OperationType type,
                                                     int totalSteps,
                                                     OperationTracker::ClockFn clock = OperationTracker::Clock::now);

    [[nodiscard]] std::shared_ptr<OperationTracker> getOperation(const std::string& id) const;
    [[nodiscard]] std::optional<types::ProgressInfo> getProgress(const std::string& id) const;
    [[nodiscard]] std::vector<types::ProgressInfo> getAllProgress() const;

    // Use ALL_OPERATIONS to receive every operation's snapshots. Subscribing before the
    // operation starts is allowed. A subscription stays registered until unsubscribe(), the
    // eviction of its operation, or a cleanupCompleted() pass after the caller drops its handle.
    Subscription subscribe(const std::string& id, size_t capacity = 0);
    void unsubscribe(const std::string& id);

    // Offers info to every matching subscriber without blocking; full channels miss it.
    void reportProgress(const types::ProgressInfo& info) const;

    // Re-broadcasts a snapshot of every running or paused operation.
    void reportRunning() const;

    // Evicts terminal trackers that ended more than maxAge ago and drops subscriptions
    // whose handle nobody holds any more. Returns the tracker eviction count.
    size_t cleanupCompleted(std::chrono::system_clock::duration maxAge);

    [[nodiscard]] nlohmann::json stats() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t subscriptionCount() const;
    [[nodiscard]] const config::ProgressConfig& config() const { return cfg_; }

private:
    const config::ProgressConfig cfg_;

    mutable std::shared_mutex opsMutex_;
    std::unordered_map<std::string, std::shared_ptr<OperationTracker>> operations_;

    mutable std::shared_mutex subsMutex_;
    std::unordered_map<std::string, std::vector<Subscription>> subscribers_;
};

}
