#include "progress/Tracker.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <mutex>
#include <ranges>
#include <stdexcept>

using namespace fileops::progress;
using namespace fileops::types;
using namespace fileops::log;

Tracker::Tracker(const config::ProgressConfig& cfg) : cfg_(cfg) {}

std::shared_ptr<OperationTracker> Tracker::startOperation(const std::string& id, const OperationType type,
                                                          const int totalSteps,
                                                          OperationTracker::ClockFn clock) {
    const auto self = weak_from_this();
    if (self.expired()) throw std::logic_error("[Tracker] progress::Tracker must be owned by a std::shared_ptr");

    auto tracker = std::make_shared<OperationTracker>(id, type, totalSteps, cfg_, std::move(clock));
    tracker->setListener([self](const ProgressInfo& info) {
        if (const auto registry = self.lock()) registry->reportProgress(info);
    });

    {
        std::unique_lock lock(opsMutex_);
        if (operations_.contains(id)) throw std::invalid_argument("[Tracker] Operation already tracked: " + id);
        operations_.emplace(id, tracker);
    }

    Registry::progress()->debug("[Tracker] Tracking {} ({}, {} steps)", id, to_string(type), totalSteps);

    reportProgress(tracker->getProgressInfo());
    return tracker;
}

std::shared_ptr<OperationTracker> Tracker::getOperation(const std::string& id) const {
    std::shared_lock lock(opsMutex_);
    const auto it = operations_.find(id);
    return it == operations_.end() ? nullptr : it->second;
}

std::optional<ProgressInfo> Tracker::getProgress(const std::string& id) const {
    const auto tracker = getOperation(id);
    if (!tracker) return std::nullopt;
    return tracker->getProgressInfo();
}

std::vector<ProgressInfo> Tracker::getAllProgress() const {
    std::vector<std::shared_ptr<OperationTracker>> trackers;
    {
        std::shared_lock lock(opsMutex_);
        trackers.reserve(operations_.size());
        for (const auto& t : operations_ | std::views::values) trackers.push_back(t);
    }

    std::vector<ProgressInfo> out;
    out.reserve(trackers.size());
    for (const auto& t : trackers) out.push_back(t->getProgressInfo());

    std::ranges::sort(out, [](const ProgressInfo& a, const ProgressInfo& b) {
        return a.start_time == b.start_time ? a.id < b.id : a.start_time < b.start_time;
    });
    return out;
}

Subscription Tracker::subscribe(const std::string& id, const size_t capacity) {
    auto ch = std::make_shared<concurrency::Channel<ProgressInfo>>(capacity == 0 ? cfg_.subscriber_buffer : capacity);
    std::unique_lock lock(subsMutex_);
    subscribers_[id].push_back(ch);
    return ch;
}

void Tracker::unsubscribe(const std::string& id) {
    std::vector<Subscription> dropped;
    {
        std::unique_lock lock(subsMutex_);
        if (const auto it = subscribers_.find(id); it != subscribers_.end()) {
            dropped = std::move(it->second);
            subscribers_.erase(it);
        }
    }
    for (const auto& ch : dropped) ch->close();
}

void Tracker::reportProgress(const ProgressInfo& info) const {
    std::vector<Subscription> targets;
    {
        std::shared_lock lock(subsMutex_);
        if (const auto it = subscribers_.find(info.id); it != subscribers_.end())
            targets.insert(targets.end(), it->second.begin(), it->second.end());
        if (const auto it = subscribers_.find(ALL_OPERATIONS); it != subscribers_.end())
            targets.insert(targets.end(), it->second.begin(), it->second.end());
    }

    for (const auto& ch : targets) ch->trySend(info);
}

void Tracker::reportRunning() const {
    std::vector<std::shared_ptr<OperationTracker>> active;
    {
        std::shared_lock lock(opsMutex_);
        for (const auto& t : operations_ | std::views::values) {
            const auto s = t->status();
            if (s == OperationStatus::Running || s == OperationStatus::Paused) active.push_back(t);
        }
    }

    for (const auto& t : active) reportProgress(t->getProgressInfo());
}

size_t Tracker::cleanupCompleted(const std::chrono::system_clock::duration maxAge) {
    const auto cutoff = std::chrono::system_clock::now() - maxAge;

    std::vector<std::string> evicted;
    {
        std::unique_lock lock(opsMutex_);
        for (auto it = operations_.begin(); it != operations_.end();) {
            const auto status = it->second->status();
            const auto end = it->second->endTime();
            if (isTerminal(status) && end && *end <= cutoff) {
                evicted.push_back(it->first);
                it = operations_.erase(it);
            } else ++it;
        }
    }

    for (const auto& id : evicted) unsubscribe(id);

    size_t abandoned = 0;
    {
        std::unique_lock lock(subsMutex_);
        for (auto it = subscribers_.begin(); it != subscribers_.end();) {
            abandoned += std::erase_if(it->second, [](const Subscription& ch) { return ch.use_count() == 1; });
            if (it->second.empty()) it = subscribers_.erase(it);
            else ++it;
        }
    }

    if (abandoned > 0)
        Registry::progress()->debug("[Tracker] Dropped {} abandoned subscription(s)", abandoned);

    if (!evicted.empty())
        Registry::progress()->debug("[Tracker] Evicted {} finished operation(s)", evicted.size());

    return evicted.size();
}

nlohmann::json Tracker::stats() const {
    std::shared_lock lock(opsMutex_);

    nlohmann::json byStatus = nlohmann::json::object();
    nlohmann::json byType = nlohmann::json::object();

    for (const auto& t : operations_ | std::views::values) {
        const auto s = to_string(t->status());
        const auto k = to_string(t->type());
        byStatus[s] = byStatus.value(s, 0) + 1;
        byType[k] = byType.value(k, 0) + 1;
    }

    return {
        {"total_operations", operations_.size()},
        {"by_status", byStatus},
        {"by_type", byType}
    };
}

size_t Tracker::size() const {
    std::shared_lock lock(opsMutex_);
    return operations_.size();
}

size_t Tracker::subscriptionCount() const {
    std::shared_lock lock(subsMutex_);
    size_t n = 0;
    for (const auto& subs : subscribers_ | std::views::values) n += subs.size();
    return n;
}
