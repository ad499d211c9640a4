#pragma once

#include "types/OperationConfig.hpp"
#include "types/OperationType.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fileops::concurrency {
class Context;
class ThreadPool;
}

namespace fileops::engine {

class Engine;
class Operation;

// Runs operations in the background with a hard cap on how many are active at once.
class Manager {
public:
    // maxConcurrent == 0 takes performance.max_concurrent_operations from config.
    explicit Manager(std::shared_ptr<Engine> engine, unsigned int maxConcurrent = 0);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Throws ConcurrencyLimitExceeded when the cap is reached; never queues.
    // Configuration problems surface here as UnsupportedOperation / InvalidConfiguration.
    std::string submitOperation(std::shared_ptr<concurrency::Context> ctx,
                                types::OperationType type,
                                const types::OperationConfig& config);

    // Throw OperationNotFound when id is not active
    void cancelOperation(const std::string& id);
    void pauseOperation(const std::string& id);
    void resumeOperation(const std::string& id);

    [[nodiscard]] std::vector<std::string> activeOperations() const;
    [[nodiscard]] unsigned int maxConcurrent() const { return maxConcurrent_; }

    // Blocks until no operation is active. Returns false if timeout elapsed first.
    bool waitIdle(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    [[nodiscard]] const std::shared_ptr<Engine>& engine() const { return engine_; }

private:
    struct OperationTask;

    std::shared_ptr<Engine> engine_;
    const unsigned int maxConcurrent_;

    mutable std::mutex mu_;
    std::condition_variable idleCv_;
    std::unordered_map<std::string, std::shared_ptr<Operation>> active_;

    std::unique_ptr<concurrency::ThreadPool> pool_;

    std::shared_ptr<Operation> find(const std::string& id) const;
    void finished(const std::string& id);
};

}
