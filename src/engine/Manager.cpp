#include "engine/Manager.hpp"
#include "engine/Engine.hpp"
#include "engine/Operation.hpp"
#include "engine/errors.hpp"
#include "concurrency/Context.hpp"
#include "concurrency/Task.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <ranges>

using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::log;

namespace {

unsigned int resolveMaxConcurrent(const unsigned int requested) {
    if (requested > 0) return requested;
    if (fileops::config::ConfigRegistry::isInitialized())
        return fileops::config::ConfigRegistry::get().performance.max_concurrent_operations;
    return fileops::config::PerformanceConfig{}.max_concurrent_operations;
}

}

struct Manager::OperationTask final : Task {
    Manager* manager;
    std::shared_ptr<Context> ctx;
    std::shared_ptr<Operation> op;
    OperationConfig config;

    OperationTask(Manager* m, std::shared_ptr<Context> c, std::shared_ptr<Operation> o, OperationConfig cfg)
        : manager(m), ctx(std::move(c)), op(std::move(o)), config(std::move(cfg)) {}

    void operator()() override {
        try {
            const auto result = manager->engine_->runOperation(*ctx, op, config);
            Registry::engine()->info("[Manager] Background operation {} completed: {}", op->id(), result.summary);
        } catch (const Cancelled& e) {
            Registry::engine()->info("[Manager] Background operation {} cancelled: {}", op->id(), e.what());
        } catch (const std::exception& e) {
            Registry::engine()->error("[Manager] Background operation {} failed: {}", op->id(), e.what());
        }

        manager->finished(op->id());
    }
};

Manager::Manager(std::shared_ptr<Engine> engine, const unsigned int maxConcurrent)
    : engine_(std::move(engine)),
      maxConcurrent_(resolveMaxConcurrent(maxConcurrent)),
      pool_(std::make_unique<ThreadPool>(maxConcurrent_, "OperationManager")) {
    if (!engine_) throw std::invalid_argument("[Manager] Engine must not be null");
}

Manager::~Manager() {
    for (const auto& id : activeOperations()) {
        if (const auto op = find(id)) op->cancel();
    }
    pool_->stop();
}

std::string Manager::submitOperation(std::shared_ptr<Context> ctx, const OperationType type,
                                     const OperationConfig& config) {
    if (!ctx) ctx = Context::background();

    std::unique_lock lock(mu_);

    if (active_.size() >= maxConcurrent_) throw ConcurrencyLimitExceeded(maxConcurrent_);

    auto op = engine_->prepareOperation(type, config);
    const auto id = op->id();
    active_.emplace(id, op);

    try {
        pool_->submit(std::make_shared<OperationTask>(this, std::move(ctx), std::move(op), config));
    } catch (const std::exception&) {
        active_.erase(id);
        throw;
    }

    Registry::engine()->debug("[Manager] Submitted {} ({} active)", id, active_.size());
    return id;
}

std::shared_ptr<Operation> Manager::find(const std::string& id) const {
    std::scoped_lock lock(mu_);
    const auto it = active_.find(id);
    return it == active_.end() ? nullptr : it->second;
}

void Manager::cancelOperation(const std::string& id) {
    const auto op = find(id);
    if (!op) throw OperationNotFound(id);
    op->cancel();
}

void Manager::pauseOperation(const std::string& id) {
    const auto op = find(id);
    if (!op) throw OperationNotFound(id);
    op->pause();
}

void Manager::resumeOperation(const std::string& id) {
    const auto op = find(id);
    if (!op) throw OperationNotFound(id);
    op->resume();
}

std::vector<std::string> Manager::activeOperations() const {
    std::scoped_lock lock(mu_);
    std::vector<std::string> ids;
    ids.reserve(active_.size());
    for (const auto& id : active_ | std::views::keys) ids.push_back(id);
    return ids;
}

bool Manager::waitIdle(const std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock lock(mu_);
    const auto idle = [this] { return active_.empty(); };
    if (!timeout) {
        idleCv_.wait(lock, idle);
        return true;
    }
    return idleCv_.wait_for(lock, *timeout, idle);
}

void Manager::finished(const std::string& id) {
    {
        std::scoped_lock lock(mu_);
        active_.erase(id);
    }
    idleCv_.notify_all();
}
