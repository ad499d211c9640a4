#include "engine/Engine.hpp"
#include "engine/Operation.hpp"
#include "engine/OperationFactory.hpp"
#include "engine/errors.hpp"
#include "engine/ops/Cleanup.hpp"
#include "engine/ops/Consolidation.hpp"
#include "engine/ops/Deduplication.hpp"
#include "engine/ops/Ownership.hpp"
#include "fs/LocalFilesystem.hpp"
#include "progress/Tracker.hpp"
#include "progress/OperationTracker.hpp"
#include "concurrency/Context.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <ctime>
#include <mutex>
#include <ranges>

using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::config;
using namespace fileops::log;

namespace {

Config activeConfig() {
    return ConfigRegistry::isInitialized() ? ConfigRegistry::get() : Config{};
}

}

Engine::Engine(std::shared_ptr<fs::Filesystem> fs, std::shared_ptr<progress::Tracker> tracker)
    : fs_(std::move(fs)), tracker_(std::move(tracker)) {
    if (!fs_ || !tracker_) {
        const auto cfg = activeConfig();
        if (!fs_) fs_ = std::make_shared<fs::LocalFilesystem>(cfg.performance.chunk_size_bytes);
        if (!tracker_) tracker_ = std::make_shared<progress::Tracker>(cfg.progress);
    }

    registerBuiltins();
}

void Engine::registerBuiltins() {
    registerOperation(OperationType::Cleanup, std::make_shared<ops::CleanupFactory>(fs_));
    registerOperation(OperationType::Deduplication, std::make_shared<ops::DeduplicationFactory>(fs_));
    registerOperation(OperationType::Consolidation, std::make_shared<ops::ConsolidationFactory>(fs_));
    registerOperation(OperationType::Ownership, std::make_shared<ops::OwnershipFactory>(fs_));
}

void Engine::registerOperation(const OperationType type, std::shared_ptr<OperationFactory> factory) {
    if (!factory) throw std::invalid_argument("[Engine] Cannot register a null factory for " + to_string(type));
    std::unique_lock lock(mu_);
    factories_[type] = std::move(factory);
}

std::shared_ptr<Operation> Engine::prepareOperation(const OperationType type, const OperationConfig& config) {
    std::shared_ptr<OperationFactory> factory;
    {
        std::shared_lock lock(mu_);
        if (const auto it = factories_.find(type); it != factories_.end()) factory = it->second;
    }

    if (!factory) throw UnsupportedOperation(to_string(type));

    factory->validate(config);

    const auto id = generateOperationId(type);
    auto op = factory->create(id, config);
    if (!op) throw Error("factory for " + to_string(type) + " returned no operation");

    return op;
}

OperationResult Engine::runOperation(const Context& ctx, const std::shared_ptr<Operation>& op,
                                     const OperationConfig& config) {
    const auto tracker = tracker_->startOperation(op->id(), op->type(), op->totalSteps());
    op->bindTracker(tracker);

    Registry::engine()->info("[Engine] Starting operation {} ({})", op->id(), to_string(op->type()));

    try {
        auto result = op->execute(ctx, config);
        tracker->complete();

        Registry::engine()->info("[Engine] Operation {} completed in {} ms: {}",
                                 op->id(), result.duration.count(), result.summary);
        return result;
    } catch (const Cancelled& e) {
        tracker->cancel();
        Registry::engine()->warn("[Engine] Operation {} cancelled: {}", op->id(), e.what());
        throw;
    } catch (const std::exception& e) {
        tracker->fail(e.what());
        Registry::engine()->error("[Engine] Operation {} failed: {}", op->id(), e.what());
        throw;
    }
}

OperationResult Engine::executeOperation(const Context& ctx, const OperationType type, const OperationConfig& config) {
    const auto op = prepareOperation(type, config);
    return runOperation(ctx, op, config);
}

std::vector<OperationType> Engine::supportedOperations() const {
    std::shared_lock lock(mu_);
    std::vector<OperationType> out;
    out.reserve(factories_.size());
    for (const auto& type : factories_ | std::views::keys) out.push_back(type);
    return out;
}

bool Engine::supports(const OperationType type) const {
    std::shared_lock lock(mu_);
    return factories_.contains(type);
}

std::string Engine::generateOperationId(const OperationType type) {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm);

    return to_string(type) + "-" + stamp + "-" + std::to_string(++seq_);
}
