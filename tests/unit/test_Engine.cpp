#include <gtest/gtest.h>
#include "engine/Engine.hpp"
#include "engine/Operation.hpp"
#include "engine/errors.hpp"
#include "progress/Tracker.hpp"
#include "concurrency/Context.hpp"
#include "support/BlockingOperation.hpp"
#include "support/TempTree.hpp"

#include <regex>
#include <set>

using namespace fileops::engine;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::test;
using namespace std::chrono_literals;

class EngineTest : public ::testing::Test {
protected:
    std::shared_ptr<Engine> engine = std::make_shared<Engine>();
    TempTree tree{"fileops_engine"};

    OperationConfig cleanupOf(const std::filesystem::path& root) const {
        OperationConfig cfg;
        cfg.include_patterns = {root.string()};
        return cfg;
    }
};

TEST_F(EngineTest, BuiltinsAreRegistered) {
    EXPECT_TRUE(engine->supports(OperationType::Cleanup));
    EXPECT_TRUE(engine->supports(OperationType::Deduplication));
    EXPECT_TRUE(engine->supports(OperationType::Consolidation));
    EXPECT_TRUE(engine->supports(OperationType::Ownership));
    EXPECT_FALSE(engine->supports(OperationType::Similarity));
    EXPECT_EQ(engine->supportedOperations().size(), 4u);
}

TEST_F(EngineTest, UnregisteredKindIsUnsupported) {
    const auto ctx = Context::background();
    try {
        engine->executeOperation(*ctx, OperationType::Similarity, OperationConfig{});
        FAIL() << "expected UnsupportedOperation";
    } catch (const UnsupportedOperation& e) {
        EXPECT_EQ(e.kind, "similarity");
    }
}

TEST_F(EngineTest, InvalidConfigurationNeverStartsATracker) {
    OperationConfig cfg = cleanupOf(tree.root());
    cfg.min_file_size = 10;
    cfg.max_file_size = 5;

    const auto ctx = Context::background();
    EXPECT_THROW(engine->executeOperation(*ctx, OperationType::Cleanup, cfg), InvalidConfiguration);
    EXPECT_EQ(engine->progressTracker()->size(), 0u);
}

TEST_F(EngineTest, CleanupWithoutPathsIsInvalid) {
    const auto ctx = Context::background();
    try {
        engine->executeOperation(*ctx, OperationType::Cleanup, OperationConfig{});
        FAIL() << "expected InvalidConfiguration";
    } catch (const InvalidConfiguration& e) {
        EXPECT_NE(std::string(e.what()).find("no paths"), std::string::npos);
    }
}

TEST_F(EngineTest, IdsAreUniqueAndCarryKindAndTimestamp) {
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) ids.insert(engine->generateOperationId(OperationType::Cleanup));
    EXPECT_EQ(ids.size(), 50u);

    const std::regex shape(R"(cleanup-\d{8}-\d{6}-\d+)");
    for (const auto& id : ids) EXPECT_TRUE(std::regex_match(id, shape)) << id;
}

TEST_F(EngineTest, CompletedRunLeavesCompletedTracker) {
    tree.dir("a");
    tree.file("b/file.txt");

    const auto ctx = Context::background();
    const auto result = engine->executeOperation(*ctx, OperationType::Cleanup, cleanupOf(tree.root()));

    EXPECT_EQ(result.status, OperationStatus::Completed);
    EXPECT_EQ(result.operation_type, OperationType::Cleanup);

    const auto info = engine->progressTracker()->getProgress(result.id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, OperationStatus::Completed);
    EXPECT_TRUE(info->end_time.has_value());
}

TEST_F(EngineTest, CancelledContextYieldsCancelledTracker) {
    tree.dir("a");
    const auto ctx = Context::withCancel(Context::background());
    ctx->cancel();

    EXPECT_THROW(engine->executeOperation(*ctx, OperationType::Cleanup, cleanupOf(tree.root())), Cancelled);

    const auto all = engine->progressTracker()->getAllProgress();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].status, OperationStatus::Cancelled);
    EXPECT_TRUE(tree.exists("a"));
}

TEST_F(EngineTest, RegisteredFactoryRunsAndCanBeCancelledMidway) {
    const auto gate = std::make_shared<Gate>();
    engine->registerOperation(OperationType::Pipeline, std::make_shared<BlockingFactory>(gate));
    EXPECT_TRUE(engine->supports(OperationType::Pipeline));

    const auto op = engine->prepareOperation(OperationType::Pipeline, OperationConfig{});
    const auto ctx = Context::background();

    std::thread runner([&] {
        EXPECT_THROW(engine->runOperation(*ctx, op, OperationConfig{}), Cancelled);
    });

    ASSERT_TRUE(eventually([&] { return gate->started.load() == 1; }));
    op->cancel();
    runner.join();

    EXPECT_EQ(engine->progressTracker()->getProgress(op->id())->status, OperationStatus::Cancelled);
}

TEST_F(EngineTest, PauseHoldsTheOperationUntilResume) {
    const auto gate = std::make_shared<Gate>();
    engine->registerOperation(OperationType::Pipeline, std::make_shared<BlockingFactory>(gate));

    const auto op = engine->prepareOperation(OperationType::Pipeline, OperationConfig{});
    const auto ctx = Context::background();

    std::thread runner([&] {
        const auto result = engine->runOperation(*ctx, op, OperationConfig{});
        EXPECT_EQ(result.status, OperationStatus::Completed);
    });

    ASSERT_TRUE(eventually([&] { return gate->iterations.load() > 0; }));
    op->pause();
    EXPECT_EQ(engine->progressTracker()->getProgress(op->id())->status, OperationStatus::Paused);

    // at most one more iteration may slip through after pause lands
    std::this_thread::sleep_for(20ms);
    const auto held = gate->iterations.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(gate->iterations.load(), held);

    op->resume();
    ASSERT_TRUE(eventually([&] { return gate->iterations.load() > held; }));

    gate->released = true;
    runner.join();
    EXPECT_EQ(engine->progressTracker()->getProgress(op->id())->status, OperationStatus::Completed);
}

TEST_F(EngineTest, CancelWhilePausedEndsCancelled) {
    const auto gate = std::make_shared<Gate>();
    engine->registerOperation(OperationType::Pipeline, std::make_shared<BlockingFactory>(gate));

    const auto op = engine->prepareOperation(OperationType::Pipeline, OperationConfig{});
    const auto ctx = Context::background();

    std::thread runner([&] {
        EXPECT_THROW(engine->runOperation(*ctx, op, OperationConfig{}), Cancelled);
    });

    ASSERT_TRUE(eventually([&] { return gate->iterations.load() > 0; }));
    op->pause();
    std::this_thread::sleep_for(10ms);
    op->cancel();
    runner.join();

    EXPECT_EQ(engine->progressTracker()->getProgress(op->id())->status, OperationStatus::Cancelled);
}

TEST_F(EngineTest, NullFactoryIsRejected) {
    EXPECT_THROW(engine->registerOperation(OperationType::Pipeline, nullptr), std::invalid_argument);
}

TEST_F(EngineTest, EstimateIsPendingWithStepCount) {
    const auto op = engine->prepareOperation(OperationType::Deduplication, OperationConfig{});
    const auto estimate = op->estimateProgress(OperationConfig{});
    EXPECT_EQ(estimate.status, OperationStatus::Pending);
    EXPECT_EQ(estimate.total_steps, 5);
    EXPECT_EQ(estimate.total_items, 1000);
}
