#include <gtest/gtest.h>
#include "engine/Engine.hpp"
#include "engine/ops/Cleanup.hpp"
#include "progress/Tracker.hpp"
#include "concurrency/Context.hpp"
#include "support/RecordingFilesystem.hpp"
#include "support/TempTree.hpp"

using namespace fileops::engine;
using namespace fileops::engine::ops;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::test;

class CleanupTest : public ::testing::Test {
protected:
    TempTree tree{"fileops_cleanup"};
    std::shared_ptr<RecordingFilesystem> fs = std::make_shared<RecordingFilesystem>();
    std::shared_ptr<Engine> engine = std::make_shared<Engine>(fs);
    std::shared_ptr<Context> ctx = Context::withCancel(Context::background());

    OperationConfig config(const bool dryRun = false) const {
        OperationConfig cfg;
        cfg.dry_run = dryRun;
        cfg.include_patterns = {tree.root().string()};
        return cfg;
    }

    OperationResult run(const OperationConfig& cfg) const {
        return engine->executeOperation(*ctx, OperationType::Cleanup, cfg);
    }

    std::string abs(const std::string& rel) const { return (tree.root() / rel).string(); }

    static std::vector<std::string> removed(const OperationResult& r) {
        return r.details.at("removed_directories").get<std::vector<std::string>>();
    }

    static std::vector<std::string> skipped(const OperationResult& r) {
        return r.details.at("skipped_directories").get<std::vector<std::string>>();
    }
};

TEST_F(CleanupTest, RemovesEmptyDirectoryAndLeavesPopulatedOne) {
    tree.dir("a");
    tree.file("b/file.txt");

    const auto result = run(config());

    EXPECT_EQ(result.status, OperationStatus::Completed);
    EXPECT_EQ(removed(result), std::vector<std::string>{abs("a")});
    EXPECT_EQ(result.files_affected, std::vector<std::string>{abs("a")});
    EXPECT_FALSE(tree.exists("a"));
    EXPECT_TRUE(tree.exists("b/file.txt"));
    EXPECT_EQ(result.summary, "Cleanup completed: 1 directories removed, 0 skipped");
}

TEST_F(CleanupTest, CollapsesNestedEmptyChainDeepestFirst) {
    tree.dir("x/y/z");
    tree.dir("x/w");

    const auto result = run(config());

    const std::vector<std::string> expected{abs("x/y/z"), abs("x/w"), abs("x/y"), abs("x")};
    EXPECT_EQ(removed(result), expected);
    EXPECT_FALSE(tree.exists("x"));
    EXPECT_TRUE(std::filesystem::exists(tree.root()));
}

TEST_F(CleanupTest, DryRunNeverRemoves) {
    tree.dir("a/b");
    tree.file("keep/f");

    const auto result = run(config(true));

    EXPECT_EQ(fs->removeCalls.load(), 0);
    EXPECT_TRUE(tree.exists("a/b"));
    EXPECT_EQ(removed(result), (std::vector<std::string>{abs("a/b"), abs("a")}));
    EXPECT_TRUE(result.details.at("dry_run").get<bool>());
    EXPECT_EQ(result.summary, "Cleanup (dry run): 2 directories would be removed, 0 skipped");
}

TEST_F(CleanupTest, RootIsNeverRemoved) {
    const auto result = run(config());
    EXPECT_TRUE(removed(result).empty());
    EXPECT_TRUE(std::filesystem::exists(tree.root()));
}

TEST_F(CleanupTest, TrailingSeparatorOnRootIsHarmless) {
    tree.dir("a");
    auto cfg = config();
    cfg.include_patterns = {tree.root().string() + "/"};

    const auto result = run(cfg);
    EXPECT_EQ(removed(result), std::vector<std::string>{abs("a")});
    EXPECT_TRUE(std::filesystem::exists(tree.root()));
}

TEST_F(CleanupTest, ExcludedSubstringProtectsNestedDirectories) {
    tree.dir("pkg/node_modules/x");
    tree.dir("other");

    auto cfg = config();
    cfg.exclude_patterns = {"node_modules"};
    const auto result = run(cfg);

    EXPECT_EQ(removed(result), std::vector<std::string>{abs("other")});
    EXPECT_TRUE(tree.exists("pkg/node_modules/x"));
}

TEST_F(CleanupTest, SystemAndHiddenDirectoriesAreKept) {
    tree.dir(".git");
    tree.dir(".cache");
    tree.dir("__pycache__");
    tree.dir("plain");

    const auto result = run(config());

    EXPECT_EQ(removed(result), std::vector<std::string>{abs("plain")});
    EXPECT_TRUE(tree.exists(".git"));
    EXPECT_TRUE(tree.exists(".cache"));
    EXPECT_TRUE(tree.exists("__pycache__"));
}

TEST_F(CleanupTest, RemovalFailureIsRecordedAndParentKept) {
    tree.dir("p/q");
    fs->failRemoveOf(tree.root() / "p" / "q");

    const auto result = run(config());

    EXPECT_EQ(result.status, OperationStatus::Completed);
    EXPECT_TRUE(removed(result).empty());
    EXPECT_EQ(skipped(result), (std::vector<std::string>{abs("p/q"), abs("p")}));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_TRUE(result.errors[0].recoverable);
    EXPECT_NE(result.errors[0].error.find("failed to remove directory"), std::string::npos);
    EXPECT_TRUE(tree.exists("p/q"));
}

TEST_F(CleanupTest, DirectoryFilledDuringScanIsKept) {
    tree.dir("late");
    // "late" gains a file between the counting pass and the detection pass
    int visits = 0;
    fs->onVisit = [&](const std::filesystem::path& p) {
        if (p == tree.root() / "late" && ++visits == 2) tree.file("late/new.txt");
    };

    const auto result = run(config());

    EXPECT_TRUE(removed(result).empty());
    EXPECT_TRUE(tree.exists("late/new.txt"));
}

TEST_F(CleanupTest, CancelDuringWalkStopsBeforeAnyRemoval) {
    for (int i = 0; i < 20; ++i) tree.dir("d" + std::to_string(i));
    fs->onVisit = [&](const std::filesystem::path&) {
        if (fs->visited.load() == 5) ctx->cancel();
    };

    EXPECT_THROW(run(config()), Cancelled);
    EXPECT_EQ(fs->removeCalls.load(), 0);

    const auto all = engine->progressTracker()->getAllProgress();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].status, OperationStatus::Cancelled);
}

TEST_F(CleanupTest, CancelByIdDuringCountingWalkStopsIt) {
    for (int i = 0; i < 20; ++i) tree.dir("d" + std::to_string(i));

    const auto op = engine->prepareOperation(OperationType::Cleanup, config());
    fs->onVisit = [&](const std::filesystem::path&) {
        if (fs->visited.load() == 5) op->cancel();
    };

    EXPECT_THROW(engine->runOperation(*ctx, op, config()), Cancelled);
    EXPECT_FALSE(ctx->done());
    EXPECT_EQ(fs->removeCalls.load(), 0);
    // root plus 20 children: the counting walk never finished
    EXPECT_LT(fs->visited.load(), 21);
    EXPECT_EQ(engine->progressTracker()->getProgress(op->id())->status, OperationStatus::Cancelled);
}

TEST_F(CleanupTest, ProgressCoversBothPassesAndRemovals) {
    tree.dir("a");
    tree.file("b/file.txt");

    const auto result = run(config());
    const auto info = engine->progressTracker()->getProgress(result.id);
    ASSERT_TRUE(info.has_value());

    // root, a, b, b/file.txt walked twice, plus one removal
    EXPECT_EQ(info->items_processed, 9);
    EXPECT_EQ(info->total_items, 9);
    EXPECT_EQ(info->steps_completed, CleanupOperation::TOTAL_STEPS);
    EXPECT_EQ(info->current_step, "Completing cleanup");
    EXPECT_EQ(result.items_processed, 9);
}

TEST_F(CleanupTest, UnreadableRootIsRecordedNotFatal) {
    auto cfg = config();
    cfg.include_patterns = {(tree.root() / "missing").string()};

    const auto result = run(cfg);
    EXPECT_EQ(result.status, OperationStatus::Completed);
    EXPECT_EQ(result.errors.size(), 1u);
}

TEST(CleanupPolicyTest, ShouldProcessDirectory) {
    OperationConfig cfg;
    cfg.exclude_patterns = {"", "tmp*", "Vendor"};

    EXPECT_TRUE(CleanupOperation::shouldProcessDirectory("/data/photos", cfg));
    EXPECT_FALSE(CleanupOperation::shouldProcessDirectory("/data/tmp123", cfg));
    EXPECT_FALSE(CleanupOperation::shouldProcessDirectory("/data/vendor/lib", cfg));
    EXPECT_FALSE(CleanupOperation::shouldProcessDirectory("/data/.svn", cfg));
    EXPECT_FALSE(CleanupOperation::shouldProcessDirectory("/data/.hidden", cfg));

    cfg.include_patterns = {".keep*"};
    EXPECT_TRUE(CleanupOperation::shouldProcessDirectory("/data/.keepme", cfg));
}
