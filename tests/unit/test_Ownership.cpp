#include <gtest/gtest.h>
#include "engine/Engine.hpp"
#include "engine/errors.hpp"
#include "engine/ops/Ownership.hpp"
#include "progress/Tracker.hpp"
#include "concurrency/Context.hpp"
#include "support/RecordingFilesystem.hpp"
#include "support/TempTree.hpp"

#include <unistd.h>

using namespace fileops::engine;
using namespace fileops::engine::ops;
using namespace fileops::types;
using namespace fileops::concurrency;
using namespace fileops::test;

class OwnershipTest : public ::testing::Test {
protected:
    TempTree tree{"fileops_chown"};
    std::shared_ptr<RecordingFilesystem> fs = std::make_shared<RecordingFilesystem>();
    std::shared_ptr<Engine> engine = std::make_shared<Engine>(fs);
    std::shared_ptr<Context> ctx = Context::background();

    void SetUp() override {
        tree.file("a/f1");
        tree.file("a/b/f2");
        tree.file("c.txt");
    }

    // Owner stays the current user, so the real run needs no privileges
    OperationConfig config(const bool dryRun = false) const {
        OperationConfig cfg;
        cfg.dry_run = dryRun;
        cfg.include_patterns = {tree.root().string()};
        cfg.custom_settings["target_user"] = std::to_string(::getuid());
        cfg.custom_settings["target_group"] = std::to_string(::getgid());
        return cfg;
    }

    OperationResult run(const OperationConfig& cfg) const {
        return engine->executeOperation(*ctx, OperationType::Ownership, cfg);
    }

    static std::vector<std::string> changed(const OperationResult& r) {
        return r.details.at("changed_items").get<std::vector<std::string>>();
    }
};

TEST_F(OwnershipTest, DryRunReportsEverythingAndTouchesNothing) {
    const auto result = run(config(true));

    EXPECT_EQ(fs->chownCalls.load(), 0);
    EXPECT_EQ(changed(result).size(), 6u);
    EXPECT_EQ(result.summary, "Ownership change (dry run): 6 items changed, 0 skipped, 0 errors");
    EXPECT_TRUE(result.details.at("dry_run").get<bool>());
}

TEST_F(OwnershipTest, AppliesToEveryWalkedPath) {
    const auto result = run(config());

    EXPECT_EQ(result.status, OperationStatus::Completed);
    EXPECT_EQ(fs->chownCalls.load(), 6);
    EXPECT_EQ(result.files_affected.size(), 6u);
    EXPECT_EQ(result.files_affected.front(), tree.root().string());
    EXPECT_EQ(result.details.at("uid").get<uid_t>(), ::getuid());
}

TEST_F(OwnershipTest, FailedItemIsSkippedAndRunContinues) {
    fs->failChownOf(tree.root() / "a" / "f1");

    const auto result = run(config());

    EXPECT_EQ(result.status, OperationStatus::Completed);
    EXPECT_EQ(changed(result).size(), 5u);
    EXPECT_EQ(result.details.at("skipped_items").size(), 1u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].error.find("f1"), std::string::npos);
    EXPECT_EQ(result.summary, "Ownership change (completed): 5 items changed, 1 skipped, 1 errors");
}

TEST_F(OwnershipTest, NonRecursiveStopsAtDirectChildren) {
    auto cfg = config(true);
    cfg.recursive = false;

    const auto items = changed(run(cfg));

    const std::vector<std::string> expected{
        tree.root().string(), (tree.root() / "a").string(), (tree.root() / "c.txt").string()
    };
    EXPECT_EQ(items, expected);
}

TEST_F(OwnershipTest, ExcludeMatchesBaseName) {
    auto cfg = config(true);
    cfg.exclude_patterns = {"*.txt", "f?"};

    const auto items = changed(run(cfg));
    EXPECT_EQ(items.size(), 3u); // root, a, a/b
}

TEST_F(OwnershipTest, ProgressNeverGoesBackwards) {
    const auto sub = engine->progressTracker()->subscribe(fileops::progress::Tracker::ALL_OPERATIONS, 64);
    const auto result = run(config());

    int64_t last = 0;
    while (const auto info = sub->tryReceive()) {
        EXPECT_GE(info->items_processed, last);
        last = info->items_processed;
    }

    const auto info = engine->progressTracker()->getProgress(result.id);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->items_processed, 12); // six scanned, six applied
    EXPECT_EQ(info->total_items, 12);
    EXPECT_EQ(info->steps_completed, OwnershipOperation::TOTAL_STEPS);
}

TEST_F(OwnershipTest, TargetUserIsRequired) {
    auto cfg = config();
    cfg.custom_settings.erase("target_user");
    EXPECT_THROW(run(cfg), InvalidConfiguration);
    EXPECT_EQ(engine->progressTracker()->size(), 0u);
}

TEST_F(OwnershipTest, UnknownUserOrGroupIsInvalid) {
    auto cfg = config();
    cfg.custom_settings["target_user"] = "no-such-user-fileops";
    EXPECT_THROW(run(cfg), InvalidConfiguration);

    cfg = config();
    cfg.custom_settings["target_group"] = "no-such-group-fileops";
    EXPECT_THROW(run(cfg), InvalidConfiguration);
}

TEST(OwnershipTargetTest, NumericOverridesWin) {
    OperationConfig cfg;
    cfg.custom_settings = {{"target_user", "0"}, {"uid", "1234"}, {"gid", "4321"}};

    const auto target = OwnershipOperation::resolveTarget(cfg);
    EXPECT_EQ(target.uid, 1234u);
    EXPECT_EQ(target.gid, 4321u);
}
