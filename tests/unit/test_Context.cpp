#include <gtest/gtest.h>
#include "concurrency/Context.hpp"

#include <thread>

using namespace fileops::concurrency;
using namespace std::chrono_literals;

TEST(ContextTest, BackgroundIsNeverDone) {
    const auto ctx = Context::background();
    EXPECT_FALSE(ctx->done());
    EXPECT_EQ(ctx->reason(), Context::Reason::None);
    EXPECT_NO_THROW(ctx->throwIfDone());
    EXPECT_FALSE(ctx->deadline().has_value());
}

TEST(ContextTest, CancelPropagatesToChildrenNotParents) {
    const auto root = Context::withCancel(Context::background());
    const auto child = Context::withCancel(root);
    const auto grandchild = Context::withCancel(child);

    child->cancel();

    EXPECT_FALSE(root->done());
    EXPECT_TRUE(child->done());
    EXPECT_TRUE(grandchild->done());
    EXPECT_EQ(grandchild->reason(), Context::Reason::Cancelled);
    EXPECT_THROW(grandchild->throwIfDone(), Cancelled);
}

TEST(ContextTest, DerivedFromCancelledParentStartsCancelled) {
    const auto root = Context::withCancel(Context::background());
    root->cancel();
    EXPECT_TRUE(Context::withCancel(root)->done());
}

TEST(ContextTest, PastDeadlineIsDeadlineExceeded) {
    const auto ctx = Context::withDeadline(Context::background(), Context::Clock::now() - 1ms);
    EXPECT_TRUE(ctx->done());
    EXPECT_EQ(ctx->reason(), Context::Reason::DeadlineExceeded);
    EXPECT_THROW(ctx->throwIfDone(), DeadlineExceeded);
}

TEST(ContextTest, DeadlineExceededIsACancellation) {
    const auto ctx = Context::withTimeout(Context::background(), 0ms);
    try {
        ctx->throwIfDone();
        FAIL() << "expected a cancellation";
    } catch (const Cancelled&) {
        SUCCEED();
    }
}

TEST(ContextTest, ChildNeverOutlivesParentDeadline) {
    const auto parentDeadline = Context::Clock::now() + 50ms;
    const auto parent = Context::withDeadline(Context::background(), parentDeadline);
    const auto child = Context::withTimeout(parent, 1h);
    ASSERT_TRUE(child->deadline().has_value());
    EXPECT_EQ(*child->deadline(), parentDeadline);
}

TEST(ContextTest, WaitForWakesOnCancel) {
    const auto ctx = Context::withCancel(Context::background());
    std::thread t([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx->cancel();
    });

    const auto start = Context::Clock::now();
    EXPECT_TRUE(ctx->waitFor(10s));
    EXPECT_LT(Context::Clock::now() - start, 5s);
    t.join();
}

TEST(ContextTest, WaitForTimesOut) {
    const auto ctx = Context::withCancel(Context::background());
    EXPECT_FALSE(ctx->waitFor(5ms));
}
