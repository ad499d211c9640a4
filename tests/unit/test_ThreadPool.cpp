#include <gtest/gtest.h>
#include "concurrency/ThreadPool.hpp"
#include "support/BlockingOperation.hpp"

#include <atomic>

using namespace fileops::concurrency;
using fileops::test::eventually;

namespace {

struct CountingTask final : Task {
    std::atomic<int>& counter;
    explicit CountingTask(std::atomic<int>& c) : counter(c) {}
    void operator()() override { ++counter; }
};

struct ThrowingTask final : Task {
    void operator()() override { throw std::runtime_error("boom"); }
};

}

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    std::atomic<int> counter{0};
    ThreadPool pool(3, "TestPool");
    EXPECT_EQ(pool.workerCount(), 3u);

    for (int i = 0; i < 50; ++i) pool.submit(std::make_shared<CountingTask>(counter));
    EXPECT_TRUE(eventually([&] { return counter.load() == 50; }));
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> counter{0};
    ThreadPool pool(1, "TestPool");

    pool.submit(std::make_shared<ThrowingTask>());
    pool.submit(std::make_shared<CountingTask>(counter));
    EXPECT_TRUE(eventually([&] { return counter.load() == 1; }));
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    ThreadPool pool(1, "TestPool");
    pool.stop();
    std::atomic<int> counter{0};
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(counter)), std::runtime_error);
}

TEST(ThreadPoolTest, ZeroWorkersIsRejected) {
    EXPECT_THROW(ThreadPool(0, "TestPool"), std::invalid_argument);
}
