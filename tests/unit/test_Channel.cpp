#include <gtest/gtest.h>
#include "concurrency/Channel.hpp"

#include <thread>

using fileops::concurrency::Channel;
using namespace std::chrono_literals;

TEST(ChannelTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(Channel<int>(0), std::invalid_argument);
}

TEST(ChannelTest, FullChannelDropsWithoutBlocking) {
    Channel<int> ch(1);
    EXPECT_TRUE(ch.trySend(1));
    EXPECT_FALSE(ch.trySend(2));
    EXPECT_FALSE(ch.trySend(3));

    EXPECT_EQ(ch.tryReceive(), 1);
    EXPECT_FALSE(ch.tryReceive().has_value());
}

TEST(ChannelTest, FifoOrder) {
    Channel<int> ch(3);
    ch.trySend(1);
    ch.trySend(2);
    ch.trySend(3);
    EXPECT_EQ(ch.size(), 3u);
    EXPECT_EQ(*ch.receive(), 1);
    EXPECT_EQ(*ch.receive(), 2);
    EXPECT_EQ(*ch.receive(), 3);
}

TEST(ChannelTest, BufferedValuesDrainAfterClose) {
    Channel<int> ch(2);
    ch.trySend(7);
    ch.close();

    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.trySend(8));
    EXPECT_EQ(ch.receive(), 7);
    EXPECT_FALSE(ch.receive().has_value());
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> ch(1);
    std::thread t([&] {
        std::this_thread::sleep_for(10ms);
        ch.close();
    });
    EXPECT_FALSE(ch.receive().has_value());
    t.join();
}

TEST(ChannelTest, ReceiveForTimesOut) {
    Channel<int> ch(1);
    EXPECT_FALSE(ch.receiveFor(5ms).has_value());
    EXPECT_FALSE(ch.closed());
}
