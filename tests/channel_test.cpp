//
// Created by cv2 on 12.10.2026.
//

#include <gtest/gtest.h>

#include <thread>
#include <vector>
#include <string>
#include <chrono>

#include "common/channel.hpp"

using perch::Channel;

TEST(ChannelTest, DeliversInOrder) {
    Channel<int> ch;
    ASSERT_TRUE(ch.send(1));
    ASSERT_TRUE(ch.send(2));
    ASSERT_TRUE(ch.send(3));
    EXPECT_EQ(ch.size(), 3u);

    EXPECT_EQ(ch.receive(), 1);
    EXPECT_EQ(ch.try_receive(), 2);
    EXPECT_EQ(ch.receive_for(std::chrono::milliseconds(10)), 3);
    EXPECT_EQ(ch.try_receive(), std::nullopt);
}

TEST(ChannelTest, ReceiveForTimesOutWhenEmpty) {
    Channel<std::string> ch;
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ch.receive_for(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(ChannelTest, CloseDrainsThenEnds) {
    Channel<int> ch;
    ch.send(7);
    ch.close();

    EXPECT_TRUE(ch.closed());
    EXPECT_FALSE(ch.send(8));
    EXPECT_EQ(ch.receive(), 7);
    EXPECT_EQ(ch.receive(), std::nullopt);
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> ch;
    std::optional<int> got = 42;

    std::thread receiver([&] { got = ch.receive(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    receiver.join();

    EXPECT_EQ(got, std::nullopt);
}

TEST(ChannelTest, ManyProducersOneConsumer) {
    Channel<int> ch;
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&ch] {
            for (int i = 0; i < kPerProducer; ++i) ch.send(i);
        });
    }

    int received = 0;
    while (received < kProducers * kPerProducer) {
        if (ch.receive_for(std::chrono::milliseconds(500))) ++received;
        else break;
    }
    for (auto& t : producers) t.join();

    EXPECT_EQ(received, kProducers * kPerProducer);
}
