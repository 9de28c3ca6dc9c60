#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>
#include "tessera/network/channel.hpp"

using namespace tessera::network;

namespace {

Message ping(uint64_t nonce) {
    return Message::make(Ping{nonce});
}

} // namespace

class ChannelTest : public ::testing::Test {
protected:
    Channel channel;
};

TEST_F(ChannelTest, StartsEmpty) {
    Message message;
    EXPECT_TRUE(channel.empty());
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_FALSE(channel.consume(message));
    EXPECT_FALSE(channel.is_closed());
}

TEST_F(ChannelTest, PreservesOrder) {
    for (uint64_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(channel.produce(ping(i)));
    }
    EXPECT_EQ(channel.size(), 5u);

    Message message;
    for (uint64_t i = 0; i < 5; ++i) {
        ASSERT_TRUE(channel.consume(message));
        EXPECT_EQ(message.as<Ping>().nonce, i);
    }
    EXPECT_TRUE(channel.empty());
}

TEST_F(ChannelTest, WaitConsumeTimesOut) {
    Message message;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.wait_consume(message, std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST_F(ChannelTest, WaitConsumeWakesOnProduce) {
    std::thread producer([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.produce(ping(42));
    });

    Message message;
    EXPECT_TRUE(channel.wait_consume(message, std::chrono::seconds(5)));
    EXPECT_EQ(message.as<Ping>().nonce, 42u);
    producer.join();
}

TEST_F(ChannelTest, CloseRejectsNewMessagesButDrainsQueued) {
    channel.produce(ping(1));
    channel.close();

    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.produce(ping(2)));

    Message message;
    EXPECT_TRUE(channel.wait_consume(message, std::chrono::milliseconds(10)));
    EXPECT_EQ(message.as<Ping>().nonce, 1u);
    EXPECT_FALSE(channel.wait_consume(message, std::chrono::milliseconds(10)));
}

TEST_F(ChannelTest, CloseWakesWaiters) {
    std::atomic<bool> returned{false};
    std::thread waiter([&]() {
        Message message;
        channel.wait_consume(message, std::chrono::seconds(10));
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.close();
    waiter.join();
    EXPECT_TRUE(returned);
}

TEST_F(ChannelTest, ConcurrentProducers) {
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 250;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([this, p]() {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                channel.produce(ping(static_cast<uint64_t>(p * PER_PRODUCER + i)));
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }

    std::vector<bool> seen(PRODUCERS * PER_PRODUCER, false);
    Message message;
    int count = 0;
    while (channel.consume(message)) {
        seen[message.as<Ping>().nonce] = true;
        ++count;
    }
    EXPECT_EQ(count, PRODUCERS * PER_PRODUCER);
    EXPECT_TRUE(std::all_of(seen.begin(), seen.end(), [](bool v) { return v; }));
}
