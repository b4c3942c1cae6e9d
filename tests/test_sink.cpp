// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <atomic>
#include <chrono>
#include <claudecode/sink.hpp>
#include <future>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace claudecode;

// =============================================================================
// BoundedQueue Tests
// =============================================================================

TEST(BoundedQueueTest, ZeroCapacityRejected)
{
    EXPECT_THROW(BoundedQueue<int> queue(0), std::invalid_argument);
}

TEST(BoundedQueueTest, DeliversInFifoOrder)
{
    BoundedQueue<int> queue(10);
    for (int i = 0; i < 5; ++i)
        EXPECT_TRUE(queue.push(i));

    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(queue.pop(), i);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BoundedQueueTest, TryPopOnEmptyReturnsNullopt)
{
    BoundedQueue<std::string> queue(1);
    EXPECT_EQ(queue.try_pop(), std::nullopt);
}

TEST(BoundedQueueTest, PopForTimesOut)
{
    BoundedQueue<int> queue(1);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.pop_for(std::chrono::milliseconds(20)), std::nullopt);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

TEST(BoundedQueueTest, CloseDrainsRemainingItems)
{
    BoundedQueue<int> queue(4);
    queue.push(1);
    queue.push(2);
    queue.close();

    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.push(3));
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), std::nullopt);
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(BoundedQueueTest, CloseIsIdempotent)
{
    BoundedQueue<int> queue(1);
    queue.close();
    EXPECT_NO_THROW(queue.close());
    EXPECT_TRUE(queue.is_closed());
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer)
{
    BoundedQueue<int> queue(1);

    auto consumer = std::async(std::launch::async, [&queue] { return queue.pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();

    ASSERT_EQ(consumer.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(consumer.get(), std::nullopt);
}

TEST(BoundedQueueTest, PushBlocksWhileFull)
{
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    auto producer = std::async(
        std::launch::async,
        [&]
        {
            bool ok = queue.push(2);
            pushed = true;
            return ok;
        }
    );

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed);

    EXPECT_EQ(queue.pop(), 1);
    ASSERT_EQ(producer.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(producer.get());
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueueTest, PushEvictingDropsOldestWhenFull)
{
    BoundedQueue<int> queue(2);
    EXPECT_EQ(queue.push_evicting(1), std::nullopt);
    EXPECT_EQ(queue.push_evicting(2), std::nullopt);
    EXPECT_EQ(queue.push_evicting(3), 1);

    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST(BoundedQueueTest, PushEvictingAfterCloseReturnsItem)
{
    BoundedQueue<std::string> queue(2);
    queue.close();
    EXPECT_EQ(queue.push_evicting("late"), "late");
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BoundedQueueTest, CloseWakesBlockedProducer)
{
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    auto producer = std::async(std::launch::async, [&queue] { return queue.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();

    ASSERT_EQ(producer.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_FALSE(producer.get());
    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(BoundedQueueTest, SingleProducerOrderSurvivesBackpressure)
{
    BoundedQueue<int> queue(2);
    constexpr int kCount = 500;

    std::thread producer(
        [&queue]
        {
            for (int i = 0; i < kCount; ++i)
                queue.push(i);
            queue.close();
        }
    );

    std::vector<int> received;
    while (auto item = queue.pop())
        received.push_back(*item);
    producer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kCount));
    for (int i = 0; i < kCount; ++i)
        EXPECT_EQ(received[i], i);
}
