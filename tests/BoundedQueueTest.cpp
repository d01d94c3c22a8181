#include <thread>
#include <gtest/gtest.h>
#include "BoundedQueue.hpp"

TEST(BoundedQueue, PopsInPushOrder)
{
    BoundedQueue<int> queue(4);
    ASSERT_TRUE(queue.push(1));
    ASSERT_TRUE(queue.push(2));
    ASSERT_TRUE(queue.push(3));

    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.pop(), 3);
}

TEST(BoundedQueue, TryPushRefusesWhenFull)
{
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_FALSE(queue.tryPush(3));
    EXPECT_EQ(queue.size(), 2u);
}

TEST(BoundedQueue, CloseDrainsThenEnds)
{
    BoundedQueue<int> queue(4);
    queue.push(7);
    queue.close();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.push(8));
    EXPECT_FALSE(queue.tryPush(8));
    EXPECT_EQ(queue.pop(), 7);
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(BoundedQueue, BlockedPushResumesAfterPop)
{
    BoundedQueue<int> queue(1);
    queue.push(1);

    std::thread producer([&queue] { queue.push(2); });

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_EQ(queue.pop(), 2);
}

TEST(BoundedQueue, ConsumerSeesEveryItemOnce)
{
    BoundedQueue<int> queue(8);
    long long sum = 0;

    std::thread consumer([&] {
        while (auto item = queue.pop())
            sum += *item;
    });

    for (int i = 1; i <= 1000; ++i)
        queue.push(i);
    queue.close();
    consumer.join();

    EXPECT_EQ(sum, 500500);
}
