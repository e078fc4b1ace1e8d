#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include "BlockingQueue.hpp"
#include "Fakes.hpp"

TEST(BlockingQueueTest, KeepsFifoOrder) {
    BlockingQueue<int> queue;
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(queue.push(i));
    }
    for (int i = 0; i < 5; i++) {
        int value = -1;
        ASSERT_TRUE(queue.pop(value));
        EXPECT_EQ(i, value);
    }
    EXPECT_TRUE(queue.empty());
}

TEST(BlockingQueueTest, BoundedPushBlocksUntilPop) {
    BlockingQueue<int> queue(2);
    ASSERT_TRUE(queue.push(1));
    ASSERT_TRUE(queue.push(2));
    EXPECT_FALSE(queue.tryPush(3));

    std::atomic<bool> pushed(false);
    std::thread producer([&] {
        queue.push(3);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed);
    EXPECT_EQ(2u, queue.size());

    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(1, value);
    EXPECT_TRUE(waitUntil([&] { return pushed.load(); }));
    producer.join();
    EXPECT_EQ(2u, queue.size());
}

TEST(BlockingQueueTest, CloseWakesBlockedWaiters) {
    BlockingQueue<int> empty_queue;
    BlockingQueue<int> full_queue(1);
    full_queue.push(1);

    std::atomic<int> failed(0);
    std::thread consumer([&] {
        int value;
        if (!empty_queue.pop(value)) failed++;
    });
    std::thread producer([&] {
        if (!full_queue.push(2)) failed++;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    empty_queue.close();
    full_queue.close();
    consumer.join();
    producer.join();

    EXPECT_EQ(2, failed);
    EXPECT_TRUE(full_queue.isClosed());
    EXPECT_FALSE(full_queue.tryPush(3));
}

TEST(BlockingQueueTest, ReopenAcceptsItemsAgain) {
    BlockingQueue<int> queue;
    queue.close();
    EXPECT_FALSE(queue.push(1));
    queue.reopen();
    EXPECT_TRUE(queue.push(1));
    int value = 0;
    EXPECT_TRUE(queue.tryPop(value));
    EXPECT_EQ(1, value);
}

TEST(BlockingQueueTest, ClearReportsDroppedItemsAndUnblocksProducer) {
    BlockingQueue<int> queue(3);
    queue.push(1);
    queue.push(2);
    queue.push(3);

    std::atomic<bool> pushed(false);
    std::thread producer([&] {
        queue.push(4);
        pushed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(pushed);

    size_t dropped = queue.clear();
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(3u, dropped);
    EXPECT_EQ(1u, queue.size());
    EXPECT_EQ(0u, BlockingQueue<int>().clear());
}

TEST(BlockingQueueTest, FinishDrainsBeforeFailing) {
    BlockingQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.finish();
    EXPECT_FALSE(queue.push(3));

    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(1, value);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(2, value);
    EXPECT_FALSE(queue.pop(value));

    queue.reopen();
    EXPECT_TRUE(queue.push(4));
}

TEST(BlockingQueueTest, FinishWakesBlockedConsumer) {
    BlockingQueue<int> queue;
    std::atomic<bool> returned(false);
    std::thread consumer([&] {
        int value;
        EXPECT_FALSE(queue.pop(value));
        returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(returned);
    queue.finish();
    consumer.join();
    EXPECT_TRUE(returned);
}
