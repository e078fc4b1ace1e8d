#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <stdexcept>
#include "BlockingQueue.hpp"
#include "TaskGroup.hpp"

TEST(TaskGroupTest, FirstFinisherEndsGroup) {
    BlockingQueue<int> blocker;
    std::atomic<int> handler_calls(0);

    TaskGroup group;
    group.setCancelHandler([&] {
        handler_calls++;
        blocker.close();
    });
    group.spawn("waiter", [&] {
        int value;
        blocker.pop(value);
    });
    group.spawn("quick", [] {});

    TaskGroup::Outcome outcome = group.wait();
    EXPECT_EQ("quick", outcome.task);
    EXPECT_FALSE(outcome.error);
    EXPECT_FALSE(outcome.cancelled);
    EXPECT_EQ(1, handler_calls);
    EXPECT_TRUE(group.isCancelled());
}

TEST(TaskGroupTest, CapturesFailure) {
    BlockingQueue<int> blocker;
    TaskGroup group;
    group.setCancelHandler([&] { blocker.close(); });
    group.spawn("waiter", [&] {
        int value;
        blocker.pop(value);
    });
    group.spawn("broken", [] { throw std::runtime_error("boom"); });

    TaskGroup::Outcome outcome = group.wait();
    EXPECT_EQ("broken", outcome.task);
    ASSERT_TRUE(outcome.error);
    EXPECT_THROW(std::rethrow_exception(outcome.error), std::runtime_error);
}

TEST(TaskGroupTest, OutsideCancelIsReportedAsCancelled) {
    BlockingQueue<int> blocker;
    TaskGroup group;
    group.setCancelHandler([&] { blocker.close(); });
    group.spawn("waiter", [&] {
        int value;
        blocker.pop(value);
    });

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        group.cancel();
    });
    TaskGroup::Outcome outcome = group.wait();
    canceller.join();

    EXPECT_TRUE(outcome.cancelled);
    EXPECT_TRUE(outcome.task.empty());
}

TEST(TaskGroupTest, DestructorCancelsAndJoins) {
    BlockingQueue<int> blocker;
    std::atomic<bool> exited(false);
    {
        TaskGroup group;
        group.setCancelHandler([&] { blocker.close(); });
        group.spawn("waiter", [&] {
            int value;
            blocker.pop(value);
            exited = true;
        });
    }
    EXPECT_TRUE(exited);
}
