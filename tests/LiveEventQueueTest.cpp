#include <gtest/gtest.h>

#include <thread>
#include "LiveEventQueue.hpp"
#include "SessionErrors.hpp"

namespace {

const char* AUDIO_THEN_DONE =
    R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"data":"AAE="}},{"text":"hi"}]},"turnComplete":true}})";

}

TEST(LiveEventQueueTest, EventsBeforeAFailureAreStillDelivered) {
    LiveEventQueue queue;
    ASSERT_TRUE(queue.handleMessage(AUDIO_THEN_DONE));
    queue.fail("connection closed by server: bye");
    EXPECT_TRUE(queue.hasFailed());

    InboundEvent event;
    ASSERT_TRUE(queue.next(event));
    EXPECT_EQ(InboundEvent::AUDIO_PAYLOAD, event.type);
    ASSERT_TRUE(queue.next(event));
    EXPECT_EQ(InboundEvent::TEXT_PAYLOAD, event.type);
    ASSERT_TRUE(queue.next(event));
    EXPECT_EQ(InboundEvent::TURN_COMPLETE, event.type);
    EXPECT_THROW(queue.next(event), ConnectionError);
}

TEST(LiveEventQueueTest, ServerErrorFailsAfterItsContent) {
    LiveEventQueue queue;
    EXPECT_FALSE(queue.handleMessage(R"({"error":{"message":"quota exceeded"}})"));
    EXPECT_EQ("quota exceeded", queue.error());

    // later failures do not replace the first reason
    queue.fail("read failed");
    EXPECT_EQ("quota exceeded", queue.error());

    InboundEvent event;
    try {
        queue.next(event);
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_STREQ("quota exceeded", e.what());
    }
}

TEST(LiveEventQueueTest, GoAwayKeepsTheConnectionUsable) {
    LiveEventQueue queue;
    EXPECT_TRUE(queue.handleMessage(R"({"goAway":{"timeLeft":"5s"}})"));
    EXPECT_TRUE(queue.handleMessage(R"({"serverContent":{"turnComplete":true}})"));
    EXPECT_FALSE(queue.hasFailed());

    InboundEvent event;
    ASSERT_TRUE(queue.next(event));
    EXPECT_EQ(InboundEvent::TURN_COMPLETE, event.type);
}

TEST(LiveEventQueueTest, UnparseableMessagesAreSkipped) {
    LiveEventQueue queue;
    EXPECT_TRUE(queue.handleMessage("{truncated"));
    EXPECT_FALSE(queue.hasFailed());
}

TEST(LiveEventQueueTest, LocalCloseEndsReceiveWithoutError) {
    LiveEventQueue queue;
    ASSERT_TRUE(queue.handleMessage(R"({"serverContent":{"turnComplete":true}})"));
    queue.close();
    // the io thread reports the aborted read after a local close
    queue.fail("read failed: operation aborted");

    InboundEvent event;
    EXPECT_FALSE(queue.next(event));
}

TEST(LiveEventQueueTest, FailureWakesBlockedReceive) {
    LiveEventQueue queue;
    std::thread failer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.fail("read failed: connection reset");
    });
    InboundEvent event;
    EXPECT_THROW(queue.next(event), ConnectionError);
    failer.join();
}
