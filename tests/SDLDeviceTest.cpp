#include <gtest/gtest.h>

#include <stdlib.h>
#include <atomic>
#include <thread>
#include "Fakes.hpp"
#include "SDLCaptureSource.hpp"
#include "SDLPlaybackSink.hpp"

// Runs against SDL's dummy driver, so no sound hardware is needed.
class SDLDeviceTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("SDL_AUDIODRIVER", "dummy", 1);
    }

    // ~20 s of 24 kHz mono s16, the dummy device never drains it during a test
    static std::vector<uint8_t> longBuffer() {
        return std::vector<uint8_t>(1 << 20, 0);
    }
};

TEST_F(SDLDeviceTest, PlaybackCloseWakesBlockedWrite) {
    SDLPlaybackSink sink;
    if (!sink.open(AudioFormat::playback())) {
        GTEST_SKIP() << "no SDL playback device";
    }

    std::atomic<int> accepted(0);
    std::atomic<bool> finished(false);
    bool last_result = true;
    std::thread writer([&] {
        for (int i = 0; i < 20; i++) {
            last_result = sink.write(longBuffer());
            if (!last_result) break;
            accepted++;
        }
        finished = true;
    });

    ASSERT_TRUE(waitUntil([&] { return accepted >= 10; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(finished);

    sink.close();
    EXPECT_TRUE(waitUntil([&] { return finished.load(); }));
    writer.join();
    EXPECT_FALSE(last_result);
    EXPECT_FALSE(sink.write(longBuffer()));
}

TEST_F(SDLDeviceTest, PlaybackDiscardReleasesBlockedWrite) {
    SDLPlaybackSink sink;
    if (!sink.open(AudioFormat::playback())) {
        GTEST_SKIP() << "no SDL playback device";
    }

    std::atomic<int> accepted(0);
    std::atomic<bool> finished(false);
    std::thread writer([&] {
        for (int i = 0; i < 12; i++) {
            if (!sink.write(longBuffer())) break;
            accepted++;
        }
        finished = true;
    });
    ASSERT_TRUE(waitUntil([&] { return accepted >= 10; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(finished);

    sink.discard();
    EXPECT_TRUE(waitUntil([&] { return finished.load(); }));
    writer.join();
    EXPECT_EQ(12, accepted);

    // the device stays open for the next turn
    EXPECT_TRUE(sink.write(std::vector<uint8_t>(960, 0)));
    sink.close();
}

TEST_F(SDLDeviceTest, CaptureCloseEndsRead) {
    SDLCaptureSource source;
    if (!source.open(AudioFormat::capture())) {
        GTEST_SKIP() << "no SDL capture device";
    }

    std::atomic<bool> finished(false);
    std::atomic<int> reads(0);
    std::thread reader([&] {
        std::vector<uint8_t> data;
        while (source.read(data)) {
            EXPECT_EQ(AudioFormat::capture().bufferBytes(), data.size());
            reads++;
        }
        finished = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    source.close();
    EXPECT_TRUE(waitUntil([&] { return finished.load(); }));
    reader.join();

    std::vector<uint8_t> data;
    EXPECT_FALSE(source.read(data));
    EXPECT_EQ(static_cast<uint64_t>(reads.load()), source.getStats().buffers_read);
}
