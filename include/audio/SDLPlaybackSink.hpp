#ifndef SDLPLAYBACKSINK
#define SDLPLAYBACKSINK

#include <SDL2/SDL.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>
#include "PlaybackSink.hpp"

class SDLPlaybackSink : public PlaybackSink {
public:
    SDLPlaybackSink();
    ~SDLPlaybackSink();

    bool open(const AudioFormat& format) override;
    bool write(const std::vector<uint8_t>& data) override;
    void discard() override;
    void close() override;
    PlaybackStats getStats() const override;

    void setDebug(bool enable) { enable_debug_ = enable; }

private:
    static void audioCallback(void* userdata, uint8_t* stream, int len);
    void fillAudioBuffer(uint8_t* stream, int len);
    void logAudioCallbackStats(int len, long long time_diff_us, int callback_count, size_t queued);

    struct AudioBuffer {
        std::vector<uint8_t> data;
        size_t read_pos = 0;
        bool isEmpty() const { return read_pos >= data.size(); }
        size_t availableBytes() const { return data.size() - read_pos; }
        void reset() { read_pos = 0; data.clear(); }
    };

    SDL_AudioDeviceID audio_device_;
    SDL_AudioSpec audio_spec_;
    bool sdl_initialized_;
    std::atomic<bool> device_opened_;

    std::queue<AudioBuffer> buffer_queue_;
    std::mutex buffer_mutex_;
    std::condition_variable buffer_cv_;
    AudioBuffer current_buffer_;
    std::atomic<bool> is_stopped_;
    uint64_t discard_count_;

    mutable std::mutex stats_mutex_;
    PlaybackStats stats_;
    std::chrono::high_resolution_clock::time_point last_callback_time_;
    bool enable_debug_;

    static const size_t MAX_FRAME_QUEUE_SIZE = 10;
    static constexpr std::chrono::milliseconds DEVICE_CHECK_INTERVAL{200};
};

#endif
