#ifndef SDLCAPTURESOURCE
#define SDLCAPTURESOURCE

#include <SDL2/SDL.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>
#include "CaptureSource.hpp"

class SDLCaptureSource : public CaptureSource {
public:
    SDLCaptureSource();
    ~SDLCaptureSource();

    bool open(const AudioFormat& format) override;
    bool read(std::vector<uint8_t>& data) override;
    void close() override;
    CaptureStats getStats() const override;

private:
    static void audioCallback(void* userdata, uint8_t* stream, int len);
    void storeCapturedAudio(const uint8_t* stream, int len);

    SDL_AudioDeviceID audio_device_;
    SDL_AudioSpec audio_spec_;
    bool sdl_initialized_;
    std::atomic<bool> device_opened_;
    AudioFormat format_;

    std::deque<uint8_t> pending_;
    size_t max_pending_bytes_;
    std::mutex buffer_mutex_;
    std::condition_variable buffer_cv_;
    std::atomic<bool> is_stopped_;

    mutable std::mutex stats_mutex_;
    CaptureStats stats_;

    static const size_t MAX_PENDING_BUFFERS = 50;
    static constexpr std::chrono::milliseconds DEVICE_CHECK_INTERVAL{200};
};

#endif
