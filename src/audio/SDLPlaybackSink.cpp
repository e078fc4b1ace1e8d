#include "SDLPlaybackSink.hpp"
#include "SessionErrors.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

SDLPlaybackSink::SDLPlaybackSink()
    : audio_device_(0)
    , sdl_initialized_(false)
    , device_opened_(false)
    , is_stopped_(true)
    , discard_count_(0)
    , enable_debug_(false) {

    audio_spec_ = {};
    stats_ = {};
    last_callback_time_ = std::chrono::high_resolution_clock::now();
}

SDLPlaybackSink::~SDLPlaybackSink() {
    close();
}

void SDLPlaybackSink::logAudioCallbackStats(int len, long long time_diff_us, int callback_count, size_t queued) {
    if (callback_count % 100 != 0) {
        return;
    }
    int bytes_per_second = audio_spec_.freq * audio_spec_.channels * SDL_AUDIO_BITSIZE(audio_spec_.format) / 8;
    long long expected_interval_us = bytes_per_second > 0 ? (long long)len * 1000000LL / bytes_per_second : 0;

    printf("playback callback #%d: interval %lld us (expected %lld us), requested %d bytes, queued %zu\n",
           callback_count, time_diff_us, expected_interval_us, len, queued);
}

bool SDLPlaybackSink::open(const AudioFormat& format){
    if(device_opened_){
        close();
    }

    if(!sdl_initialized_){
        if(SDL_InitSubSystem(SDL_INIT_AUDIO) < 0){
            fprintf(stderr,"SDL audio init failed: %s\n",SDL_GetError());
            return false;
        }
        sdl_initialized_ = true;
    }

    SDL_AudioSpec desired_spec;
    memset(&desired_spec,0,sizeof(desired_spec));
    desired_spec.freq = format.sample_rate;
    desired_spec.format = AUDIO_S16SYS;
    desired_spec.channels = format.channels;
    desired_spec.samples = format.frames_per_buffer;
    desired_spec.callback = audioCallback;
    desired_spec.userdata = this;

    audio_device_ = SDL_OpenAudioDevice(nullptr, 0, &desired_spec, &audio_spec_, 0);
    if(audio_device_ == 0){
        fprintf(stderr,"failed to open playback device: %s\n",SDL_GetError());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        while(!buffer_queue_.empty()){
            buffer_queue_.pop();
        }
        current_buffer_.reset();
        is_stopped_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = {};
    }
    device_opened_ = true;

    printf("SDL playback opened: %d Hz, %d ch, %d samples per callback (device=%d)\n",
           audio_spec_.freq, audio_spec_.channels, audio_spec_.samples, audio_device_);
    SDL_PauseAudioDevice(audio_device_, 0);
    return true;
}

bool SDLPlaybackSink::write(const std::vector<uint8_t>& data){
    AudioBuffer buffer;
    buffer.data = data;

    std::unique_lock<std::mutex> lock(buffer_mutex_);
    uint64_t discards_at_entry = discard_count_;
    while(!is_stopped_ && buffer_queue_.size() >= MAX_FRAME_QUEUE_SIZE){
        if(SDL_GetAudioDeviceStatus(audio_device_) == SDL_AUDIO_STOPPED){
            throw DeviceError("playback device stopped");
        }
        buffer_cv_.wait_for(lock, DEVICE_CHECK_INTERVAL);
    }
    if(is_stopped_){
        return false;
    }
    if(buffer.data.empty() || discard_count_ != discards_at_entry){
        return true;
    }
    buffer_queue_.push(std::move(buffer));
    return true;
}

void SDLPlaybackSink::audioCallback(void* userdata, uint8_t* stream, int len){
    SDLPlaybackSink* sink = static_cast<SDLPlaybackSink*>(userdata);
    sink->fillAudioBuffer(stream, len);
}

void SDLPlaybackSink::fillAudioBuffer(uint8_t* stream, int len){
    auto callback_time = std::chrono::high_resolution_clock::now();
    auto time_diff = std::chrono::duration_cast<std::chrono::microseconds>(callback_time - last_callback_time_);
    last_callback_time_ = callback_time;

    memset(stream, audio_spec_.silence, len);
    if(is_stopped_){
        return;
    }

    int bytes_to_fill = len;
    uint8_t* output_ptr = stream;
    uint64_t buffers_started = 0;
    uint64_t bytes_copied = 0;

    std::unique_lock<std::mutex> lock(buffer_mutex_);
    if(enable_debug_){
        static int callback_count = 0;
        callback_count++;
        logAudioCallbackStats(len, time_diff.count(), callback_count, buffer_queue_.size());
    }
    while(bytes_to_fill > 0){
        if(current_buffer_.isEmpty()){
            if(buffer_queue_.empty()){
                break;
            }
            current_buffer_ = std::move(buffer_queue_.front());
            buffer_queue_.pop();
            buffers_started++;
        }

        size_t to_copy = std::min((size_t)bytes_to_fill, current_buffer_.availableBytes());
        memcpy(output_ptr, current_buffer_.data.data() + current_buffer_.read_pos, to_copy);

        current_buffer_.read_pos += to_copy;
        output_ptr += to_copy;
        bytes_to_fill -= to_copy;
        bytes_copied += to_copy;

        if(current_buffer_.isEmpty()){
            current_buffer_.reset();
        }
    }
    lock.unlock();

    if(buffers_started > 0){
        buffer_cv_.notify_all();
    }

    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    stats_.buffers_played += buffers_started;
    stats_.bytes_played += bytes_copied;
    stats_.underrun = (bytes_to_fill > 0);
}

void SDLPlaybackSink::discard(){
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        dropped = buffer_queue_.size();
        discard_count_++;
        while(!buffer_queue_.empty()){
            buffer_queue_.pop();
        }
        current_buffer_.reset();
    }
    buffer_cv_.notify_all();
    if(enable_debug_){
        printf("playback discarded %zu queued buffers\n",dropped);
    }
}

void SDLPlaybackSink::close(){
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        is_stopped_ = true;
        while(!buffer_queue_.empty()){
            buffer_queue_.pop();
        }
        current_buffer_.reset();
    }
    buffer_cv_.notify_all();

    if(device_opened_){
        SDL_PauseAudioDevice(audio_device_, 1);
        SDL_CloseAudioDevice(audio_device_);
        audio_device_ = 0;
        device_opened_ = false;
        printf("SDL playback closed\n");
    }

    if(sdl_initialized_){
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        sdl_initialized_ = false;
    }
}

PlaybackSink::PlaybackStats SDLPlaybackSink::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}
