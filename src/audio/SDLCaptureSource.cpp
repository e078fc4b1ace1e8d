#include "SDLCaptureSource.hpp"
#include "SessionErrors.hpp"

#include <cstdio>
#include <cstring>

namespace {
    SDL_AudioFormat avFormatToSDL(AVSampleFormat format) {
        switch (format) {
            case AV_SAMPLE_FMT_U8:
                return AUDIO_U8;
            case AV_SAMPLE_FMT_S16:
                return AUDIO_S16SYS;
            case AV_SAMPLE_FMT_S32:
                return AUDIO_S32SYS;
            case AV_SAMPLE_FMT_FLT:
                return AUDIO_F32SYS;
            default:
                return AUDIO_S16SYS;
        }
    }
}

SDLCaptureSource::SDLCaptureSource()
    : audio_device_(0)
    , sdl_initialized_(false)
    , device_opened_(false)
    , max_pending_bytes_(0)
    , is_stopped_(true) {

    audio_spec_ = {};
    stats_ = {};
}

SDLCaptureSource::~SDLCaptureSource() {
    close();
}

bool SDLCaptureSource::open(const AudioFormat& format){
    if(device_opened_){
        close();
    }
    format_ = format;

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
    desired_spec.format = avFormatToSDL(format.sample_fmt);
    desired_spec.channels = format.channels;
    desired_spec.samples = format.frames_per_buffer;
    desired_spec.callback = audioCallback;
    desired_spec.userdata = this;

    // no ALLOW_* flags: SDL converts to the requested format for us
    audio_device_ = SDL_OpenAudioDevice(nullptr, 1, &desired_spec, &audio_spec_, 0);
    if(audio_device_ == 0){
        fprintf(stderr,"failed to open capture device: %s\n",SDL_GetError());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        pending_.clear();
        max_pending_bytes_ = format.bufferBytes() * MAX_PENDING_BUFFERS;
        is_stopped_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = {};
    }
    device_opened_ = true;

    printf("SDL capture opened: %d Hz, %d ch, %d frames per buffer (device=%d)\n",
           audio_spec_.freq, audio_spec_.channels, format.frames_per_buffer, audio_device_);
    SDL_PauseAudioDevice(audio_device_, 0);
    return true;
}

void SDLCaptureSource::audioCallback(void* userdata, uint8_t* stream, int len){
    SDLCaptureSource* source = static_cast<SDLCaptureSource*>(userdata);
    source->storeCapturedAudio(stream, len);
}

void SDLCaptureSource::storeCapturedAudio(const uint8_t* stream, int len){
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if(is_stopped_){
            return;
        }
        pending_.insert(pending_.end(), stream, stream + len);
        // reader fell behind, keep only the newest audio
        if(pending_.size() > max_pending_bytes_){
            dropped = pending_.size() - max_pending_bytes_;
            pending_.erase(pending_.begin(), pending_.begin() + dropped);
        }
    }
    buffer_cv_.notify_one();

    if(dropped > 0){
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.bytes_dropped += dropped;
    }
}

bool SDLCaptureSource::read(std::vector<uint8_t>& data){
    size_t wanted = format_.bufferBytes();

    std::unique_lock<std::mutex> lock(buffer_mutex_);
    while(!is_stopped_ && pending_.size() < wanted){
        // an unplugged microphone just stops calling back
        if(SDL_GetAudioDeviceStatus(audio_device_) == SDL_AUDIO_STOPPED){
            throw DeviceError("capture device stopped");
        }
        buffer_cv_.wait_for(lock, DEVICE_CHECK_INTERVAL);
    }
    if(is_stopped_){
        return false;
    }
    data.assign(pending_.begin(), pending_.begin() + wanted);
    pending_.erase(pending_.begin(), pending_.begin() + wanted);
    lock.unlock();

    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    stats_.buffers_read++;
    return true;
}

void SDLCaptureSource::close(){
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        is_stopped_ = true;
        pending_.clear();
    }
    buffer_cv_.notify_all();

    // the callback takes buffer_mutex_, so the device is closed outside of it
    if(device_opened_){
        SDL_CloseAudioDevice(audio_device_);
        audio_device_ = 0;
        device_opened_ = false;
        printf("SDL capture closed\n");
    }

    if(sdl_initialized_){
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        sdl_initialized_ = false;
    }
}

CaptureSource::CaptureStats SDLCaptureSource::getStats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}
