#ifndef AUDIOFORMAT
#define AUDIOFORMAT

#include <stdint.h>
#include <string>
#include <vector>
extern "C"{
    #include <libavutil/samplefmt.h>
}

#define PCM_MIME_TYPE "audio/pcm"

struct AudioFormat {
    int sample_rate = 16000;
    int channels = 1;
    AVSampleFormat sample_fmt = AV_SAMPLE_FMT_S16;
    int frames_per_buffer = 1024;

    size_t bytesPerFrame() const {
        return av_get_bytes_per_sample(sample_fmt) * channels;
    }
    size_t bufferBytes() const {
        return bytesPerFrame() * frames_per_buffer;
    }

    // microphone side: 16 kHz mono s16, 1024 frames per read
    static AudioFormat capture() {
        AudioFormat format;
        return format;
    }

    // speaker side: 24 kHz mono s16
    static AudioFormat playback() {
        AudioFormat format;
        format.sample_rate = 24000;
        return format;
    }
};

struct AudioChunk {
    std::vector<uint8_t> data;
    std::string mime_type = PCM_MIME_TYPE;
};

#endif
