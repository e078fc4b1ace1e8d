#ifndef PLAYBACKSINK
#define PLAYBACKSINK

#include <cstdint>
#include <vector>
#include "AudioFormat.hpp"

class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;
    virtual bool open(const AudioFormat& format) = 0;

    // Blocks while the device queue is full. Returns false once closed,
    // throws DeviceError if the device is gone.
    virtual bool write(const std::vector<uint8_t>& data) = 0;

    // drops everything queued but not yet played, the device stays open
    virtual void discard() = 0;

    // idempotent, wakes a blocked write()
    virtual void close() = 0;

    struct PlaybackStats {
        uint64_t buffers_played = 0;
        uint64_t bytes_played = 0;
        bool underrun = false;
    };
    virtual PlaybackStats getStats() const = 0;
};

#endif
