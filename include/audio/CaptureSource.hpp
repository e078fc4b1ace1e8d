#ifndef CAPTURESOURCE
#define CAPTURESOURCE

#include <cstdint>
#include <vector>
#include "AudioFormat.hpp"

class CaptureSource {
public:
    virtual ~CaptureSource() = default;
    virtual bool open(const AudioFormat& format) = 0;

    // Blocks until one buffer (format.bufferBytes()) is available.
    // Returns false once closed; throws DeviceError if the device fails.
    virtual bool read(std::vector<uint8_t>& data) = 0;

    // idempotent, wakes a blocked read()
    virtual void close() = 0;

    struct CaptureStats {
        uint64_t buffers_read = 0;
        uint64_t bytes_dropped = 0;
    };
    virtual CaptureStats getStats() const = 0;
};

#endif
