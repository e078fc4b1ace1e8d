#ifndef LIVECONNECTION
#define LIVECONNECTION

#include <memory>
#include <string>
#include <vector>
#include "AudioFormat.hpp"
#include "CredentialRotator.hpp"
#include "SessionConfig.hpp"

struct InboundEvent {
    enum Type {
        AUDIO_PAYLOAD,
        TEXT_PAYLOAD,
        TURN_COMPLETE
    };

    Type type = TURN_COMPLETE;
    std::vector<uint8_t> audio;
    std::string text;

    static InboundEvent audioPayload(std::vector<uint8_t> data) {
        InboundEvent event;
        event.type = AUDIO_PAYLOAD;
        event.audio = std::move(data);
        return event;
    }
    static InboundEvent textPayload(const std::string& text) {
        InboundEvent event;
        event.type = TEXT_PAYLOAD;
        event.text = text;
        return event;
    }
    static InboundEvent turnComplete() {
        return InboundEvent();
    }
};

// One upstream duplex session. sendAudio/sendText may be called from
// different threads while another thread sits in receive().
class LiveConnection {
public:
    virtual ~LiveConnection() = default;

    // both throw ConnectionError
    virtual void sendAudio(const AudioChunk& chunk) = 0;
    virtual void sendText(const std::string& text, bool end_of_turn) = 0;

    // Blocks for the next event. Returns false once the connection is closed,
    // throws ConnectionError on a transport failure.
    virtual bool receive(InboundEvent& event) = 0;

    // idempotent, callable from any thread, wakes a blocked receive()
    virtual void close() = 0;
};

class LiveConnector {
public:
    virtual ~LiveConnector() = default;

    // throws ConnectionError
    virtual std::unique_ptr<LiveConnection> open(const Credential& credential,
                                                 const SessionConfig& config) = 0;

    // Callable from any thread: aborts an open() in progress and makes
    // further ones fail until reset().
    virtual void cancel() = 0;
    virtual void reset() = 0;
};

#endif
