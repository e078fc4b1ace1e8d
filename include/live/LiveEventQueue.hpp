#ifndef LIVEEVENTQUEUE
#define LIVEEVENTQUEUE

#include <atomic>
#include <mutex>
#include <string>
#include "BlockingQueue.hpp"
#include "LiveConnection.hpp"

// Hands server events from the socket thread to the receive pipeline.
// A failure is reported only after every event that arrived before it has
// been consumed.
class LiveEventQueue {
public:
    LiveEventQueue();

    // one raw server message; false once it carried a server error
    bool handleMessage(const std::string& message);
    // first reason wins
    void fail(const std::string& reason);

    // Blocks for the next event. Returns false once closed, throws
    // ConnectionError when the buffered events are drained after a failure.
    bool next(InboundEvent& event);
    void close();

    bool hasFailed() const;
    std::string error() const;

private:
    BlockingQueue<InboundEvent> events_;

    mutable std::mutex error_mutex_;
    std::string error_;
    bool failed_;
    std::atomic<bool> closed_;
};

#endif
