#ifndef FAKES
#define FAKES

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "BlockingQueue.hpp"
#include "CaptureSource.hpp"
#include "LiveConnection.hpp"
#include "PlaybackSink.hpp"
#include "SessionErrors.hpp"

inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)){
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!condition()){
        if(std::chrono::steady_clock::now() >= deadline){
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

// Gate that blocked callers wait on until the test opens it.
class Gate {
public:
    explicit Gate(bool open = true) : open_(open) {}

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }
    void open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }
    // false if abort() returned true first
    bool pass(const std::function<bool()>& abort) {
        std::unique_lock<std::mutex> lock(mutex_);
        while(!open_){
            if(abort()){
                return false;
            }
            cv_.wait_for(lock, std::chrono::milliseconds(2));
        }
        return true;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_;
};

// Everything one fake connection saw; outlives the connection itself.
struct FakeConnectionState {
    Credential credential;
    SessionConfig config;

    std::mutex mutex;
    std::vector<AudioChunk> sent_audio;
    std::vector<std::string> sent_text;

    BlockingQueue<InboundEvent> inbound;
    std::atomic<int> receive_calls{0};
    std::atomic<bool> closed{false};
    std::atomic<bool> fail_audio_send{false};
    Gate audio_gate;

    size_t sentAudioCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent_audio.size();
    }
    std::vector<std::string> sentText() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent_text;
    }
};

class FakeConnection : public LiveConnection {
public:
    explicit FakeConnection(std::shared_ptr<FakeConnectionState> state) : state_(state) {}
    ~FakeConnection() { close(); }

    void sendAudio(const AudioChunk& chunk) override {
        if(state_->closed){
            throw ConnectionError("closed");
        }
        if(state_->fail_audio_send){
            throw ConnectionError("audio send failed");
        }
        if(!state_->audio_gate.pass([this]{ return state_->closed.load(); })){
            throw ConnectionError("closed");
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->sent_audio.push_back(chunk);
    }

    void sendText(const std::string& text, bool) override {
        if(state_->closed){
            throw ConnectionError("closed");
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->sent_text.push_back(text);
    }

    bool receive(InboundEvent& event) override {
        state_->receive_calls++;
        return state_->inbound.pop(event);
    }

    void close() override {
        state_->closed = true;
        state_->inbound.close();
    }

private:
    std::shared_ptr<FakeConnectionState> state_;
};

class FakeConnector : public LiveConnector {
public:
    std::unique_ptr<LiveConnection> open(const Credential& credential,
                                         const SessionConfig& config) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempts_.push_back(credential);
        }
        if(cancelled_ || !open_gate.pass([this]{ return cancelled_.load(); })){
            throw ConnectionError("connection cancelled");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if(always_fail || failures_left > 0){
            if(failures_left > 0){
                failures_left--;
            }
            throw ConnectionError("refused #" + std::to_string(attempts_.size()));
        }
        auto state = std::make_shared<FakeConnectionState>();
        state->credential = credential;
        state->config = config;
        if(gate_audio){
            state->audio_gate.close();
        }
        connections_.push_back(state);
        return std::make_unique<FakeConnection>(state);
    }

    void cancel() override {
        cancels++;
        cancelled_ = true;
    }

    void reset() override {
        cancelled_ = false;
    }

    size_t attemptCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_.size();
    }
    std::vector<Credential> attempts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }
    size_t connectionCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }
    std::shared_ptr<FakeConnectionState> connection(size_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        return index < connections_.size() ? connections_[index] : nullptr;
    }

    std::atomic<bool> always_fail{false};
    int failures_left = 0;
    // new connections hold every sendAudio() until audio_gate opens
    bool gate_audio = false;
    // open() hangs here, as a stalled handshake would, until opened or cancelled
    Gate open_gate;
    std::atomic<int> cancels{0};

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::vector<Credential> attempts_;
    std::vector<std::shared_ptr<FakeConnectionState>> connections_;
};

// Produces the numbered chunks made available so far, then blocks until closed.
class FakeCapture : public CaptureSource {
public:
    bool open(const AudioFormat&) override {
        opens++;
        if(!open_result){
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        return true;
    }

    bool read(std::vector<uint8_t>& data) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]{ return closed_ || read_failures_ > 0 || produced_ < chunks_available_; });
        if(closed_){
            return false;
        }
        if(read_failures_ > 0){
            read_failures_--;
            throw DeviceError("capture device lost");
        }
        produced_++;
        reads++;
        data.assign(4, static_cast<uint8_t>(produced_));
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        cv_.notify_all();
    }

    CaptureStats getStats() const override {
        CaptureStats stats;
        stats.buffers_read = reads;
        return stats;
    }

    void makeAvailable(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_available_ += count;
        cv_.notify_all();
    }

    // the next count reads throw DeviceError
    void failReads(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_failures_ += count;
        cv_.notify_all();
    }

    bool open_result = true;
    std::atomic<int> opens{0};
    std::atomic<int> reads{0};

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = true;
    int produced_ = 0;
    int chunks_available_ = 0;
    int read_failures_ = 0;
};

class FakePlayback : public PlaybackSink {
public:
    bool open(const AudioFormat&) override {
        opens++;
        closed_ = false;
        return open_result;
    }

    // a discard() while blocked drops the buffer, like the SDL sink does
    bool write(const std::vector<uint8_t>& data) override {
        write_calls++;
        if(fail_writes){
            throw DeviceError("playback device lost");
        }
        int epoch = discards.load();
        if(!gate.pass([this]{ return closed_.load(); })){
            return false;
        }
        if(closed_){
            return false;
        }
        if(discards != epoch){
            return true;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        written_.push_back(data);
        return true;
    }

    void discard() override {
        discards++;
    }

    void close() override {
        closed_ = true;
    }

    PlaybackStats getStats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        PlaybackStats stats;
        stats.buffers_played = written_.size();
        return stats;
    }

    std::vector<std::vector<uint8_t>> written() {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    bool open_result = true;
    std::atomic<bool> fail_writes{false};
    std::atomic<int> opens{0};
    std::atomic<int> write_calls{0};
    std::atomic<int> discards{0};
    Gate gate;

private:
    mutable std::mutex mutex_;
    std::atomic<bool> closed_{true};
    std::vector<std::vector<uint8_t>> written_;
};

#endif
