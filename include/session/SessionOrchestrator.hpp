#ifndef SESSIONORCHESTRATOR
#define SESSIONORCHESTRATOR

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "AudioFormat.hpp"
#include "BlockingQueue.hpp"
#include "CaptureSource.hpp"
#include "CredentialRotator.hpp"
#include "LiveConnection.hpp"
#include "PlaybackSink.hpp"
#include "SessionConfig.hpp"
#include "TaskGroup.hpp"

#define QUIT_COMMAND "q"

class SessionOrchestrator {
public:
    enum State {
        IDLE,
        CONNECTING,
        ACTIVE,
        RECOVERING,
        TERMINATED
    };

    struct Policy {
        int max_connect_attempts = 3;
        std::chrono::milliseconds retry_delay{2000};
        size_t outbound_queue_size = 5;
        // quit token ends the pipelines; reconnect afterwards or terminate
        bool reconnect_on_quit = true;
        // consecutive device-caused group failures before giving up
        int max_device_failures = 3;
        AudioFormat capture_format = AudioFormat::capture();
        AudioFormat playback_format = AudioFormat::playback();
        bool verbose = false;
    };

    typedef std::function<void(const std::string&)> TextCallback;
    typedef std::function<void()> TurnCompleteCallback;
    typedef std::function<void(State, const std::string&)> StateCallback;

    SessionOrchestrator(CredentialRotator& credentials,
                        LiveConnector& connector,
                        CaptureSource& capture,
                        PlaybackSink& playback);
    SessionOrchestrator(CredentialRotator& credentials,
                        LiveConnector& connector,
                        CaptureSource& capture,
                        PlaybackSink& playback,
                        const Policy& policy);
    ~SessionOrchestrator();

    // callbacks run on pipeline threads; set them before start()
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    void setTurnCompleteCallback(TurnCompleteCallback callback) { turn_complete_callback_ = std::move(callback); }
    void setStateCallback(StateCallback callback) { state_callback_ = std::move(callback); }

    // false if a session is already running
    bool start(const SessionConfig& config);
    // idempotent, safe from any thread but the pipelines' own
    void stop();
    bool isRunning() const { return is_running_; }

    // queued for the text-injection pipeline; false when no session is running
    bool sendText(const std::string& text);
    // applied by the config task; takes effect on the next connection
    void updateConfig(const SessionConfigUpdate& update);

    // Up to max_connect_attempts opens, a fresh credential each time and
    // retry_delay in between. Rethrows the last error when all fail.
    std::unique_ptr<LiveConnection> connect();

    State getState() const;
    SessionConfig getConfig() const;
    size_t pendingOutboundChunks() const { return outbound_queue_.size(); }
    size_t pendingPlaybackChunks() const { return inbound_audio_queue_.size(); }

    static const char* stateName(State state);
    static bool isQuitCommand(const std::string& text);

private:
    enum GroupExit {
        EXIT_QUIT,
        EXIT_FAILED,
        EXIT_DEVICE_FAILED,
        EXIT_CANCELLED
    };

    void sessionLoop();
    void configApplyLoop();
    GroupExit runPipelines(LiveConnection& connection);
    GroupExit classifyOutcome(const TaskGroup::Outcome& outcome);
    void logDeviceStats();

    void outboundLoop(LiveConnection& connection);
    void captureLoop(TaskGroup& group);
    void receiveLoop(LiveConnection& connection, TaskGroup& group);
    void playbackLoop(TaskGroup& group);
    void textInjectionLoop(LiveConnection& connection);

    bool sleepUnlessStopped(std::chrono::milliseconds delay);
    void setState(State state, const std::string& message);
    void joinThreads();

    CredentialRotator& credentials_;
    LiveConnector& connector_;
    CaptureSource& capture_;
    PlaybackSink& playback_;
    Policy policy_;

    BlockingQueue<AudioChunk> outbound_queue_;
    // reply audio tagged with the turn it belongs to
    struct PlaybackChunk {
        uint64_t turn = 0;
        std::vector<uint8_t> data;
    };

    BlockingQueue<PlaybackChunk> inbound_audio_queue_;
    std::atomic<uint64_t> audio_turn_;
    BlockingQueue<std::string> text_queue_;
    BlockingQueue<SessionConfigUpdate> config_queue_;

    mutable std::mutex config_mutex_;
    SessionConfig config_;

    mutable std::mutex state_mutex_;
    State state_;

    std::mutex group_mutex_;
    TaskGroup* current_group_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::atomic<bool> should_stop_;
    std::atomic<bool> is_running_;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<std::thread> session_thread_;
    std::unique_ptr<std::thread> config_thread_;

    TextCallback text_callback_;
    TurnCompleteCallback turn_complete_callback_;
    StateCallback state_callback_;
};

#endif
