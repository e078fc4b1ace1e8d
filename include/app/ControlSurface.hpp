#ifndef CONTROLSURFACE
#define CONTROLSURFACE

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "SessionConfig.hpp"
#include "SessionOrchestrator.hpp"

// Front door for a user interface: start/stop/send/update plus the in-memory
// conversation shown to the user.
class ControlSurface {
public:
    struct Message {
        enum Role {
            USER,
            MODEL,
            STATUS
        };
        Role role;
        std::string text;
    };

    typedef std::function<void(const Message&)> DisplayCallback;

    explicit ControlSurface(SessionOrchestrator& orchestrator);
    ~ControlSurface();

    // stops a running session first
    bool start(const SessionConfig& config);
    void stop();
    bool sendText(const std::string& text);
    void updateConfig(const SessionConfigUpdate& update);

    bool isRunning() const;
    std::string statusText() const;
    std::string lastStatus() const;
    SessionConfig currentConfig() const;
    std::vector<Message> messages() const;

    // called for every new message and for streamed model text
    void setDisplayCallback(DisplayCallback callback) { display_callback_ = std::move(callback); }

private:
    void onModelText(const std::string& text);
    void onTurnComplete();
    void onStateChanged(SessionOrchestrator::State state, const std::string& message);
    void appendMessage(Message::Role role, const std::string& text);

    SessionOrchestrator& orchestrator_;

    mutable std::mutex messages_mutex_;
    std::vector<Message> messages_;
    bool model_turn_open_;
    std::string last_status_;

    DisplayCallback display_callback_;
};

#endif
