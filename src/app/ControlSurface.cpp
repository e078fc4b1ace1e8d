#include "ControlSurface.hpp"

#include <cstdio>

ControlSurface::ControlSurface(SessionOrchestrator& orchestrator)
    :orchestrator_(orchestrator)
    ,model_turn_open_(false)
    ,last_status_("stopped")
{
    orchestrator_.setTextCallback([this](const std::string& text){
        onModelText(text);
    });
    orchestrator_.setTurnCompleteCallback([this]{
        onTurnComplete();
    });
    orchestrator_.setStateCallback([this](SessionOrchestrator::State state, const std::string& message){
        onStateChanged(state, message);
    });
}

ControlSurface::~ControlSurface(){
    stop();
    orchestrator_.setTextCallback(nullptr);
    orchestrator_.setTurnCompleteCallback(nullptr);
    orchestrator_.setStateCallback(nullptr);
}

bool ControlSurface::start(const SessionConfig& config){
    stop();
    if(!SessionConfig::isKnownVoice(config.voice_name)){
        fprintf(stderr,"warning: unknown voice %s\n",config.voice_name.c_str());
    }
    if(!orchestrator_.start(config)){
        fprintf(stderr,"Failed to start session\n");
        return false;
    }
    printf("Session started successfully\n");
    return true;
}

void ControlSurface::stop(){
    orchestrator_.stop();
}

bool ControlSurface::sendText(const std::string& text){
    if(text.empty() || !orchestrator_.isRunning()){
        return false;
    }
    if(!orchestrator_.sendText(text)){
        return false;
    }
    if(!SessionOrchestrator::isQuitCommand(text)){
        appendMessage(Message::USER, text);
    }
    return true;
}

void ControlSurface::updateConfig(const SessionConfigUpdate& update){
    if(update.voice_name && !SessionConfig::isKnownVoice(*update.voice_name)){
        fprintf(stderr,"warning: unknown voice %s\n",update.voice_name->c_str());
    }
    orchestrator_.updateConfig(update);
}

bool ControlSurface::isRunning() const {
    return orchestrator_.isRunning();
}

std::string ControlSurface::statusText() const {
    return isRunning() ? "Session Active" : "Session Inactive";
}

std::string ControlSurface::lastStatus() const {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    return last_status_;
}

SessionConfig ControlSurface::currentConfig() const {
    return orchestrator_.getConfig();
}

std::vector<ControlSurface::Message> ControlSurface::messages() const {
    std::lock_guard<std::mutex> lock(messages_mutex_);
    return messages_;
}

void ControlSurface::onModelText(const std::string& text){
    Message fragment{Message::MODEL, text};
    {
        std::lock_guard<std::mutex> lock(messages_mutex_);
        // one entry per model turn, streamed fragments get appended
        if(model_turn_open_ && !messages_.empty() && messages_.back().role == Message::MODEL){
            messages_.back().text += text;
        }else{
            messages_.push_back(fragment);
            model_turn_open_ = true;
        }
    }
    if(display_callback_){
        display_callback_(fragment);
    }
}

void ControlSurface::onTurnComplete(){
    std::lock_guard<std::mutex> lock(messages_mutex_);
    model_turn_open_ = false;
}

void ControlSurface::onStateChanged(SessionOrchestrator::State state, const std::string& message){
    std::string status;
    switch(state){
        case SessionOrchestrator::TERMINATED:
            status = (message == "stopped" || message == "quit") ? message : "error: " + message;
            break;
        case SessionOrchestrator::RECOVERING:
            status = "reconnecting: " + message;
            break;
        default:
            status = SessionOrchestrator::stateName(state);
            break;
    }
    {
        std::lock_guard<std::mutex> lock(messages_mutex_);
        last_status_ = status;
        model_turn_open_ = false;
    }
    if(display_callback_){
        display_callback_(Message{Message::STATUS, status});
    }
}

void ControlSurface::appendMessage(Message::Role role, const std::string& text){
    Message message{role, text};
    {
        std::lock_guard<std::mutex> lock(messages_mutex_);
        messages_.push_back(message);
        model_turn_open_ = false;
    }
    if(display_callback_){
        display_callback_(message);
    }
}
