#include "LiveEventQueue.hpp"
#include "GeminiProtocol.hpp"
#include "SessionErrors.hpp"

#include <cstdio>
#include <vector>

LiveEventQueue::LiveEventQueue()
    :failed_(false)
    ,closed_(false)
{
}

bool LiveEventQueue::handleMessage(const std::string& message){
    std::vector<InboundEvent> events;
    if(!parseServerMessage(message, events)){
        fprintf(stderr,"ignoring unparseable server message (%zu bytes)\n",message.size());
        return true;
    }
    for(InboundEvent& event : events){
        events_.tryPush(std::move(event));
    }

    std::string error = serverErrorText(message);
    if(!error.empty()){
        fail(error);
        return false;
    }
    std::string time_left;
    if(parseGoAway(message, time_left)){
        printf("server is going away (time left: %s)\n", time_left.empty() ? "unknown" : time_left.c_str());
    }
    return true;
}

void LiveEventQueue::fail(const std::string& reason){
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if(failed_){
            return;
        }
        error_ = reason;
        failed_ = true;
    }
    fprintf(stderr,"Gemini connection error: %s\n",reason.c_str());
    events_.finish();
}

bool LiveEventQueue::next(InboundEvent& event){
    if(events_.pop(event)){
        return true;
    }
    std::lock_guard<std::mutex> lock(error_mutex_);
    if(failed_ && !closed_){
        throw ConnectionError(error_);
    }
    return false;
}

void LiveEventQueue::close(){
    closed_ = true;
    events_.close();
}

bool LiveEventQueue::hasFailed() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return failed_;
}

std::string LiveEventQueue::error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}
