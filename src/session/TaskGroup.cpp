#include "TaskGroup.hpp"

TaskGroup::TaskGroup()
    :finished_(false)
    ,cancelled_(false)
    ,handler_invoked_(false)
{
}

TaskGroup::~TaskGroup(){
    cancel();
    if(!handler_invoked_ && cancel_handler_){
        handler_invoked_ = true;
        cancel_handler_();
    }
    joinAll();
}

void TaskGroup::setCancelHandler(std::function<void()> handler){
    cancel_handler_ = std::move(handler);
}

void TaskGroup::spawn(const std::string& name, std::function<void()> task){
    threads_.push_back(std::make_unique<std::thread>(&TaskGroup::runTask, this, name, std::move(task)));
}

void TaskGroup::runTask(const std::string& name, const std::function<void()>& task){
    try{
        task();
        finish(name, nullptr);
    }catch(...){
        finish(name, std::current_exception());
    }
}

void TaskGroup::finish(const std::string& name, std::exception_ptr error){
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(finished_){
        return;
    }
    finished_ = true;
    // after an outside cancel, task exits are fallout of the cancel itself
    if(!cancelled_){
        outcome_.task = name;
        outcome_.error = error;
    }
    state_cv_.notify_all();
}

void TaskGroup::cancel(){
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(cancelled_){
        return;
    }
    cancelled_ = true;
    if(!finished_){
        outcome_.cancelled = true;
    }
    state_cv_.notify_all();
}

TaskGroup::Outcome TaskGroup::wait(){
    Outcome outcome;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait(lock, [this]{ return finished_ || cancelled_; });
        cancelled_ = true;
        outcome = outcome_;
    }

    if(!handler_invoked_ && cancel_handler_){
        handler_invoked_ = true;
        cancel_handler_();
    }
    joinAll();
    return outcome;
}

void TaskGroup::joinAll(){
    for(auto& thread : threads_){
        if(thread && thread->joinable()){
            thread->join();
        }
    }
    threads_.clear();
}
