#ifndef TASKGROUP
#define TASKGROUP

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// All-or-nothing group of worker threads. The first task to return or throw
// ends the group: the cancel handler runs once, then every thread is joined.
class TaskGroup {
public:
    struct Outcome {
        std::string task;               // first task to finish, empty if cancelled from outside
        std::exception_ptr error;       // set when that task threw
        bool cancelled = false;         // cancel() was called before any task finished
    };

    TaskGroup();
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // runs on the thread calling wait(); must unblock every task
    void setCancelHandler(std::function<void()> handler);

    void spawn(const std::string& name, std::function<void()> task);

    Outcome wait();

    // safe from any thread
    void cancel();
    bool isCancelled() const { return cancelled_; }

private:
    void runTask(const std::string& name, const std::function<void()>& task);
    void finish(const std::string& name, std::exception_ptr error);
    void joinAll();

    std::vector<std::unique_ptr<std::thread>> threads_;
    std::function<void()> cancel_handler_;

    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool finished_;
    Outcome outcome_;
    std::atomic<bool> cancelled_;
    bool handler_invoked_;
};

#endif
