#ifndef BLOCKINGQUEUE
#define BLOCKINGQUEUE

#include <deque>
#include <mutex>
#include <condition_variable>

// FIFO shared between pipelines. max_size == 0 means unbounded.
// close() wakes every waiter and makes push/pop fail until reopen();
// items still buffered at close stay there. finish() only ends the producer
// side: pop keeps returning buffered items and fails once they are gone.
template <typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(size_t max_size = 0)
        : max_size_(max_size), stopped_(false), finished_(false) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // blocks while the queue is full
    bool push(T item) {
        std::unique_lock<std::mutex> lock(buffer_mutex_);
        cond_full_.wait(lock, [this] { return stopped_ || finished_ || !isFull(); });
        if (stopped_ || finished_) {
            return false;
        }
        buffer_.push_back(std::move(item));
        cond_empty_.notify_one();
        return true;
    }

    bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (stopped_ || finished_ || isFull()) {
            return false;
        }
        buffer_.push_back(std::move(item));
        cond_empty_.notify_one();
        return true;
    }

    // blocks while the queue is empty
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(buffer_mutex_);
        cond_empty_.wait(lock, [this] { return stopped_ || finished_ || !buffer_.empty(); });
        if (stopped_ || buffer_.empty()) {
            return false;
        }
        item = std::move(buffer_.front());
        buffer_.pop_front();
        cond_full_.notify_one();
        return true;
    }

    bool tryPop(T& item) {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        if (stopped_ || buffer_.empty()) {
            return false;
        }
        item = std::move(buffer_.front());
        buffer_.pop_front();
        cond_full_.notify_one();
        return true;
    }

    // drops everything buffered, returns how many items were dropped
    size_t clear() {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        size_t dropped = buffer_.size();
        buffer_.clear();
        cond_full_.notify_all();
        return dropped;
    }

    void close() {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        stopped_ = true;
        cond_empty_.notify_all();
        cond_full_.notify_all();
    }

    void finish() {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        finished_ = true;
        cond_empty_.notify_all();
        cond_full_.notify_all();
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        stopped_ = false;
        finished_ = false;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return stopped_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        return buffer_.size();
    }

    bool empty() const { return size() == 0; }
    size_t capacity() const { return max_size_; }

private:
    bool isFull() const { return max_size_ > 0 && buffer_.size() >= max_size_; }

    std::deque<T> buffer_;
    size_t max_size_;
    mutable std::mutex buffer_mutex_;
    std::condition_variable cond_empty_;
    std::condition_variable cond_full_;
    bool stopped_;
    bool finished_;
};

#endif
