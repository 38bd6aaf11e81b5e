#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace facewatch {

// Thread-safe bounded FIFO. try_push() refuses when full or stopped, pop()
// waits for an item and returns false once stopped and drained.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t max_items = 16) : max_items_(max_items) {}

    bool try_push(T item) {
        std::unique_lock<std::mutex> lock(mu_);
        if (stopped_ || queue_.size() >= max_items_) return false;
        queue_.push(std::move(item));
        lock.unlock();
        cv_empty_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_empty_.wait(lock, [&] { return !queue_.empty() || stopped_; });
        if (stopped_ && queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Drops everything still queued and returns how many items were discarded.
    size_t clear() {
        std::lock_guard<std::mutex> lock(mu_);
        size_t n = queue_.size();
        std::queue<T>().swap(queue_);
        return n;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_empty_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

    bool full() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size() >= max_items_;
    }

    size_t capacity() const { return max_items_; }

private:
    size_t max_items_;
    std::queue<T> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    bool stopped_{false};
};

}  // namespace facewatch
