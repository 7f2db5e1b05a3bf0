#pragma once
#include <queue>
#include <mutex>
#include <condition_variable>
#include <cstddef>

// Blocking FIFO with a fixed capacity, used between the line producer and
// the ingestion workers. close() rejects further pushes and lets pop() drain
// what is left, then return false.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity), closed_(false) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while full. Returns false if the queue is closed.
    bool push(T item) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_full_.wait(lk, [&]{ return q_.size() < capacity_ || closed_; });
        if (closed_) return false;
        q_.push(std::move(item));
        cv_empty_.notify_one();
        return true;
    }

    // Blocks while empty. Returns false once closed and drained.
    bool pop(T &out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_empty_.wait(lk, [&]{ return !q_.empty() || closed_; });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop();
        cv_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    size_t capacity_;
    std::queue<T> q_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool closed_;
};
