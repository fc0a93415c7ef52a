#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace shieldcore {

// Bounded MPMC queue connecting pipeline stages.
//   push()      blocks while full (backpressure)
//   try_push()  never blocks, returns false when full (load shedding)
//   pop()       blocks until an item arrives or the queue is closed
// After close(), pushes fail and pop() drains what is left then returns false.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool push(T item) {
        std::unique_lock<std::mutex> lk(m_);
        not_full_.wait(lk, [&] { return closed_ || q_.size() < capacity_; });
        if (closed_) return false;
        q_.push_back(std::move(item));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool try_push(T item) {
        std::unique_lock<std::mutex> lk(m_);
        if (closed_ || q_.size() >= capacity_) return false;
        q_.push_back(std::move(item));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(m_);
        not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return true;
    }

    // Waits at most `timeout`. Returns false on timeout or closed-and-empty.
    template<typename Rep, typename Period>
    bool pop_for(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(m_);
        if (!not_empty_.wait_for(lk, timeout, [&] { return closed_ || !q_.empty(); }))
            return false;
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(m_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    std::deque<T> q_;
    bool closed_ = false;
    mutable std::mutex m_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace shieldcore
