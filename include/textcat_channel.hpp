#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace textcat {

// Bounded FIFO queue linking two pipeline stages.
//
// Notes:
// - push() blocks while the queue is full, pop() blocks while it is empty and open.
// - close() marks the end of input: pop() drains what is left, then returns false.
// - cancel() wakes every waiter; afterwards push() and pop() return false at once.
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("channel capacity must be positive");
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Returns false if the channel was cancelled or closed
    bool push(T value) {
        std::unique_lock<std::mutex> lock(mtx_);
        not_full_.wait(lock, [&] { return cancelled_ || closed_ || items_.size() < capacity_; });
        if (cancelled_ || closed_) return false;

        items_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    // Returns false once closed and drained, or cancelled
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mtx_);
        not_empty_.wait(lock, [&] { return cancelled_ || closed_ || !items_.empty(); });
        if (cancelled_ || items_.empty()) return false;

        out = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void cancel() {
        std::lock_guard<std::mutex> lock(mtx_);
        cancelled_ = true;
        items_.clear();
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return cancelled_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mtx_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    const size_t capacity_;
    bool closed_ = false;
    bool cancelled_ = false;
};

} // namespace textcat
