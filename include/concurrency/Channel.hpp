#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace fileops::concurrency {

// Bounded FIFO. Producers never block: trySend drops the value when the buffer is
// full. Receivers may block until a value arrives or the channel is closed; values
// buffered before close() are still delivered.
template<typename T>
class Channel {
public:
    explicit Channel(const std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("Channel capacity must be greater than zero");
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool trySend(T value) {
        {
            std::scoped_lock lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return popLocked();
    }

    template<typename Rep, typename Period>
    std::optional<T> receiveFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return popLocked();
    }

    std::optional<T> tryReceive() {
        std::scoped_lock lock(mutex_);
        return popLocked();
    }

    void close() {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::scoped_lock lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    std::optional<T> popLocked() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}
