#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace codedrop {
namespace utils {

// Thread-safe FIFO used to pass events between the transport and presentation threads
template <typename T>
class Channel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR
    Channel() = default;
    ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an item to the back of the queue, returns false once the channel is closed
    bool produce(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Retrieves and removes the next item without waiting
    bool consume(T& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Waits up to timeout for the next item
    template <typename Rep, typename Period>
    bool consume_for(T& item, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; })) {
            return false;
        }
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Wakes all waiting consumers, later produce() calls are dropped
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }


    // ---- QUERY METHODS ----
    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<T> queue_;
    bool closed_{false};
};

} // namespace utils
} // namespace codedrop
