#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace courier::bus {

// FIFO queue with a FIFO list of blocked consumers. A publish hands the
// message straight to the oldest waiting consumer when there is one.
template <typename T>
class MessageQueue {
public:
    // Returns false when the queue is closed; the message is dropped.
    bool Publish(T message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (!waiters_.empty()) {
            auto waiter = waiters_.front();
            waiters_.pop_front();
            waiter->message = std::move(message);
            waiter->done = true;
            waiter->cv.notify_one();
            return true;
        }
        queue_.push_back(std::move(message));
        return true;
    }

    std::optional<T> Consume(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return std::nullopt;
        }
        if (!queue_.empty()) {
            T message = std::move(queue_.front());
            queue_.pop_front();
            return message;
        }
        auto waiter = std::make_shared<Waiter>();
        waiters_.push_back(waiter);
        if (!waiter->cv.wait_for(lock, timeout, [&waiter] { return waiter->done; })) {
            // Still under the lock: no publisher can pick this waiter any more.
            auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
            if (it != waiters_.end()) {
                waiters_.erase(it);
            }
            return std::nullopt;
        }
        return std::move(waiter->message);
    }

    std::vector<T> Peek(std::size_t limit) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto count = std::min(limit, queue_.size());
        return std::vector<T>(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(count));
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t WaiterCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiters_.size();
    }

    std::size_t Drain(std::size_t limit) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto count = std::min(limit, queue_.size());
        queue_.erase(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(count));
        return count;
    }

    // Wakes every waiter with no message. Pending messages stay until drained.
    void Close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (auto& waiter : waiters_) {
            waiter->done = true;
            waiter->cv.notify_one();
        }
        waiters_.clear();
    }

private:
    struct Waiter {
        std::condition_variable cv;
        std::optional<T> message;
        bool done = false;
    };

    mutable std::mutex mutex_;
    std::deque<T> queue_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    bool closed_ = false;
};

}  // namespace courier::bus
