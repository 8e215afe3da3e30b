#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>

namespace scalebox::bus {

// Ordered single-consumer channel carrying the events of one logical
// operation. The producer (transport) pushes events and finishes the stream
// with Close() or Fail(); the consumer pulls with Next().
template <typename T>
class EventStream {
public:
    void Push(T event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || cancelled_) {
                return;
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void Fail(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            error_ = std::move(error);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Consumer side: drop pending events and wake a blocked Next().
    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
            queue_.clear();
        }
        cv_.notify_all();
    }

    // Blocks until an event is available. Returns false once the stream is
    // drained after Close() or Cancel(); rethrows the Fail() error after the
    // events queued before it were delivered.
    bool Next(T& event) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_ || cancelled_; });
        return TakeLocked(event);
    }

    bool TryNext(T& event, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_ || cancelled_; })) {
            return false;
        }
        return TakeLocked(event);
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ || cancelled_;
    }

    std::size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    bool TakeLocked(T& event) {
        if (cancelled_) {
            return false;
        }
        if (!queue_.empty()) {
            event = std::move(queue_.front());
            queue_.pop_front();
            return true;
        }
        if (error_) {
            auto error = error_;
            error_ = nullptr;
            std::rethrow_exception(error);
        }
        return false;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::exception_ptr error_;
    bool closed_ = false;
    bool cancelled_ = false;
};

}  // namespace scalebox::bus
