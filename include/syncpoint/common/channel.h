#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace syncpoint {

/// Thread-safe FIFO handing values from producer threads to consumer threads.
/// A capacity of zero makes the channel unbounded.
/// After Close(), Send() fails and Receive() returns what is still buffered,
/// then std::nullopt.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    /// Blocks while the channel is full. Returns false if the channel is closed.
    bool Send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return closed_ || HasRoom(); });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Never blocks. Returns false if the channel is full or closed.
    bool TrySend(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || !HasRoom()) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Blocks until a value is available or the channel is closed and empty.
    std::optional<T> Receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        return PopLocked(lock);
    }

    /// Like Receive() but gives up after `timeout`.
    template <typename Rep, typename Period>
    std::optional<T> ReceiveFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
        return PopLocked(lock);
    }

    std::optional<T> TryReceive() {
        std::unique_lock<std::mutex> lock(mutex_);
        return PopLocked(lock);
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// True once the channel is closed and everything buffered was received.
    bool IsDrained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t Capacity() const {
        return capacity_;
    }

private:
    bool HasRoom() const {
        return capacity_ == 0 || queue_.size() < capacity_;
    }

    std::optional<T> PopLocked(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(queue_.front()));
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    const size_t capacity_;
    std::deque<T> queue_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

}  // namespace syncpoint
