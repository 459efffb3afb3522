/**
 * Message Channel
 *
 * Unbounded multi-producer FIFO queue that can be closed. Carries requests
 * and replies across the worker boundary and transfer chunks from a
 * download thread to the loader.
 */

#ifndef MESSAGE_CHANNEL_HPP
#define MESSAGE_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace snpmatch {

/**
 * After close(), push() is refused and pop() drains what is left, then
 * returns nullopt.
 */
template <typename T>
class MessageChannel {
public:
    /**
     * @return false if the channel is closed
     */
    bool push(T message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * Block until a message arrives or the channel is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return take_front();
    }

    /**
     * Like pop(), but gives up after `timeout`
     */
    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return take_front();
    }

    /**
     * Take a message if one is queued
     */
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /**
     * Closed and nothing left to pop
     */
    bool drained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    // Caller holds mutex_
    std::optional<T> take_front() {
        if (queue_.empty()) return std::nullopt;
        T message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace snpmatch

#endif // MESSAGE_CHANNEL_HPP
