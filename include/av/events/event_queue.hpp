/**
 * @file event_queue.hpp
 * @brief Bounded thread-safe queue between the notifier and the dispatch loop
 *
 * EXAMPLE:
 * ThreadSafeQueue<FsEvent> queue(1024);
 * queue.push(event);          // Notifier thread (blocks while full)
 * auto event = queue.pop();   // Dispatch thread (blocks until available)
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace av::events {

/**
 * @brief Thread-safe FIFO queue with a fixed capacity
 *
 * THREAD SAFETY:
 * - Multiple producers and consumers may use the queue concurrently
 * - push() waits for room; try_push() never waits
 * - shutdown() wakes every waiter; pop() drains what is left, then
 *   returns nullopt
 */
template<typename T>
class ThreadSafeQueue {
public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit ThreadSafeQueue(std::size_t capacity = kDefaultCapacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Push item, waiting while the queue is full
     *
     * RETURNS: false if the queue was shut down (item discarded)
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return queue_.size() < capacity_ || shutdown_;
            });
            if (shutdown_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Push item only if there is room
     *
     * RETURNS: false if full or shut down
     */
    bool try_push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop item (blocking until available or shutdown)
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || shutdown_;
        })) {
            return std::nullopt;  // Timeout
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take(lock);
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Drop every queued item
     *
     * RETURNS: number of items dropped
     */
    std::size_t clear() {
        std::size_t dropped = 0;
        {
            std::unique_lock lock(mutex_);
            dropped = queue_.size();
            std::queue<T>().swap(queue_);
        }
        not_full_.notify_all();
        return dropped;
    }

    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void reset() {
        std::unique_lock lock(mutex_);
        shutdown_ = false;
    }

private:
    T take(std::unique_lock<std::mutex>& lock) {
        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    std::queue<T> queue_;
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool shutdown_ = false;
};

} // namespace av::events
