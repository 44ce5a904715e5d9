#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstddef>

namespace sovereign_defense {
namespace event_management {

/**
 * @brief Bounded multi-producer / multi-consumer FIFO channel
 *
 * Two overflow policies are offered: push() blocks the producer until room
 * is available (used for ingestion and the ledger hand-off, which must never
 * lose items), pushDropOldest() evicts the oldest pending item (used for the
 * enforcement and alert boundaries). Once closed, pushes are refused and pop()
 * keeps returning items until the queue is drained.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Pushes an item, waiting while the queue is full
     *
     * @return false if the queue was closed before the item could be added
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pushes an item, evicting the oldest pending one when full
     *
     * @param item Item to add
     * @param dropped Receives the evicted item, if any
     * @return false if the queue is closed
     */
    bool pushDropOldest(T item, std::optional<T>& dropped) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (items_.size() >= capacity_) {
            dropped = std::move(items_.front());
            items_.pop_front();
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pops the next item, waiting until one is available
     *
     * @return std::nullopt once the queue is closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this]() { return closed_ || !items_.empty(); });
        return takeFront();
    }

    /**
     * @brief Pops the next item, waiting at most the given timeout
     */
    template <typename Rep, typename Period>
    std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });
        return takeFront();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    std::optional<T> takeFront() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace event_management
} // namespace sovereign_defense
