/**
 * @file work_queue.hpp
 * @brief Bounded blocking queue between the chunk producer and the workers
 *
 * WHY THIS FILE EXISTS:
 * The worker pool distributes chunks with a single producer (the thread that
 * drives the ChunkReader) and N consumers (the workers). Bounding the queue
 * keeps at most `capacity` chunk payloads buffered in memory on top of the
 * ones being transmitted.
 *
 * EXAMPLE:
 * BoundedQueue<Chunk> queue(4);
 * queue.push(std::move(chunk));   // Producer (blocks while full)
 * auto chunk = queue.pop();       // Consumer (blocks until available or closed)
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace dsup::upload {

/**
 * @brief Thread-safe FIFO queue with a fixed capacity
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - close() wakes every waiting producer and consumer
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * @brief Push item, waiting for free space
     *
     * RETURNS: false if the queue was closed before the item could be added
     * BLOCKS: Yes, while the queue is full
     */
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return queue_.size() < capacity_ || closed_;
            });

            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Item, or nullopt once the queue is closed and drained
     * BLOCKS: Yes, until an item is available or the queue is closed
     */
    std::optional<T> pop() {
        std::optional<T> item;
        {
            std::unique_lock lock(mutex_);
            not_empty_.wait(lock, [this]() {
                return !queue_.empty() || closed_;
            });

            if (queue_.empty()) {
                return std::nullopt;
            }
            item.emplace(std::move(queue_.front()));
            queue_.pop_front();
        }
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Stop accepting items; consumers still drain what is queued
     */
    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /**
     * @brief Drop every queued item
     *
     * RETURNS: Number of items discarded
     */
    std::size_t clear() {
        std::size_t dropped = 0;
        {
            std::unique_lock lock(mutex_);
            dropped = queue_.size();
            queue_.clear();
        }
        not_full_.notify_all();
        return dropped;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

private:
    const std::size_t capacity_;
    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
};

} // namespace dsup::upload
