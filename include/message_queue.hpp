/**
 * netsdr-client
 */

#pragma once

#include <stddef.h>

#include <condition_variable>
#include <mutex>
#include <queue>
#include <utility>

enum QueuePushResult {
    QUEUE_PUSHED = 0,
    QUEUE_FULL = 1,
    QUEUE_CLOSED = 2,
};

template <typename T>
class MessageQueue {
 public:
    // capacity 0 does not bound the queue
    explicit MessageQueue(size_t capacity = 0) : capacity_(capacity) {}

    // A full queue rejects the item instead of blocking the producer.
    QueuePushResult push(T item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) {
                return QUEUE_CLOSED;
            }
            if (capacity_ != 0 && queue_.size() >= capacity_) {
                return QUEUE_FULL;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return QUEUE_PUSHED;
    }

    // Blocks until an item arrives. Returns false when the queue is closed and drained.
    bool pop(T *item) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        *item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // items already queued stay queued when the capacity shrinks below their count
    void set_capacity(size_t capacity) {
        std::lock_guard<std::mutex> lock(mtx_);
        capacity_ = capacity;
    }

 private:
    std::queue<T> queue_;
    std::mutex mtx_;
    std::condition_variable cv_;
    size_t capacity_;
    bool closed_ = false;
};
