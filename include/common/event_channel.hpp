#pragma once

#include <deque>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <string>
#include <cstddef>
#include <utility>

// Bounded multi-producer, single-consumer queue.
//
// Items sharing a key keep their relative order. An incoming coalescable item
// replaces the most recent queued item with the same key when that item is
// coalescable too, so a slow consumer sees the latest progress instead of a
// backlog. When the queue is full, coalescable items are discarded instead of
// blocking the producer; other items are always accepted.
template<typename T>
class EventChannel {
public:
    using KeyFunction = std::function<std::string(const T&)>;
    using CoalescePredicate = std::function<bool(const T&)>;

    EventChannel(size_t capacity, KeyFunction key, CoalescePredicate coalescable)
        : capacity_(capacity == 0 ? 1 : capacity)
        , key_(std::move(key))
        , coalescable_(std::move(coalescable)) {
    }

    // Returns false when the item was dropped or the channel is closed
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }

            bool canCoalesce = coalescable_ && coalescable_(item);
            if (canCoalesce && key_) {
                const std::string key = key_(item);
                for (auto it = queue_.rbegin(); it != queue_.rend(); ++it) {
                    if (key_(*it) != key) {
                        continue;
                    }
                    if (coalescable_(*it)) {
                        *it = std::move(item);
                        ++coalesced_;
                        return true;
                    }
                    break;
                }
            }

            if (queue_.size() >= capacity_ && canCoalesce) {
                ++dropped_;
                return false;
            }
            queue_.push_back(std::move(item));
        }
        condition_.notify_one();
        return true;
    }

    // Waits up to timeout; false on timeout or when closed and drained
    bool pop(T& item, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!condition_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
            return false;
        }
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        condition_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    size_t coalescedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return coalesced_;
    }

private:
    const size_t capacity_;
    KeyFunction key_;
    CoalescePredicate coalescable_;

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool closed_{false};
    size_t dropped_{0};
    size_t coalesced_{0};
};
