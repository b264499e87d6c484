// src/pending_queue.hpp
// Bounded FIFO of messages awaiting a connection.

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace atlantis {

// Order-preserving buffer with drop-oldest eviction. Under sustained
// disconnection it is lossy: only the newest `capacity` entries survive.
template <typename T>
class PendingQueue {
public:
    explicit PendingQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    PendingQueue(const PendingQueue&) = delete;
    PendingQueue& operator=(const PendingQueue&) = delete;

    // Append; evicts the oldest entry first when full. Returns the number
    // of entries evicted (0 or 1).
    size_t enqueue(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t evicted = 0;
        while (items_.size() >= capacity_) {
            items_.pop_front();
            evicted++;
        }
        items_.push_back(std::move(item));
        return evicted;
    }

    // Re-insert at the head, for an item whose send failed. When full the
    // oldest queued entry makes room, never the returned item.
    void put_back(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        while (items_.size() >= capacity_) {
            items_.pop_front();
        }
        items_.push_front(std::move(item));
    }

    // Hand entries to `sink` oldest first while it returns true. The entry
    // that failed goes back to the head and draining stops. Returns the
    // number of entries delivered.
    template <typename Sink>
    size_t drain_into(Sink&& sink) {
        size_t delivered = 0;
        while (true) {
            std::optional<T> item;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (items_.empty()) break;
                item.emplace(std::move(items_.front()));
                items_.pop_front();
            }
            if (!sink(*item)) {
                put_back(std::move(*item));
                break;
            }
            delivered++;
        }
        return delivered;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    // Shrinking drops the oldest entries beyond the new bound.
    void set_capacity(size_t capacity) {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_ = capacity == 0 ? 1 : capacity;
        while (items_.size() > capacity_) {
            items_.pop_front();
        }
    }

    size_t capacity() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return capacity_;
    }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> items_;
};

} // namespace atlantis
