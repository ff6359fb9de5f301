// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace peerlink {
namespace util {

/**
 * ThreadSafeMap - Thread-safe wrapper around std::unordered_map
 *
 * Usage:
 *   ThreadSafeMap<std::string, PeerPtr> peers_;
 *   peers_.TryInsert(id, peer);
 *   auto peer = peers_.Get(id);
 *   auto removed = peers_.Take(id);
 *
 * Every operation takes the lock once. Values are returned by copy, so
 * Value should be cheap to copy (shared_ptr, ids).
 */
template <typename Key, typename Value>
class ThreadSafeMap {
public:
    ThreadSafeMap() = default;

    // Non-copyable and non-movable (mutex cannot be moved)
    ThreadSafeMap(const ThreadSafeMap&) = delete;
    ThreadSafeMap& operator=(const ThreadSafeMap&) = delete;
    ThreadSafeMap(ThreadSafeMap&&) = delete;
    ThreadSafeMap& operator=(ThreadSafeMap&&) = delete;

    /**
     * Insert only if key doesn't exist
     * Returns true if inserted, false if key already exists
     */
    bool TryInsert(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::optional<Value> Get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * Remove entry and hand it back
     * Returns nullopt if the key didn't exist
     */
    std::optional<Value> Take(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        Value value = std::move(it->second);
        map_.erase(it);
        return value;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.size();
    }

    /**
     * Snapshot of all values (safe to iterate without lock)
     */
    std::vector<Value> GetAllValues() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Value> values;
        values.reserve(map_.size());
        for (const auto& [key, value] : map_) {
            values.push_back(value);
        }
        return values;
    }

    /**
     * Remove every entry and hand them back
     */
    std::vector<Value> TakeAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Value> values;
        values.reserve(map_.size());
        for (auto& [key, value] : map_) {
            values.push_back(std::move(value));
        }
        map_.clear();
        return values;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, Value> map_;
};

/**
 * BoundedQueue - Thread-safe FIFO with a fixed capacity
 *
 * TryPush never blocks: it fails when the queue is full, so producers
 * observe backpressure instead of buffering without limit. Waiting for
 * items is left to the consumer (see network::WriteScheduler).
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Returns false (and leaves value untouched) if the queue is full
     */
    bool TryPush(T&& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.size() >= capacity_) {
            return false;
        }
        items_.push_back(std::move(value));
        return true;
    }

    std::optional<T> TryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    /**
     * Drop everything still queued, returning how many items were dropped
     */
    size_t Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = items_.size();
        items_.clear();
        return n;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool Empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

    size_t Capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::deque<T> items_;
    const size_t capacity_;
};

} // namespace util
} // namespace peerlink
