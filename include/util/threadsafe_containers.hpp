// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace swaprelay {
namespace util {

/**
 * ThreadSafeMap - Thread-safe wrapper around std::map or std::unordered_map
 *
 * Usage:
 *   ThreadSafeMap<BridgeTransferId, ActiveSwap, std::map> swaps_;
 *   swaps_.TryInsert(id, swap);
 *
 *   // Read data without expensive copies
 *   swaps_.Read(id, [&](const ActiveSwap& s) { status = s.status; });
 *
 *   // Modify data in-place
 *   swaps_.Modify(id, [](ActiveSwap& s) { s.status = SwapStatus::Locked; });
 *
 *   swaps_.Erase(id);
 *
 * All operations take a single lock. Callbacks run under the lock and
 * must not call back into the same map.
 */
template <typename Key, typename Value,
          template<typename...> class MapType = std::unordered_map>
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
        return map_.insert({key, value}).second;
    }

    /**
     * Read value by key with a callback
     * Returns true if key exists and was read, false otherwise
     */
    template <typename Func>
    bool Read(const Key& key, Func&& reader) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            reader(it->second);
            return true;
        }
        return false;
    }

    /**
     * Copy of the value, or std::nullopt if absent
     */
    std::optional<Value> Get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.count(key) > 0;
    }

    /**
     * In-place modification
     * Returns true if key exists and was modified, false otherwise
     */
    template <typename Func>
    bool Modify(const Key& key, Func&& modifier) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            modifier(it->second);
            return true;
        }
        return false;
    }

    /**
     * Remove entry by key
     * Returns true if removed, false if key didn't exist
     */
    bool Erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    /**
     * Remove entry only if predicate(value) holds
     * Returns true if removed
     */
    template <typename Pred>
    bool EraseIf(const Key& key, Pred&& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end() && predicate(it->second)) {
            map_.erase(it);
            return true;
        }
        return false;
    }

    /**
     * Remove entry and hand back its value
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

    bool Empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.empty();
    }

    /**
     * Get all keys (snapshot, safe to iterate without lock)
     */
    std::vector<Key> GetKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Key> keys;
        keys.reserve(map_.size());
        for (const auto& [key, value] : map_) {
            keys.push_back(key);
        }
        return keys;
    }

private:
    mutable std::mutex mutex_;
    MapType<Key, Value> map_;
};

} // namespace util
} // namespace swaprelay
