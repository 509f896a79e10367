// File: src/storage/ttl_cache.hpp
#pragma once

#include "core/types.hpp"
#include <atomic>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace motionrank {

/// Bounded LRU cache whose entries also expire after a fixed time-to-live
///
/// Thread-safe with mutex protection. An entry read after its TTL has
/// elapsed is dropped and the read counts as a miss. When capacity is
/// reached the least recently used entry is evicted.
///
/// @tparam Key Key type (must be hashable)
/// @tparam Value Value type (must be copyable)
template<typename Key, typename Value>
class TtlCache {
public:
    /// Construct cache
    /// @param capacity Maximum number of entries (minimum 1)
    /// @param ttl Time an entry stays valid after it was stored
    /// @param clock Time source
    TtlCache(size_t capacity, Timestamp::Duration ttl, Clock clock = SystemClock())
        : capacity_(capacity), ttl_(ttl), clock_(std::move(clock)) {
        if (capacity_ == 0) {
            capacity_ = 1;  // Minimum capacity
        }
    }

    /// Get value from cache
    /// @param key Key to lookup
    /// @return Value if present and not expired, std::nullopt otherwise
    std::optional<Value> Get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        if (clock_() - map_it->second->stored_at >= ttl_) {
            items_.erase(map_it->second);
            map_.erase(map_it);
            expirations_.fetch_add(1, std::memory_order_relaxed);
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        hits_.fetch_add(1, std::memory_order_relaxed);

        // Move to front (most recently used)
        items_.splice(items_.begin(), items_, map_it->second);

        return map_it->second->value;
    }

    /// Store value, restarting its TTL
    /// @param key Key to store
    /// @param value Value to store
    void Put(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        Timestamp now = clock_();

        auto map_it = map_.find(key);
        if (map_it != map_.end()) {
            map_it->second->value = value;
            map_it->second->stored_at = now;
            items_.splice(items_.begin(), items_, map_it->second);
            return;
        }

        if (items_.size() >= capacity_) {
            map_.erase(items_.back().key);
            items_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        items_.push_front(Entry{key, value, now});
        map_[key] = items_.begin();
    }

    /// Remove entry
    /// @return true if removed, false if not found
    bool Remove(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return false;
        }

        items_.erase(map_it->second);
        map_.erase(map_it);
        return true;
    }

    /// Drop all entries; statistics are kept
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        map_.clear();
    }

    /// Number of stored entries, expired ones included until they are read
    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Capacity() const { return capacity_; }
    Timestamp::Duration Ttl() const { return ttl_; }

    uint64_t Hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t Misses() const { return misses_.load(std::memory_order_relaxed); }
    uint64_t Evictions() const { return evictions_.load(std::memory_order_relaxed); }
    uint64_t Expirations() const { return expirations_.load(std::memory_order_relaxed); }

    /// Statistics structure
    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        uint64_t expirations{0};
        float hit_rate{0.0f};
    };

    Stats GetStats() const {
        std::lock_guard<std::mutex> lock(mutex_);

        Stats stats;
        stats.size = items_.size();
        stats.capacity = capacity_;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        stats.expirations = expirations_.load(std::memory_order_relaxed);

        uint64_t total = stats.hits + stats.misses;
        if (total > 0) {
            stats.hit_rate = static_cast<float>(stats.hits) / static_cast<float>(total);
        }

        return stats;
    }

private:
    struct Entry {
        Key key;
        Value value;
        Timestamp stored_at;
    };

    size_t capacity_;
    Timestamp::Duration ttl_;
    Clock clock_;

    /// Front = most recently used, Back = least recently used
    std::list<Entry> items_;
    std::unordered_map<Key, typename std::list<Entry>::iterator> map_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace motionrank
