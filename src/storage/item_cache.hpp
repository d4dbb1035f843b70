// File: src/storage/item_cache.hpp
#pragma once

#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace modelstore {

/// Canonical text of a filter set
///
/// Dimensions and their allowed labels are sorted and every field is
/// length-prefixed, so equivalent filters give the same text regardless of
/// insertion order and distinct filters never collide.
std::string CanonicalFilters(const Filters& filters);

/// FNV-1a hash of CanonicalFilters(filters)
uint64_t HashFilters(const Filters& filters);

/// Key of one cached item read
///
/// Without filters the key is the (session, kind, name) "everything" entry;
/// filtered reads add the canonical filter text, which decides equality.
/// filter_hash only spreads keys over buckets.
struct CacheKey {
    SessionID session;
    ItemType kind{ItemType::SET};
    std::string name;
    std::optional<std::string> filters;
    std::optional<uint64_t> filter_hash;

    static CacheKey Make(SessionID session, ItemType kind, const std::string& name,
                         const Filters& filters);

    bool operator==(const CacheKey& other) const {
        return session == other.session && kind == other.kind && name == other.name &&
               filters == other.filters;
    }

    struct Hash {
        size_t operator()(const CacheKey& key) const;
    };
};

/// Invalidation pattern; unset fields match anything
///
/// Matching compares the fields the pattern sets, so one pattern with
/// (session, kind, name) covers the unfiltered entry and every filtered one.
struct CachePattern {
    SessionID session;
    std::optional<ItemType> kind;
    std::optional<std::string> name;
    std::optional<std::string> filters;

    bool Matches(const CacheKey& key) const {
        if (key.session != session) return false;
        if (kind && key.kind != *kind) return false;
        if (name && key.name != *name) return false;
        if (filters && key.filters != filters) return false;
        return true;
    }
};

/// Cache of item reads keyed by CacheKey
///
/// LRU eviction at capacity, thread-safe with mutex protection. Get returns
/// a copy of the stored value so callers can never alter cached data. When
/// disabled, Put stores nothing and Get always misses.
///
/// @tparam Value Cached value type (must be copyable)
template<typename Value>
class ItemCache {
public:
    /// @param capacity Maximum number of entries (minimum 1)
    /// @param enabled False turns the cache into a no-op store
    explicit ItemCache(size_t capacity, bool enabled = true)
        : capacity_(capacity == 0 ? 1 : capacity), enabled_(enabled) {}

    bool enabled() const { return enabled_; }

    /// Get a copy of the cached value
    /// A hit moves the entry to the front and counts towards its hit count.
    /// @return Value if cached and enabled, std::nullopt otherwise
    std::optional<Value> Get(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!enabled_) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        hits_.fetch_add(1, std::memory_order_relaxed);
        map_it->second->hits++;

        items_.splice(items_.begin(), items_, map_it->second);
        return map_it->second->value;
    }

    /// Store a value, replacing any value under the same key
    /// @return true if an existing entry was replaced
    bool Put(const CacheKey& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!enabled_) {
            return false;
        }

        auto map_it = map_.find(key);
        if (map_it != map_.end()) {
            map_it->second->value = value;
            items_.splice(items_.begin(), items_, map_it->second);
            return true;
        }

        if (items_.size() >= capacity_) {
            map_.erase(items_.back().key);
            items_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        items_.push_front(Entry{key, value, 0});
        map_[key] = items_.begin();
        return false;
    }

    /// Remove exactly one key
    /// @return true if removed
    bool Remove(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return false;
        }
        items_.erase(map_it->second);
        map_.erase(map_it);
        return true;
    }

    /// Remove every entry matching the pattern
    /// @return Number of entries removed
    size_t RemoveMatching(const CachePattern& pattern) {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t removed = 0;
        for (auto it = items_.begin(); it != items_.end();) {
            if (pattern.Matches(it->key)) {
                map_.erase(it->key);
                it = items_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    /// Remove all entries and reset statistics
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);

        items_.clear();
        map_.clear();

        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        evictions_.store(0, std::memory_order_relaxed);
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Capacity() const { return capacity_; }

    bool Contains(const CacheKey& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /// Hits recorded for one key since it was stored (0 if absent)
    uint64_t HitCount(const CacheKey& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto map_it = map_.find(key);
        return map_it == map_.end() ? 0 : map_it->second->hits;
    }

    uint64_t Hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t Misses() const { return misses_.load(std::memory_order_relaxed); }
    uint64_t Evictions() const { return evictions_.load(std::memory_order_relaxed); }

    /// Statistics structure
    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
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

        uint64_t total = stats.hits + stats.misses;
        if (total > 0) {
            stats.hit_rate = static_cast<float>(stats.hits) / static_cast<float>(total);
        }
        return stats;
    }

private:
    struct Entry {
        CacheKey key;
        Value value;
        uint64_t hits;
    };

    size_t capacity_;
    bool enabled_;

    /// Most recently used at the front
    std::list<Entry> items_;

    std::unordered_map<CacheKey, typename std::list<Entry>::iterator, CacheKey::Hash> map_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace modelstore
