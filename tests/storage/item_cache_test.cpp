// File: tests/storage/item_cache_test.cpp
#include "storage/item_cache.hpp"
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace modelstore {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

CacheKey ParKey(SessionID session, const std::string& name, const Filters& filters = {}) {
    return CacheKey::Make(session, ItemType::PAR, name, filters);
}

// ============================================================================
// Key and Filter Hash Tests
// ============================================================================

TEST(CacheKeyTest, UnfilteredKeyHasNoFilterHash) {
    CacheKey key = ParKey(SessionID(1), "demand");
    EXPECT_FALSE(key.filter_hash.has_value());
    EXPECT_FALSE(key.filters.has_value());
}

TEST(CacheKeyTest, FilteredKeyCarriesFilterHash) {
    CacheKey key = ParKey(SessionID(1), "demand", Filters{{"j", {"chicago"}}});
    ASSERT_TRUE(key.filter_hash.has_value());
    EXPECT_EQ(HashFilters(Filters{{"j", {"chicago"}}}), *key.filter_hash);
}

TEST(CacheKeyTest, FilterHashIgnoresLabelOrder) {
    Filters a{{"i", {"seattle", "san-diego"}}};
    Filters b{{"i", {"san-diego", "seattle"}}};
    EXPECT_EQ(HashFilters(a), HashFilters(b));
}

TEST(CacheKeyTest, FilterHashComparesNumbersByStringForm) {
    Filters numeric{{"year", {2020}}};
    Filters text{{"year", {"2020"}}};
    EXPECT_EQ(HashFilters(numeric), HashFilters(text));
}

TEST(CacheKeyTest, DifferentFiltersHashDifferently) {
    EXPECT_NE(HashFilters(Filters{{"i", {"ab", "c"}}}), HashFilters(Filters{{"i", {"a", "bc"}}}));
    EXPECT_NE(HashFilters(Filters{{"i", {"a"}}}), HashFilters(Filters{{"j", {"a"}}}));
}

TEST(CacheKeyTest, EquivalentFiltersGiveEqualKeys) {
    CacheKey a = ParKey(SessionID(1), "demand", Filters{{"i", {"seattle", "san-diego"}}});
    CacheKey b = ParKey(SessionID(1), "demand", Filters{{"i", {"san-diego", "seattle"}}});
    EXPECT_EQ(*a.filters, *b.filters);
    EXPECT_TRUE(a == b);
    EXPECT_EQ(CacheKey::Hash()(a), CacheKey::Hash()(b));
}

TEST(CacheKeyTest, EqualFilterHashDoesNotMakeKeysEqual) {
    CacheKey a = ParKey(SessionID(1), "demand", Filters{{"i", {"seattle"}}});
    CacheKey b = ParKey(SessionID(1), "demand", Filters{{"i", {"san-diego"}}});
    b.filter_hash = a.filter_hash;

    EXPECT_FALSE(a == b);

    ItemCache<int> cache(10);
    cache.Put(a, 1);
    cache.Put(b, 2);
    EXPECT_EQ(2u, cache.Size());
    EXPECT_EQ(1, *cache.Get(a));
    EXPECT_EQ(2, *cache.Get(b));
}

TEST(CacheKeyTest, PatternMatchesByFieldsItSets) {
    SessionID session(7);
    CacheKey plain = ParKey(session, "demand");
    CacheKey filtered = ParKey(session, "demand", Filters{{"j", {"topeka"}}});
    CacheKey other = ParKey(session, "supply");

    CachePattern pattern;
    pattern.session = session;
    pattern.kind = ItemType::PAR;
    pattern.name = "demand";

    EXPECT_TRUE(pattern.Matches(plain));
    EXPECT_TRUE(pattern.Matches(filtered));
    EXPECT_FALSE(pattern.Matches(other));

    CachePattern foreign;
    foreign.session = SessionID(8);
    EXPECT_FALSE(foreign.Matches(plain));
}

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(ItemCacheTest, ConstructorSetsCapacity) {
    ItemCache<std::string> cache(10);
    EXPECT_EQ(10u, cache.Capacity());
    EXPECT_EQ(0u, cache.Size());
    EXPECT_TRUE(cache.enabled());
}

TEST(ItemCacheTest, ZeroCapacitySetToOne) {
    ItemCache<int> cache(0);
    EXPECT_EQ(1u, cache.Capacity());
}

TEST(ItemCacheTest, PutAndGet) {
    ItemCache<std::string> cache(5);
    CacheKey key = ParKey(SessionID(1), "a");

    EXPECT_FALSE(cache.Put(key, "value"));

    auto result = cache.Get(key);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ("value", *result);
}

TEST(ItemCacheTest, PutReplacesExistingEntry) {
    ItemCache<std::string> cache(5);
    CacheKey key = ParKey(SessionID(1), "a");

    cache.Put(key, "old");
    EXPECT_TRUE(cache.Put(key, "new"));

    EXPECT_EQ("new", *cache.Get(key));
    EXPECT_EQ(1u, cache.Size());
}

TEST(ItemCacheTest, GetReturnsCopy) {
    ItemCache<ItemData> cache(5);
    CacheKey key = ParKey(SessionID(1), "i");

    ItemData data(ItemType::SET, ItemShape::INDEX_SET, {"i"});
    ItemRow row;
    row.key = {"seattle"};
    data.mutable_rows().push_back(row);
    cache.Put(key, data);

    auto first = cache.Get(key);
    ASSERT_TRUE(first.has_value());
    first->mutable_rows().clear();

    auto second = cache.Get(key);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(1u, second->size());
}

TEST(ItemCacheTest, FilteredAndUnfilteredEntriesAreDistinct) {
    ItemCache<int> cache(5);
    SessionID session(1);

    cache.Put(ParKey(session, "d"), 1);
    cache.Put(ParKey(session, "d", Filters{{"j", {"topeka"}}}), 2);

    EXPECT_EQ(2u, cache.Size());
    EXPECT_EQ(1, *cache.Get(ParKey(session, "d")));
    EXPECT_EQ(2, *cache.Get(ParKey(session, "d", Filters{{"j", {"topeka"}}})));
}

TEST(ItemCacheTest, RemoveExactKey) {
    ItemCache<int> cache(5);
    CacheKey key = ParKey(SessionID(1), "a");

    cache.Put(key, 1);
    EXPECT_TRUE(cache.Remove(key));
    EXPECT_FALSE(cache.Remove(key));
    EXPECT_FALSE(cache.Contains(key));
}

TEST(ItemCacheTest, RemoveMatchingCoversFilteredVariants) {
    ItemCache<int> cache(10);
    SessionID session(1);

    cache.Put(ParKey(session, "d"), 1);
    cache.Put(ParKey(session, "d", Filters{{"j", {"a"}}}), 2);
    cache.Put(ParKey(session, "d", Filters{{"j", {"b"}}}), 3);
    cache.Put(ParKey(session, "f"), 4);
    cache.Put(ParKey(SessionID(2), "d"), 5);

    CachePattern pattern;
    pattern.session = session;
    pattern.kind = ItemType::PAR;
    pattern.name = "d";

    EXPECT_EQ(3u, cache.RemoveMatching(pattern));
    EXPECT_EQ(2u, cache.Size());
    EXPECT_TRUE(cache.Contains(ParKey(session, "f")));
    EXPECT_TRUE(cache.Contains(ParKey(SessionID(2), "d")));
}

TEST(ItemCacheTest, RemoveMatchingSessionOnly) {
    ItemCache<int> cache(10);
    SessionID session(1);

    cache.Put(ParKey(session, "a"), 1);
    cache.Put(CacheKey::Make(session, ItemType::SET, "i", {}), 2);
    cache.Put(ParKey(SessionID(2), "a"), 3);

    CachePattern pattern;
    pattern.session = session;

    EXPECT_EQ(2u, cache.RemoveMatching(pattern));
    EXPECT_EQ(1u, cache.Size());
}

TEST(ItemCacheTest, ClearRemovesAllAndResetsStatistics) {
    ItemCache<int> cache(5);
    CacheKey key = ParKey(SessionID(1), "a");

    cache.Put(key, 1);
    cache.Get(key);
    cache.Get(ParKey(SessionID(1), "b"));

    cache.Clear();

    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(0u, cache.Hits());
    EXPECT_EQ(0u, cache.Misses());
}

// ============================================================================
// Eviction Tests
// ============================================================================

TEST(ItemCacheTest, EvictsLeastRecentlyUsed) {
    ItemCache<int> cache(3);
    SessionID session(1);

    cache.Put(ParKey(session, "a"), 1);
    cache.Put(ParKey(session, "b"), 2);
    cache.Put(ParKey(session, "c"), 3);

    // Touch "a" so "b" becomes the oldest
    cache.Get(ParKey(session, "a"));
    cache.Put(ParKey(session, "d"), 4);

    EXPECT_EQ(3u, cache.Size());
    EXPECT_TRUE(cache.Contains(ParKey(session, "a")));
    EXPECT_FALSE(cache.Contains(ParKey(session, "b")));
    EXPECT_EQ(1u, cache.Evictions());
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST(ItemCacheTest, HitCountPerKey) {
    ItemCache<int> cache(5);
    CacheKey key = ParKey(SessionID(1), "a");

    EXPECT_EQ(0u, cache.HitCount(key));
    cache.Put(key, 1);
    cache.Get(key);
    cache.Get(key);

    EXPECT_EQ(2u, cache.HitCount(key));
}

TEST(ItemCacheTest, HitCountRestartsAfterRemoval) {
    ItemCache<int> cache(5);
    CacheKey key = ParKey(SessionID(1), "a");

    cache.Put(key, 1);
    cache.Get(key);
    cache.Remove(key);
    cache.Put(key, 1);

    EXPECT_EQ(0u, cache.HitCount(key));
}

TEST(ItemCacheTest, GetStatsReportsHitRate) {
    ItemCache<int> cache(5);
    CacheKey key = ParKey(SessionID(1), "a");

    cache.Put(key, 1);
    cache.Get(key);
    cache.Get(key);
    cache.Get(key);
    cache.Get(ParKey(SessionID(1), "missing"));

    auto stats = cache.GetStats();
    EXPECT_EQ(1u, stats.size);
    EXPECT_EQ(5u, stats.capacity);
    EXPECT_EQ(3u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_FLOAT_EQ(0.75f, stats.hit_rate);
}

TEST(ItemCacheTest, DisabledCacheStoresNothing) {
    ItemCache<int> cache(5, false);
    CacheKey key = ParKey(SessionID(1), "a");

    EXPECT_FALSE(cache.enabled());
    EXPECT_FALSE(cache.Put(key, 1));
    EXPECT_FALSE(cache.Get(key).has_value());
    EXPECT_EQ(0u, cache.Size());
    EXPECT_EQ(1u, cache.Misses());
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST(ItemCacheTest, ConcurrentMixedOperationsAreSafe) {
    ItemCache<int> cache(50);
    SessionID session(1);
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, session, t]() {
            for (int i = 0; i < 200; ++i) {
                CacheKey key = ParKey(session, "item" + std::to_string((t * 200 + i) % 80));
                cache.Put(key, i);
                cache.Get(key);
                if (i % 10 == 0) {
                    CachePattern pattern;
                    pattern.session = session;
                    pattern.name = key.name;
                    cache.RemoveMatching(pattern);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(cache.Size(), 50u);
}

} // namespace
} // namespace modelstore
