#include <jsondelta-cpp/cache.hpp>
#include <jsondelta-cpp/json.hpp>

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace jsondelta_cpp;

// -- LruCache -----------------------------------------------------------------

TEST(LruCache, find_after_insert) {
    auto cache = LruCache<std::string, int>{4};
    cache.insert("a", 1);
    EXPECT_EQ(cache.find("a"), 1);
    EXPECT_FALSE(cache.find("b").has_value());
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(LruCache, evicts_least_recently_used) {
    auto cache = LruCache<std::string, int>{2};
    cache.insert("a", 1);
    cache.insert("b", 2);
    (void)cache.find("a");
    EXPECT_TRUE(cache.insert("c", 3));

    EXPECT_TRUE(cache.find("a").has_value());
    EXPECT_FALSE(cache.find("b").has_value());
    EXPECT_TRUE(cache.find("c").has_value());
    EXPECT_EQ(cache.evictions(), 1u);
}

TEST(LruCache, reinsert_refreshes_value) {
    auto cache = LruCache<std::string, int>{2};
    cache.insert("a", 1);
    EXPECT_FALSE(cache.insert("a", 5));
    EXPECT_EQ(cache.find("a"), 5);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(LruCache, zero_capacity_never_retains) {
    auto cache = LruCache<std::string, int>{0};
    cache.insert("a", 1);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.find("a").has_value());
}

TEST(LruCache, concurrent_inserts_and_lookups) {
    auto cache = LruCache<int, int>{64};
    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                cache.insert(t * 1000 + i, i);
                (void)cache.find(t * 1000 + i / 2);
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_LE(cache.size(), 64u);
}

// -- Caches -------------------------------------------------------------------

TEST(Caches, default_capacities) {
    const auto caches = Caches{};
    EXPECT_EQ(caches.hashes.capacity(), HashCache::default_capacity);
    EXPECT_EQ(caches.patterns.capacity(), PatternCache::default_capacity);
}

TEST(Caches, disabled_bundle_retains_nothing) {
    auto caches = Caches::disabled();
    caches->patterns.insert("k", Value{1});
    EXPECT_EQ(caches->patterns.size(), 0u);
}

TEST(Caches, clear_empties_both) {
    auto caches = Caches{};
    caches.patterns.insert("k", Value{1});
    caches.hashes.insert(std::string(100, 'x'), 7);
    caches.clear();
    EXPECT_EQ(caches.patterns.size(), 0u);
    EXPECT_EQ(caches.hashes.size(), 0u);
}

// -- pattern_key --------------------------------------------------------------

TEST(PatternKey, prefix_and_canonical_text) {
    const auto key = pattern_key("expand", parse_value(R"({"b":1,"a":2})"));
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, R"(expand:{"a":2,"b":1})");
}

TEST(PatternKey, invalid_utf8_is_not_cacheable) {
    EXPECT_FALSE(pattern_key("expand", Value{std::string{"\xc3"}}).has_value());
}
