#include <gtest/gtest.h>
#include "s3xfer/cache/listing_cache.hpp"
#include <algorithm>
#include <thread>

using namespace s3xfer::cache;
using s3xfer::store::ObjectEntry;

namespace {

ObjectEntry file(const std::string& key, uint64_t size = 1) {
    ObjectEntry entry;
    entry.key = key;
    entry.name = key.substr(key.rfind('/') + 1);
    entry.size = size;
    return entry;
}

std::vector<std::string> keys_of(const CachedListing& listing) {
    std::vector<std::string> keys;
    for (const auto& entry : listing.entries) {
        keys.push_back(entry.key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace

class ListingCacheTest : public ::testing::Test {
protected:
    ListingCache make_cache(size_t max_entries = 30) {
        return ListingCache(max_entries, std::chrono::seconds(30), [this]() { return now; });
    }
    
    void advance(std::chrono::milliseconds by) { now += by; }
    
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point(std::chrono::hours(1));
};

TEST_F(ListingCacheTest, MissReturnsNothing) {
    auto cache = make_cache();
    
    EXPECT_FALSE(cache.get("docs/").has_value());
    EXPECT_TRUE(cache.is_stale("docs/"));
    EXPECT_EQ(cache.get_mutation_counter("docs/"), 0u);
    EXPECT_FALSE(cache.invalidate("docs/"));
}

TEST_F(ListingCacheTest, PutThenGet) {
    auto cache = make_cache();
    cache.put("docs/", {file("docs/a"), file("docs/b")});
    
    auto listing = cache.get("docs/");
    ASSERT_TRUE(listing.has_value());
    EXPECT_EQ(listing->prefix, "docs/");
    EXPECT_EQ(keys_of(*listing), (std::vector<std::string>{"docs/a", "docs/b"}));
    EXPECT_FALSE(listing->dirty);
    EXPECT_EQ(listing->fetched_at, now);
}

TEST_F(ListingCacheTest, GetReturnsSnapshot) {
    auto cache = make_cache();
    cache.put("docs/", {file("docs/a")});
    
    auto listing = cache.get("docs/");
    listing->entries.clear();
    
    EXPECT_EQ(cache.get("docs/")->entries.size(), 1u);
}

TEST_F(ListingCacheTest, EvictsLeastRecentlyUsed) {
    auto cache = make_cache(2);
    cache.put("a/", {});
    cache.put("b/", {});
    
    // Touching a/ leaves b/ as the eviction candidate
    cache.get("a/");
    cache.put("c/", {});
    
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.get("a/").has_value());
    EXPECT_FALSE(cache.get("b/").has_value());
    EXPECT_TRUE(cache.get("c/").has_value());
}

TEST_F(ListingCacheTest, NeverExceedsCapacity) {
    auto cache = make_cache(3);
    for (int i = 0; i < 10; ++i) {
        cache.put("p" + std::to_string(i) + "/", {});
        EXPECT_LE(cache.size(), 3u);
    }
    EXPECT_TRUE(cache.get("p9/").has_value());
    EXPECT_FALSE(cache.get("p0/").has_value());
}

TEST_F(ListingCacheTest, StalenessUsesStrictThreshold) {
    auto cache = make_cache();
    cache.put("docs/", {});
    
    advance(std::chrono::seconds(30));
    EXPECT_FALSE(cache.is_stale("docs/"));
    
    advance(std::chrono::milliseconds(1));
    EXPECT_TRUE(cache.is_stale("docs/"));
    
    cache.put("docs/", {});
    EXPECT_FALSE(cache.is_stale("docs/"));
}

TEST_F(ListingCacheTest, MutationMarksDirtyAndCounts) {
    auto cache = make_cache();
    cache.put("docs/", {file("docs/a")});
    
    EXPECT_TRUE(cache.apply_mutation("docs/", [](auto& entries) { entries.push_back(file("docs/b")); }));
    EXPECT_TRUE(cache.apply_mutation("docs/", [](auto& entries) { entries.pop_back(); }));
    
    auto listing = cache.get("docs/");
    EXPECT_TRUE(listing->dirty);
    EXPECT_EQ(listing->mutation_counter, 2u);
    EXPECT_EQ(cache.get_mutation_counter("docs/"), 2u);
}

TEST_F(ListingCacheTest, MutationOnMissingPrefixIsRejected) {
    auto cache = make_cache();
    bool called = false;
    
    EXPECT_FALSE(cache.apply_mutation("docs/", [&called](auto&) { called = true; }));
    EXPECT_FALSE(called);
}

TEST_F(ListingCacheTest, PutKeepsMutationCounter) {
    auto cache = make_cache();
    cache.put("docs/", {});
    cache.apply_mutation("docs/", [](auto& entries) { entries.push_back(file("docs/a")); });
    
    cache.put("docs/", {file("docs/a")});
    
    auto listing = cache.get("docs/");
    EXPECT_FALSE(listing->dirty);
    EXPECT_EQ(listing->mutation_counter, 1u);
}

TEST_F(ListingCacheTest, RevalidateWithoutMutationsReplaces) {
    auto cache = make_cache();
    cache.put("docs/", {file("docs/a"), file("docs/b")});
    advance(std::chrono::minutes(1));
    
    EXPECT_TRUE(cache.safe_revalidate("docs/", {file("docs/b"), file("docs/c")}, 0));
    
    auto listing = cache.get("docs/");
    EXPECT_EQ(keys_of(*listing), (std::vector<std::string>{"docs/b", "docs/c"}));
    EXPECT_FALSE(listing->dirty);
    EXPECT_EQ(listing->fetched_at, now);
}

TEST_F(ListingCacheTest, RevalidateMergesOptimisticEntries) {
    auto cache = make_cache();
    cache.put("docs/", {file("docs/A"), file("docs/B")});
    uint64_t counter_at_fetch_start = cache.get_mutation_counter("docs/");
    
    cache.apply_mutation("docs/", [](auto& entries) { entries.push_back(file("docs/C")); });
    ASSERT_EQ(cache.get_mutation_counter("docs/"), 1u);
    
    EXPECT_TRUE(cache.safe_revalidate("docs/", {file("docs/A"), file("docs/B")}, counter_at_fetch_start));
    
    auto listing = cache.get("docs/");
    EXPECT_EQ(keys_of(*listing), (std::vector<std::string>{"docs/A", "docs/B", "docs/C"}));
    EXPECT_TRUE(listing->dirty);
    EXPECT_EQ(listing->mutation_counter, 1u);
}

TEST_F(ListingCacheTest, RevalidatePrefersServerVersionOfSameKey) {
    auto cache = make_cache();
    cache.put("docs/", {file("docs/A", 1)});
    cache.apply_mutation("docs/", [](auto& entries) { entries[0].size = 99; });
    
    cache.safe_revalidate("docs/", {file("docs/A", 5)}, 0);
    
    auto listing = cache.get("docs/");
    ASSERT_EQ(listing->entries.size(), 1u);
    EXPECT_EQ(listing->entries[0].size.value_or(0), 5u);
    EXPECT_FALSE(listing->dirty);
}

TEST_F(ListingCacheTest, RevalidateAfterInvalidateStoresResult) {
    auto cache = make_cache();
    cache.put("docs/", {file("docs/old")});
    cache.invalidate("docs/");
    
    EXPECT_TRUE(cache.safe_revalidate("docs/", {file("docs/new")}, 0));
    
    auto listing = cache.get("docs/");
    ASSERT_TRUE(listing.has_value());
    EXPECT_EQ(keys_of(*listing), (std::vector<std::string>{"docs/new"}));
    EXPECT_EQ(listing->mutation_counter, 0u);
}

TEST_F(ListingCacheTest, InvalidateAll) {
    auto cache = make_cache();
    cache.put("a/", {});
    cache.put("b/", {});
    
    cache.invalidate_all();
    
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("a/").has_value());
}

TEST(ListingCacheConcurrencyTest, ConcurrentMutationsAreAllCounted) {
    ListingCache cache;
    cache.put("shared/", {});
    
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 250; ++i) {
                cache.apply_mutation("shared/", [t, i](auto& entries) {
                    entries.push_back(file("shared/" + std::to_string(t) + "-" + std::to_string(i)));
                });
                cache.get("shared/");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    
    auto listing = cache.get("shared/");
    EXPECT_EQ(listing->mutation_counter, 1000u);
    EXPECT_EQ(listing->entries.size(), 1000u);
}
