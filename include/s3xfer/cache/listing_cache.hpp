#pragma once

#include "s3xfer/store/object_store.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace s3xfer::cache {

struct CachedListing {
    std::string prefix;
    std::vector<store::ObjectEntry> entries;
    std::chrono::steady_clock::time_point fetched_at;
    bool dirty = false;
    uint64_t mutation_counter = 0;
};

// LRU cache of prefix listings with stale-while-revalidate support.
// Optimistic edits bump a per-prefix mutation counter so that a background
// refresh started before the edit can merge instead of overwriting it.
class ListingCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Mutation = std::function<void(std::vector<store::ObjectEntry>&)>;
    
    static constexpr size_t DEFAULT_MAX_ENTRIES = 30;
    static constexpr std::chrono::seconds DEFAULT_STALE_AFTER{30};
    
    explicit ListingCache(size_t max_entries = DEFAULT_MAX_ENTRIES,
                          std::chrono::milliseconds stale_after = DEFAULT_STALE_AFTER,
                          Clock clock = nullptr);
    
    // Promotes the entry to most recently used
    std::optional<CachedListing> get(const std::string& prefix);
    
    void put(const std::string& prefix, std::vector<store::ObjectEntry> entries);
    bool invalidate(const std::string& prefix);
    void invalidate_all();
    bool is_stale(const std::string& prefix) const;
    
    bool apply_mutation(const std::string& prefix, const Mutation& mutation);
    uint64_t get_mutation_counter(const std::string& prefix) const;
    
    bool safe_revalidate(const std::string& prefix,
                         std::vector<store::ObjectEntry> server_entries,
                         uint64_t counter_at_fetch_start);
    
    size_t size() const;
    size_t max_entries() const { return max_entries_; }

private:
    using LruList = std::list<CachedListing>;
    
    std::chrono::steady_clock::time_point now() const;
    void promote(LruList::iterator it);
    void insert_fresh(const std::string& prefix, std::vector<store::ObjectEntry> entries);
    void evict_if_needed();
    
    size_t max_entries_;
    std::chrono::milliseconds stale_after_;
    Clock clock_;
    
    // Front is most recently used
    LruList lru_;
    std::unordered_map<std::string, LruList::iterator> index_;
    mutable std::mutex mutex_;
};

} // namespace s3xfer::cache
