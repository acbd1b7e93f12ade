#include "s3xfer/cache/listing_cache.hpp"
#include "s3xfer/core/logger.hpp"
#include <iterator>
#include <unordered_set>
#include <utility>

namespace s3xfer::cache {

ListingCache::ListingCache(size_t max_entries, std::chrono::milliseconds stale_after, Clock clock)
    : max_entries_(max_entries)
    , stale_after_(stale_after)
    , clock_(std::move(clock)) {
}

std::chrono::steady_clock::time_point ListingCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void ListingCache::promote(LruList::iterator it) {
    lru_.splice(lru_.begin(), lru_, it);
}

void ListingCache::insert_fresh(const std::string& prefix, std::vector<store::ObjectEntry> entries) {
    CachedListing listing;
    listing.prefix = prefix;
    listing.entries = std::move(entries);
    listing.fetched_at = now();
    
    lru_.push_front(std::move(listing));
    index_[prefix] = lru_.begin();
    evict_if_needed();
}

void ListingCache::evict_if_needed() {
    while (lru_.size() > max_entries_) {
        LOG_DEBUG("Evicted cache entry: '{}'", lru_.back().prefix);
        index_.erase(lru_.back().prefix);
        lru_.pop_back();
    }
}

std::optional<CachedListing> ListingCache::get(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = index_.find(prefix);
    if (it == index_.end()) {
        return std::nullopt;
    }
    promote(it->second);
    return *it->second;
}

void ListingCache::put(const std::string& prefix, std::vector<store::ObjectEntry> entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = index_.find(prefix);
    if (it == index_.end()) {
        insert_fresh(prefix, std::move(entries));
        return;
    }
    
    // The mutation counter survives a replace
    auto& listing = *it->second;
    listing.entries = std::move(entries);
    listing.fetched_at = now();
    listing.dirty = false;
    promote(it->second);
}

bool ListingCache::invalidate(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = index_.find(prefix);
    if (it == index_.end()) {
        return false;
    }
    lru_.erase(it->second);
    index_.erase(it);
    return true;
}

void ListingCache::invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    index_.clear();
}

bool ListingCache::is_stale(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = index_.find(prefix);
    if (it == index_.end()) {
        return true;
    }
    return now() - it->second->fetched_at > stale_after_;
}

bool ListingCache::apply_mutation(const std::string& prefix, const Mutation& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = index_.find(prefix);
    if (it == index_.end()) {
        return false;
    }
    
    auto& listing = *it->second;
    mutation(listing.entries);
    listing.dirty = true;
    ++listing.mutation_counter;
    return true;
}

uint64_t ListingCache::get_mutation_counter(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = index_.find(prefix);
    return it == index_.end() ? 0 : it->second->mutation_counter;
}

bool ListingCache::safe_revalidate(const std::string& prefix,
                                   std::vector<store::ObjectEntry> server_entries,
                                   uint64_t counter_at_fetch_start) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = index_.find(prefix);
    if (it == index_.end()) {
        // Dropped while the fetch was in flight
        insert_fresh(prefix, std::move(server_entries));
        return true;
    }
    
    auto& listing = *it->second;
    promote(it->second);
    
    if (listing.mutation_counter == counter_at_fetch_start) {
        listing.entries = std::move(server_entries);
        listing.fetched_at = now();
        listing.dirty = false;
        return true;
    }
    
    // Server entries are taken as base truth and cached entries whose key the
    // server did not return are kept as optimistic. An entry deleted on the
    // server during the fetch but edited locally therefore comes back until
    // the next clean refresh.
    std::unordered_set<std::string> server_keys;
    for (const auto& entry : server_entries) {
        server_keys.insert(entry.key);
    }
    
    std::vector<store::ObjectEntry> optimistic;
    for (auto& entry : listing.entries) {
        if (server_keys.count(entry.key) == 0) {
            optimistic.push_back(std::move(entry));
        }
    }
    
    LOG_DEBUG("Merged revalidation for '{}': {} server + {} optimistic items",
              prefix, server_entries.size(), optimistic.size());
    
    listing.dirty = !optimistic.empty();
    listing.entries = std::move(server_entries);
    listing.entries.insert(listing.entries.end(),
                           std::make_move_iterator(optimistic.begin()),
                           std::make_move_iterator(optimistic.end()));
    listing.fetched_at = now();
    return true;
}

size_t ListingCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

} // namespace s3xfer::cache
