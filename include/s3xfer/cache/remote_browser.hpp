#pragma once

#include "listing_cache.hpp"
#include "s3xfer/store/object_store.hpp"
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace s3xfer::cache {

// Serves prefix listings from the cache and revalidates them in the
// background. Completed uploads and deletes are applied to the cached
// listings right away.
class RemoteBrowser {
public:
    using ListingHandler = std::function<void(const std::string& prefix, const CachedListing& listing)>;
    using ErrorHandler = std::function<void(const std::string& prefix,
                                            const std::string& message,
                                            const std::string& detail)>;
    
    RemoteBrowser(std::shared_ptr<store::ObjectStoreClient> client,
                  std::string bucket,
                  std::shared_ptr<ListingCache> cache,
                  size_t fetch_threads = 2);
    ~RemoteBrowser();
    
    RemoteBrowser(const RemoteBrowser&) = delete;
    RemoteBrowser& operator=(const RemoteBrowser&) = delete;
    
    void set_listing_handler(ListingHandler handler);
    void set_error_handler(ErrorHandler handler);
    
    // Cached listing, possibly stale; a fetch is started when it is
    // missing or stale
    std::optional<CachedListing> browse(const std::string& prefix);
    
    // Returns false when a fetch for the prefix is already running
    bool refresh(const std::string& prefix);
    
    bool note_uploaded(const std::string& key, uint64_t size,
                       const std::optional<std::string>& etag = std::nullopt);
    
    // Keys that could not be deleted; the rest leave the cached listings
    std::vector<std::string> delete_keys(const std::vector<std::string>& keys);
    
    void wait_idle();
    size_t fetches_in_flight() const;
    
    const std::string& bucket() const { return bucket_; }
    
    static std::string parent_prefix(const std::string& key);
    static std::string normalize_prefix(const std::string& prefix);

private:
    bool schedule_fetch(const std::string& prefix);
    void run_fetch(const std::string& prefix);
    void finish_fetch(const std::string& prefix);
    
    std::shared_ptr<store::ObjectStoreClient> client_;
    std::string bucket_;
    std::shared_ptr<ListingCache> cache_;
    
    ListingHandler listing_handler_;
    ErrorHandler error_handler_;
    
    std::set<std::string> in_flight_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    
    boost::asio::thread_pool pool_;
};

} // namespace s3xfer::cache
