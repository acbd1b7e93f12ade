#include "s3xfer/cache/remote_browser.hpp"
#include "s3xfer/store/store_error.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/core/utils.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <map>
#include <unordered_set>

namespace s3xfer::cache {

RemoteBrowser::RemoteBrowser(std::shared_ptr<store::ObjectStoreClient> client,
                             std::string bucket,
                             std::shared_ptr<ListingCache> cache,
                             size_t fetch_threads)
    : client_(std::move(client))
    , bucket_(std::move(bucket))
    , cache_(std::move(cache))
    , pool_(std::max<size_t>(fetch_threads, 1)) {
}

RemoteBrowser::~RemoteBrowser() {
    pool_.join();
}

void RemoteBrowser::set_listing_handler(ListingHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    listing_handler_ = std::move(handler);
}

void RemoteBrowser::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_handler_ = std::move(handler);
}

std::string RemoteBrowser::parent_prefix(const std::string& key) {
    std::string trimmed = key;
    if (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    auto pos = trimmed.rfind('/');
    return pos == std::string::npos ? "" : trimmed.substr(0, pos + 1);
}

std::string RemoteBrowser::normalize_prefix(const std::string& prefix) {
    size_t start = prefix.find_first_not_of('/');
    if (start == std::string::npos) {
        return "";
    }
    std::string result = prefix.substr(start);
    if (result.back() != '/') {
        result += '/';
    }
    return result;
}

std::optional<CachedListing> RemoteBrowser::browse(const std::string& prefix) {
    auto normalized = normalize_prefix(prefix);
    
    auto cached = cache_->get(normalized);
    if (!cached || cache_->is_stale(normalized)) {
        schedule_fetch(normalized);
    }
    return cached;
}

bool RemoteBrowser::refresh(const std::string& prefix) {
    return schedule_fetch(normalize_prefix(prefix));
}

bool RemoteBrowser::schedule_fetch(const std::string& prefix) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!in_flight_.insert(prefix).second) {
            LOG_DEBUG("Fetch for '{}' already in flight", prefix);
            return false;
        }
    }
    
    boost::asio::post(pool_, [this, prefix]() { run_fetch(prefix); });
    return true;
}

void RemoteBrowser::run_fetch(const std::string& prefix) {
    // Taken before the request so edits made while it runs are merged
    uint64_t counter = cache_->get_mutation_counter(prefix);
    
    try {
        auto result = client_->list_objects(bucket_, prefix, "/");
        cache_->safe_revalidate(prefix, std::move(result.entries), counter);
        
        auto listing = cache_->get(prefix);
        ListingHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = listing_handler_;
        }
        if (listing && handler) {
            handler(prefix, *listing);
        }
    } catch (const store::StoreError& e) {
        LOG_ERROR("Fetch failed for prefix '{}': {}", prefix, e.detail());
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = error_handler_;
        }
        if (handler) {
            handler(prefix, e.user_message(), e.detail());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Fetch failed for prefix '{}': {}", prefix, e.what());
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = error_handler_;
        }
        if (handler) {
            handler(prefix, e.what(), e.what());
        }
    }
    
    finish_fetch(prefix);
}

void RemoteBrowser::finish_fetch(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(prefix);
    if (in_flight_.empty()) {
        idle_cv_.notify_all();
    }
}

bool RemoteBrowser::note_uploaded(const std::string& key, uint64_t size,
                                  const std::optional<std::string>& etag) {
    auto parent = parent_prefix(key);
    
    store::ObjectEntry entry;
    entry.name = key.substr(parent.size());
    entry.key = key;
    entry.is_prefix = false;
    entry.size = size;
    entry.last_modified = core::utils::TimeUtils::now();
    entry.etag = etag;
    
    return cache_->apply_mutation(parent, [&entry](std::vector<store::ObjectEntry>& entries) {
        auto it = std::find_if(entries.begin(), entries.end(),
                               [&entry](const store::ObjectEntry& e) { return e.key == entry.key; });
        if (it != entries.end()) {
            *it = entry;
        } else {
            entries.push_back(entry);
        }
    });
}

std::vector<std::string> RemoteBrowser::delete_keys(const std::vector<std::string>& keys) {
    if (keys.empty()) {
        return {};
    }
    
    std::vector<std::string> failed;
    try {
        failed = client_->delete_objects(bucket_, keys);
    } catch (const store::StoreError& e) {
        LOG_ERROR("Batch delete of {} keys failed: {}", keys.size(), e.detail());
        return keys;
    }
    
    std::unordered_set<std::string> failed_set(failed.begin(), failed.end());
    std::map<std::string, std::unordered_set<std::string>> deleted_by_parent;
    for (const auto& key : keys) {
        if (failed_set.count(key) == 0) {
            deleted_by_parent[parent_prefix(key)].insert(key);
        }
    }
    
    for (const auto& [parent, deleted] : deleted_by_parent) {
        cache_->apply_mutation(parent, [&deleted](std::vector<store::ObjectEntry>& entries) {
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [&deleted](const store::ObjectEntry& e) {
                                             return deleted.count(e.key) > 0;
                                         }),
                          entries.end());
        });
    }
    
    if (!failed.empty()) {
        LOG_WARN("{} of {} keys could not be deleted", failed.size(), keys.size());
    }
    return failed;
}

void RemoteBrowser::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_.empty(); });
}

size_t RemoteBrowser::fetches_in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

} // namespace s3xfer::cache
