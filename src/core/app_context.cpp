#include "s3xfer/core/app_context.hpp"
#include "s3xfer/core/config.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/core/utils.hpp"
#include <algorithm>

namespace s3xfer::core {

AppContext::AppContext(const Config& config, std::string bucket)
    : bucket_(std::move(bucket))
    , store_root_(utils::FileUtils::expand_user(config.get_string("store.root", "~/.s3xfer/store")))
    , db_path_(utils::FileUtils::expand_user(config.get_string("db.path", "~/.s3xfer/s3xfer.db")))
    , cache_entries_(static_cast<size_t>(std::max(1, config.get_int("cache.max_entries", 30))))
    , cache_stale_after_(static_cast<int64_t>(config.get_double("cache.stale_seconds", 30.0) * 1000))
    , engine_config_(transfer::EngineConfig::from_config(config)) {
    
    if (bucket_.empty()) {
        bucket_ = config.get_string("store.bucket", "default");
    }
}

bool AppContext::initialize() {
    if (!engine_config_.validate()) {
        error_ = "Invalid transfer configuration";
        return false;
    }
    
    database_ = std::make_shared<storage::TransferDatabase>(db_path_);
    if (!database_->initialize()) {
        error_ = "Failed to open transfer database: " + db_path_.string();
        return false;
    }
    
    store_ = std::make_shared<store::FilesystemObjectStore>(store_root_);
    if (!store_->create_bucket(bucket_)) {
        error_ = "Failed to open bucket '" + bucket_ + "' under " + store_root_.string();
        return false;
    }
    
    if (!database_->ensure_bucket(bucket_)) {
        error_ = "Failed to register bucket '" + bucket_ + "'";
        return false;
    }
    
    listing_cache_ = std::make_shared<cache::ListingCache>(cache_entries_, cache_stale_after_);
    browser_ = std::make_shared<cache::RemoteBrowser>(store_, bucket_, listing_cache_);
    
    LOG_DEBUG("Opened bucket '{}' at {} (database {})", bucket_, store_root_.string(), db_path_.string());
    return true;
}

std::unique_ptr<transfer::TransferEngine> AppContext::make_engine() const {
    return std::make_unique<transfer::TransferEngine>(store_, database_, bucket_, engine_config_);
}

void AppContext::note_finished(int64_t transfer_id) {
    if (!browser_) {
        return;
    }
    auto record = database_->get_transfer(transfer_id);
    if (!record || record->direction != storage::Direction::UPLOAD ||
        record->status != storage::TransferStatus::COMPLETED) {
        return;
    }
    
    if (browser_->note_uploaded(record->object_key, record->total_bytes.value_or(record->transferred))) {
        LOG_DEBUG("Added '{}' to the cached listing", record->object_key);
    }
}

} // namespace s3xfer::core
