#pragma once

#include "s3xfer/cache/listing_cache.hpp"
#include "s3xfer/cache/remote_browser.hpp"
#include "s3xfer/storage/transfer_database.hpp"
#include "s3xfer/store/filesystem_object_store.hpp"
#include "s3xfer/transfer/engine_config.hpp"
#include "s3xfer/transfer/transfer_engine.hpp"
#include <memory>
#include <string>

namespace s3xfer::core {

class Config;

// Services shared by the commands of one invocation
class AppContext {
public:
    AppContext(const Config& config, std::string bucket);
    
    // Opens the database and the store bucket, creating both when missing
    bool initialize();
    const std::string& error() const { return error_; }
    
    std::shared_ptr<storage::TransferDatabase> database() const { return database_; }
    std::shared_ptr<store::FilesystemObjectStore> store() const { return store_; }
    const std::string& bucket() const { return bucket_; }
    const transfer::EngineConfig& engine_config() const { return engine_config_; }
    
    std::shared_ptr<cache::ListingCache> listing_cache() const { return listing_cache_; }
    std::shared_ptr<cache::RemoteBrowser> browser() const { return browser_; }
    
    std::unique_ptr<transfer::TransferEngine> make_engine() const;
    
    // Adds a completed upload to the cached listing of its folder
    void note_finished(int64_t transfer_id);

private:
    std::string bucket_;
    std::filesystem::path store_root_;
    std::filesystem::path db_path_;
    size_t cache_entries_;
    std::chrono::milliseconds cache_stale_after_;
    transfer::EngineConfig engine_config_;
    
    std::shared_ptr<storage::TransferDatabase> database_;
    std::shared_ptr<store::FilesystemObjectStore> store_;
    std::shared_ptr<cache::ListingCache> listing_cache_;
    std::shared_ptr<cache::RemoteBrowser> browser_;
    std::string error_;
};

} // namespace s3xfer::core
