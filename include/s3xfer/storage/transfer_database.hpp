#pragma once

#include "transfer_types.hpp"
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace s3xfer::storage {

// Persistent transfer queue and multipart part bookkeeping.
// All statements run on one connection, serialized by a mutex.
class TransferDatabase {
public:
    static constexpr int SCHEMA_VERSION = 1;
    
    explicit TransferDatabase(const std::filesystem::path& db_path);
    ~TransferDatabase();
    
    TransferDatabase(const TransferDatabase&) = delete;
    TransferDatabase& operator=(const TransferDatabase&) = delete;
    
    bool initialize();
    void close();
    int schema_version();
    
    // Buckets
    std::optional<int64_t> ensure_bucket(const std::string& name,
                                         const std::string& profile = "default",
                                         const std::string& region = "");
    std::optional<int64_t> find_bucket_id(const std::string& name);
    
    // Transfers
    std::optional<int64_t> create_transfer(const NewTransfer& transfer);
    std::optional<TransferRecord> get_transfer(int64_t id);
    std::vector<TransferRecord> list_transfers(std::optional<int64_t> bucket_id = std::nullopt);
    std::vector<TransferRecord> list_transfers_by_status(const std::vector<TransferStatus>& statuses,
                                                         std::optional<int64_t> bucket_id = std::nullopt);
    
    // Oldest queued transfer not in `exclude`, by creation time
    std::optional<int64_t> next_queued_transfer(std::optional<int64_t> bucket_id,
                                                const std::set<int64_t>& exclude = {});
    std::vector<int64_t> paused_transfer_ids(int64_t bucket_id);
    
    bool set_status(int64_t id, TransferStatus status);
    bool mark_paused(int64_t id, uint64_t transferred);
    bool mark_completed(int64_t id, uint64_t transferred);
    bool mark_failed(int64_t id, const std::string& message);
    bool set_total_bytes(int64_t id, uint64_t total_bytes);
    bool set_transferred(int64_t id, uint64_t transferred);
    bool set_upload_id(int64_t id, const std::optional<std::string>& upload_id);
    bool increment_retry_count(int64_t id);
    
    // Back to queued with retry_count 0 and no error message
    bool reset_for_retry(int64_t id);
    
    std::set<std::string> known_upload_ids();
    
    // Parts
    bool create_parts(int64_t transfer_id, const std::vector<TransferPart>& parts);
    std::vector<TransferPart> get_parts(int64_t transfer_id);
    std::vector<TransferPart> pending_parts(int64_t transfer_id);
    std::vector<TransferPart> completed_parts(int64_t transfer_id);
    bool mark_part_completed(int64_t transfer_id, int part_number, const std::string& etag);
    bool reset_parts(int64_t transfer_id);
    uint64_t completed_bytes(int64_t transfer_id);
    
    // Preferences
    std::optional<std::string> get_pref(const std::string& key);
    bool set_pref(const std::string& key, const std::string& value);
    bool get_bool_pref(const std::string& key, bool default_value = false);
    int get_int_pref(const std::string& key, int default_value = 0);

private:
    using Binder = std::function<void(sqlite3_stmt*)>;
    
    bool create_tables();
    bool apply_pragmas();
    
    // Runs a statement that returns no rows; caller holds mutex_
    bool execute(const char* sql, const Binder& bind);
    bool exec_script(const char* sql);
    
    std::vector<TransferRecord> query_transfers(const std::string& sql, const Binder& bind);
    std::vector<TransferPart> query_parts(const char* sql, int64_t transfer_id);
    std::optional<std::string> get_pref_locked(const std::string& key);
    
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex mutex_;
};

} // namespace s3xfer::storage
