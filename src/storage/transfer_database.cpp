#include "s3xfer/storage/transfer_database.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/core/utils.hpp"
#include <sqlite3.h>

namespace s3xfer::storage {

namespace {

constexpr const char* TRANSFER_COLUMNS =
    "id, bucket_id, object_key, direction, total_bytes, transferred, status, "
    "upload_id, local_path, error_message, retry_count, created_at, updated_at";

constexpr const char* PART_COLUMNS =
    "transfer_id, part_number, \"offset\", size, etag, status";

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        bind_text(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(stmt, index);
}

TransferRecord read_transfer(sqlite3_stmt* stmt) {
    TransferRecord record;
    record.id = sqlite3_column_int64(stmt, 0);
    record.bucket_id = sqlite3_column_int64(stmt, 1);
    record.object_key = column_text(stmt, 2);
    record.direction = parse_direction(column_text(stmt, 3)).value_or(Direction::UPLOAD);
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        record.total_bytes = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    }
    record.transferred = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    record.status = parse_transfer_status(column_text(stmt, 6)).value_or(TransferStatus::QUEUED);
    record.upload_id = column_optional_text(stmt, 7);
    record.local_path = column_text(stmt, 8);
    record.error_message = column_optional_text(stmt, 9);
    record.retry_count = sqlite3_column_int(stmt, 10);
    record.created_at = column_text(stmt, 11);
    record.updated_at = column_text(stmt, 12);
    return record;
}

TransferPart read_part(sqlite3_stmt* stmt) {
    TransferPart part;
    part.transfer_id = sqlite3_column_int64(stmt, 0);
    part.part_number = sqlite3_column_int(stmt, 1);
    part.offset = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
    part.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    part.etag = column_optional_text(stmt, 4);
    part.status = parse_part_status(column_text(stmt, 5)).value_or(PartStatus::PENDING);
    return part;
}

} // namespace

TransferDatabase::TransferDatabase(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

TransferDatabase::~TransferDatabase() {
    close();
}

bool TransferDatabase::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (db_path_.has_parent_path()) {
        core::utils::FileUtils::create_directories(db_path_.parent_path());
    }
    
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    if (!apply_pragmas() || !create_tables()) {
        return false;
    }
    
    LOG_INFO("Database initialized at {}", db_path_.string());
    return true;
}

void TransferDatabase::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool TransferDatabase::apply_pragmas() {
    return exec_script("PRAGMA journal_mode=WAL;") && exec_script("PRAGMA foreign_keys=ON;");
}

bool TransferDatabase::exec_script(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQL script failed: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool TransferDatabase::create_tables() {
    const char* create_schema_version = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )";
    
    const char* create_schema = R"(
        CREATE TABLE IF NOT EXISTS buckets (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            name        TEXT NOT NULL,
            region      TEXT,
            profile     TEXT NOT NULL,
            created_at  TEXT NOT NULL DEFAULT (datetime('now')),
            UNIQUE(name, profile)
        );
        
        CREATE TABLE IF NOT EXISTS transfers (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            bucket_id       INTEGER NOT NULL REFERENCES buckets(id) ON DELETE CASCADE,
            object_key      TEXT NOT NULL,
            direction       TEXT NOT NULL CHECK(direction IN ('upload', 'download')),
            total_bytes     INTEGER,
            transferred     INTEGER DEFAULT 0,
            status          TEXT NOT NULL DEFAULT 'queued'
                            CHECK(status IN ('queued','in_progress','paused','completed','failed','cancelled')),
            upload_id       TEXT,
            local_path      TEXT NOT NULL,
            error_message   TEXT,
            retry_count     INTEGER DEFAULT 0,
            created_at      TEXT NOT NULL DEFAULT (datetime('now')),
            updated_at      TEXT NOT NULL DEFAULT (datetime('now'))
        );
        CREATE INDEX IF NOT EXISTS idx_transfers_status ON transfers(status);
        
        CREATE TABLE IF NOT EXISTS transfer_parts (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            transfer_id     INTEGER NOT NULL REFERENCES transfers(id) ON DELETE CASCADE,
            part_number     INTEGER NOT NULL,
            "offset"        INTEGER NOT NULL,
            size            INTEGER NOT NULL,
            etag            TEXT,
            status          TEXT NOT NULL DEFAULT 'pending'
                            CHECK(status IN ('pending','in_progress','completed','failed')),
            UNIQUE(transfer_id, part_number)
        );
        
        CREATE TABLE IF NOT EXISTS preferences (
            key         TEXT PRIMARY KEY,
            value       TEXT NOT NULL
        );
    )";
    
    if (!exec_script(create_schema_version)) {
        return false;
    }
    
    int current = 0;
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM schema_version;", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
            current = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }
    
    if (current >= SCHEMA_VERSION) {
        return true;
    }
    
    LOG_INFO("Applying schema version {}", SCHEMA_VERSION);
    if (!exec_script("BEGIN;")) {
        return false;
    }
    bool ok = exec_script(create_schema) &&
        execute("INSERT OR REPLACE INTO schema_version (version) VALUES (?);",
                [](sqlite3_stmt* s) { sqlite3_bind_int(s, 1, SCHEMA_VERSION); });
    if (!ok) {
        exec_script("ROLLBACK;");
        return false;
    }
    return exec_script("COMMIT;");
}

int TransferDatabase::schema_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM schema_version;", -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return 0;
    }
    
    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

bool TransferDatabase::execute(const char* sql, const Binder& bind) {
    if (!db_) {
        LOG_ERROR("Database is not open");
        return false;
    }
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: {}", sqlite3_errmsg(db_));
        return false;
    }
    
    if (bind) {
        bind(stmt);
    }
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        LOG_ERROR("Statement failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

// Buckets

std::optional<int64_t> TransferDatabase::ensure_bucket(const std::string& name,
                                                       const std::string& profile,
                                                       const std::string& region) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    bool inserted = execute(
        "INSERT OR IGNORE INTO buckets (name, region, profile) VALUES (?, ?, ?);",
        [&](sqlite3_stmt* stmt) {
            bind_text(stmt, 1, name);
            bind_optional_text(stmt, 2, region.empty() ? std::nullopt : std::optional<std::string>(region));
            bind_text(stmt, 3, profile);
        });
    if (!inserted) {
        return std::nullopt;
    }
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, "SELECT id FROM buckets WHERE name = ? AND profile = ?;",
                                    -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return std::nullopt;
    }
    bind_text(stmt, 1, name);
    bind_text(stmt, 2, profile);
    
    std::optional<int64_t> id;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return id;
}

std::optional<int64_t> TransferDatabase::find_bucket_id(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, "SELECT id FROM buckets WHERE name = ? ORDER BY id DESC LIMIT 1;",
                                    -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return std::nullopt;
    }
    bind_text(stmt, 1, name);
    
    std::optional<int64_t> id;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        id = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return id;
}

// Transfers

std::optional<int64_t> TransferDatabase::create_transfer(const NewTransfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    bool ok = execute(R"(
        INSERT INTO transfers (bucket_id, object_key, direction, total_bytes, local_path)
        VALUES (?, ?, ?, ?, ?);
    )", [&](sqlite3_stmt* stmt) {
        sqlite3_bind_int64(stmt, 1, transfer.bucket_id);
        bind_text(stmt, 2, transfer.object_key);
        bind_text(stmt, 3, to_string(transfer.direction));
        if (transfer.total_bytes) {
            sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(*transfer.total_bytes));
        } else {
            sqlite3_bind_null(stmt, 4);
        }
        bind_text(stmt, 5, transfer.local_path);
    });
    
    if (!ok) {
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<TransferRecord> TransferDatabase::query_transfers(const std::string& sql, const Binder& bind) {
    std::vector<TransferRecord> records;
    if (!db_) {
        return records;
    }
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare transfer query: {}", sqlite3_errmsg(db_));
        return records;
    }
    
    if (bind) {
        bind(stmt);
    }
    
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(read_transfer(stmt));
    }
    sqlite3_finalize(stmt);
    return records;
}

std::optional<TransferRecord> TransferDatabase::get_transfer(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto records = query_transfers(
        std::string("SELECT ") + TRANSFER_COLUMNS + " FROM transfers WHERE id = ?;",
        [id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, id); });
    
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

std::vector<TransferRecord> TransferDatabase::list_transfers(std::optional<int64_t> bucket_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string sql = std::string("SELECT ") + TRANSFER_COLUMNS + " FROM transfers";
    if (bucket_id) {
        sql += " WHERE bucket_id = ?";
    }
    sql += " ORDER BY created_at ASC, id ASC;";
    
    return query_transfers(sql, [&](sqlite3_stmt* stmt) {
        if (bucket_id) {
            sqlite3_bind_int64(stmt, 1, *bucket_id);
        }
    });
}

std::vector<TransferRecord> TransferDatabase::list_transfers_by_status(
    const std::vector<TransferStatus>& statuses, std::optional<int64_t> bucket_id) {
    
    if (statuses.empty()) {
        return {};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<std::string> placeholders(statuses.size(), "?");
    std::string sql = std::string("SELECT ") + TRANSFER_COLUMNS + " FROM transfers WHERE status IN (" +
        core::utils::StringUtils::join(placeholders, ", ") + ")";
    if (bucket_id) {
        sql += " AND bucket_id = ?";
    }
    sql += " ORDER BY created_at ASC, id ASC;";
    
    return query_transfers(sql, [&](sqlite3_stmt* stmt) {
        int index = 1;
        for (auto status : statuses) {
            bind_text(stmt, index++, to_string(status));
        }
        if (bucket_id) {
            sqlite3_bind_int64(stmt, index, *bucket_id);
        }
    });
}

std::optional<int64_t> TransferDatabase::next_queued_transfer(std::optional<int64_t> bucket_id,
                                                              const std::set<int64_t>& exclude) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::string sql = "SELECT id FROM transfers WHERE status = 'queued'";
    if (bucket_id) {
        sql += " AND bucket_id = ?";
    }
    sql += " ORDER BY created_at ASC, id ASC;";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare queue query: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    if (bucket_id) {
        sqlite3_bind_int64(stmt, 1, *bucket_id);
    }
    
    std::optional<int64_t> next;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        int64_t id = sqlite3_column_int64(stmt, 0);
        if (exclude.count(id) == 0) {
            next = id;
            break;
        }
    }
    sqlite3_finalize(stmt);
    return next;
}

std::vector<int64_t> TransferDatabase::paused_transfer_ids(int64_t bucket_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::vector<int64_t> ids;
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_,
        "SELECT id FROM transfers WHERE status = 'paused' AND bucket_id = ? ORDER BY created_at ASC, id ASC;",
        -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return ids;
    }
    sqlite3_bind_int64(stmt, 1, bucket_id);
    
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

bool TransferDatabase::set_status(int64_t id, TransferStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute("UPDATE transfers SET status = ?, updated_at = datetime('now') WHERE id = ?;",
        [&](sqlite3_stmt* stmt) {
            bind_text(stmt, 1, to_string(status));
            sqlite3_bind_int64(stmt, 2, id);
        });
}

bool TransferDatabase::mark_paused(int64_t id, uint64_t transferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(
        "UPDATE transfers SET status = 'paused', transferred = ?, updated_at = datetime('now') WHERE id = ?;",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(transferred));
            sqlite3_bind_int64(stmt, 2, id);
        });
}

bool TransferDatabase::mark_completed(int64_t id, uint64_t transferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(
        "UPDATE transfers SET status = 'completed', transferred = ?, error_message = NULL, "
        "updated_at = datetime('now') WHERE id = ?;",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(transferred));
            sqlite3_bind_int64(stmt, 2, id);
        });
}

bool TransferDatabase::mark_failed(int64_t id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(
        "UPDATE transfers SET status = 'failed', error_message = ?, updated_at = datetime('now') WHERE id = ?;",
        [&](sqlite3_stmt* stmt) {
            bind_text(stmt, 1, message);
            sqlite3_bind_int64(stmt, 2, id);
        });
}

bool TransferDatabase::set_total_bytes(int64_t id, uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute("UPDATE transfers SET total_bytes = ? WHERE id = ?;",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(total_bytes));
            sqlite3_bind_int64(stmt, 2, id);
        });
}

bool TransferDatabase::set_transferred(int64_t id, uint64_t transferred) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute("UPDATE transfers SET transferred = ?, updated_at = datetime('now') WHERE id = ?;",
        [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(transferred));
            sqlite3_bind_int64(stmt, 2, id);
        });
}

bool TransferDatabase::set_upload_id(int64_t id, const std::optional<std::string>& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute("UPDATE transfers SET upload_id = ? WHERE id = ?;",
        [&](sqlite3_stmt* stmt) {
            bind_optional_text(stmt, 1, upload_id);
            sqlite3_bind_int64(stmt, 2, id);
        });
}

bool TransferDatabase::increment_retry_count(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute("UPDATE transfers SET retry_count = retry_count + 1 WHERE id = ?;",
        [id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, id); });
}

bool TransferDatabase::reset_for_retry(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(
        "UPDATE transfers SET status = 'queued', retry_count = 0, error_message = NULL, "
        "updated_at = datetime('now') WHERE id = ?;",
        [id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, id); });
}

std::set<std::string> TransferDatabase::known_upload_ids() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    std::set<std::string> ids;
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, "SELECT upload_id FROM transfers WHERE upload_id IS NOT NULL;",
                                    -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return ids;
    }
    
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.insert(column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return ids;
}

// Parts

bool TransferDatabase::create_parts(int64_t transfer_id, const std::vector<TransferPart>& parts) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!exec_script("BEGIN;")) {
        return false;
    }
    
    for (const auto& part : parts) {
        bool ok = execute(R"(
            INSERT OR IGNORE INTO transfer_parts (transfer_id, part_number, "offset", size, status)
            VALUES (?, ?, ?, ?, 'pending');
        )", [&](sqlite3_stmt* stmt) {
            sqlite3_bind_int64(stmt, 1, transfer_id);
            sqlite3_bind_int(stmt, 2, part.part_number);
            sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(part.offset));
            sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(part.size));
        });
        if (!ok) {
            exec_script("ROLLBACK;");
            return false;
        }
    }
    
    return exec_script("COMMIT;");
}

std::vector<TransferPart> TransferDatabase::query_parts(const char* sql, int64_t transfer_id) {
    std::vector<TransferPart> parts;
    if (!db_) {
        return parts;
    }
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare part query: {}", sqlite3_errmsg(db_));
        return parts;
    }
    sqlite3_bind_int64(stmt, 1, transfer_id);
    
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        parts.push_back(read_part(stmt));
    }
    sqlite3_finalize(stmt);
    return parts;
}

std::vector<TransferPart> TransferDatabase::get_parts(int64_t transfer_id) {
    static const std::string sql = std::string("SELECT ") + PART_COLUMNS +
        " FROM transfer_parts WHERE transfer_id = ? ORDER BY part_number ASC;";
    std::lock_guard<std::mutex> lock(mutex_);
    return query_parts(sql.c_str(), transfer_id);
}

std::vector<TransferPart> TransferDatabase::pending_parts(int64_t transfer_id) {
    static const std::string sql = std::string("SELECT ") + PART_COLUMNS +
        " FROM transfer_parts WHERE transfer_id = ? AND status != 'completed' ORDER BY part_number ASC;";
    std::lock_guard<std::mutex> lock(mutex_);
    return query_parts(sql.c_str(), transfer_id);
}

std::vector<TransferPart> TransferDatabase::completed_parts(int64_t transfer_id) {
    static const std::string sql = std::string("SELECT ") + PART_COLUMNS +
        " FROM transfer_parts WHERE transfer_id = ? AND status = 'completed' ORDER BY part_number ASC;";
    std::lock_guard<std::mutex> lock(mutex_);
    return query_parts(sql.c_str(), transfer_id);
}

bool TransferDatabase::mark_part_completed(int64_t transfer_id, int part_number, const std::string& etag) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(
        "UPDATE transfer_parts SET status = 'completed', etag = ? WHERE transfer_id = ? AND part_number = ?;",
        [&](sqlite3_stmt* stmt) {
            bind_text(stmt, 1, etag);
            sqlite3_bind_int64(stmt, 2, transfer_id);
            sqlite3_bind_int(stmt, 3, part_number);
        });
}

bool TransferDatabase::reset_parts(int64_t transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute("UPDATE transfer_parts SET status = 'pending', etag = NULL WHERE transfer_id = ?;",
        [transfer_id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, transfer_id); });
}

uint64_t TransferDatabase::completed_bytes(int64_t transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_,
        "SELECT COALESCE(SUM(size), 0) FROM transfer_parts WHERE transfer_id = ? AND status = 'completed';",
        -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return 0;
    }
    sqlite3_bind_int64(stmt, 1, transfer_id);
    
    result = sqlite3_step(stmt);
    uint64_t done = (result == SQLITE_ROW) ? static_cast<uint64_t>(sqlite3_column_int64(stmt, 0)) : 0;
    sqlite3_finalize(stmt);
    return done;
}

// Preferences

std::optional<std::string> TransferDatabase::get_pref_locked(const std::string& key) {
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, "SELECT value FROM preferences WHERE key = ?;", -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        return std::nullopt;
    }
    bind_text(stmt, 1, key);
    
    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

std::optional<std::string> TransferDatabase::get_pref(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_pref_locked(key);
}

bool TransferDatabase::set_pref(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute("INSERT OR REPLACE INTO preferences (key, value) VALUES (?, ?);",
        [&](sqlite3_stmt* stmt) {
            bind_text(stmt, 1, key);
            bind_text(stmt, 2, value);
        });
}

bool TransferDatabase::get_bool_pref(const std::string& key, bool default_value) {
    auto value = get_pref(key);
    if (!value) {
        return default_value;
    }
    auto lower = core::utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int TransferDatabase::get_int_pref(const std::string& key, int default_value) {
    auto value = get_pref(key);
    if (!value) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(*value, &consumed);
        return consumed == value->size() ? parsed : default_value;
    } catch (const std::exception&) {
        return default_value;
    }
}

} // namespace s3xfer::storage
