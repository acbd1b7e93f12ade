#pragma once

#include "engine_config.hpp"
#include "transfer_worker.hpp"
#include "s3xfer/storage/transfer_database.hpp"
#include "s3xfer/store/object_store.hpp"
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace s3xfer::transfer {

// Schedules transfers of one bucket onto a bounded worker pool.
// Handlers are invoked from worker threads.
class TransferEngine {
public:
    // Unknown multipart uploads younger than this may belong to another client
    static constexpr std::chrono::hours ORPHAN_UPLOAD_GRACE{24};
    
    using ProgressHandler = std::function<void(int64_t id, uint64_t done, uint64_t total)>;
    using SpeedHandler = std::function<void(int64_t id, double bytes_per_second)>;
    using StatusHandler = std::function<void(int64_t id, storage::TransferStatus status)>;
    using FinishedHandler = std::function<void(int64_t id)>;
    using ErrorHandler = std::function<void(int64_t id, const std::string& message, const std::string& detail)>;
    
    TransferEngine(std::shared_ptr<store::ObjectStoreClient> client,
                   std::shared_ptr<storage::TransferDatabase> database,
                   std::string bucket,
                   EngineConfig config = {});
    ~TransferEngine();
    
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;
    
    // Event handlers
    void set_progress_handler(ProgressHandler handler);
    void set_speed_handler(SpeedHandler handler);
    void set_status_handler(StatusHandler handler);
    void set_finished_handler(FinishedHandler handler);
    void set_error_handler(ErrorHandler handler);
    
    // Records a new transfer for this bucket and enqueues it
    std::optional<int64_t> submit_upload(const std::string& local_path, const std::string& key);
    std::optional<int64_t> submit_download(const std::string& key, const std::string& local_path);
    
    // Transfer control
    bool enqueue(int64_t id);
    bool pause(int64_t id);
    bool resume(int64_t id);
    bool cancel(int64_t id);
    bool retry(int64_t id);
    void pause_all();
    void resume_all();
    
    // Startup recovery; returns the number of transfers enqueued
    size_t restore_pending();
    int cleanup_orphaned_uploads();
    
    bool wait_for_idle(std::chrono::milliseconds timeout);
    size_t active_count() const;
    bool is_active(int64_t id) const;
    bool is_paused_globally() const;
    
    std::optional<int64_t> bucket_id() const { return bucket_id_; }
    const std::string& bucket() const { return bucket_; }
    const EngineConfig& config() const { return config_; }

private:
    void start_worker(const storage::TransferRecord& record, std::shared_ptr<TransferControl> control);
    void admit_next();
    
    // Frees the slot of a finished run; true if a resume is waiting for it
    bool release(int64_t id);
    void after_release(int64_t id, bool resume_requested);
    
    void on_worker_finished(int64_t id);
    void on_worker_failed(int64_t id, const std::string& message, const std::string& detail);
    void on_worker_stopped(int64_t id, storage::TransferStatus status);
    
    void emit_status(int64_t id, storage::TransferStatus status);
    
    // User handler exceptions are logged so bookkeeping always finishes
    template<typename Handler, typename... Args>
    void notify(const char* event, const Handler& handler, int64_t id, const Args&... args) {
        if (!handler) {
            return;
        }
        try {
            handler(id, args...);
        } catch (const std::exception& e) {
            LOG_ERROR("Transfer {}: {} handler threw: {}", id, event, e.what());
        }
    }
    void cancel_inactive(const storage::TransferRecord& record);
    
    std::shared_ptr<store::ObjectStoreClient> client_;
    std::shared_ptr<storage::TransferDatabase> database_;
    std::string bucket_;
    std::optional<int64_t> bucket_id_;
    EngineConfig config_;
    
    // Transfer registry
    std::unordered_map<int64_t, std::shared_ptr<TransferControl>> controls_;
    std::set<int64_t> resume_after_stop_;
    size_t releases_in_progress_;
    bool paused_globally_;
    bool shutting_down_;
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    
    ProgressHandler progress_handler_;
    SpeedHandler speed_handler_;
    StatusHandler status_handler_;
    FinishedHandler finished_handler_;
    ErrorHandler error_handler_;
    mutable std::mutex handlers_mutex_;
    
    boost::asio::thread_pool pool_;
};

} // namespace s3xfer::transfer
