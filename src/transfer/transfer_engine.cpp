#include "s3xfer/transfer/transfer_engine.hpp"
#include "s3xfer/transfer/download_worker.hpp"
#include "s3xfer/transfer/upload_worker.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/core/utils.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <filesystem>

namespace s3xfer::transfer {

namespace fs = std::filesystem;
using storage::Direction;
using storage::TransferStatus;

TransferEngine::TransferEngine(std::shared_ptr<store::ObjectStoreClient> client,
                               std::shared_ptr<storage::TransferDatabase> database,
                               std::string bucket,
                               EngineConfig config)
    : client_(std::move(client))
    , database_(std::move(database))
    , bucket_(std::move(bucket))
    , config_(std::move(config))
    , releases_in_progress_(0)
    , paused_globally_(false)
    , shutting_down_(false)
    , pool_(std::max<uint32_t>(config_.max_concurrent_transfers, 1)) {
    
    bucket_id_ = database_->find_bucket_id(bucket_);
    if (!bucket_id_) {
        bucket_id_ = database_->ensure_bucket(bucket_);
    }
    if (!bucket_id_) {
        LOG_ERROR("Could not resolve bucket id for '{}'", bucket_);
    }
}

TransferEngine::~TransferEngine() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        // Running workers stop at their next boundary and stay resumable
        for (auto& [id, control] : controls_) {
            control->pause = true;
        }
    }
    pool_.join();
}

// Event handlers

void TransferEngine::set_progress_handler(ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    progress_handler_ = std::move(handler);
}

void TransferEngine::set_speed_handler(SpeedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    speed_handler_ = std::move(handler);
}

void TransferEngine::set_status_handler(StatusHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    status_handler_ = std::move(handler);
}

void TransferEngine::set_finished_handler(FinishedHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    finished_handler_ = std::move(handler);
}

void TransferEngine::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    error_handler_ = std::move(handler);
}

void TransferEngine::emit_status(int64_t id, TransferStatus status) {
    StatusHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = status_handler_;
    }
    notify("status", handler, id, status);
}

// Submission

std::optional<int64_t> TransferEngine::submit_upload(const std::string& local_path, const std::string& key) {
    if (!bucket_id_) {
        return std::nullopt;
    }
    
    storage::NewTransfer transfer;
    transfer.bucket_id = *bucket_id_;
    transfer.direction = Direction::UPLOAD;
    transfer.object_key = key;
    transfer.local_path = local_path;
    
    transfer.total_bytes = core::utils::FileUtils::file_size(local_path);
    
    auto id = database_->create_transfer(transfer);
    if (id) {
        enqueue(*id);
    }
    return id;
}

std::optional<int64_t> TransferEngine::submit_download(const std::string& key, const std::string& local_path) {
    if (!bucket_id_) {
        return std::nullopt;
    }
    
    storage::NewTransfer transfer;
    transfer.bucket_id = *bucket_id_;
    transfer.direction = Direction::DOWNLOAD;
    transfer.object_key = key;
    transfer.local_path = local_path;
    
    auto id = database_->create_transfer(transfer);
    if (id) {
        enqueue(*id);
    }
    return id;
}

// Transfer control

bool TransferEngine::enqueue(int64_t id) {
    auto record = database_->get_transfer(id);
    if (!record) {
        LOG_WARN("Cannot enqueue transfer {}: record not found", id);
        return false;
    }
    
    std::shared_ptr<TransferControl> control;
    bool deferred = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return false;
        }
        if (controls_.count(id) > 0) {
            LOG_WARN("Transfer {} is already active", id);
            return false;
        }
        
        if (paused_globally_ || controls_.size() >= config_.max_concurrent_transfers) {
            deferred = true;
        } else {
            control = std::make_shared<TransferControl>();
            controls_[id] = control;
        }
    }
    
    if (deferred) {
        // Admitted later in creation order
        if (record->status != TransferStatus::QUEUED) {
            if (!database_->set_status(id, TransferStatus::QUEUED)) {
                LOG_ERROR("Could not record status of transfer {}", id);
            }
            emit_status(id, TransferStatus::QUEUED);
        }
        LOG_DEBUG("Transfer {} queued until a slot is free", id);
        return true;
    }
    
    if (!database_->set_status(id, TransferStatus::IN_PROGRESS)) {
        LOG_ERROR("Could not record status of transfer {}", id);
    }
    emit_status(id, TransferStatus::IN_PROGRESS);
    
    LOG_INFO("Enqueued {} {} ({})", storage::to_string(record->direction), id, record->object_key);
    start_worker(*record, control);
    return true;
}

void TransferEngine::start_worker(const storage::TransferRecord& record, std::shared_ptr<TransferControl> control) {
    WorkerSignals signals;
    signals.progress = [this](int64_t id, uint64_t done, uint64_t total) {
        ProgressHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = progress_handler_;
        }
        notify("progress", handler, id, done, total);
    };
    signals.speed = [this](int64_t id, double bytes_per_second) {
        SpeedHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handler = speed_handler_;
        }
        notify("speed", handler, id, bytes_per_second);
    };
    signals.finished = [this](int64_t id) { on_worker_finished(id); };
    signals.failed = [this](int64_t id, const std::string& message, const std::string& detail) {
        on_worker_failed(id, message, detail);
    };
    signals.stopped = [this](int64_t id, TransferStatus status) { on_worker_stopped(id, status); };
    
    std::shared_ptr<TransferWorker> worker;
    if (record.direction == Direction::UPLOAD) {
        worker = std::make_shared<UploadWorker>(record.id, client_, database_, bucket_,
                                                std::move(control), config_, std::move(signals));
    } else {
        worker = std::make_shared<DownloadWorker>(record.id, client_, database_, bucket_,
                                                  std::move(control), config_, std::move(signals));
    }
    
    boost::asio::post(pool_, [worker]() { worker->run(); });
}

bool TransferEngine::pause(int64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = controls_.find(id);
        if (it != controls_.end()) {
            it->second->pause = true;
            resume_after_stop_.erase(id);
            LOG_INFO("Pause requested for transfer {}", id);
            return true;
        }
    }
    
    // Not running: only a transfer waiting for a slot can be paused
    auto record = database_->get_transfer(id);
    if (!record || record->status != TransferStatus::QUEUED) {
        LOG_WARN("Cannot pause transfer {}: not active", id);
        return false;
    }
    if (!database_->mark_paused(id, record->transferred)) {
        LOG_ERROR("Could not record pause of transfer {}", id);
    }
    emit_status(id, TransferStatus::PAUSED);
    return true;
}

bool TransferEngine::resume(int64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (controls_.count(id) > 0) {
            // Still winding down from a pause; resumed once it stops
            resume_after_stop_.insert(id);
            LOG_INFO("Transfer {} will resume when its worker stops", id);
            return true;
        }
    }
    
    auto record = database_->get_transfer(id);
    if (!record) {
        LOG_WARN("Cannot resume transfer {}: record not found", id);
        return false;
    }
    if (record->status == TransferStatus::COMPLETED || record->status == TransferStatus::CANCELLED) {
        LOG_WARN("Cannot resume transfer {} in status {}", id, storage::to_string(record->status));
        return false;
    }
    
    if (!database_->set_status(id, TransferStatus::QUEUED)) {
        LOG_ERROR("Could not record status of transfer {}", id);
    }
    emit_status(id, TransferStatus::QUEUED);
    LOG_INFO("Resuming transfer {}", id);
    return enqueue(id);
}

bool TransferEngine::cancel(int64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = controls_.find(id);
        if (it != controls_.end()) {
            it->second->cancel = true;
            resume_after_stop_.erase(id);
            LOG_INFO("Cancel requested for transfer {}", id);
            return true;
        }
    }
    
    auto record = database_->get_transfer(id);
    if (!record) {
        LOG_WARN("Cannot cancel transfer {}: record not found", id);
        return false;
    }
    if (record->status == TransferStatus::COMPLETED || record->status == TransferStatus::CANCELLED) {
        LOG_WARN("Cannot cancel transfer {} in status {}", id, storage::to_string(record->status));
        return false;
    }
    
    cancel_inactive(*record);
    return true;
}

void TransferEngine::cancel_inactive(const storage::TransferRecord& record) {
    if (record.direction == Direction::UPLOAD && record.upload_id) {
        try {
            client_->abort_multipart_upload(bucket_, record.object_key, *record.upload_id);
        } catch (const store::StoreError& e) {
            LOG_WARN("Abort of upload {} for transfer {} failed: {}", *record.upload_id, record.id, e.detail());
        }
    } else if (record.direction == Direction::DOWNLOAD) {
        auto temp = config_.temp_path_for(record.local_path, record.id);
        if (!core::utils::FileUtils::remove_file(temp)) {
            LOG_WARN("Could not remove partial download {}", temp.string());
        }
    }
    
    if (!database_->set_status(record.id, TransferStatus::CANCELLED)) {
        LOG_ERROR("Could not record status of transfer {}", record.id);
    }
    LOG_INFO("Transfer {} cancelled", record.id);
    emit_status(record.id, TransferStatus::CANCELLED);
}

bool TransferEngine::retry(int64_t id) {
    if (is_active(id)) {
        LOG_WARN("Cannot retry transfer {}: still active", id);
        return false;
    }
    if (!database_->get_transfer(id)) {
        LOG_WARN("Cannot retry transfer {}: record not found", id);
        return false;
    }
    if (!database_->reset_for_retry(id)) {
        return false;
    }
    
    emit_status(id, TransferStatus::QUEUED);
    LOG_INFO("Retrying transfer {}", id);
    return enqueue(id);
}

void TransferEngine::pause_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    paused_globally_ = true;
    for (auto& [id, control] : controls_) {
        control->pause = true;
    }
    resume_after_stop_.clear();
    LOG_INFO("Paused all transfers ({} active)", controls_.size());
}

void TransferEngine::resume_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_globally_ = false;
    }
    
    if (bucket_id_) {
        for (auto id : database_->paused_transfer_ids(*bucket_id_)) {
            resume(id);
        }
    }
    admit_next();
}

// Recovery

size_t TransferEngine::restore_pending() {
    auto pending = database_->list_transfers_by_status(
        {TransferStatus::QUEUED, TransferStatus::IN_PROGRESS, TransferStatus::PAUSED}, bucket_id_);
    
    size_t restored = 0;
    for (const auto& record : pending) {
        if (is_active(record.id)) {
            continue;
        }
        
        std::error_code ec;
        if (record.direction == Direction::UPLOAD && !fs::is_regular_file(record.local_path, ec)) {
            LOG_WARN("Transfer {}: source {} is gone", record.id, record.local_path);
            if (!database_->mark_failed(record.id, "Source file no longer exists.")) {
                LOG_ERROR("Could not record failure of transfer {}", record.id);
            }
            emit_status(record.id, TransferStatus::FAILED);
            continue;
        }
        if (record.direction == Direction::DOWNLOAD) {
            auto parent = fs::path(record.local_path).parent_path();
            if (!parent.empty() && !fs::is_directory(parent, ec)) {
                LOG_WARN("Transfer {}: destination {} is gone", record.id, parent.string());
                if (!database_->mark_failed(record.id, "Destination directory no longer exists.")) {
                    LOG_ERROR("Could not record failure of transfer {}", record.id);
                }
                emit_status(record.id, TransferStatus::FAILED);
                continue;
            }
        }
        
        if (record.status == TransferStatus::IN_PROGRESS) {
            if (!database_->set_status(record.id, TransferStatus::QUEUED)) {
                LOG_ERROR("Could not record status of transfer {}", record.id);
            }
            emit_status(record.id, TransferStatus::QUEUED);
        }
        
        if (enqueue(record.id)) {
            ++restored;
        }
    }
    
    LOG_INFO("Restored {} of {} pending transfers", restored, pending.size());
    return restored;
}

int TransferEngine::cleanup_orphaned_uploads() {
    std::vector<store::MultipartUpload> uploads;
    try {
        uploads = client_->list_multipart_uploads(bucket_);
    } catch (const store::StoreError& e) {
        LOG_ERROR("Could not list multipart uploads for {}: {}", bucket_, e.detail());
        return 0;
    }
    
    auto known = database_->known_upload_ids();
    auto cutoff = std::chrono::system_clock::now() - ORPHAN_UPLOAD_GRACE;
    
    int aborted = 0;
    for (const auto& upload : uploads) {
        if (known.count(upload.upload_id) > 0 || upload.initiated >= cutoff) {
            continue;
        }
        
        try {
            client_->abort_multipart_upload(bucket_, upload.key, upload.upload_id);
            ++aborted;
            LOG_INFO("Aborted orphaned upload {} for '{}'", upload.upload_id, upload.key);
        } catch (const store::StoreError& e) {
            LOG_WARN("Failed to abort orphaned upload {}: {}", upload.upload_id, e.detail());
        }
    }
    return aborted;
}

// Worker completion

bool TransferEngine::release(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    controls_.erase(id);
    ++releases_in_progress_;
    return resume_after_stop_.erase(id) > 0;
}

void TransferEngine::after_release(int64_t id, bool resume_requested) {
    if (resume_requested) {
        resume(id);
    }
    admit_next();
    
    std::lock_guard<std::mutex> lock(mutex_);
    --releases_in_progress_;
    idle_cv_.notify_all();
}

void TransferEngine::on_worker_finished(int64_t id) {
    release(id);
    
    emit_status(id, TransferStatus::COMPLETED);
    FinishedHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = finished_handler_;
    }
    notify("finished", handler, id);
    
    after_release(id, false);
}

void TransferEngine::on_worker_failed(int64_t id, const std::string& message, const std::string& detail) {
    release(id);
    
    emit_status(id, TransferStatus::FAILED);
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = error_handler_;
    }
    notify("error", handler, id, message, detail);
    
    after_release(id, false);
}

void TransferEngine::on_worker_stopped(int64_t id, TransferStatus status) {
    bool resume_requested = release(id);
    emit_status(id, status);
    after_release(id, resume_requested && status == TransferStatus::PAUSED);
}

void TransferEngine::admit_next() {
    while (true) {
        std::set<int64_t> exclude;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_ || paused_globally_ ||
                controls_.size() >= config_.max_concurrent_transfers) {
                return;
            }
            for (const auto& [id, control] : controls_) {
                exclude.insert(id);
            }
        }
        
        auto next = database_->next_queued_transfer(bucket_id_, exclude);
        if (!next || !enqueue(*next) || !is_active(*next)) {
            return;
        }
    }
}

bool TransferEngine::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return controls_.empty() && releases_in_progress_ == 0;
    });
}

size_t TransferEngine::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return controls_.size();
}

bool TransferEngine::is_active(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return controls_.count(id) > 0;
}

bool TransferEngine::is_paused_globally() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_globally_;
}

} // namespace s3xfer::transfer
