#include "s3xfer/transfer/transfer_worker.hpp"

namespace s3xfer::transfer {

TransferWorker::TransferWorker(int64_t transfer_id,
                               std::shared_ptr<store::ObjectStoreClient> client,
                               std::shared_ptr<storage::TransferDatabase> database,
                               std::string bucket,
                               std::shared_ptr<TransferControl> control,
                               EngineConfig config,
                               WorkerSignals signals)
    : transfer_id_(transfer_id)
    , client_(std::move(client))
    , database_(std::move(database))
    , bucket_(std::move(bucket))
    , control_(control ? std::move(control) : std::make_shared<TransferControl>())
    , config_(std::move(config))
    , signals_(std::move(signals))
    , rng_(std::random_device{}()) {
}

void TransferWorker::run() {
    try {
        execute();
    } catch (const RetryExhaustedError& e) {
        LOG_ERROR("{} {} failed: {} {}", label(), transfer_id_, e.what(), e.detail());
        fail(e.what(), e.detail());
    } catch (const store::StoreError& e) {
        LOG_ERROR("{} {} failed: {}", label(), transfer_id_, e.detail());
        fail(e.user_message(), e.detail());
    } catch (const std::exception& e) {
        LOG_ERROR("{} {} failed: {}", label(), transfer_id_, e.what());
        fail(e.what(), e.what());
    }
}

void TransferWorker::fail(const std::string& message, const std::string& detail) {
    if (!database_->mark_failed(transfer_id_, message)) {
        LOG_ERROR("Failed to mark {} {} as failed", label(), transfer_id_);
    }
    emit("failed", signals_.failed, transfer_id_, message, detail);
}

void TransferWorker::complete(uint64_t total) {
    if (!database_->mark_completed(transfer_id_, total)) {
        LOG_ERROR("Failed to mark {} {} as completed", label(), transfer_id_);
        fail("Could not record completed transfer.", "");
        return;
    }
    emit("progress", signals_.progress, transfer_id_, total, total);
    LOG_INFO("{} {} completed", label(), transfer_id_);
    emit("finished", signals_.finished, transfer_id_);
}

void TransferWorker::stop_paused(uint64_t transferred) {
    if (!database_->mark_paused(transfer_id_, transferred)) {
        LOG_ERROR("Failed to mark {} {} as paused", label(), transfer_id_);
    }
    LOG_INFO("{} {} paused at {} bytes", label(), transfer_id_, transferred);
    emit("stopped", signals_.stopped, transfer_id_, storage::TransferStatus::PAUSED);
}

void TransferWorker::stop_cancelled() {
    if (!database_->set_status(transfer_id_, storage::TransferStatus::CANCELLED)) {
        LOG_ERROR("Failed to mark {} {} as cancelled", label(), transfer_id_);
    }
    LOG_INFO("{} {} cancelled", label(), transfer_id_);
    emit("stopped", signals_.stopped, transfer_id_, storage::TransferStatus::CANCELLED);
}

void TransferWorker::report_progress(uint64_t done, uint64_t total, uint64_t chunk_bytes) {
    emit("progress", signals_.progress, transfer_id_, done, total);
    auto speed = speed_.record(chunk_bytes);
    if (speed) {
        emit("speed", signals_.speed, transfer_id_, *speed);
    }
}

} // namespace s3xfer::transfer
