#pragma once

#include "engine_config.hpp"
#include "speed_tracker.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/storage/transfer_database.hpp"
#include "s3xfer/store/object_store.hpp"
#include "s3xfer/store/store_error.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

namespace s3xfer::transfer {

// Cooperative flags shared between the engine and one running worker.
// Workers look at them between parts or chunks.
struct TransferControl {
    std::atomic<bool> pause{false};
    std::atomic<bool> cancel{false};
};

struct WorkerSignals {
    std::function<void(int64_t id, uint64_t done, uint64_t total)> progress;
    std::function<void(int64_t id, double bytes_per_second)> speed;
    std::function<void(int64_t id)> finished;
    std::function<void(int64_t id, const std::string& message, const std::string& detail)> failed;
    
    // Run ended by a pause or a cancel request
    std::function<void(int64_t id, storage::TransferStatus status)> stopped;
};

class RetryExhaustedError : public std::runtime_error {
public:
    RetryExhaustedError(const std::string& message, std::string detail)
        : std::runtime_error(message), detail_(std::move(detail)) {}
    
    const std::string& detail() const { return detail_; }
    
private:
    std::string detail_;
};

class TransferWorker {
public:
    TransferWorker(int64_t transfer_id,
                   std::shared_ptr<store::ObjectStoreClient> client,
                   std::shared_ptr<storage::TransferDatabase> database,
                   std::string bucket,
                   std::shared_ptr<TransferControl> control,
                   EngineConfig config,
                   WorkerSignals signals);
    virtual ~TransferWorker() = default;
    
    // Emits exactly one of finished, failed or stopped. Never throws.
    void run();
    
    int64_t transfer_id() const { return transfer_id_; }

protected:
    virtual void execute() = 0;
    virtual const char* label() const = 0;
    
    template<typename Fn>
    auto with_retry(const std::string& operation, Fn&& fn) -> decltype(fn()) {
        const int attempts = std::max(1, config_.retry.max_attempts);
        for (int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const store::StoreError& e) {
                std::string detail = e.detail().empty() ? e.user_message()
                                                        : e.user_message() + " (" + e.detail() + ")";
                if (attempt + 1 >= attempts) {
                    throw RetryExhaustedError(std::string(label()) + " failed after " +
                                              std::to_string(attempts) + " attempts.", detail);
                }
                
                auto delay = config_.retry.delay_for(attempt, rng_);
                LOG_WARN("{} {}: {} attempt {} failed, retrying in {}ms: {}",
                         label(), transfer_id_, operation, attempt + 1, delay.count(), detail);
                if (!database_->increment_retry_count(transfer_id_)) {
                    LOG_WARN("{} {}: could not record retry", label(), transfer_id_);
                }
                if (delay.count() > 0) {
                    std::this_thread::sleep_for(delay);
                }
            }
        }
    }
    
    // A throwing handler is logged and leaves the recorded outcome alone
    template<typename Handler, typename... Args>
    void emit(const char* event, const Handler& handler, const Args&... args) {
        if (!handler) {
            return;
        }
        try {
            handler(args...);
        } catch (const std::exception& e) {
            LOG_ERROR("{} {}: {} handler threw: {}", label(), transfer_id_, event, e.what());
        }
    }
    
    bool cancel_requested() const { return control_->cancel.load(); }
    bool pause_requested() const { return control_->pause.load(); }
    
    void fail(const std::string& message, const std::string& detail);
    void complete(uint64_t total);
    void stop_paused(uint64_t transferred);
    void stop_cancelled();
    void report_progress(uint64_t done, uint64_t total, uint64_t chunk_bytes);
    
    int64_t transfer_id_;
    std::shared_ptr<store::ObjectStoreClient> client_;
    std::shared_ptr<storage::TransferDatabase> database_;
    std::string bucket_;
    std::shared_ptr<TransferControl> control_;
    EngineConfig config_;
    WorkerSignals signals_;

private:
    SpeedTracker speed_;
    std::mt19937_64 rng_;
};

} // namespace s3xfer::transfer
