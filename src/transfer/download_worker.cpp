#include "s3xfer/transfer/download_worker.hpp"
#include <fstream>

namespace s3xfer::transfer {

namespace fs = std::filesystem;

namespace {

void write_all(std::ofstream& out, const std::vector<uint8_t>& data, const fs::path& path) {
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
        throw std::runtime_error("Write failed: " + path.string());
    }
}

} // namespace

void DownloadWorker::execute() {
    auto record = database_->get_transfer(transfer_id_);
    if (!record) {
        LOG_ERROR("Download {}: transfer record not found", transfer_id_);
        emit("failed", signals_.failed, transfer_id_, std::string("Transfer record not found."), std::string());
        return;
    }
    
    fs::path target(record->local_path);
    fs::path directory = target.parent_path().empty() ? fs::path(".") : target.parent_path();
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        fail("Destination directory does not exist.", directory.string());
        return;
    }
    
    if (!database_->set_status(transfer_id_, storage::TransferStatus::IN_PROGRESS)) {
        LOG_ERROR("Download {}: could not mark in progress", transfer_id_);
    }
    
    auto head = client_->head_object(bucket_, record->object_key);
    uint64_t total = head.size.value_or(0);
    if (!database_->set_total_bytes(transfer_id_, total)) {
        LOG_WARN("Download {}: could not record size {}", transfer_id_, total);
    }
    
    auto temp = config_.temp_path_for(target, transfer_id_);
    LOG_INFO("Download {} started: {} -> {} ({} bytes)", transfer_id_, record->object_key, target.string(), total);
    
    if (total < config_.multipart_threshold) {
        single_download(record->object_key, target, temp, total);
    } else {
        ranged_download(record->object_key, target, temp, total);
    }
}

void DownloadWorker::single_download(const std::string& key, const fs::path& target,
                                     const fs::path& temp, uint64_t total) {
    auto data = with_retry("get_object", [&]() { return client_->get_object(bucket_, key); });
    
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot create temp file: " + temp.string());
        }
        write_all(out, data, temp);
    }
    
    fs::rename(temp, target);
    complete(total);
}

void DownloadWorker::ranged_download(const std::string& key, const fs::path& target,
                                     const fs::path& temp, uint64_t total) {
    uint64_t offset = 0;
    std::error_code ec;
    if (fs::exists(temp, ec)) {
        offset = fs::file_size(temp);
        if (!database_->set_transferred(transfer_id_, offset)) {
            LOG_WARN("Download {}: could not record progress {}", transfer_id_, offset);
        }
        LOG_INFO("Download {} resuming at offset {}", transfer_id_, offset);
    }
    
    {
        std::ofstream out(temp, std::ios::binary | std::ios::app);
        if (!out) {
            throw std::runtime_error("Cannot open temp file: " + temp.string());
        }
        
        while (offset < total) {
            if (cancel_requested()) {
                out.close();
                cancel_download(temp);
                return;
            }
            if (pause_requested()) {
                stop_paused(offset);
                return;
            }
            
            uint64_t last = std::min(offset + config_.download_chunk_size - 1, total - 1);
            auto data = with_retry("get_object range " + std::to_string(offset), [&]() {
                return client_->get_object(bucket_, key, store::ByteRange{offset, last});
            });
            if (data.empty()) {
                throw std::runtime_error("Empty response for bytes " + std::to_string(offset) + "-" +
                                         std::to_string(last) + " of " + key);
            }
            
            write_all(out, data, temp);
            offset += data.size();
            
            if (!database_->set_transferred(transfer_id_, offset)) {
                LOG_WARN("Download {}: could not record progress {}", transfer_id_, offset);
            }
            report_progress(offset, total, data.size());
        }
    }
    
    uint64_t actual = fs::file_size(temp);
    if (actual != total) {
        fail("Size mismatch: expected " + std::to_string(total) + ", got " + std::to_string(actual), "");
        return;
    }
    
    fs::rename(temp, target);
    complete(total);
}

void DownloadWorker::cancel_download(const fs::path& temp) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        LOG_WARN("Download {}: could not remove temp file {}: {}", transfer_id_, temp.string(), ec.message());
    }
    stop_cancelled();
}

} // namespace s3xfer::transfer
