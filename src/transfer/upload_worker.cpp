#include "s3xfer/transfer/upload_worker.hpp"
#include <fstream>

namespace s3xfer::transfer {

namespace fs = std::filesystem;

void UploadWorker::execute() {
    auto record = database_->get_transfer(transfer_id_);
    if (!record) {
        LOG_ERROR("Upload {}: transfer record not found", transfer_id_);
        emit("failed", signals_.failed, transfer_id_, std::string("Transfer record not found."), std::string());
        return;
    }
    
    fs::path path(record->local_path);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        fail("Source file no longer exists.", path.string());
        return;
    }
    
    uint64_t size = fs::file_size(path);
    if ((!record->total_bytes || *record->total_bytes != size) &&
        !database_->set_total_bytes(transfer_id_, size)) {
        LOG_WARN("Upload {}: could not record size {}", transfer_id_, size);
    }
    if (!database_->set_status(transfer_id_, storage::TransferStatus::IN_PROGRESS)) {
        LOG_ERROR("Upload {}: could not mark in progress", transfer_id_);
    }
    
    LOG_INFO("Upload {} started: {} -> {} ({} bytes)", transfer_id_, path.string(), record->object_key, size);
    
    if (size < config_.multipart_threshold) {
        single_upload(path, record->object_key, size);
    } else {
        multipart_upload(path, record->object_key, size, *record);
    }
}

void UploadWorker::single_upload(const fs::path& path, const std::string& key, uint64_t size) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read source file: " + path.string());
    }
    
    std::vector<uint8_t> body(size);
    if (size > 0) {
        file.read(reinterpret_cast<char*>(body.data()), static_cast<std::streamsize>(size));
        if (static_cast<uint64_t>(file.gcount()) != size) {
            throw std::runtime_error("Source file changed while reading: " + path.string());
        }
    }
    
    with_retry("put_object", [&]() { client_->put_object(bucket_, key, body); });
    complete(size);
}

std::optional<std::string> UploadWorker::reconcile_parts(const std::string& key, const std::string& upload_id) {
    std::vector<store::UploadedPart> confirmed;
    try {
        confirmed = client_->list_parts(bucket_, key, upload_id);
    } catch (const store::StoreError& e) {
        if (e.code() != store::StoreErrorCode::NO_SUCH_UPLOAD) {
            throw;
        }
        LOG_WARN("Upload {}: multipart upload {} no longer exists, starting over", transfer_id_, upload_id);
        if (!database_->reset_parts(transfer_id_) || !database_->set_upload_id(transfer_id_, std::nullopt)) {
            throw std::runtime_error("Could not reset parts for transfer " + std::to_string(transfer_id_));
        }
        return std::nullopt;
    }
    
    for (const auto& part : confirmed) {
        if (!database_->mark_part_completed(transfer_id_, part.part_number, part.etag)) {
            throw std::runtime_error("Could not record part " + std::to_string(part.part_number) +
                                     " for transfer " + std::to_string(transfer_id_));
        }
    }
    LOG_DEBUG("Upload {}: backend confirmed {} parts of {}", transfer_id_, confirmed.size(), upload_id);
    return upload_id;
}

void UploadWorker::multipart_upload(const fs::path& path, const std::string& key, uint64_t size,
                                    const storage::TransferRecord& record) {
    uint64_t part_size = config_.part_size_for(size);
    uint64_t part_count = (size + part_size - 1) / part_size;
    
    std::vector<storage::TransferPart> layout;
    layout.reserve(part_count);
    for (uint64_t i = 0; i < part_count; ++i) {
        storage::TransferPart part;
        part.transfer_id = transfer_id_;
        part.part_number = static_cast<int>(i + 1);
        part.offset = i * part_size;
        part.size = std::min(part_size, size - part.offset);
        layout.push_back(part);
    }
    if (!database_->create_parts(transfer_id_, layout)) {
        throw std::runtime_error("Could not record parts for transfer " + std::to_string(transfer_id_));
    }
    
    std::optional<std::string> upload_id;
    if (record.upload_id) {
        upload_id = reconcile_parts(key, *record.upload_id);
    }
    
    if (!upload_id) {
        upload_id = with_retry("create_multipart_upload",
                               [&]() { return client_->create_multipart_upload(bucket_, key); });
        if (!database_->set_upload_id(transfer_id_, upload_id)) {
            throw std::runtime_error("Could not record upload id for transfer " + std::to_string(transfer_id_));
        }
    }
    
    auto pending = database_->pending_parts(transfer_id_);
    uint64_t done = database_->completed_bytes(transfer_id_);
    
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot read source file: " + path.string());
    }
    
    std::vector<uint8_t> buffer;
    for (const auto& part : pending) {
        if (cancel_requested()) {
            cancel_upload(key, *upload_id);
            return;
        }
        if (pause_requested()) {
            stop_paused(done);
            return;
        }
        
        buffer.resize(part.size);
        file.clear();
        file.seekg(static_cast<std::streamoff>(part.offset));
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(part.size));
        if (static_cast<uint64_t>(file.gcount()) != part.size) {
            throw std::runtime_error("Source file changed while reading part " +
                                     std::to_string(part.part_number) + ": " + path.string());
        }
        
        auto etag = with_retry("upload_part " + std::to_string(part.part_number), [&]() {
            return client_->upload_part(bucket_, key, *upload_id, part.part_number, buffer);
        });
        
        if (!database_->mark_part_completed(transfer_id_, part.part_number, etag)) {
            throw std::runtime_error("Could not record part " + std::to_string(part.part_number) +
                                     " for transfer " + std::to_string(transfer_id_));
        }
        done += part.size;
        if (!database_->set_transferred(transfer_id_, done)) {
            LOG_WARN("Upload {}: could not record progress {}", transfer_id_, done);
        }
        report_progress(done, size, part.size);
    }
    
    std::vector<store::PartETag> parts;
    for (const auto& part : database_->completed_parts(transfer_id_)) {
        parts.push_back({part.part_number, part.etag.value_or("")});
    }
    if (parts.size() != part_count) {
        throw std::runtime_error("Upload has " + std::to_string(parts.size()) + " of " +
                                 std::to_string(part_count) + " parts completed");
    }
    
    with_retry("complete_multipart_upload",
               [&]() { client_->complete_multipart_upload(bucket_, key, *upload_id, parts); });
    complete(size);
}

void UploadWorker::cancel_upload(const std::string& key, const std::string& upload_id) {
    try {
        client_->abort_multipart_upload(bucket_, key, upload_id);
    } catch (const store::StoreError& e) {
        LOG_WARN("Upload {}: abort of {} failed: {}", transfer_id_, upload_id, e.detail());
    }
    stop_cancelled();
}

} // namespace s3xfer::transfer
