#pragma once

#include "transfer_worker.hpp"
#include <filesystem>

namespace s3xfer::transfer {

// Uploads one local file. Files at or above the multipart threshold go
// up in parts recorded in the database, so a later run only sends the
// parts the backend has not confirmed.
class UploadWorker : public TransferWorker {
public:
    using TransferWorker::TransferWorker;

protected:
    void execute() override;
    const char* label() const override { return "Upload"; }

private:
    void single_upload(const std::filesystem::path& path, const std::string& key, uint64_t size);
    void multipart_upload(const std::filesystem::path& path, const std::string& key, uint64_t size,
                          const storage::TransferRecord& record);
    
    // Returns the upload id to continue with, or nullopt if a new one is needed
    std::optional<std::string> reconcile_parts(const std::string& key, const std::string& upload_id);
    void cancel_upload(const std::string& key, const std::string& upload_id);
};

} // namespace s3xfer::transfer
