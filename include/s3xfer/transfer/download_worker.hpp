#pragma once

#include "transfer_worker.hpp"
#include <filesystem>

namespace s3xfer::transfer {

// Downloads one object into a temp file beside the target and renames it
// into place. Large objects are fetched in ranges, appending to the temp
// file, so an interrupted run continues from the temp file's size.
class DownloadWorker : public TransferWorker {
public:
    using TransferWorker::TransferWorker;

protected:
    void execute() override;
    const char* label() const override { return "Download"; }

private:
    void single_download(const std::string& key, const std::filesystem::path& target,
                         const std::filesystem::path& temp, uint64_t total);
    void ranged_download(const std::string& key, const std::filesystem::path& target,
                         const std::filesystem::path& temp, uint64_t total);
    void cancel_download(const std::filesystem::path& temp);
};

} // namespace s3xfer::transfer
