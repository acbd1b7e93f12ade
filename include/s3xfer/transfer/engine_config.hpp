#pragma once

#include "retry_policy.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace s3xfer::core {
class Config;
}

namespace s3xfer::transfer {

constexpr uint64_t MiB = 1024ULL * 1024;
constexpr uint64_t GiB = 1024ULL * MiB;

constexpr uint64_t DEFAULT_PART_SIZE = 8 * MiB;
constexpr uint64_t LARGE_PART_SIZE = 64 * MiB;
constexpr uint64_t HUGE_PART_SIZE = 512 * MiB;
constexpr uint64_t MULTIPART_THRESHOLD = 8 * MiB;

// Part size that keeps a multipart upload under 10,000 parts
uint64_t select_part_size(uint64_t file_size);

struct EngineConfig {
    uint32_t max_concurrent_transfers = 4;
    uint64_t multipart_threshold = MULTIPART_THRESHOLD;
    uint64_t download_chunk_size = DEFAULT_PART_SIZE;
    
    uint64_t default_part_size = DEFAULT_PART_SIZE;
    uint64_t large_part_size = LARGE_PART_SIZE;
    uint64_t huge_part_size = HUGE_PART_SIZE;
    uint64_t large_file_limit = 50 * GiB;
    uint64_t huge_file_limit = 500 * GiB;
    
    RetryPolicy retry;
    std::string temp_prefix = ".s3xfer-download-";
    
    static EngineConfig from_config(const core::Config& config);
    
    bool validate() const;
    
    uint64_t part_size_for(uint64_t file_size) const;
    std::filesystem::path temp_path_for(const std::filesystem::path& target, int64_t transfer_id) const;
};

} // namespace s3xfer::transfer
