#include "s3xfer/transfer/engine_config.hpp"
#include "s3xfer/core/config.hpp"
#include "s3xfer/core/logger.hpp"

namespace s3xfer::transfer {

uint64_t select_part_size(uint64_t file_size) {
    return EngineConfig{}.part_size_for(file_size);
}

EngineConfig EngineConfig::from_config(const core::Config& config) {
    EngineConfig engine;
    
    int concurrent = config.get_int("transfer.max_concurrent", static_cast<int>(engine.max_concurrent_transfers));
    engine.max_concurrent_transfers = concurrent > 0 ? static_cast<uint32_t>(concurrent) : 0;
    
    engine.retry.max_attempts = config.get_int("transfer.max_retries", engine.retry.max_attempts);
    
    if (auto threshold = config.get_as<uint64_t>("transfer.multipart_threshold")) {
        engine.multipart_threshold = *threshold;
    }
    if (auto chunk = config.get_as<uint64_t>("transfer.chunk_size")) {
        engine.download_chunk_size = *chunk;
    }
    if (auto base_ms = config.get_as<int64_t>("transfer.retry_base_ms")) {
        engine.retry.base_delay = std::chrono::milliseconds(*base_ms);
    }
    
    return engine;
}

bool EngineConfig::validate() const {
    if (max_concurrent_transfers == 0 || max_concurrent_transfers > 64) {
        LOG_ERROR("Invalid max_concurrent_transfers: {}", max_concurrent_transfers);
        return false;
    }
    
    if (multipart_threshold == 0 || download_chunk_size == 0) {
        LOG_ERROR("Multipart threshold and chunk size must be positive");
        return false;
    }
    
    if (default_part_size == 0 || large_part_size == 0 || huge_part_size == 0) {
        LOG_ERROR("Part sizes must be positive");
        return false;
    }
    
    if (!retry.validate()) {
        LOG_ERROR("Invalid retry policy: {} attempts", retry.max_attempts);
        return false;
    }
    
    return true;
}

uint64_t EngineConfig::part_size_for(uint64_t file_size) const {
    if (file_size <= large_file_limit) {
        return default_part_size;
    }
    if (file_size <= huge_file_limit) {
        return large_part_size;
    }
    return huge_part_size;
}

std::filesystem::path EngineConfig::temp_path_for(const std::filesystem::path& target, int64_t transfer_id) const {
    return target.parent_path() / (temp_prefix + std::to_string(transfer_id) + ".tmp");
}

} // namespace s3xfer::transfer
