#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace s3xfer::storage {

enum class Direction {
    UPLOAD,
    DOWNLOAD
};

enum class TransferStatus {
    QUEUED,
    IN_PROGRESS,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class PartStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

// Values match the CHECK constraints of the transfers tables
std::string to_string(Direction direction);
std::string to_string(TransferStatus status);
std::string to_string(PartStatus status);

std::optional<Direction> parse_direction(const std::string& text);
std::optional<TransferStatus> parse_transfer_status(const std::string& text);
std::optional<PartStatus> parse_part_status(const std::string& text);

bool is_terminal(TransferStatus status);

struct TransferRecord {
    int64_t id = 0;
    int64_t bucket_id = 0;
    std::string object_key;
    Direction direction = Direction::UPLOAD;
    std::optional<uint64_t> total_bytes;
    uint64_t transferred = 0;
    TransferStatus status = TransferStatus::QUEUED;
    std::optional<std::string> upload_id;
    std::string local_path;
    std::optional<std::string> error_message;
    int retry_count = 0;
    std::string created_at;
    std::string updated_at;
};

struct TransferPart {
    int64_t transfer_id = 0;
    int part_number = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::optional<std::string> etag;
    PartStatus status = PartStatus::PENDING;
};

struct NewTransfer {
    int64_t bucket_id = 0;
    Direction direction = Direction::UPLOAD;
    std::string object_key;
    std::string local_path;
    std::optional<uint64_t> total_bytes;
};

} // namespace s3xfer::storage
