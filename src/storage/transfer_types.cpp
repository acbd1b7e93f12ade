#include "s3xfer/storage/transfer_types.hpp"

namespace s3xfer::storage {

std::string to_string(Direction direction) {
    return direction == Direction::UPLOAD ? "upload" : "download";
}

std::string to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::QUEUED: return "queued";
        case TransferStatus::IN_PROGRESS: return "in_progress";
        case TransferStatus::PAUSED: return "paused";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "queued";
}

std::string to_string(PartStatus status) {
    switch (status) {
        case PartStatus::PENDING: return "pending";
        case PartStatus::IN_PROGRESS: return "in_progress";
        case PartStatus::COMPLETED: return "completed";
        case PartStatus::FAILED: return "failed";
    }
    return "pending";
}

std::optional<Direction> parse_direction(const std::string& text) {
    if (text == "upload") return Direction::UPLOAD;
    if (text == "download") return Direction::DOWNLOAD;
    return std::nullopt;
}

std::optional<TransferStatus> parse_transfer_status(const std::string& text) {
    if (text == "queued") return TransferStatus::QUEUED;
    if (text == "in_progress") return TransferStatus::IN_PROGRESS;
    if (text == "paused") return TransferStatus::PAUSED;
    if (text == "completed") return TransferStatus::COMPLETED;
    if (text == "failed") return TransferStatus::FAILED;
    if (text == "cancelled") return TransferStatus::CANCELLED;
    return std::nullopt;
}

std::optional<PartStatus> parse_part_status(const std::string& text) {
    if (text == "pending") return PartStatus::PENDING;
    if (text == "in_progress") return PartStatus::IN_PROGRESS;
    if (text == "completed") return PartStatus::COMPLETED;
    if (text == "failed") return PartStatus::FAILED;
    return std::nullopt;
}

bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED ||
           status == TransferStatus::FAILED ||
           status == TransferStatus::CANCELLED;
}

} // namespace s3xfer::storage
