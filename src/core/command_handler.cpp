#include "s3xfer/core/command_handler.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/core/utils.hpp"
#include "s3xfer/storage/transfer_types.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>

namespace s3xfer::core {

namespace {

using storage::TransferStatus;
using utils::StringUtils;

std::optional<int64_t> parse_transfer_id(const std::string& text) {
    try {
        size_t consumed = 0;
        auto id = std::stoll(text, &consumed);
        if (consumed != text.size() || id <= 0) {
            return std::nullopt;
        }
        return id;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Prints engine events to the console
void attach_console(transfer::TransferEngine& engine, AppContext& context) {
    auto console_mutex = std::make_shared<std::mutex>();
    auto last_percent = std::make_shared<std::map<int64_t, int>>();
    
    engine.set_progress_handler([console_mutex, last_percent](int64_t id, uint64_t done, uint64_t total) {
        int percent = total > 0 ? static_cast<int>(done * 100 / total) : 100;
        std::lock_guard<std::mutex> lock(*console_mutex);
        auto& last = (*last_percent)[id];
        if (percent == 100 || percent >= last + 10) {
            last = percent;
            std::cout << "  [" << id << "] " << std::setw(3) << percent << "% ("
                      << StringUtils::format_bytes(done) << " of "
                      << StringUtils::format_bytes(total) << ")\n";
        }
    });
    
    engine.set_status_handler([console_mutex](int64_t id, TransferStatus status) {
        LOG_DEBUG("Transfer {} is now {}", id, storage::to_string(status));
        if (status == TransferStatus::PAUSED || status == TransferStatus::CANCELLED) {
            std::lock_guard<std::mutex> lock(*console_mutex);
            std::cout << "  [" << id << "] " << storage::to_string(status) << "\n";
        }
    });
    
    engine.set_finished_handler([console_mutex, &context](int64_t id) {
        context.note_finished(id);
        std::lock_guard<std::mutex> lock(*console_mutex);
        std::cout << "✓ Transfer " << id << " completed\n";
    });
    
    engine.set_error_handler([console_mutex](int64_t id, const std::string& message, const std::string& detail) {
        std::lock_guard<std::mutex> lock(*console_mutex);
        std::cout << "✗ Transfer " << id << " failed: " << message << "\n";
        if (!detail.empty()) {
            std::cout << "  " << detail << "\n";
        }
    });
}

// Returns the time spent waiting
std::chrono::milliseconds wait_until_idle(transfer::TransferEngine& engine) {
    auto started = std::chrono::steady_clock::now();
    while (!engine.wait_for_idle(std::chrono::seconds(1))) {
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

// Final state of the given transfers, as a command result
CommandResult summarize(storage::TransferDatabase& database, const std::vector<int64_t>& ids) {
    size_t failed = 0;
    for (auto id : ids) {
        auto record = database.get_transfer(id);
        if (!record || record->status == TransferStatus::FAILED) {
            ++failed;
        }
    }
    
    if (failed > 0) {
        return CommandResult::error(std::to_string(failed) + " of " + std::to_string(ids.size()) +
                                    " transfers failed");
    }
    return CommandResult::ok();
}

void print_listing(const cache::CachedListing& listing) {
    size_t folders = 0;
    size_t files = 0;
    uint64_t total_size = 0;
    
    for (const auto& entry : listing.entries) {
        if (entry.is_prefix) {
            std::cout << "  " << std::setw(12) << "PRE" << "  " << std::setw(20) << " "
                      << "  " << entry.name << "\n";
            ++folders;
            continue;
        }
        
        uint64_t size = entry.size.value_or(0);
        std::string modified = entry.last_modified ? utils::TimeUtils::to_iso_string(*entry.last_modified) : "-";
        std::cout << "  " << std::setw(12) << StringUtils::format_bytes(size) << "  "
                  << std::setw(20) << modified << "  " << entry.name << "\n";
        ++files;
        total_size += size;
    }
    
    std::cout << "\n" << folders << " folders, " << files << " objects, "
              << StringUtils::format_bytes(total_size) << "\n";
}

} // namespace

// UploadCommandHandler Implementation
CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path local_path = args[1];
    if (!utils::FileUtils::is_file(local_path)) {
        return CommandResult::error("File does not exist: " + local_path.string());
    }
    
    std::string key = args[2];
    if (key.empty() || key.back() == '/') {
        key += local_path.filename().string();
    }
    
    try {
        auto engine = context_->make_engine();
        attach_console(*engine, *context_);
        
        auto id = engine->submit_upload(std::filesystem::absolute(local_path).string(), key);
        if (!id) {
            return CommandResult::error("Failed to record transfer");
        }
        
        std::cout << "Uploading " << local_path.filename().string() << " to "
                  << context_->bucket() << "/" << key << " (transfer " << *id << ")\n";
        auto elapsed = wait_until_idle(*engine);
        std::cout << "Finished in " << StringUtils::format_duration(elapsed) << "\n";
        
        return summarize(*context_->database(), {*id});
    } catch (const std::exception& e) {
        return CommandResult::error("Upload failed: " + std::string(e.what()));
    }
}

// DownloadCommandHandler Implementation
CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const std::string& key = args[1];
    std::filesystem::path local_path = args[2];
    if (utils::FileUtils::is_directory(local_path)) {
        local_path /= key.substr(cache::RemoteBrowser::parent_prefix(key).size());
    }
    
    try {
        auto engine = context_->make_engine();
        attach_console(*engine, *context_);
        
        auto id = engine->submit_download(key, std::filesystem::absolute(local_path).string());
        if (!id) {
            return CommandResult::error("Failed to record transfer");
        }
        
        std::cout << "Downloading " << context_->bucket() << "/" << key << " to "
                  << local_path.string() << " (transfer " << *id << ")\n";
        auto elapsed = wait_until_idle(*engine);
        std::cout << "Finished in " << StringUtils::format_duration(elapsed) << "\n";
        
        return summarize(*context_->database(), {*id});
    } catch (const std::exception& e) {
        return CommandResult::error("Download failed: " + std::string(e.what()));
    }
}

// LsCommandHandler Implementation
CommandResult LsCommandHandler::execute(const std::vector<std::string>& args) {
    std::string prefix = args.size() > 1 ? cache::RemoteBrowser::normalize_prefix(args[1]) : "";
    
    // Outlives this call; the browser is shared across commands
    struct FetchError {
        std::mutex mutex;
        std::optional<std::string> message;
    };
    auto error = std::make_shared<FetchError>();
    
    try {
        auto browser = context_->browser();
        browser->set_error_handler([error](const std::string&, const std::string& message,
                                           const std::string&) {
            std::lock_guard<std::mutex> lock(error->mutex);
            error->message = message;
        });
        
        auto listing = browser->browse(prefix);
        browser->wait_idle();
        
        {
            std::lock_guard<std::mutex> lock(error->mutex);
            if (error->message) {
                return CommandResult::error(*error->message);
            }
        }
        
        listing = browser->browse(prefix);
        if (!listing) {
            return CommandResult::error("No listing available for '" + prefix + "'");
        }
        
        std::cout << context_->bucket() << "/" << prefix << "\n\n";
        print_listing(*listing);
        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Listing failed: " + std::string(e.what()));
    }
}

// RmCommandHandler Implementation
CommandResult RmCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::vector<std::string> keys(args.begin() + 1, args.end());
    
    try {
        auto browser = context_->browser();
        auto failed = browser->delete_keys(keys);
        
        std::cout << "Deleted " << (keys.size() - failed.size()) << " of " << keys.size() << " objects\n";
        for (const auto& key : failed) {
            std::cout << "  could not delete: " << key << "\n";
        }
        
        if (!failed.empty()) {
            return CommandResult::error(std::to_string(failed.size()) + " objects could not be deleted");
        }
        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Delete failed: " + std::string(e.what()));
    }
}

// TransfersCommandHandler Implementation
CommandResult TransfersCommandHandler::execute(const std::vector<std::string>& args) {
    auto bucket_id = context_->database()->find_bucket_id(context_->bucket());
    if (!bucket_id) {
        return CommandResult::error("Unknown bucket: " + context_->bucket());
    }
    
    auto records = context_->database()->list_transfers(*bucket_id);
    if (records.empty()) {
        std::cout << "No transfers recorded for " << context_->bucket() << ".\n";
        return CommandResult::ok();
    }
    
    std::cout << "Transfers for " << context_->bucket() << ":\n\n";
    std::cout << "  " << std::left << std::setw(6) << "ID" << std::setw(10) << "DIR"
              << std::setw(13) << "STATUS" << std::setw(24) << "PROGRESS"
              << std::setw(22) << "UPDATED" << "KEY\n";
    
    for (const auto& record : records) {
        std::string progress = StringUtils::format_bytes(record.transferred);
        if (record.total_bytes) {
            progress += " / " + StringUtils::format_bytes(*record.total_bytes);
        }
        
        auto updated = utils::TimeUtils::from_sql_datetime(record.updated_at);
        
        std::cout << "  " << std::left << std::setw(6) << record.id
                  << std::setw(10) << storage::to_string(record.direction)
                  << std::setw(13) << storage::to_string(record.status)
                  << std::setw(24) << progress
                  << std::setw(22) << (updated ? utils::TimeUtils::to_iso_string(*updated) : record.updated_at)
                  << record.object_key << "\n";
        
        if (record.error_message) {
            std::cout << "        " << *record.error_message;
            if (record.retry_count > 0) {
                std::cout << " (" << record.retry_count << " retries)";
            }
            std::cout << "\n";
        }
    }
    std::cout << std::right;
    
    return CommandResult::ok();
}

// RestoreCommandHandler Implementation
CommandResult RestoreCommandHandler::execute(const std::vector<std::string>& args) {
    try {
        auto engine = context_->make_engine();
        attach_console(*engine, *context_);
        
        auto restored = engine->restore_pending();
        if (restored == 0) {
            std::cout << "No pending transfers to restore.\n";
            return CommandResult::ok();
        }
        
        std::cout << "Restoring " << restored << " transfers\n";
        wait_until_idle(*engine);
        
        auto failed = context_->database()->list_transfers_by_status({TransferStatus::FAILED},
                                                                     engine->bucket_id());
        std::cout << "Done. " << failed.size() << " failed transfers recorded for "
                  << context_->bucket() << ".\n";
        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Restore failed: " + std::string(e.what()));
    }
}

// RetryCommandHandler Implementation
CommandResult RetryCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto id = parse_transfer_id(args[1]);
    if (!id) {
        return CommandResult::error("Invalid transfer id: " + args[1]);
    }
    
    try {
        auto engine = context_->make_engine();
        attach_console(*engine, *context_);
        
        if (!engine->retry(*id)) {
            return CommandResult::error("Transfer " + args[1] + " cannot be retried");
        }
        
        wait_until_idle(*engine);
        return summarize(*context_->database(), {*id});
    } catch (const std::exception& e) {
        return CommandResult::error("Retry failed: " + std::string(e.what()));
    }
}

// CancelCommandHandler Implementation
CommandResult CancelCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    auto id = parse_transfer_id(args[1]);
    if (!id) {
        return CommandResult::error("Invalid transfer id: " + args[1]);
    }
    
    try {
        auto engine = context_->make_engine();
        if (!engine->cancel(*id)) {
            return CommandResult::error("Transfer " + args[1] + " cannot be cancelled");
        }
        
        std::cout << "Transfer " << *id << " cancelled\n";
        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Cancel failed: " + std::string(e.what()));
    }
}

// CleanupCommandHandler Implementation
CommandResult CleanupCommandHandler::execute(const std::vector<std::string>& args) {
    try {
        auto engine = context_->make_engine();
        int aborted = engine->cleanup_orphaned_uploads();
        
        std::cout << "Aborted " << aborted << " orphaned multipart uploads in "
                  << context_->bucket() << "\n";
        return CommandResult::ok();
    } catch (const std::exception& e) {
        return CommandResult::error("Cleanup failed: " + std::string(e.what()));
    }
}

} // namespace s3xfer::core
