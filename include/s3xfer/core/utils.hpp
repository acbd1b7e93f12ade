#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace s3xfer::core::utils {

class StringUtils {
public:
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    static bool ends_with(const std::string& str, const std::string& suffix);
    static std::string format_bytes(uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    
    // Reversible mapping of arbitrary text onto a single path component
    static std::string percent_encode(const std::string& str);
    static std::optional<std::string> percent_decode(const std::string& str);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static bool is_directory(const std::filesystem::path& path);
    static std::optional<uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static bool remove_file(const std::filesystem::path& path);
    static std::filesystem::path get_home_dir();
    
    // "~/x" -> "$HOME/x"
    static std::filesystem::path expand_user(const std::string& path);
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
    
    // SQLite datetime('now') text, always UTC
    static std::optional<std::chrono::system_clock::time_point> from_sql_datetime(const std::string& str);
    static std::chrono::system_clock::time_point from_file_time(std::filesystem::file_time_type time);
};

} // namespace s3xfer::core::utils
