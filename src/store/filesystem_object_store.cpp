#include "s3xfer/store/filesystem_object_store.hpp"
#include "s3xfer/store/content_hasher.hpp"
#include "s3xfer/store/store_error.hpp"
#include "s3xfer/core/logger.hpp"
#include "s3xfer/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <tuple>

namespace s3xfer::store {

namespace fs = std::filesystem;
using core::utils::StringUtils;
using core::utils::TimeUtils;

namespace {

constexpr const char* UPLOAD_META_FILE = "upload.meta";
constexpr const char* ETAG_SUFFIX = ".etag";

std::string quoted(const std::string& value) {
    return "\"" + value + "\"";
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::vector<uint8_t> read_bytes(const fs::path& path, uint64_t offset, uint64_t length) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StoreError::from_backend("IOError", "", "cannot open " + path.string());
    }
    
    std::vector<uint8_t> data(length);
    file.seekg(static_cast<std::streamoff>(offset));
    if (length > 0) {
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    }
    if (static_cast<uint64_t>(file.gcount()) != length && length > 0) {
        throw StoreError::from_backend("IOError", "", "short read from " + path.string());
    }
    return data;
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw StoreError::from_backend("IOError", "", "cannot write " + path.string());
    }
    file << text;
    if (!file) {
        throw StoreError::from_backend("IOError", "", "write failed for " + path.string());
    }
}

std::string part_file_name(int part_number) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "part-%05d", part_number);
    return buffer;
}

std::string name_after(const std::string& key, const std::string& prefix) {
    return prefix.empty() ? key : key.substr(prefix.size());
}

std::string last_component(const std::string& key) {
    auto pos = key.rfind('/');
    return pos == std::string::npos ? key : key.substr(pos + 1);
}

// Converts filesystem failures into StoreError so callers only see one type
template<typename Fn>
auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const fs::filesystem_error& e) {
        LOG_ERROR("{} failed: {}", operation, e.what());
        throw StoreError::from_backend("IOError", "", std::string(operation) + ": " + e.what());
    }
}

} // namespace

FilesystemObjectStore::FilesystemObjectStore(const fs::path& root, size_t page_size)
    : root_(root)
    , page_size_(page_size == 0 ? DEFAULT_PAGE_SIZE : page_size)
    , rng_(std::random_device{}()) {
}

bool FilesystemObjectStore::create_bucket(const std::string& bucket) {
    if (bucket.empty() || bucket.find('/') != std::string::npos || bucket == "." || bucket == "..") {
        LOG_ERROR("Invalid bucket name '{}'", bucket);
        return false;
    }
    
    std::error_code ec;
    for (const char* sub : {"objects", "etags", "uploads", "tmp"}) {
        fs::create_directories(root_ / bucket / sub, ec);
        if (ec) {
            LOG_ERROR("Failed to create bucket '{}': {}", bucket, ec.message());
            return false;
        }
    }
    return true;
}

bool FilesystemObjectStore::bucket_exists(const std::string& bucket) const {
    std::error_code ec;
    return !bucket.empty() && fs::is_directory(root_ / bucket / "objects", ec);
}

fs::path FilesystemObjectStore::bucket_dir(const std::string& bucket) const {
    if (!bucket_exists(bucket)) {
        throw StoreError::from_backend("NoSuchBucket", "The specified bucket does not exist",
                                       "bucket: " + bucket);
    }
    return root_ / bucket;
}

void FilesystemObjectStore::validate_key(const std::string& key) const {
    if (key.empty()) {
        throw StoreError::from_backend("InvalidArgument", "Object key must not be empty.", "");
    }
    // The encoded key must also fit in one directory entry
    if (key.size() > MAX_KEY_LENGTH || StringUtils::percent_encode(key).size() > 255) {
        throw StoreError::from_backend("KeyTooLongError", "", "key length " + std::to_string(key.size()));
    }
}

fs::path FilesystemObjectStore::object_path(const std::string& bucket, const std::string& key) const {
    validate_key(key);
    return bucket_dir(bucket) / "objects" / StringUtils::percent_encode(key);
}

fs::path FilesystemObjectStore::etag_path(const std::string& bucket, const std::string& key) const {
    return bucket_dir(bucket) / "etags" / StringUtils::percent_encode(key);
}

fs::path FilesystemObjectStore::upload_dir(const std::string& bucket, const std::string& key,
                                           const std::string& upload_id) const {
    auto dir = bucket_dir(bucket) / "uploads" / upload_id;
    bool valid_id = !upload_id.empty() &&
        std::all_of(upload_id.begin(), upload_id.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
    
    std::error_code ec;
    if (!valid_id || !fs::is_directory(dir, ec)) {
        throw StoreError::from_backend("NoSuchUpload", "", "upload id: " + upload_id);
    }
    
    auto meta = StringUtils::split(read_text(dir / UPLOAD_META_FILE), '\n');
    std::string stored_key;
    for (const auto& line : meta) {
        if (StringUtils::starts_with(line, "key=")) {
            stored_key = StringUtils::percent_decode(line.substr(4)).value_or("");
        }
    }
    if (stored_key != key) {
        throw StoreError::from_backend("NoSuchUpload", "", "upload " + upload_id + " belongs to another key");
    }
    return dir;
}

fs::path FilesystemObjectStore::part_path(const fs::path& upload, int part_number) const {
    return upload / part_file_name(part_number);
}

std::string FilesystemObjectStore::random_hex(size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += digits[rng_() & 0xf];
    }
    return result;
}

fs::path FilesystemObjectStore::temp_path(const std::string& bucket) {
    return bucket_dir(bucket) / "tmp" / (random_hex(16) + ".part");
}

void FilesystemObjectStore::write_atomically(const std::string& bucket, const fs::path& target,
                                             const std::vector<uint8_t>& body) {
    auto temp = temp_path(bucket);
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StoreError::from_backend("IOError", "", "cannot create " + temp.string());
        }
        file.write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
        if (!file) {
            std::error_code ec;
            fs::remove(temp, ec);
            throw StoreError::from_backend("IOError", "", "write failed for " + temp.string());
        }
    }
    fs::rename(temp, target);
}

std::vector<std::string> FilesystemObjectStore::sorted_keys(const std::string& bucket) const {
    std::vector<std::string> keys;
    for (const auto& entry : fs::directory_iterator(bucket_dir(bucket) / "objects")) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto key = StringUtils::percent_decode(entry.path().filename().string());
        if (key) {
            keys.push_back(*key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

ObjectEntry FilesystemObjectStore::make_entry(const std::string& bucket, const std::string& key,
                                              const std::string& prefix) const {
    auto path = bucket_dir(bucket) / "objects" / StringUtils::percent_encode(key);
    
    ObjectEntry entry;
    entry.name = name_after(key, prefix);
    entry.key = key;
    entry.is_prefix = false;
    entry.size = fs::file_size(path);
    entry.last_modified = TimeUtils::from_file_time(fs::last_write_time(path));
    entry.storage_class = "STANDARD";
    
    auto etag = read_text(etag_path(bucket, key));
    if (!etag.empty()) {
        entry.etag = etag;
    }
    return entry;
}

// Listing

FilesystemObjectStore::ObjectPage FilesystemObjectStore::list_objects_page(
    const std::string& bucket, const std::string& prefix, const std::string& delimiter,
    const std::optional<std::string>& token) {
    
    // Tokens are "k:<last key>" or "p:<last common prefix>"
    std::string after;
    bool after_prefix = false;
    if (token) {
        after_prefix = StringUtils::starts_with(*token, "p:");
        after = token->substr(2);
    }
    
    ObjectPage page;
    size_t count = 0;
    std::string last_prefix;
    std::string last_token;
    
    for (const auto& key : sorted_keys(bucket)) {
        if (!StringUtils::starts_with(key, prefix)) {
            continue;
        }
        if (token) {
            if (key <= after) continue;
            if (after_prefix && StringUtils::starts_with(key, after)) continue;
        }
        
        std::string rest = key.substr(prefix.size());
        auto pos = delimiter.empty() ? std::string::npos : rest.find(delimiter);
        std::string common;
        if (pos != std::string::npos) {
            common = prefix + rest.substr(0, pos + delimiter.size());
            if (common == last_prefix) {
                continue;
            }
        }
        
        if (count == page_size_) {
            page.next_token = last_token;
            break;
        }
        
        if (!common.empty()) {
            last_prefix = common;
            last_token = "p:" + common;
            page.common_prefixes.push_back(common);
        } else {
            last_token = "k:" + key;
            page.objects.push_back(make_entry(bucket, key, prefix));
        }
        ++count;
    }
    
    return page;
}

ListResult FilesystemObjectStore::list_objects(const std::string& bucket, const std::string& prefix,
                                               const std::string& delimiter) {
    return guarded("list_objects", [&]() {
        LOG_DEBUG("list_objects bucket={} prefix='{}'", bucket, prefix);
        
        ListResult result;
        std::optional<std::string> token;
        int page_count = 0;
        
        do {
            auto page = list_objects_page(bucket, prefix, delimiter, token);
            ++page_count;
            
            for (auto& object : page.objects) {
                if (object.key == prefix) {
                    continue;
                }
                result.entries.push_back(std::move(object));
            }
            
            for (const auto& common : page.common_prefixes) {
                ObjectEntry folder;
                folder.key = common;
                folder.name = name_after(common, prefix);
                if (!delimiter.empty() && StringUtils::ends_with(folder.name, delimiter)) {
                    folder.name.resize(folder.name.size() - delimiter.size());
                }
                folder.is_prefix = true;
                result.common_prefixes.push_back(common);
                result.entries.push_back(std::move(folder));
            }
            
            token = page.next_token;
        } while (token);
        
        LOG_DEBUG("list_objects returned {} items, {} prefixes across {} pages",
                  result.entries.size(), result.common_prefixes.size(), page_count);
        return result;
    });
}

// Single objects

ObjectEntry FilesystemObjectStore::head_object(const std::string& bucket, const std::string& key) {
    return guarded("head_object", [&]() {
        LOG_DEBUG("head_object bucket={} key='{}'", bucket, key);
        auto path = object_path(bucket, key);
        if (!fs::is_regular_file(path)) {
            throw StoreError::from_backend("NoSuchKey", "", "key: " + key);
        }
        
        auto entry = make_entry(bucket, key, "");
        entry.name = last_component(key);
        return entry;
    });
}

std::vector<uint8_t> FilesystemObjectStore::get_object(const std::string& bucket, const std::string& key,
                                                       std::optional<ByteRange> range) {
    return guarded("get_object", [&]() {
        auto path = object_path(bucket, key);
        if (!fs::is_regular_file(path)) {
            throw StoreError::from_backend("NoSuchKey", "", "key: " + key);
        }
        
        uint64_t size = fs::file_size(path);
        if (!range) {
            LOG_DEBUG("get_object bucket={} key='{}'", bucket, key);
            return read_bytes(path, 0, size);
        }
        
        LOG_DEBUG("get_object bucket={} key='{}' range=bytes={}-{}", bucket, key, range->first, range->last);
        if (range->first >= size || range->last < range->first) {
            throw StoreError::from_backend("InvalidRange", "",
                "bytes=" + std::to_string(range->first) + "-" + std::to_string(range->last) +
                " of " + std::to_string(size));
        }
        uint64_t last = std::min(range->last, size - 1);
        return read_bytes(path, range->first, last - range->first + 1);
    });
}

void FilesystemObjectStore::put_object(const std::string& bucket, const std::string& key,
                                       const std::vector<uint8_t>& body) {
    guarded("put_object", [&]() {
        LOG_DEBUG("put_object bucket={} key='{}' size={}", bucket, key, body.size());
        auto target = object_path(bucket, key);
        
        auto etag = quoted(ContentHasher::hex_digest(body));
        
        write_atomically(bucket, target, body);
        write_text(etag_path(bucket, key), etag);
    });
}

void FilesystemObjectStore::delete_object(const std::string& bucket, const std::string& key) {
    guarded("delete_object", [&]() {
        LOG_DEBUG("delete_object bucket={} key='{}'", bucket, key);
        // Deleting a missing key succeeds, as on S3
        fs::remove(object_path(bucket, key));
        fs::remove(etag_path(bucket, key));
    });
}

std::vector<std::string> FilesystemObjectStore::delete_objects(const std::string& bucket,
                                                               const std::vector<std::string>& keys) {
    LOG_DEBUG("delete_objects bucket={} count={}", bucket, keys.size());
    std::vector<std::string> failed;
    for (const auto& key : keys) {
        try {
            delete_object(bucket, key);
        } catch (const StoreError& e) {
            LOG_WARN("delete_objects: could not delete '{}': {}", key, e.detail());
            failed.push_back(key);
        }
    }
    return failed;
}

void FilesystemObjectStore::copy_object(const std::string& src_bucket, const std::string& src_key,
                                        const std::string& dst_bucket, const std::string& dst_key) {
    guarded("copy_object", [&]() {
        LOG_DEBUG("copy_object {}/{} -> {}/{}", src_bucket, src_key, dst_bucket, dst_key);
        auto source = object_path(src_bucket, src_key);
        if (!fs::is_regular_file(source)) {
            throw StoreError::from_backend("NoSuchKey", "", "key: " + src_key);
        }
        auto target = object_path(dst_bucket, dst_key);
        
        auto temp = temp_path(dst_bucket);
        fs::copy_file(source, temp, fs::copy_options::overwrite_existing);
        fs::rename(temp, target);
        write_text(etag_path(dst_bucket, dst_key), read_text(etag_path(src_bucket, src_key)));
    });
}

// Multipart uploads

std::string FilesystemObjectStore::create_multipart_upload(const std::string& bucket, const std::string& key) {
    return guarded("create_multipart_upload", [&]() {
        validate_key(key);
        auto upload_id = random_hex(32);
        auto dir = bucket_dir(bucket) / "uploads" / upload_id;
        fs::create_directories(dir);
        
        auto initiated = std::chrono::duration_cast<std::chrono::seconds>(
            TimeUtils::now().time_since_epoch()).count();
        write_text(dir / UPLOAD_META_FILE,
                   "key=" + StringUtils::percent_encode(key) + "\n" +
                   "initiated=" + std::to_string(initiated) + "\n");
        
        LOG_DEBUG("create_multipart_upload key='{}' upload_id={}", key, upload_id);
        return upload_id;
    });
}

std::string FilesystemObjectStore::upload_part(const std::string& bucket, const std::string& key,
                                               const std::string& upload_id, int part_number,
                                               const std::vector<uint8_t>& body) {
    return guarded("upload_part", [&]() {
        if (part_number < 1 || part_number > MAX_PART_NUMBER) {
            throw StoreError::from_backend("InvalidArgument",
                "Part number must be an integer between 1 and 10000.",
                "part number " + std::to_string(part_number));
        }
        auto dir = upload_dir(bucket, key, upload_id);
        
        auto etag = quoted(ContentHasher::hex_digest(body));
        
        auto path = part_path(dir, part_number);
        write_atomically(bucket, path, body);
        write_text(fs::path(path.string() + ETAG_SUFFIX), etag);
        
        LOG_DEBUG("upload_part key='{}' part={} size={}", key, part_number, body.size());
        return etag;
    });
}

void FilesystemObjectStore::complete_multipart_upload(const std::string& bucket, const std::string& key,
                                                      const std::string& upload_id,
                                                      const std::vector<PartETag>& parts) {
    guarded("complete_multipart_upload", [&]() {
        auto dir = upload_dir(bucket, key, upload_id);
        if (parts.empty()) {
            throw StoreError::from_backend("InvalidPart", "", "no parts given for " + upload_id);
        }
        
        int previous = 0;
        for (const auto& part : parts) {
            if (part.part_number <= previous) {
                throw StoreError::from_backend("InvalidPartOrder", "",
                    "part " + std::to_string(part.part_number) + " after " + std::to_string(previous));
            }
            previous = part.part_number;
            
            auto path = part_path(dir, part.part_number);
            if (!fs::is_regular_file(path) ||
                read_text(fs::path(path.string() + ETAG_SUFFIX)) != part.etag) {
                throw StoreError::from_backend("InvalidPart", "",
                    "part " + std::to_string(part.part_number) + " etag " + part.etag);
            }
        }
        
        auto temp = temp_path(bucket);
        ContentHasher digest;
        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw StoreError::from_backend("IOError", "", "cannot create " + temp.string());
            }
            for (const auto& part : parts) {
                std::ifstream in(part_path(dir, part.part_number), std::ios::binary);
                out << in.rdbuf();
                digest.update(part.etag);
            }
            if (!out) {
                std::error_code ec;
                fs::remove(temp, ec);
                throw StoreError::from_backend("IOError", "", "write failed for " + temp.string());
            }
        }
        
        fs::rename(temp, object_path(bucket, key));
        write_text(etag_path(bucket, key), quoted(digest.finalize_hex() + "-" + std::to_string(parts.size())));
        fs::remove_all(dir);
        
        LOG_DEBUG("complete_multipart_upload key='{}' parts={}", key, parts.size());
    });
}

void FilesystemObjectStore::abort_multipart_upload(const std::string& bucket, const std::string& key,
                                                   const std::string& upload_id) {
    guarded("abort_multipart_upload", [&]() {
        LOG_DEBUG("abort_multipart_upload key='{}' upload_id={}", key, upload_id);
        fs::remove_all(upload_dir(bucket, key, upload_id));
    });
}

FilesystemObjectStore::PartPage FilesystemObjectStore::list_parts_page(const std::string& bucket,
                                                                       const std::string& upload_id,
                                                                       int marker) {
    std::map<int, UploadedPart> parts;
    for (const auto& entry : fs::directory_iterator(bucket_dir(bucket) / "uploads" / upload_id)) {
        auto name = entry.path().filename().string();
        if (!StringUtils::starts_with(name, "part-") || StringUtils::ends_with(name, ETAG_SUFFIX)) {
            continue;
        }
        int number = 0;
        try {
            number = std::stoi(name.substr(5));
        } catch (const std::exception&) {
            continue;
        }
        if (number <= marker) {
            continue;
        }
        
        UploadedPart part;
        part.part_number = number;
        part.size = fs::file_size(entry.path());
        part.etag = read_text(fs::path(entry.path().string() + ETAG_SUFFIX));
        parts[number] = part;
    }
    
    PartPage page;
    for (const auto& [number, part] : parts) {
        if (page.parts.size() == page_size_) {
            page.next_marker = page.parts.back().part_number;
            break;
        }
        page.parts.push_back(part);
    }
    return page;
}

std::vector<UploadedPart> FilesystemObjectStore::list_parts(const std::string& bucket, const std::string& key,
                                                            const std::string& upload_id) {
    return guarded("list_parts", [&]() {
        upload_dir(bucket, key, upload_id);
        
        std::vector<UploadedPart> parts;
        int marker = 0;
        while (true) {
            auto page = list_parts_page(bucket, upload_id, marker);
            parts.insert(parts.end(), page.parts.begin(), page.parts.end());
            if (!page.next_marker) break;
            marker = *page.next_marker;
        }
        
        LOG_DEBUG("list_parts key='{}' upload_id={} parts={}", key, upload_id, parts.size());
        return parts;
    });
}

FilesystemObjectStore::UploadPage FilesystemObjectStore::list_uploads_page(
    const std::string& bucket, const std::optional<std::pair<std::string, std::string>>& marker) {
    
    std::vector<MultipartUpload> uploads;
    for (const auto& entry : fs::directory_iterator(bucket_dir(bucket) / "uploads")) {
        if (!entry.is_directory()) {
            continue;
        }
        
        MultipartUpload upload;
        upload.upload_id = entry.path().filename().string();
        bool has_key = false;
        for (const auto& line : StringUtils::split(read_text(entry.path() / UPLOAD_META_FILE), '\n')) {
            if (StringUtils::starts_with(line, "key=")) {
                auto key = StringUtils::percent_decode(line.substr(4));
                if (key) {
                    upload.key = *key;
                    has_key = true;
                }
            } else if (StringUtils::starts_with(line, "initiated=")) {
                try {
                    upload.initiated = std::chrono::system_clock::time_point(
                        std::chrono::seconds(std::stoll(line.substr(10))));
                } catch (const std::exception&) {
                    LOG_WARN("Bad initiated time in upload {}", upload.upload_id);
                }
            }
        }
        if (!has_key) {
            continue;
        }
        
        if (marker && std::make_pair(upload.key, upload.upload_id) <= *marker) {
            continue;
        }
        uploads.push_back(upload);
    }
    
    std::sort(uploads.begin(), uploads.end(), [](const MultipartUpload& a, const MultipartUpload& b) {
        return std::tie(a.key, a.upload_id) < std::tie(b.key, b.upload_id);
    });
    
    UploadPage page;
    if (uploads.size() > page_size_) {
        uploads.resize(page_size_);
        page.next_marker = std::make_pair(uploads.back().key, uploads.back().upload_id);
    }
    page.uploads = std::move(uploads);
    return page;
}

std::vector<MultipartUpload> FilesystemObjectStore::list_multipart_uploads(const std::string& bucket) {
    return guarded("list_multipart_uploads", [&]() {
        std::vector<MultipartUpload> uploads;
        std::optional<std::pair<std::string, std::string>> marker;
        do {
            auto page = list_uploads_page(bucket, marker);
            uploads.insert(uploads.end(), page.uploads.begin(), page.uploads.end());
            marker = page.next_marker;
        } while (marker);
        
        LOG_DEBUG("list_multipart_uploads bucket={} count={}", bucket, uploads.size());
        return uploads;
    });
}

} // namespace s3xfer::store
