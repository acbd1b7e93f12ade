#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace s3xfer::store {

struct ObjectEntry {
    std::string name;  // relative to the listing prefix
    std::string key;
    bool is_prefix = false;
    std::optional<uint64_t> size;
    std::optional<std::chrono::system_clock::time_point> last_modified;
    std::optional<std::string> storage_class;
    std::optional<std::string> etag;
    
    bool operator==(const ObjectEntry& other) const = default;
};

struct ListResult {
    std::vector<ObjectEntry> entries;
    std::vector<std::string> common_prefixes;
};

// Inclusive byte range, like an HTTP Range header
struct ByteRange {
    uint64_t first = 0;
    uint64_t last = 0;
};

struct PartETag {
    int part_number = 0;
    std::string etag;
};

struct UploadedPart {
    int part_number = 0;
    std::string etag;
    uint64_t size = 0;
};

struct MultipartUpload {
    std::string key;
    std::string upload_id;
    std::chrono::system_clock::time_point initiated;
};

// Capability needed by the transfer engine and the remote browser.
// Every failure is reported as a StoreError.
class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;
    
    virtual ListResult list_objects(const std::string& bucket,
                                    const std::string& prefix,
                                    const std::string& delimiter = "/") = 0;
    virtual ObjectEntry head_object(const std::string& bucket, const std::string& key) = 0;
    virtual std::vector<uint8_t> get_object(const std::string& bucket, const std::string& key,
                                            std::optional<ByteRange> range = std::nullopt) = 0;
    virtual void put_object(const std::string& bucket, const std::string& key,
                            const std::vector<uint8_t>& body) = 0;
    virtual void delete_object(const std::string& bucket, const std::string& key) = 0;
    
    // Best effort; returns the keys that could not be deleted
    virtual std::vector<std::string> delete_objects(const std::string& bucket,
                                                    const std::vector<std::string>& keys) = 0;
    virtual void copy_object(const std::string& src_bucket, const std::string& src_key,
                             const std::string& dst_bucket, const std::string& dst_key) = 0;
    
    // Multipart uploads
    virtual std::string create_multipart_upload(const std::string& bucket, const std::string& key) = 0;
    virtual std::string upload_part(const std::string& bucket, const std::string& key,
                                    const std::string& upload_id, int part_number,
                                    const std::vector<uint8_t>& body) = 0;
    virtual void complete_multipart_upload(const std::string& bucket, const std::string& key,
                                           const std::string& upload_id,
                                           const std::vector<PartETag>& parts) = 0;
    virtual void abort_multipart_upload(const std::string& bucket, const std::string& key,
                                        const std::string& upload_id) = 0;
    virtual std::vector<UploadedPart> list_parts(const std::string& bucket, const std::string& key,
                                                 const std::string& upload_id) = 0;
    virtual std::vector<MultipartUpload> list_multipart_uploads(const std::string& bucket) = 0;
};

} // namespace s3xfer::store
