#pragma once

#include "s3xfer/store/object_store.hpp"
#include <filesystem>
#include <mutex>
#include <random>

namespace s3xfer::store {

// Object store kept in a local directory tree:
//   <root>/<bucket>/objects/<percent-encoded key>
//   <root>/<bucket>/etags/<percent-encoded key>
//   <root>/<bucket>/uploads/<upload id>/{upload.meta, part-NNNNN, part-NNNNN.etag}
// Listings are served page by page and joined, the way a paginating
// wire client behaves.
class FilesystemObjectStore : public ObjectStoreClient {
public:
    static constexpr size_t DEFAULT_PAGE_SIZE = 1000;
    static constexpr size_t MAX_KEY_LENGTH = 1024;
    static constexpr int MAX_PART_NUMBER = 10000;
    
    explicit FilesystemObjectStore(const std::filesystem::path& root,
                                   size_t page_size = DEFAULT_PAGE_SIZE);
    
    bool create_bucket(const std::string& bucket);
    bool bucket_exists(const std::string& bucket) const;
    
    ListResult list_objects(const std::string& bucket, const std::string& prefix,
                            const std::string& delimiter = "/") override;
    ObjectEntry head_object(const std::string& bucket, const std::string& key) override;
    std::vector<uint8_t> get_object(const std::string& bucket, const std::string& key,
                                    std::optional<ByteRange> range = std::nullopt) override;
    void put_object(const std::string& bucket, const std::string& key,
                    const std::vector<uint8_t>& body) override;
    void delete_object(const std::string& bucket, const std::string& key) override;
    std::vector<std::string> delete_objects(const std::string& bucket,
                                            const std::vector<std::string>& keys) override;
    void copy_object(const std::string& src_bucket, const std::string& src_key,
                     const std::string& dst_bucket, const std::string& dst_key) override;
    
    std::string create_multipart_upload(const std::string& bucket, const std::string& key) override;
    std::string upload_part(const std::string& bucket, const std::string& key,
                            const std::string& upload_id, int part_number,
                            const std::vector<uint8_t>& body) override;
    void complete_multipart_upload(const std::string& bucket, const std::string& key,
                                   const std::string& upload_id,
                                   const std::vector<PartETag>& parts) override;
    void abort_multipart_upload(const std::string& bucket, const std::string& key,
                                const std::string& upload_id) override;
    std::vector<UploadedPart> list_parts(const std::string& bucket, const std::string& key,
                                         const std::string& upload_id) override;
    std::vector<MultipartUpload> list_multipart_uploads(const std::string& bucket) override;
    
    const std::filesystem::path& root() const { return root_; }
    
private:
    struct ObjectPage {
        std::vector<ObjectEntry> objects;
        std::vector<std::string> common_prefixes;
        std::optional<std::string> next_token;
    };
    
    struct PartPage {
        std::vector<UploadedPart> parts;
        std::optional<int> next_marker;
    };
    
    struct UploadPage {
        std::vector<MultipartUpload> uploads;
        std::optional<std::pair<std::string, std::string>> next_marker;
    };
    
    // Single-page primitives
    ObjectPage list_objects_page(const std::string& bucket, const std::string& prefix,
                                 const std::string& delimiter,
                                 const std::optional<std::string>& token);
    PartPage list_parts_page(const std::string& bucket, const std::string& upload_id,
                             int marker);
    UploadPage list_uploads_page(const std::string& bucket,
                                 const std::optional<std::pair<std::string, std::string>>& marker);
    
    std::filesystem::path bucket_dir(const std::string& bucket) const;
    std::filesystem::path object_path(const std::string& bucket, const std::string& key) const;
    std::filesystem::path etag_path(const std::string& bucket, const std::string& key) const;
    std::filesystem::path upload_dir(const std::string& bucket, const std::string& key,
                                     const std::string& upload_id) const;
    std::filesystem::path part_path(const std::filesystem::path& upload, int part_number) const;
    
    std::vector<std::string> sorted_keys(const std::string& bucket) const;
    ObjectEntry make_entry(const std::string& bucket, const std::string& key,
                           const std::string& prefix) const;
    
    // Writes through a temp file in <bucket>/tmp and renames into place
    void write_atomically(const std::string& bucket, const std::filesystem::path& target,
                          const std::vector<uint8_t>& body);
    std::filesystem::path temp_path(const std::string& bucket);
    std::string random_hex(size_t length);
    
    void validate_key(const std::string& key) const;
    
    std::filesystem::path root_;
    size_t page_size_;
    
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace s3xfer::store
