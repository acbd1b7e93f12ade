#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace s3xfer::store {

// Incremental BLAKE2b digest used for object and part ETags.
// 16 bytes, the length of the MD5 digest in an S3 ETag.
class ContentHasher {
public:
    static constexpr size_t DIGEST_SIZE = 16;
    
    ContentHasher();
    ~ContentHasher();
    
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    
    void update(std::span<const std::uint8_t> data);
    void update(const std::string& text);
    
    // Lowercase hex of the digest. The hasher is consumed.
    std::string finalize_hex();
    
    static std::string hex_digest(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

} // namespace s3xfer::store
