#include <gtest/gtest.h>
#include "s3xfer/store/content_hasher.hpp"
#include "s3xfer/store/filesystem_object_store.hpp"
#include "support/test_support.hpp"
#include <algorithm>
#include <cctype>

using namespace s3xfer::store;
using s3xfer::testing::TempDir;
using s3xfer::testing::pattern_bytes;
using s3xfer::testing::to_bytes;

TEST(ContentHasherTest, DigestIsLowercaseHex) {
    auto digest = ContentHasher::hex_digest(to_bytes("hello world"));
    
    EXPECT_EQ(digest.size(), ContentHasher::DIGEST_SIZE * 2);
    EXPECT_TRUE(std::all_of(digest.begin(), digest.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f');
    })) << digest;
}

TEST(ContentHasherTest, SameContentSameDigest) {
    EXPECT_EQ(ContentHasher::hex_digest(pattern_bytes(1000, 4)), ContentHasher::hex_digest(pattern_bytes(1000, 4)));
    EXPECT_NE(ContentHasher::hex_digest(pattern_bytes(1000, 4)), ContentHasher::hex_digest(pattern_bytes(1000, 5)));
    EXPECT_NE(ContentHasher::hex_digest({}), ContentHasher::hex_digest(pattern_bytes(1)));
}

TEST(ContentHasherTest, IncrementalMatchesOneShot) {
    auto data = pattern_bytes(4096, 7);
    
    ContentHasher hasher;
    hasher.update(std::span<const uint8_t>(data.data(), 1000));
    hasher.update(std::span<const uint8_t>(data.data() + 1000, data.size() - 1000));
    
    EXPECT_EQ(hasher.finalize_hex(), ContentHasher::hex_digest(data));
}

TEST(ContentHasherTest, FinalizedHasherRejectsReuse) {
    ContentHasher hasher;
    hasher.update("abc");
    hasher.finalize_hex();
    
    EXPECT_THROW(hasher.update("more"), std::logic_error);
    EXPECT_THROW(hasher.finalize_hex(), std::logic_error);
}

TEST(ContentHasherTest, StoreEtagsAreQuotedDigests) {
    TempDir temp_dir;
    FilesystemObjectStore store(temp_dir / "store");
    ASSERT_TRUE(store.create_bucket("media"));
    
    auto body = pattern_bytes(300, 2);
    store.put_object("media", "a.bin", body);
    EXPECT_EQ(store.head_object("media", "a.bin").etag.value_or(""),
              "\"" + ContentHasher::hex_digest(body) + "\"");
    
    auto upload_id = store.create_multipart_upload("media", "b.bin");
    auto etag = store.upload_part("media", "b.bin", upload_id, 1, body);
    EXPECT_EQ(etag, "\"" + ContentHasher::hex_digest(body) + "\"");
}
