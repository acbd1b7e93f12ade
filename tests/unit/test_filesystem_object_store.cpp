#include <gtest/gtest.h>
#include "s3xfer/store/filesystem_object_store.hpp"
#include "support/test_support.hpp"
#include <algorithm>

using namespace s3xfer::store;
using s3xfer::testing::TempDir;
using s3xfer::testing::pattern_bytes;
using s3xfer::testing::to_bytes;

class FilesystemObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<FilesystemObjectStore>(temp_dir.path(), 2);
        ASSERT_TRUE(store->create_bucket(bucket));
    }
    
    void put(const std::string& key, const std::string& body = "x") {
        store->put_object(bucket, key, to_bytes(body));
    }
    
    static std::vector<std::string> names(const ListResult& result) {
        std::vector<std::string> out;
        for (const auto& entry : result.entries) {
            out.push_back(entry.name);
        }
        std::sort(out.begin(), out.end());
        return out;
    }
    
    static StoreErrorCode error_code_of(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const StoreError& e) {
            return e.code();
        }
        ADD_FAILURE() << "expected a StoreError";
        return StoreErrorCode::UNKNOWN;
    }
    
    TempDir temp_dir;
    std::string bucket = "media";
    std::unique_ptr<FilesystemObjectStore> store;
};

TEST_F(FilesystemObjectStoreTest, BucketLifecycle) {
    EXPECT_TRUE(store->bucket_exists("media"));
    EXPECT_FALSE(store->bucket_exists("other"));
    EXPECT_FALSE(store->create_bucket("a/b"));
    EXPECT_FALSE(store->create_bucket(""));
    
    EXPECT_EQ(error_code_of([&] { store->list_objects("other", ""); }), StoreErrorCode::NO_SUCH_BUCKET);
}

TEST_F(FilesystemObjectStoreTest, PutHeadGet) {
    put("docs/readme.txt", "hello world");
    
    auto head = store->head_object(bucket, "docs/readme.txt");
    EXPECT_EQ(head.key, "docs/readme.txt");
    EXPECT_EQ(head.name, "readme.txt");
    EXPECT_EQ(head.size.value_or(0), 11u);
    EXPECT_FALSE(head.is_prefix);
    ASSERT_TRUE(head.etag.has_value());
    EXPECT_EQ(head.etag->front(), '"');
    EXPECT_TRUE(head.last_modified.has_value());
    
    EXPECT_EQ(store->get_object(bucket, "docs/readme.txt"), to_bytes("hello world"));
}

TEST_F(FilesystemObjectStoreTest, SameContentSameEtag) {
    put("a.txt", "same");
    put("b.txt", "same");
    put("c.txt", "different");
    
    EXPECT_EQ(store->head_object(bucket, "a.txt").etag, store->head_object(bucket, "b.txt").etag);
    EXPECT_NE(store->head_object(bucket, "a.txt").etag, store->head_object(bucket, "c.txt").etag);
}

TEST_F(FilesystemObjectStoreTest, MissingKey) {
    EXPECT_EQ(error_code_of([&] { store->head_object(bucket, "nope"); }), StoreErrorCode::NOT_FOUND);
    EXPECT_EQ(error_code_of([&] { store->get_object(bucket, "nope"); }), StoreErrorCode::NOT_FOUND);
}

TEST_F(FilesystemObjectStoreTest, InvalidKeys) {
    EXPECT_EQ(error_code_of([&] { put(""); }), StoreErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(error_code_of([&] { put(std::string(1025, 'k')); }), StoreErrorCode::INVALID_ARGUMENT);
}

TEST_F(FilesystemObjectStoreTest, RangedGet) {
    store->put_object(bucket, "blob", pattern_bytes(100));
    auto all = pattern_bytes(100);
    
    auto middle = store->get_object(bucket, "blob", ByteRange{10, 19});
    EXPECT_EQ(middle, std::vector<uint8_t>(all.begin() + 10, all.begin() + 20));
    
    // Past the end is clamped
    auto tail = store->get_object(bucket, "blob", ByteRange{90, 500});
    EXPECT_EQ(tail.size(), 10u);
    
    EXPECT_EQ(error_code_of([&] { store->get_object(bucket, "blob", ByteRange{100, 150}); }),
              StoreErrorCode::INVALID_RANGE);
}

TEST_F(FilesystemObjectStoreTest, ListingSplitsFilesAndFolders) {
    put("photos/a.jpg");
    put("photos/b.jpg");
    put("photos/2024/c.jpg");
    put("photos/2024/d.jpg");
    put("photos/2023/e.jpg");
    put("photosynthesis.txt");
    put("photos/");
    
    auto result = store->list_objects(bucket, "photos/");
    
    EXPECT_EQ(names(result), (std::vector<std::string>{"2023", "2024", "a.jpg", "b.jpg"}));
    EXPECT_EQ(result.common_prefixes, (std::vector<std::string>{"photos/2023/", "photos/2024/"}));
    
    for (const auto& entry : result.entries) {
        EXPECT_NE(entry.key, "photos/");
        if (entry.is_prefix) {
            EXPECT_FALSE(entry.size.has_value());
        }
    }
}

TEST_F(FilesystemObjectStoreTest, ListingJoinsAllPages) {
    // Page size is 2, so this spans several pages
    for (int i = 0; i < 7; ++i) {
        put("logs/day-" + std::to_string(i) + ".log");
    }
    for (int i = 0; i < 3; ++i) {
        put("logs/archive-" + std::to_string(i) + "/old.log");
    }
    
    auto result = store->list_objects(bucket, "logs/");
    
    EXPECT_EQ(result.entries.size(), 10u);
    EXPECT_EQ(result.common_prefixes.size(), 3u);
}

TEST_F(FilesystemObjectStoreTest, FolderWithManyChildrenAppearsOnce) {
    for (int i = 0; i < 5; ++i) {
        put("a/many/" + std::to_string(i));
    }
    put("a/z.txt");
    
    auto result = store->list_objects(bucket, "a/");
    
    EXPECT_EQ(names(result), (std::vector<std::string>{"many", "z.txt"}));
}

TEST_F(FilesystemObjectStoreTest, RootListing) {
    put("top.txt");
    put("dir/inner.txt");
    
    auto result = store->list_objects(bucket, "");
    
    EXPECT_EQ(names(result), (std::vector<std::string>{"dir", "top.txt"}));
}

TEST_F(FilesystemObjectStoreTest, DeleteIsIdempotent) {
    put("gone.txt");
    store->delete_object(bucket, "gone.txt");
    store->delete_object(bucket, "gone.txt");
    
    EXPECT_EQ(error_code_of([&] { store->head_object(bucket, "gone.txt"); }), StoreErrorCode::NOT_FOUND);
}

TEST_F(FilesystemObjectStoreTest, BatchDeleteReportsFailures) {
    put("a.txt");
    put("b.txt");
    
    auto failed = store->delete_objects(bucket, {"a.txt", "", "b.txt", "never-existed"});
    
    EXPECT_EQ(failed, (std::vector<std::string>{""}));
    EXPECT_TRUE(store->list_objects(bucket, "").entries.empty());
}

TEST_F(FilesystemObjectStoreTest, CopyObject) {
    put("src.txt", "payload");
    store->copy_object(bucket, "src.txt", bucket, "backup/src.txt");
    
    EXPECT_EQ(store->get_object(bucket, "backup/src.txt"), to_bytes("payload"));
    EXPECT_EQ(store->head_object(bucket, "backup/src.txt").etag, store->head_object(bucket, "src.txt").etag);
}

TEST_F(FilesystemObjectStoreTest, MultipartUpload) {
    auto first = pattern_bytes(300, 1);
    auto second = pattern_bytes(200, 2);
    
    auto upload_id = store->create_multipart_upload(bucket, "big.bin");
    auto etag1 = store->upload_part(bucket, "big.bin", upload_id, 1, first);
    auto etag2 = store->upload_part(bucket, "big.bin", upload_id, 2, second);
    
    auto parts = store->list_parts(bucket, "big.bin", upload_id);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].part_number, 1);
    EXPECT_EQ(parts[0].etag, etag1);
    EXPECT_EQ(parts[1].size, 200u);
    
    store->complete_multipart_upload(bucket, "big.bin", upload_id, {{1, etag1}, {2, etag2}});
    
    auto expected = first;
    expected.insert(expected.end(), second.begin(), second.end());
    EXPECT_EQ(store->get_object(bucket, "big.bin"), expected);
    
    auto etag = store->head_object(bucket, "big.bin").etag.value_or("");
    EXPECT_NE(etag.find("-2\""), std::string::npos);
    EXPECT_TRUE(store->list_multipart_uploads(bucket).empty());
}

TEST_F(FilesystemObjectStoreTest, ListPartsAcrossPages) {
    auto upload_id = store->create_multipart_upload(bucket, "paged.bin");
    for (int part = 1; part <= 5; ++part) {
        store->upload_part(bucket, "paged.bin", upload_id, part, pattern_bytes(10, static_cast<uint8_t>(part)));
    }
    
    auto parts = store->list_parts(bucket, "paged.bin", upload_id);
    ASSERT_EQ(parts.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(parts[i].part_number, i + 1);
    }
}

TEST_F(FilesystemObjectStoreTest, CompleteRejectsBadParts) {
    auto upload_id = store->create_multipart_upload(bucket, "k");
    auto etag1 = store->upload_part(bucket, "k", upload_id, 1, pattern_bytes(10));
    auto etag2 = store->upload_part(bucket, "k", upload_id, 2, pattern_bytes(10, 9));
    
    EXPECT_EQ(error_code_of([&] {
        store->complete_multipart_upload(bucket, "k", upload_id, {{2, etag2}, {1, etag1}});
    }), StoreErrorCode::INVALID_PART);
    
    EXPECT_EQ(error_code_of([&] {
        store->complete_multipart_upload(bucket, "k", upload_id, {{1, "\"bogus\""}});
    }), StoreErrorCode::INVALID_PART);
    
    EXPECT_EQ(error_code_of([&] {
        store->complete_multipart_upload(bucket, "k", upload_id, {{1, etag1}, {3, etag2}});
    }), StoreErrorCode::INVALID_PART);
}

TEST_F(FilesystemObjectStoreTest, PartNumberBounds) {
    auto upload_id = store->create_multipart_upload(bucket, "k");
    
    EXPECT_EQ(error_code_of([&] { store->upload_part(bucket, "k", upload_id, 0, pattern_bytes(1)); }),
              StoreErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(error_code_of([&] { store->upload_part(bucket, "k", upload_id, 10001, pattern_bytes(1)); }),
              StoreErrorCode::INVALID_ARGUMENT);
}

TEST_F(FilesystemObjectStoreTest, UnknownOrForeignUpload) {
    auto upload_id = store->create_multipart_upload(bucket, "mine");
    
    EXPECT_EQ(error_code_of([&] { store->list_parts(bucket, "mine", "0123abcd"); }),
              StoreErrorCode::NO_SUCH_UPLOAD);
    EXPECT_EQ(error_code_of([&] { store->list_parts(bucket, "theirs", upload_id); }),
              StoreErrorCode::NO_SUCH_UPLOAD);
    EXPECT_EQ(error_code_of([&] { store->list_parts(bucket, "mine", "../../etc"); }),
              StoreErrorCode::NO_SUCH_UPLOAD);
}

TEST_F(FilesystemObjectStoreTest, AbortRemovesUpload) {
    auto upload_id = store->create_multipart_upload(bucket, "k");
    store->upload_part(bucket, "k", upload_id, 1, pattern_bytes(10));
    
    store->abort_multipart_upload(bucket, "k", upload_id);
    
    EXPECT_EQ(error_code_of([&] { store->list_parts(bucket, "k", upload_id); }),
              StoreErrorCode::NO_SUCH_UPLOAD);
    EXPECT_EQ(error_code_of([&] { store->abort_multipart_upload(bucket, "k", upload_id); }),
              StoreErrorCode::NO_SUCH_UPLOAD);
}

TEST_F(FilesystemObjectStoreTest, ListMultipartUploadsAcrossPages) {
    std::vector<std::string> ids;
    for (int i = 0; i < 5; ++i) {
        ids.push_back(store->create_multipart_upload(bucket, "key-" + std::to_string(i)));
    }
    
    auto uploads = store->list_multipart_uploads(bucket);
    
    ASSERT_EQ(uploads.size(), 5u);
    EXPECT_EQ(uploads[0].key, "key-0");
    EXPECT_EQ(uploads[4].key, "key-4");
    auto age = std::chrono::system_clock::now() - uploads[0].initiated;
    EXPECT_LT(age, std::chrono::minutes(1));
}
