#include <gtest/gtest.h>
#include "s3xfer/transfer/upload_worker.hpp"
#include "s3xfer/store/filesystem_object_store.hpp"
#include "support/test_support.hpp"
#include <sqlite3.h>
#include <stdexcept>

using namespace s3xfer::transfer;
using namespace s3xfer::storage;
using namespace s3xfer::store;
using s3xfer::testing::MockObjectStore;
using s3xfer::testing::TempDir;
using s3xfer::testing::pattern_bytes;
using s3xfer::testing::transient_error;
using s3xfer::testing::write_file;
using ::testing::_;
using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

// Makes every later attempt to set `status` on a transfer abort
void reject_status_writes(const std::filesystem::path& db_path, const std::string& status) {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.string().c_str(), &db), SQLITE_OK);
    std::string sql = "CREATE TRIGGER reject_" + status + " BEFORE UPDATE OF status ON transfers "
                      "WHEN NEW.status = '" + status + "' BEGIN SELECT RAISE(ABORT, 'rejected'); END;";
    char* error = nullptr;
    int result = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    std::string message = error ? error : "";
    sqlite3_free(error);
    sqlite3_close(db);
    ASSERT_EQ(result, SQLITE_OK) << message;
}

} // namespace

class UploadWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        database = std::make_shared<TransferDatabase>(temp_dir / "transfers.db");
        ASSERT_TRUE(database->initialize());
        auto id = database->ensure_bucket("media");
        ASSERT_TRUE(id.has_value());
        bucket_id = *id;
        
        mock = std::make_shared<NiceMock<MockObjectStore>>();
        
        config.multipart_threshold = 1024;
        config.default_part_size = 1024;
        config.download_chunk_size = 1024;
        config.retry.base_delay = std::chrono::milliseconds(1);
        
        signals.finished = [this](int64_t) { events.push_back("finished"); };
        signals.failed = [this](int64_t, const std::string& message, const std::string& detail) {
            events.push_back("failed");
            failure_message = message;
            failure_detail = detail;
        };
        signals.stopped = [this](int64_t, TransferStatus status) {
            events.push_back("stopped:" + to_string(status));
        };
        signals.progress = [this](int64_t, uint64_t done, uint64_t total) {
            progress.emplace_back(done, total);
        };
    }
    
    int64_t create_upload(const std::vector<uint8_t>& data, const std::string& key) {
        auto source = temp_dir / ("source-" + std::to_string(next_file_++) + ".bin");
        write_file(source, data);
        
        NewTransfer transfer;
        transfer.bucket_id = bucket_id;
        transfer.direction = Direction::UPLOAD;
        transfer.object_key = key;
        transfer.local_path = source.string();
        transfer.total_bytes = data.size();
        auto id = database->create_transfer(transfer);
        EXPECT_TRUE(id.has_value());
        return id.value_or(0);
    }
    
    void run(int64_t id, std::shared_ptr<ObjectStoreClient> client) {
        UploadWorker worker(id, std::move(client), database, "media", control, config, signals);
        worker.run();
    }
    
    TransferRecord record(int64_t id) {
        auto found = database->get_transfer(id);
        EXPECT_TRUE(found.has_value());
        return found.value_or(TransferRecord{});
    }
    
    TempDir temp_dir;
    std::shared_ptr<TransferDatabase> database;
    std::shared_ptr<NiceMock<MockObjectStore>> mock;
    std::shared_ptr<TransferControl> control = std::make_shared<TransferControl>();
    int64_t bucket_id = 0;
    EngineConfig config;
    WorkerSignals signals;
    
    std::vector<std::string> events;
    std::vector<std::pair<uint64_t, uint64_t>> progress;
    std::string failure_message;
    std::string failure_detail;

private:
    int next_file_ = 0;
};

TEST_F(UploadWorkerTest, SmallFileUsesSinglePut) {
    auto data = pattern_bytes(500);
    auto id = create_upload(data, "docs/small.bin");
    
    EXPECT_CALL(*mock, put_object("media", "docs/small.bin", data)).Times(1);
    EXPECT_CALL(*mock, create_multipart_upload(_, _)).Times(0);
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::COMPLETED);
    EXPECT_EQ(stored.transferred, 500u);
    ASSERT_TRUE(stored.total_bytes.has_value());
    EXPECT_EQ(*stored.total_bytes, 500u);
    EXPECT_THAT(events, ElementsAre("finished"));
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back(), std::make_pair(uint64_t{500}, uint64_t{500}));
}

TEST_F(UploadWorkerTest, LargeFileUploadsPartsInOrder) {
    auto data = pattern_bytes(1024 + 300);
    auto id = create_upload(data, "big.bin");
    
    std::vector<uint8_t> first(data.begin(), data.begin() + 1024);
    std::vector<uint8_t> second(data.begin() + 1024, data.end());
    
    {
        InSequence sequence;
        EXPECT_CALL(*mock, create_multipart_upload("media", "big.bin")).WillOnce(Return("upload-1"));
        EXPECT_CALL(*mock, upload_part("media", "big.bin", "upload-1", 1, first)).WillOnce(Return("etag-1"));
        EXPECT_CALL(*mock, upload_part("media", "big.bin", "upload-1", 2, second)).WillOnce(Return("etag-2"));
        EXPECT_CALL(*mock, complete_multipart_upload("media", "big.bin", "upload-1",
            ElementsAre(AllOf(Field(&PartETag::part_number, 1), Field(&PartETag::etag, "etag-1")),
                        AllOf(Field(&PartETag::part_number, 2), Field(&PartETag::etag, "etag-2")))))
            .Times(1);
    }
    EXPECT_CALL(*mock, put_object(_, _, _)).Times(0);
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::COMPLETED);
    EXPECT_EQ(stored.transferred, data.size());
    ASSERT_TRUE(stored.upload_id.has_value());
    EXPECT_EQ(*stored.upload_id, "upload-1");
    
    auto parts = database->get_parts(id);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].offset, 0u);
    EXPECT_EQ(parts[0].size, 1024u);
    EXPECT_EQ(parts[1].offset, 1024u);
    EXPECT_EQ(parts[1].size, 300u);
    EXPECT_EQ(parts[1].status, PartStatus::COMPLETED);
    
    EXPECT_THAT(events, ElementsAre("finished"));
}

TEST_F(UploadWorkerTest, ResumeSkipsPartsConfirmedByBackend) {
    auto store = std::make_shared<FilesystemObjectStore>(temp_dir / "store");
    ASSERT_TRUE(store->create_bucket("media"));
    
    auto data = pattern_bytes(3 * 1024, 7);
    auto id = create_upload(data, "resume.bin");
    
    // An earlier run got as far as part 1
    auto upload_id = store->create_multipart_upload("media", "resume.bin");
    store->upload_part("media", "resume.bin", upload_id, 1,
                       std::vector<uint8_t>(data.begin(), data.begin() + 1024));
    ASSERT_TRUE(database->set_upload_id(id, upload_id));
    
    run(id, store);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::COMPLETED);
    EXPECT_EQ(store->get_object("media", "resume.bin"), data);
    EXPECT_TRUE(store->list_multipart_uploads("media").empty());
    
    // The first progress report already counts the confirmed part
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front().first, 2048u);
}

TEST_F(UploadWorkerTest, ResumeUsesStoredUploadIdWithoutCreatingAnother) {
    auto data = pattern_bytes(2 * 1024);
    auto id = create_upload(data, "again.bin");
    ASSERT_TRUE(database->set_upload_id(id, std::string("upload-9")));
    
    EXPECT_CALL(*mock, list_parts("media", "again.bin", "upload-9"))
        .WillOnce(Return(std::vector<UploadedPart>{{1, "etag-1", 1024}}));
    EXPECT_CALL(*mock, create_multipart_upload(_, _)).Times(0);
    EXPECT_CALL(*mock, upload_part(_, _, _, 1, _)).Times(0);
    EXPECT_CALL(*mock, upload_part("media", "again.bin", "upload-9", 2, _)).WillOnce(Return("etag-2"));
    EXPECT_CALL(*mock, complete_multipart_upload("media", "again.bin", "upload-9", _)).Times(1);
    
    run(id, mock);
    
    EXPECT_EQ(record(id).status, TransferStatus::COMPLETED);
}

TEST_F(UploadWorkerTest, VanishedUploadStartsOver) {
    auto data = pattern_bytes(2 * 1024);
    auto id = create_upload(data, "gone.bin");
    ASSERT_TRUE(database->set_upload_id(id, std::string("stale")));
    
    EXPECT_CALL(*mock, list_parts("media", "gone.bin", "stale"))
        .WillOnce(Throw(StoreError::from_backend("NoSuchUpload", "", "404")));
    EXPECT_CALL(*mock, create_multipart_upload("media", "gone.bin")).WillOnce(Return("fresh"));
    EXPECT_CALL(*mock, upload_part("media", "gone.bin", "fresh", _, _)).Times(2).WillRepeatedly(Return("e"));
    EXPECT_CALL(*mock, upload_part(_, _, "stale", _, _)).Times(0);
    EXPECT_CALL(*mock, complete_multipart_upload("media", "gone.bin", "fresh", _)).Times(1);
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::COMPLETED);
    ASSERT_TRUE(stored.upload_id.has_value());
    EXPECT_EQ(*stored.upload_id, "fresh");
}

TEST_F(UploadWorkerTest, TransientFailureIsRetried) {
    auto data = pattern_bytes(100);
    auto id = create_upload(data, "flaky.bin");
    
    EXPECT_CALL(*mock, put_object("media", "flaky.bin", _))
        .WillOnce(Throw(transient_error()))
        .WillOnce(Return());
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::COMPLETED);
    EXPECT_EQ(stored.retry_count, 1);
}

TEST_F(UploadWorkerTest, ExhaustedRetriesFailTheTransfer) {
    auto data = pattern_bytes(100);
    auto id = create_upload(data, "down.bin");
    
    EXPECT_CALL(*mock, put_object("media", "down.bin", _)).Times(3).WillRepeatedly(Throw(transient_error()));
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::FAILED);
    ASSERT_TRUE(stored.error_message.has_value());
    EXPECT_EQ(*stored.error_message, "Upload failed after 3 attempts.");
    EXPECT_EQ(stored.retry_count, 2);
    
    EXPECT_THAT(events, ElementsAre("failed"));
    EXPECT_EQ(failure_message, "Upload failed after 3 attempts.");
    EXPECT_NE(failure_detail.find("temporarily unavailable"), std::string::npos);
    EXPECT_NE(failure_detail.find("503"), std::string::npos);
}

TEST_F(UploadWorkerTest, CancelAbortsMultipartUpload) {
    auto data = pattern_bytes(2 * 1024);
    auto id = create_upload(data, "cancel.bin");
    control->cancel = true;
    
    EXPECT_CALL(*mock, create_multipart_upload("media", "cancel.bin")).WillOnce(Return("upload-c"));
    EXPECT_CALL(*mock, upload_part(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*mock, abort_multipart_upload("media", "cancel.bin", "upload-c")).Times(1);
    EXPECT_CALL(*mock, complete_multipart_upload(_, _, _, _)).Times(0);
    
    run(id, mock);
    
    EXPECT_EQ(record(id).status, TransferStatus::CANCELLED);
    EXPECT_THAT(events, ElementsAre("stopped:cancelled"));
}

TEST_F(UploadWorkerTest, FailedAbortStillCancels) {
    auto data = pattern_bytes(2 * 1024);
    auto id = create_upload(data, "cancel.bin");
    control->cancel = true;
    
    EXPECT_CALL(*mock, create_multipart_upload(_, _)).WillOnce(Return("upload-c"));
    EXPECT_CALL(*mock, abort_multipart_upload(_, _, _)).WillOnce(Throw(transient_error()));
    
    run(id, mock);
    
    EXPECT_EQ(record(id).status, TransferStatus::CANCELLED);
    EXPECT_THAT(events, ElementsAre("stopped:cancelled"));
}

TEST_F(UploadWorkerTest, PauseKeepsUploadIdAndProgress) {
    auto data = pattern_bytes(2 * 1024);
    auto id = create_upload(data, "pause.bin");
    control->pause = true;
    
    EXPECT_CALL(*mock, create_multipart_upload(_, _)).WillOnce(Return("upload-p"));
    EXPECT_CALL(*mock, upload_part(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*mock, abort_multipart_upload(_, _, _)).Times(0);
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::PAUSED);
    EXPECT_EQ(stored.transferred, 0u);
    ASSERT_TRUE(stored.upload_id.has_value());
    EXPECT_EQ(*stored.upload_id, "upload-p");
    EXPECT_EQ(database->pending_parts(id).size(), 2u);
    EXPECT_THAT(events, ElementsAre("stopped:paused"));
}

TEST_F(UploadWorkerTest, MissingSourceFails) {
    auto id = create_upload(pattern_bytes(10), "missing.bin");
    std::filesystem::remove(record(id).local_path);
    
    EXPECT_CALL(*mock, put_object(_, _, _)).Times(0);
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::FAILED);
    ASSERT_TRUE(stored.error_message.has_value());
    EXPECT_EQ(*stored.error_message, "Source file no longer exists.");
    EXPECT_EQ(failure_detail, stored.local_path);
}

TEST_F(UploadWorkerTest, MissingRecordReportsFailureOnly) {
    EXPECT_CALL(*mock, put_object(_, _, _)).Times(0);
    
    run(4242, mock);
    
    EXPECT_THAT(events, ElementsAre("failed"));
    EXPECT_EQ(failure_message, "Transfer record not found.");
    EXPECT_FALSE(database->get_transfer(4242).has_value());
}

TEST_F(UploadWorkerTest, FileAtThresholdUsesMultipart) {
    auto data = pattern_bytes(1024);
    auto id = create_upload(data, "edge.bin");
    
    EXPECT_CALL(*mock, create_multipart_upload("media", "edge.bin")).WillOnce(Return("upload-1"));
    EXPECT_CALL(*mock, upload_part("media", "edge.bin", "upload-1", 1, data)).WillOnce(Return("etag-1"));
    EXPECT_CALL(*mock, complete_multipart_upload("media", "edge.bin", "upload-1", _)).Times(1);
    EXPECT_CALL(*mock, put_object(_, _, _)).Times(0);
    
    run(id, mock);
    
    EXPECT_EQ(record(id).status, TransferStatus::COMPLETED);
    EXPECT_THAT(events, ElementsAre("finished"));
}

TEST_F(UploadWorkerTest, EmptyFileUsesSinglePutWithEmptyBody) {
    auto id = create_upload({}, "empty.bin");
    
    EXPECT_CALL(*mock, put_object("media", "empty.bin", std::vector<uint8_t>{})).Times(1);
    EXPECT_CALL(*mock, create_multipart_upload(_, _)).Times(0);
    
    run(id, mock);
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::COMPLETED);
    EXPECT_EQ(stored.transferred, 0u);
    EXPECT_THAT(events, ElementsAre("finished"));
}

TEST_F(UploadWorkerTest, ThrowingFinishedHandlerKeepsCompletion) {
    auto id = create_upload(pattern_bytes(100), "a.bin");
    signals.finished = [this](int64_t) {
        events.push_back("finished");
        throw std::runtime_error("handler boom");
    };
    
    run(id, mock);
    
    EXPECT_THAT(events, ElementsAre("finished"));
    EXPECT_EQ(record(id).status, TransferStatus::COMPLETED);
}

TEST_F(UploadWorkerTest, ThrowingProgressHandlerDoesNotFailUpload) {
    auto id = create_upload(pattern_bytes(1024 + 10), "b.bin");
    signals.progress = [](int64_t, uint64_t, uint64_t) { throw std::runtime_error("progress boom"); };
    
    EXPECT_CALL(*mock, create_multipart_upload(_, _)).WillOnce(Return("upload-2"));
    EXPECT_CALL(*mock, upload_part(_, _, _, _, _)).WillOnce(Return("etag-1")).WillOnce(Return("etag-2"));
    
    run(id, mock);
    
    EXPECT_THAT(events, ElementsAre("finished"));
    EXPECT_EQ(record(id).status, TransferStatus::COMPLETED);
}

TEST_F(UploadWorkerTest, UnrecordedCompletionFailsInsteadOfFinishing) {
    auto id = create_upload(pattern_bytes(100), "c.bin");
    reject_status_writes(temp_dir / "transfers.db", "completed");
    
    EXPECT_CALL(*mock, put_object("media", "c.bin", _)).Times(1);
    
    run(id, mock);
    
    EXPECT_THAT(events, ElementsAre("failed"));
    EXPECT_EQ(failure_message, "Could not record completed transfer.");
    
    auto stored = record(id);
    EXPECT_EQ(stored.status, TransferStatus::FAILED);
    ASSERT_TRUE(stored.error_message.has_value());
    EXPECT_EQ(*stored.error_message, "Could not record completed transfer.");
}
