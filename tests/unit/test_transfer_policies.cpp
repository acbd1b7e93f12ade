#include <gtest/gtest.h>
#include "s3xfer/transfer/engine_config.hpp"
#include "s3xfer/transfer/retry_policy.hpp"
#include "s3xfer/transfer/speed_tracker.hpp"

using namespace s3xfer::transfer;
using namespace std::chrono_literals;

// Retry policy

TEST(RetryPolicyTest, FirstRetryIsImmediate) {
    RetryPolicy policy;
    std::mt19937_64 rng(7);
    
    EXPECT_EQ(policy.delay_for(0, rng), 0ms);
    EXPECT_EQ(policy.delay_for(-1, rng), 0ms);
}

TEST(RetryPolicyTest, DelaysGrowWithJitterBounds) {
    RetryPolicy policy;
    std::mt19937_64 rng(42);
    
    EXPECT_EQ(policy.min_delay_for(1), 1000ms);
    EXPECT_EQ(policy.max_delay_for(1), 1500ms);
    EXPECT_EQ(policy.min_delay_for(2), 4000ms);
    EXPECT_EQ(policy.max_delay_for(2), 6000ms);
    
    for (int i = 0; i < 200; ++i) {
        for (int attempt = 1; attempt <= 3; ++attempt) {
            auto delay = policy.delay_for(attempt, rng);
            EXPECT_GE(delay, policy.min_delay_for(attempt));
            EXPECT_LE(delay, policy.max_delay_for(attempt));
        }
    }
}

TEST(RetryPolicyTest, NoJitterIsDeterministic) {
    RetryPolicy policy;
    policy.base_delay = 10ms;
    policy.jitter = 0.0;
    std::mt19937_64 rng(1);
    
    EXPECT_EQ(policy.delay_for(1, rng), 10ms);
    EXPECT_EQ(policy.delay_for(3, rng), 160ms);
}

TEST(RetryPolicyTest, Validation) {
    RetryPolicy policy;
    EXPECT_TRUE(policy.validate());
    
    policy.max_attempts = 0;
    EXPECT_FALSE(policy.validate());
    
    policy.max_attempts = 3;
    policy.growth = 0.5;
    EXPECT_FALSE(policy.validate());
}

// Speed tracking

class SpeedTrackerTest : public ::testing::Test {
protected:
    SpeedTracker make_tracker() {
        return SpeedTracker([this]() { return now; });
    }
    
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::time_point(1h);
};

TEST_F(SpeedTrackerTest, EmitsAtMostTwicePerSecond) {
    auto tracker = make_tracker();
    
    EXPECT_FALSE(tracker.record(100).has_value());
    
    now += 200ms;
    EXPECT_FALSE(tracker.record(100).has_value());
    
    now += 400ms;
    auto speed = tracker.record(100);
    ASSERT_TRUE(speed.has_value());
    EXPECT_NEAR(*speed, 500.0, 1e-6);
    
    now += 100ms;
    EXPECT_FALSE(tracker.record(100).has_value());
}

TEST_F(SpeedTrackerTest, OldSamplesLeaveTheWindow) {
    auto tracker = make_tracker();
    tracker.record(1000);
    now += 1s;
    tracker.record(1000);
    EXPECT_EQ(tracker.sample_count(), 2u);
    
    now += 2500ms;
    tracker.record(1000);
    EXPECT_EQ(tracker.sample_count(), 2u);
    
    now += 1s;
    auto speed = tracker.record(1000);
    ASSERT_TRUE(speed.has_value());
    EXPECT_NEAR(*speed, 2000.0, 1e-6);
}

TEST_F(SpeedTrackerTest, Reset) {
    auto tracker = make_tracker();
    tracker.record(10);
    now += 1s;
    tracker.record(10);
    
    tracker.reset();
    
    EXPECT_EQ(tracker.sample_count(), 0u);
    EXPECT_FALSE(tracker.record(10).has_value());
}

// Part sizing

TEST(PartSizeTest, Tiers) {
    EXPECT_EQ(select_part_size(0), 8 * MiB);
    EXPECT_EQ(select_part_size(9 * MiB), 8 * MiB);
    EXPECT_EQ(select_part_size(50 * GiB), 8 * MiB);
    EXPECT_EQ(select_part_size(50 * GiB + 1), 64 * MiB);
    EXPECT_EQ(select_part_size(500 * GiB), 64 * MiB);
    EXPECT_EQ(select_part_size(500 * GiB + 1), 512 * MiB);
}

TEST(PartSizeTest, StaysUnderPartLimit) {
    for (uint64_t size : {50 * GiB, 500 * GiB, 4096 * GiB}) {
        uint64_t part = select_part_size(size);
        EXPECT_LE((size + part - 1) / part, 10000u) << size;
    }
}

TEST(EngineConfigTest, TempPath) {
    EngineConfig config;
    
    EXPECT_EQ(config.temp_path_for("/data/out/video.mp4", 17),
              std::filesystem::path("/data/out/.s3xfer-download-17.tmp"));
}

TEST(EngineConfigTest, Validation) {
    EngineConfig config;
    EXPECT_TRUE(config.validate());
    
    config.max_concurrent_transfers = 0;
    EXPECT_FALSE(config.validate());
    
    config.max_concurrent_transfers = 4;
    config.download_chunk_size = 0;
    EXPECT_FALSE(config.validate());
}
