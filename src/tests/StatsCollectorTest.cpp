#include "../manager/StatsCollector.hpp"
#include "FakeTransferEngine.hpp"
#include <gtest/gtest.h>
#include <atomic>

TEST(StatsCollectorTest, MeasuresProgressAndSpeed) {
    TransferStats stats;
    stats.bytes_downloaded = 1048576;
    stats.active_peers = 12;

    StatsSample sample = StatsCollector::measure(stats, 0, 4194304, std::chrono::seconds(1));
    EXPECT_DOUBLE_EQ(25.0, sample.progress);
    EXPECT_DOUBLE_EQ(1.0, sample.download_mb);
    EXPECT_DOUBLE_EQ(1024.0, sample.speed_kbs);
    EXPECT_EQ(12, sample.peers);
}

TEST(StatsCollectorTest, SpeedScalesWithInterval) {
    TransferStats stats;
    stats.bytes_downloaded = 2048;

    StatsSample sample = StatsCollector::measure(stats, 1024, 1 << 20, std::chrono::milliseconds(500));
    EXPECT_DOUBLE_EQ(2.0, sample.speed_kbs);
}

TEST(StatsCollectorTest, ProgressIsClamped) {
    TransferStats stats;
    stats.bytes_downloaded = 5000;

    EXPECT_DOUBLE_EQ(100.0, StatsCollector::measure(stats, 0, 1000, std::chrono::seconds(1)).progress);
    EXPECT_DOUBLE_EQ(100.0, StatsCollector::measure(stats, 0, 0, std::chrono::seconds(1)).progress);
}

TEST(StatsCollectorTest, SpeedNeverNegative) {
    TransferStats stats;
    stats.bytes_downloaded = 100;

    EXPECT_DOUBLE_EQ(0.0, StatsCollector::measure(stats, 500, 1000, std::chrono::seconds(1)).speed_kbs);
}

TEST(StatsCollectorTest, CarriesFailure) {
    TransferStats stats;
    stats.failed = true;
    stats.error = "disk full";

    StatsSample sample = StatsCollector::measure(stats, 0, 1000, std::chrono::seconds(1));
    EXPECT_TRUE(sample.failed);
    EXPECT_EQ("disk full", sample.error);
}

TEST(StatsCollectorTest, DeliversSamplesUntilStopped) {
    auto transfer = std::make_shared<FakeTransfer>(makeMetadata({{"movie.mp4", 1000}}, 100), "", true);
    transfer->setStats(500, 3);

    std::atomic<int> samples{0};
    std::atomic<uint64_t> seen_id{0};
    StatsCollector collector(7, transfer, 1000, "Sample", std::chrono::milliseconds(10),
        [&](uint64_t session_id, const StatsSample& sample) {
            seen_id = session_id;
            EXPECT_DOUBLE_EQ(50.0, sample.progress);
            ++samples;
            return true;
        });

    collector.start();
    EXPECT_TRUE(collector.isRunning());
    ASSERT_TRUE(waitUntil([&] { return samples >= 2; }));
    collector.stop();

    EXPECT_FALSE(collector.isRunning());
    EXPECT_EQ(7u, seen_id.load());
    int after_stop = samples;
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    EXPECT_EQ(after_stop, samples.load());
}

TEST(StatsCollectorTest, SupersededSinkEndsCollector) {
    auto transfer = std::make_shared<FakeTransfer>(makeMetadata({{"movie.mp4", 1000}}, 100), "", true);

    std::atomic<int> samples{0};
    StatsCollector collector(1, transfer, 1000, "Sample", std::chrono::milliseconds(10),
        [&](uint64_t, const StatsSample&) {
            ++samples;
            return false;
        });

    collector.start();
    ASSERT_TRUE(waitUntil([&] { return !collector.isRunning(); }));
    EXPECT_EQ(1, samples.load());
}

TEST(StatsCollectorTest, StopBeforeStartIsHarmless) {
    auto transfer = std::make_shared<FakeTransfer>(makeMetadata({{"movie.mp4", 1000}}, 100), "", true);
    StatsCollector collector(1, transfer, 1000, "Sample", std::chrono::seconds(60),
        [](uint64_t, const StatsSample&) { return true; });

    collector.stop();
    collector.stop();
    EXPECT_FALSE(collector.isRunning());
}
