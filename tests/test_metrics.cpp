#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <vector>
#include "metrics.hpp"

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        metrics = std::make_unique<MetricsCollector>();
    }

    std::unique_ptr<MetricsCollector> metrics;
};

TEST_F(MetricsCollectorTest, InitialState) {
    EXPECT_EQ(metrics->total_frames(), 0u);
    EXPECT_EQ(metrics->total_bytes(), 0u);
    EXPECT_EQ(metrics->total_downloads(), 0u);
    EXPECT_DOUBLE_EQ(metrics->average_latency_ms(), 0.0);
    EXPECT_DOUBLE_EQ(metrics->parallel_average_latency_ms(), 0.0);
    EXPECT_DOUBLE_EQ(metrics->sequential_average_latency_ms(), 0.0);
    EXPECT_DOUBLE_EQ(metrics->throughput_per_sec(), 0.0);
    EXPECT_DOUBLE_EQ(metrics->speedup(), 1.0);
    EXPECT_EQ(metrics->min_latency_ms(), 0);  // not the internal sentinel
    EXPECT_EQ(metrics->max_latency_ms(), 0);
}

TEST_F(MetricsCollectorTest, RecordDownloadSumsBytes) {
    const std::vector<uint64_t> sizes = {1024, 2048, 1, 0, 77777};
    uint64_t sum = 0;
    for (auto b : sizes) {
        metrics->record_download(b);
        sum += b;
    }
    EXPECT_EQ(metrics->total_bytes(), sum);
    EXPECT_EQ(metrics->total_downloads(), sizes.size());
}

TEST_F(MetricsCollectorTest, RecordProcessingAverages) {
    metrics->record_processing(1'000'000'000LL);  // 1 second
    metrics->record_processing(2'000'000'000LL);  // 2 seconds

    EXPECT_EQ(metrics->total_frames(), 2u);
    EXPECT_NEAR(metrics->average_latency_ms(), 1500.0, 0.1);
}

TEST_F(MetricsCollectorTest, LatencyTracking) {
    metrics->record_processing(5'000'000LL);   // 5ms
    metrics->record_processing(10'000'000LL);  // 10ms
    metrics->record_processing(15'000'000LL);  // 15ms

    EXPECT_EQ(metrics->min_latency_ms(), 5);
    EXPECT_EQ(metrics->max_latency_ms(), 15);
}

TEST_F(MetricsCollectorTest, LatencyIsTruncatedToWholeMilliseconds) {
    metrics->record_processing(7'999'999LL);
    metrics->record_processing(3'400'000LL);
    metrics->record_processing(12'000'001LL);

    EXPECT_EQ(metrics->min_latency_ms(), 3);
    EXPECT_EQ(metrics->max_latency_ms(), 12);
}

TEST_F(MetricsCollectorTest, PathTimesDoNotTouchMinMaxOrFrames) {
    metrics->record_parallel_processing(50'000'000LL);
    metrics->record_sequential_processing(400'000'000LL);

    EXPECT_EQ(metrics->total_frames(), 0u);
    EXPECT_EQ(metrics->min_latency_ms(), 0);
    EXPECT_EQ(metrics->max_latency_ms(), 0);
    // Per-frame averages stay 0 until a frame is recorded.
    EXPECT_DOUBLE_EQ(metrics->parallel_average_latency_ms(), 0.0);
}

TEST_F(MetricsCollectorTest, ParallelSequentialComparison) {
    metrics->record_parallel_processing(10'000'000LL);     // 10ms
    metrics->record_sequential_processing(100'000'000LL);  // 100ms
    metrics->record_processing(110'000'000LL);

    EXPECT_DOUBLE_EQ(metrics->speedup(), 10.0);
    EXPECT_DOUBLE_EQ(metrics->parallel_average_latency_ms(), 10.0);
    EXPECT_DOUBLE_EQ(metrics->sequential_average_latency_ms(), 100.0);
}

TEST_F(MetricsCollectorTest, SpeedupWithoutParallelTimeIsOne) {
    metrics->record_sequential_processing(123'456'789LL);
    metrics->record_processing(123'456'789LL);
    EXPECT_DOUBLE_EQ(metrics->speedup(), 1.0);
}

TEST_F(MetricsCollectorTest, ThroughputCountsFramesOverUptime) {
    for (int i = 0; i < 5; ++i) metrics->record_processing(1'000'000LL);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    const double fps = metrics->throughput_per_sec();
    EXPECT_GT(fps, 0.0);
    EXPECT_LT(fps, 5.0 / 0.02 + 1.0);
}

TEST_F(MetricsCollectorTest, ResetMatchesFreshCollector) {
    metrics->record_download(1024);
    metrics->record_processing(1'000'000'000LL);
    metrics->record_parallel_processing(5'000'000LL);
    metrics->record_sequential_processing(9'000'000LL);

    metrics->reset();
    MetricsCollector fresh;

    EXPECT_EQ(metrics->total_frames(), fresh.total_frames());
    EXPECT_EQ(metrics->total_bytes(), fresh.total_bytes());
    EXPECT_EQ(metrics->total_downloads(), fresh.total_downloads());
    EXPECT_EQ(metrics->min_latency_ms(), fresh.min_latency_ms());
    EXPECT_EQ(metrics->max_latency_ms(), fresh.max_latency_ms());
    EXPECT_DOUBLE_EQ(metrics->average_latency_ms(), fresh.average_latency_ms());
    EXPECT_DOUBLE_EQ(metrics->parallel_average_latency_ms(), fresh.parallel_average_latency_ms());
    EXPECT_DOUBLE_EQ(metrics->sequential_average_latency_ms(),
                     fresh.sequential_average_latency_ms());
    EXPECT_DOUBLE_EQ(metrics->speedup(), fresh.speedup());
    EXPECT_DOUBLE_EQ(metrics->throughput_per_sec(), 0.0);

    // Min tracking starts over after a reset.
    metrics->record_processing(42'000'000LL);
    EXPECT_EQ(metrics->min_latency_ms(), 42);
}

TEST_F(MetricsCollectorTest, SnapshotCopiesCounters) {
    metrics->record_download(300);
    metrics->record_parallel_processing(2'000'000LL);
    metrics->record_sequential_processing(6'000'000LL);
    metrics->record_processing(8'000'000LL);

    MetricsSnapshot s = metrics->snapshot();
    EXPECT_EQ(s.total_downloads, 1u);
    EXPECT_EQ(s.total_bytes, 300u);
    EXPECT_EQ(s.total_frames, 1u);
    EXPECT_EQ(s.min_latency_ms, 8);
    EXPECT_EQ(s.max_latency_ms, 8);
    EXPECT_DOUBLE_EQ(s.speedup, 3.0);
    EXPECT_DOUBLE_EQ(s.avg_latency_ms, 8.0);

    // Later writes do not alter a snapshot already taken.
    metrics->record_download(1);
    EXPECT_EQ(s.total_bytes, 300u);
}

TEST_F(MetricsCollectorTest, PrometheusOutput) {
    metrics->record_processing(5'000'000LL);
    std::string text = metrics->prometheus_text(metrics->snapshot());

    EXPECT_NE(text.find("sunedge_frames_processed_total 1"), std::string::npos);
    EXPECT_NE(text.find("sunedge_downloaded_bytes_total"), std::string::npos);
    EXPECT_NE(text.find("sunedge_speedup_ratio"), std::string::npos);
    EXPECT_NE(text.find("path=\"parallel\""), std::string::npos);
}

TEST_F(MetricsCollectorTest, ConcurrentAccess) {
    const int num_threads = 8;
    const int operations_per_thread = 1000;

    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t, operations_per_thread]() {
            for (int i = 0; i < operations_per_thread; ++i) {
                metrics->record_download(10);
                metrics->record_processing(static_cast<int64_t>(t * 1000 + i + 1) * 1'000'000LL);
                metrics->record_parallel_processing(1);
                (void)metrics->snapshot();
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(metrics->total_frames(), static_cast<uint64_t>(num_threads * operations_per_thread));
    EXPECT_EQ(metrics->total_bytes(), static_cast<uint64_t>(num_threads * operations_per_thread * 10));
    EXPECT_EQ(metrics->min_latency_ms(), 1);
    EXPECT_EQ(metrics->max_latency_ms(), (num_threads - 1) * 1000 + operations_per_thread);
}
