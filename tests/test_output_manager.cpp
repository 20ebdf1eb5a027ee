#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <sstream>
#include "output_manager.hpp"

class OutputConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = OutputConfig{};
    }

    OutputConfig config;
};

TEST_F(OutputConfigTest, DefaultValues) {
    EXPECT_FALSE(config.verbose_logging);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.performance_summary_interval, 30);
    EXPECT_TRUE(config.enable_csv_logging);
    EXPECT_EQ(config.csv_output_path, "output/frame_log.csv");
}

TEST(PerformanceStatsTest, FlareFrameRate) {
    PerformanceStats stats;
    stats.reset();
    EXPECT_DOUBLE_EQ(stats.getFlareFrameRate(), 0.0);

    stats.total_frames = 8;
    stats.frames_with_flares = 2;
    EXPECT_DOUBLE_EQ(stats.getFlareFrameRate(), 25.0);

    stats.reset();
    EXPECT_EQ(stats.total_frames, 0u);
    EXPECT_EQ(stats.start_time, stats.last_summary);
}

class OutputManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "sunedge_output_tests";
        std::filesystem::remove_all(test_dir);

        config.log_level = "warn";
        config.csv_output_path = (test_dir / "nested" / "frames.csv").string();
        config.performance_summary_interval = 3600;
    }

    void TearDown() override {
        spdlog::set_level(spdlog::level::warn);
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::vector<std::string> readLines(const std::string& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }

    static ProcessedResult sampleResult() {
        return ProcessedResult(Bytes(300, 1), Bytes(300, 1), 2'000'000, 8'000'000, 2048);
    }

    std::filesystem::path test_dir;
    OutputConfig config;
    MetricsCollector metrics;
};

TEST_F(OutputManagerTest, WritesCsvHeaderAndRows) {
    {
        OutputManager output(config, metrics);
        EXPECT_TRUE(std::filesystem::exists(config.csv_output_path));

        output.processFrame(1, sampleResult(), {});
        output.processFrame(2, sampleResult(), {{10, 20, 150, 230}, {50, 60, 400, 250}});
        output.cleanup();
        output.cleanup();  // idempotent
    }

    auto lines = readLines(config.csv_output_path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0],
              "frame_id,parallel_ms,sequential_ms,speedup,original_bytes,output_bytes,flare_count");
    EXPECT_EQ(lines[1], "1,2.000,8.000,4.000,2048,300,0");
    EXPECT_EQ(lines[2], "2,2.000,8.000,4.000,2048,300,2");
}

TEST_F(OutputManagerTest, CsvDisabledWritesNothing) {
    config.enable_csv_logging = false;
    OutputManager output(config, metrics);
    output.processFrame(1, sampleResult(), {});
    output.cleanup();

    EXPECT_FALSE(std::filesystem::exists(config.csv_output_path));
}

TEST_F(OutputManagerTest, TracksFlareStatistics) {
    config.enable_csv_logging = false;
    OutputManager output(config, metrics);

    output.processFrame(1, sampleResult(), {});
    output.processFrame(2, sampleResult(), {{1, 1, 120, 210}});
    output.processFrame(3, sampleResult(), {{5, 5, 900, 240}, {9, 9, 300, 220}});

    PerformanceStats stats = output.stats();
    EXPECT_EQ(stats.total_frames, 3u);
    EXPECT_EQ(stats.frames_with_flares, 2u);
    EXPECT_EQ(stats.flare_events, 3u);
    EXPECT_EQ(stats.largest_flare, 900u);
    EXPECT_NEAR(stats.getFlareFrameRate(), 66.67, 0.01);

    auto latest = output.latestFlares();
    ASSERT_EQ(latest.size(), 2u);
    EXPECT_EQ(latest[0], (FlareEvent{5, 5, 900, 240}));

    output.processFrame(4, sampleResult(), {});
    EXPECT_TRUE(output.latestFlares().empty());
}

TEST_F(OutputManagerTest, VerboseModeStillCounts) {
    config.enable_csv_logging = false;
    config.verbose_logging = true;
    OutputManager output(config, metrics);

    output.processFrame(7, ProcessedResult::sequential_only(Bytes(10, 0), 1'000'000, 10),
                        {{3, 4, 100, 201}});
    EXPECT_EQ(output.stats().total_frames, 1u);
}

TEST_F(OutputManagerTest, AppliesLogLevel) {
    config.enable_csv_logging = false;
    config.log_level = "error";
    OutputManager output(config, metrics);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
}
