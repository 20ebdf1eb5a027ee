#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>
#include <spdlog/fmt/fmt.h>
#include "region_detector.hpp"
#include "test_helpers.hpp"

class RegionDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        frame = cv::Mat(200, 300, CV_8UC3, cv::Scalar(10, 10, 10));
        mask = cv::Mat::zeros(200, 300, CV_8UC1);
    }

    void add_disc(cv::Point center, int radius) {
        cv::circle(frame, center, radius, cv::Scalar(255, 255, 255), -1);
        cv::circle(mask, center, radius, cv::Scalar(255), -1);
    }

    RegionDetector detector;
    cv::Mat frame;
    cv::Mat mask;
};

TEST_F(RegionDetectorTest, DarkFrameHasNoFlares) {
    EXPECT_TRUE(detector.detect(frame).empty());
    EXPECT_TRUE(detector.detect(encode_image(frame)).empty());
}

TEST_F(RegionDetectorTest, SingleDisc) {
    add_disc({100, 80}, 20);

    auto flares = detector.detect(encode_image(frame));
    ASSERT_EQ(flares.size(), 1u);

    const FlareEvent& f = flares[0];
    EXPECT_EQ(f.size, cv::countNonZero(mask));
    EXPECT_NEAR(f.x, 100, 1);
    EXPECT_NEAR(f.y, 80, 1);
    EXPECT_EQ(f.intensity, 255);
}

TEST_F(RegionDetectorTest, SeparatedDiscsAreSeparateFlares) {
    add_disc({60, 60}, 15);
    add_disc({220, 140}, 25);

    auto flares = detector.detect(frame);
    ASSERT_EQ(flares.size(), 2u);

    // Row-major scan finds the upper disc first.
    EXPECT_NEAR(flares[0].x, 60, 1);
    EXPECT_NEAR(flares[0].y, 60, 1);
    EXPECT_NEAR(flares[1].x, 220, 1);
    EXPECT_NEAR(flares[1].y, 140, 1);
    EXPECT_GT(flares[1].size, flares[0].size);
}

TEST_F(RegionDetectorTest, SmallRegionsAreIgnored) {
    // 9x9 = 81 pixels, below the default 100 pixel minimum.
    frame(cv::Rect(10, 10, 9, 9)).setTo(cv::Scalar(255, 255, 255));
    EXPECT_TRUE(detector.detect(frame).empty());

    // 10x10 = 100 pixels is enough.
    frame(cv::Rect(100, 100, 10, 10)).setTo(cv::Scalar(255, 255, 255));
    auto flares = detector.detect(frame);
    ASSERT_EQ(flares.size(), 1u);
    EXPECT_EQ(flares[0].size, 100);
}

TEST_F(RegionDetectorTest, ThresholdIsExclusive) {
    // gray == 200 is not bright.
    frame(cv::Rect(0, 0, 50, 50)).setTo(cv::Scalar(200, 200, 200));
    EXPECT_TRUE(detector.detect(frame).empty());

    frame(cv::Rect(0, 0, 50, 50)).setTo(cv::Scalar(201, 201, 201));
    EXPECT_EQ(detector.detect(frame).size(), 1u);
}

TEST_F(RegionDetectorTest, DiagonalNeighboursAreNotConnected) {
    RegionDetectorConfig cfg;
    cfg.min_region_size = 1;
    RegionDetector fine(cfg);

    frame.at<cv::Vec3b>(50, 50) = cv::Vec3b(255, 255, 255);
    frame.at<cv::Vec3b>(51, 51) = cv::Vec3b(255, 255, 255);
    EXPECT_EQ(fine.detect(frame).size(), 2u);
}

TEST_F(RegionDetectorTest, AcceptsGrayscaleMat) {
    add_disc({150, 100}, 12);
    auto flares = detector.detect(mask);
    ASSERT_EQ(flares.size(), 1u);
    EXPECT_EQ(flares[0].size, cv::countNonZero(mask));
}

TEST_F(RegionDetectorTest, GarbageInputYieldsNothing) {
    EXPECT_TRUE(detector.detect(Bytes{}).empty());
    EXPECT_TRUE(detector.detect(Bytes{0xde, 0xad, 0xbe, 0xef}).empty());
}

TEST_F(RegionDetectorTest, FlareEventsCarryUsefulDescription) {
    add_disc({100, 80}, 20);
    auto flares = detector.detect(frame);
    ASSERT_EQ(flares.size(), 1u);
    const FlareEvent& f = flares[0];
    EXPECT_EQ(f.to_string(), fmt::format("Flare at ({},{}) size={} intensity={}", f.x, f.y,
                                         f.size, f.intensity));
}
