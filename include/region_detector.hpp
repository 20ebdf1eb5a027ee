#pragma once

#include <vector>

#include <opencv2/opencv.hpp>

#include "types.hpp"

struct RegionDetectorConfig {
  int brightness_threshold{200};  // bright when gray > threshold
  int min_region_size{100};       // pixels
};

// Connected-component scan for bright regions ("flares") in a single frame.
// No state is carried between frames.
class RegionDetector {
public:
  explicit RegionDetector(RegionDetectorConfig cfg = {}) : cfg_(cfg) {}

  // Encoded image bytes. Undecodable or empty input yields no events.
  std::vector<FlareEvent> detect(const Bytes& encoded) const;
  std::vector<FlareEvent> detect(const cv::Mat& bgr) const;

  const RegionDetectorConfig& config() const { return cfg_; }

private:
  FlareEvent flood_fill(const cv::Mat& gray, cv::Mat& visited, int sx, int sy) const;

  RegionDetectorConfig cfg_;
};
