#include "region_detector.hpp"

#include <spdlog/spdlog.h>

#include <deque>

#include "edge_processor.hpp"

std::vector<FlareEvent> RegionDetector::detect(const Bytes& encoded) const {
  if (encoded.empty()) return {};
  cv::Mat img;
  try {
    img = cv::imdecode(encoded, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    spdlog::debug("Flare detection: imdecode raised: {}", e.what());
  }
  if (img.empty()) return {};
  return detect(img);
}

std::vector<FlareEvent> RegionDetector::detect(const cv::Mat& bgr) const {
  std::vector<FlareEvent> flares;
  if (bgr.empty()) return flares;

  cv::Mat gray;
  if (bgr.type() == CV_8UC1) {
    gray = bgr;
  } else if (bgr.type() == CV_8UC3) {
    gray.create(bgr.rows, bgr.cols, CV_8UC1);
    sobel::grayscale_rows(bgr, gray, 0, bgr.rows);
  } else {
    spdlog::warn("Flare detection: unsupported image type {}", bgr.type());
    return flares;
  }
  cv::Mat visited = cv::Mat::zeros(bgr.rows, bgr.cols, CV_8UC1);

  for (int y = 0; y < gray.rows; ++y) {
    const uint8_t* g = gray.ptr<uint8_t>(y);
    for (int x = 0; x < gray.cols; ++x) {
      if (visited.at<uint8_t>(y, x) || g[x] <= cfg_.brightness_threshold) continue;
      FlareEvent ev = flood_fill(gray, visited, x, y);
      if (ev.size >= cfg_.min_region_size) flares.push_back(ev);
    }
  }

  if (!flares.empty()) {
    spdlog::info("Detected {} solar flares", flares.size());
  }
  return flares;
}

FlareEvent RegionDetector::flood_fill(const cv::Mat& gray, cv::Mat& visited, int sx,
                                      int sy) const {
  static const int kDx[4] = {-1, 1, 0, 0};
  static const int kDy[4] = {0, 0, -1, 1};

  std::deque<cv::Point> queue;
  queue.emplace_back(sx, sy);
  visited.at<uint8_t>(sy, sx) = 1;

  int64_t size = 0, sum_x = 0, sum_y = 0, sum_intensity = 0;
  while (!queue.empty()) {
    const cv::Point p = queue.front();
    queue.pop_front();

    ++size;
    sum_x += p.x;
    sum_y += p.y;
    sum_intensity += gray.at<uint8_t>(p.y, p.x);

    for (int d = 0; d < 4; ++d) {
      const int nx = p.x + kDx[d];
      const int ny = p.y + kDy[d];
      if (nx < 0 || ny < 0 || nx >= gray.cols || ny >= gray.rows) continue;
      uint8_t& seen = visited.at<uint8_t>(ny, nx);
      if (seen || gray.at<uint8_t>(ny, nx) <= cfg_.brightness_threshold) continue;
      seen = 1;
      queue.emplace_back(nx, ny);
    }
  }

  FlareEvent ev;
  ev.size = static_cast<int>(size);
  ev.x = static_cast<int>(sum_x / size);
  ev.y = static_cast<int>(sum_y / size);
  ev.intensity = static_cast<int>(sum_intensity / size);
  return ev;
}
