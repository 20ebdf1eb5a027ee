#include "edge_processor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

using namespace std::chrono;

namespace sobel {

void grayscale_rows(const cv::Mat& bgr, cv::Mat& gray, int y0, int y1) {
  for (int y = y0; y < y1; ++y) {
    const cv::Vec3b* src = bgr.ptr<cv::Vec3b>(y);
    uint8_t* dst = gray.ptr<uint8_t>(y);
    for (int x = 0; x < bgr.cols; ++x) {
      dst[x] = static_cast<uint8_t>((src[x][0] + src[x][1] + src[x][2]) / 3);
    }
  }
}

uint8_t magnitude_at(const cv::Mat& gray, int x, int y) {
  const uint8_t* up = gray.ptr<uint8_t>(y - 1);
  const uint8_t* mid = gray.ptr<uint8_t>(y);
  const uint8_t* down = gray.ptr<uint8_t>(y + 1);

  const int gx = -up[x - 1] - 2 * mid[x - 1] - down[x - 1] + up[x + 1] + 2 * mid[x + 1] +
                 down[x + 1];
  const int gy = -up[x - 1] - 2 * up[x] - up[x + 1] + down[x - 1] + 2 * down[x] + down[x + 1];

  const long mag = std::lround(std::sqrt(static_cast<double>(gx * gx + gy * gy)));
  return static_cast<uint8_t>(std::clamp<long>(mag, 0, 255));
}

void magnitude_rows(const cv::Mat& gray, cv::Mat& out, int y0, int y1) {
  y0 = std::max(y0, 1);
  y1 = std::min(y1, gray.rows - 1);
  for (int y = y0; y < y1; ++y) {
    uint8_t* dst = out.ptr<uint8_t>(y);
    for (int x = 1; x < gray.cols - 1; ++x) {
      dst[x] = magnitude_at(gray, x, y);
    }
  }
}

}  // namespace sobel

EdgeProcessor::EdgeProcessor(std::string name, const ProcessingConfig& cfg,
                             MetricsCollector* metrics)
    : metrics_(metrics), name_(std::move(name)), cfg_(cfg) {}

ProcessOutput EdgeProcessor::process(const RawImage& image) {
  const auto t0 = Clock::now();
  ProcessOutput out;

  cv::Mat decoded;
  if (image && !image->empty()) {
    try {
      decoded = cv::imdecode(*image, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
      spdlog::debug("[{}] imdecode raised: {}", name_, e.what());
    }
  }

  if (decoded.empty()) {
    spdlog::warn("[{}] failed to decode image ({} bytes), passing through", name_,
                 image ? image->size() : 0);
    if (image) out.bytes = *image;
  } else {
    out.bytes = encode(sobel_magnitude(decoded));
  }

  out.duration_ns = duration_cast<nanoseconds>(Clock::now() - t0).count();
  report(out.duration_ns);
  return out;
}

Bytes EdgeProcessor::encode(const cv::Mat& magnitude) const {
  cv::Mat rgb;
  cv::cvtColor(magnitude, rgb, cv::COLOR_GRAY2BGR);
  Bytes buf;
  const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, cfg_.jpeg_quality};
  if (!cv::imencode(".jpg", rgb, buf, params)) {
    throw ProcessingError(name_ + ": JPEG encoding failed");
  }
  return buf;
}

ParallelEdgeProcessor::ParallelEdgeProcessor(const ProcessingConfig& cfg,
                                             MetricsCollector* metrics)
    : EdgeProcessor("parallel", cfg, metrics) {
  const size_t n = cfg.parallel_workers > 0 ? static_cast<size_t>(cfg.parallel_workers)
                                            : default_parallelism();
  pool_ = std::make_unique<WorkerPool>(n, "sobel-bands");
  spdlog::info("Parallel edge processor using {} row bands (CPU threads)", n);
}

ParallelEdgeProcessor::~ParallelEdgeProcessor() { shutdown(); }

void ParallelEdgeProcessor::shutdown() { pool_->shutdown(); }

template <typename Fn>
void ParallelEdgeProcessor::run_bands(int rows, Fn&& fn) {
  const int bands = static_cast<int>(std::min<size_t>(pool_->size(), std::max(rows, 1)));
  const int per_band = rows / bands;

  std::vector<std::future<void>> pending;
  pending.reserve(bands);
  for (int b = 0; b < bands; ++b) {
    const int y0 = b * per_band;
    const int y1 = (b == bands - 1) ? rows : y0 + per_band;
    pending.push_back(pool_->submit([&fn, y0, y1] { fn(y0, y1); }));
  }
  // Barrier: every band completes (or fails) before anything is returned.
  for (auto& f : pending) f.wait();
  for (auto& f : pending) f.get();
}

cv::Mat ParallelEdgeProcessor::sobel_magnitude(const cv::Mat& bgr) {
  cv::Mat gray(bgr.rows, bgr.cols, CV_8UC1);
  cv::Mat out = cv::Mat::zeros(bgr.rows, bgr.cols, CV_8UC1);

  run_bands(bgr.rows, [&](int y0, int y1) { sobel::grayscale_rows(bgr, gray, y0, y1); });
  // Bands read one row past each edge from the finished grayscale plane.
  run_bands(bgr.rows, [&](int y0, int y1) { sobel::magnitude_rows(gray, out, y0, y1); });
  return out;
}

void ParallelEdgeProcessor::report(int64_t duration_ns) {
  if (metrics_) metrics_->record_parallel_processing(duration_ns);
}

SequentialEdgeProcessor::SequentialEdgeProcessor(const ProcessingConfig& cfg,
                                                 MetricsCollector* metrics)
    : EdgeProcessor("sequential", cfg, metrics) {}

cv::Mat SequentialEdgeProcessor::sobel_magnitude(const cv::Mat& bgr) {
  cv::Mat gray(bgr.rows, bgr.cols, CV_8UC1);
  cv::Mat out = cv::Mat::zeros(bgr.rows, bgr.cols, CV_8UC1);
  sobel::grayscale_rows(bgr, gray, 0, bgr.rows);
  sobel::magnitude_rows(gray, out, 0, bgr.rows);
  return out;
}

void SequentialEdgeProcessor::report(int64_t duration_ns) {
  if (metrics_) metrics_->record_sequential_processing(duration_ns);
}
