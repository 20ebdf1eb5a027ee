#pragma once

#include <memory>
#include <string>

#include <opencv2/opencv.hpp>

#include "metrics.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

struct ProcessingConfig {
  int jpeg_quality{95};
  int parallel_workers{0};  // 0 = hardware concurrency
};

// Sobel edge magnitude shared by both variants. All functions work on whole rows
// in [y0, y1) so a caller can split the image into bands.
namespace sobel {

// gray(y, x) = (R + G + B) / 3 for a CV_8UC3 BGR image.
void grayscale_rows(const cv::Mat& bgr, cv::Mat& gray, int y0, int y1);

// Writes magnitudes for interior rows of [y0, y1). Reads rows y-1 and y+1 of `gray`,
// so `gray` must be complete for those rows before this runs.
void magnitude_rows(const cv::Mat& gray, cv::Mat& out, int y0, int y1);

uint8_t magnitude_at(const cv::Mat& gray, int x, int y);

}  // namespace sobel

// Decodes an encoded image, computes the Sobel magnitude and re-encodes it as JPEG.
// Undecodable input is returned unchanged.
class EdgeProcessor {
public:
  EdgeProcessor(std::string name, const ProcessingConfig& cfg, MetricsCollector* metrics);
  virtual ~EdgeProcessor() = default;

  ProcessOutput process(const RawImage& image);

  // Single-channel magnitude plane (border rows/cols are 0). No codec involved.
  virtual cv::Mat sobel_magnitude(const cv::Mat& bgr) = 0;

  virtual void shutdown() {}

  const std::string& name() const { return name_; }

protected:
  virtual void report(int64_t duration_ns) = 0;

  MetricsCollector* metrics_;

private:
  Bytes encode(const cv::Mat& magnitude) const;

  std::string name_;
  ProcessingConfig cfg_;
};

// Splits rows into one contiguous band per worker thread.
class ParallelEdgeProcessor : public EdgeProcessor {
public:
  explicit ParallelEdgeProcessor(const ProcessingConfig& cfg = {},
                                 MetricsCollector* metrics = nullptr);
  ~ParallelEdgeProcessor() override;

  cv::Mat sobel_magnitude(const cv::Mat& bgr) override;
  void shutdown() override;

  size_t workers() const { return pool_->size(); }

protected:
  void report(int64_t duration_ns) override;

private:
  template <typename Fn>
  void run_bands(int rows, Fn&& fn);

  std::unique_ptr<WorkerPool> pool_;
};

// Single-threaded baseline.
class SequentialEdgeProcessor : public EdgeProcessor {
public:
  explicit SequentialEdgeProcessor(const ProcessingConfig& cfg = {},
                                   MetricsCollector* metrics = nullptr);

  cv::Mat sobel_magnitude(const cv::Mat& bgr) override;

protected:
  void report(int64_t duration_ns) override;
};
