#pragma once
#include <atomic>
#include <cstdint>
#include <limits>
#include <string>

struct MetricsSnapshot {
  uint64_t total_downloads{0};
  uint64_t total_bytes{0};
  uint64_t total_frames{0};
  int64_t total_processing_ns{0};
  int64_t parallel_processing_ns{0};
  int64_t sequential_processing_ns{0};
  int64_t min_latency_ms{0};
  int64_t max_latency_ms{0};
  double avg_latency_ms{0};
  double parallel_avg_latency_ms{0};
  double sequential_avg_latency_ms{0};
  double speedup{1.0};
  double throughput_per_sec{0};
  double uptime_secs{0};
};

// Lock-free counters shared by the fetcher, both processors and the pipeline.
// Each field is updated by a single atomic operation; readers may see one field
// ahead of a sibling, never a torn value.
class MetricsCollector {
public:
  MetricsCollector();

  void record_download(uint64_t bytes);
  // Total per-frame wall-clock time, dispatch to join.
  void record_processing(int64_t duration_ns);
  void record_parallel_processing(int64_t duration_ns);
  void record_sequential_processing(int64_t duration_ns);

  double average_latency_ms() const;
  double parallel_average_latency_ms() const;
  double sequential_average_latency_ms() const;
  double speedup() const;
  double throughput_per_sec() const;

  // Whole milliseconds, truncated. 0 until a frame is recorded.
  int64_t min_latency_ms() const;
  int64_t max_latency_ms() const;

  uint64_t total_downloads() const { return downloads_.load(std::memory_order_relaxed); }
  uint64_t total_bytes() const { return bytes_.load(std::memory_order_relaxed); }
  uint64_t total_frames() const { return frames_.load(std::memory_order_relaxed); }

  void reset();

  MetricsSnapshot snapshot() const;
  std::string prometheus_text(const MetricsSnapshot& s) const;

private:
  static constexpr int64_t kNoMin = std::numeric_limits<int64_t>::max();

  double per_frame_ms(const std::atomic<int64_t>& total_ns) const;
  double elapsed_secs() const;

  std::atomic<uint64_t> downloads_{0};
  std::atomic<uint64_t> bytes_{0};
  std::atomic<uint64_t> frames_{0};
  std::atomic<int64_t> processing_ns_{0};
  std::atomic<int64_t> parallel_ns_{0};
  std::atomic<int64_t> sequential_ns_{0};
  std::atomic<int64_t> min_latency_ms_{kNoMin};
  std::atomic<int64_t> max_latency_ms_{0};
  std::atomic<int64_t> start_ns_{0};
};
