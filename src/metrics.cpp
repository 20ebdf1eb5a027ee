#include "metrics.hpp"

#include <chrono>
#include <sstream>

#include "types.hpp"

namespace {

int64_t now_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch())
      .count();
}

}  // namespace

MetricsCollector::MetricsCollector() { start_ns_.store(now_ns()); }

void MetricsCollector::record_download(uint64_t bytes) {
  downloads_.fetch_add(1, std::memory_order_relaxed);
  bytes_.fetch_add(bytes, std::memory_order_relaxed);
}

void MetricsCollector::record_processing(int64_t duration_ns) {
  processing_ns_.fetch_add(duration_ns, std::memory_order_relaxed);
  frames_.fetch_add(1, std::memory_order_relaxed);

  const int64_t ms = duration_ns / 1'000'000;
  int64_t cur = min_latency_ms_.load(std::memory_order_relaxed);
  while (ms < cur && !min_latency_ms_.compare_exchange_weak(cur, ms, std::memory_order_relaxed)) {
  }
  cur = max_latency_ms_.load(std::memory_order_relaxed);
  while (ms > cur && !max_latency_ms_.compare_exchange_weak(cur, ms, std::memory_order_relaxed)) {
  }
}

void MetricsCollector::record_parallel_processing(int64_t duration_ns) {
  parallel_ns_.fetch_add(duration_ns, std::memory_order_relaxed);
}

void MetricsCollector::record_sequential_processing(int64_t duration_ns) {
  sequential_ns_.fetch_add(duration_ns, std::memory_order_relaxed);
}

double MetricsCollector::per_frame_ms(const std::atomic<int64_t>& total_ns) const {
  const auto frames = frames_.load(std::memory_order_relaxed);
  if (frames == 0) return 0.0;
  return static_cast<double>(total_ns.load(std::memory_order_relaxed)) /
         static_cast<double>(frames) / 1e6;
}

double MetricsCollector::average_latency_ms() const { return per_frame_ms(processing_ns_); }

double MetricsCollector::parallel_average_latency_ms() const { return per_frame_ms(parallel_ns_); }

double MetricsCollector::sequential_average_latency_ms() const {
  return per_frame_ms(sequential_ns_);
}

double MetricsCollector::speedup() const {
  const auto par = parallel_ns_.load(std::memory_order_relaxed);
  const auto seq = sequential_ns_.load(std::memory_order_relaxed);
  if (par == 0) return 1.0;
  return static_cast<double>(seq) / static_cast<double>(par);
}

double MetricsCollector::elapsed_secs() const {
  return static_cast<double>(now_ns() - start_ns_.load()) / 1e9;
}

double MetricsCollector::throughput_per_sec() const {
  const double secs = elapsed_secs();
  if (secs <= 0.0) return 0.0;
  return static_cast<double>(frames_.load(std::memory_order_relaxed)) / secs;
}

int64_t MetricsCollector::min_latency_ms() const {
  const auto v = min_latency_ms_.load(std::memory_order_relaxed);
  return v == kNoMin ? 0 : v;
}

int64_t MetricsCollector::max_latency_ms() const {
  return max_latency_ms_.load(std::memory_order_relaxed);
}

void MetricsCollector::reset() {
  downloads_.store(0);
  bytes_.store(0);
  frames_.store(0);
  processing_ns_.store(0);
  parallel_ns_.store(0);
  sequential_ns_.store(0);
  min_latency_ms_.store(kNoMin);
  max_latency_ms_.store(0);
  start_ns_.store(now_ns());
}

MetricsSnapshot MetricsCollector::snapshot() const {
  MetricsSnapshot s{};
  s.total_downloads = total_downloads();
  s.total_bytes = total_bytes();
  s.total_frames = total_frames();
  s.total_processing_ns = processing_ns_.load();
  s.parallel_processing_ns = parallel_ns_.load();
  s.sequential_processing_ns = sequential_ns_.load();
  s.min_latency_ms = min_latency_ms();
  s.max_latency_ms = max_latency_ms();
  s.avg_latency_ms = average_latency_ms();
  s.parallel_avg_latency_ms = parallel_average_latency_ms();
  s.sequential_avg_latency_ms = sequential_average_latency_ms();
  s.speedup = speedup();
  s.throughput_per_sec = throughput_per_sec();
  s.uptime_secs = elapsed_secs();
  return s;
}

std::string MetricsCollector::prometheus_text(const MetricsSnapshot& s) const {
  std::ostringstream os;
  os << "sunedge_downloads_total " << s.total_downloads << "\n";
  os << "sunedge_downloaded_bytes_total " << s.total_bytes << "\n";
  os << "sunedge_frames_processed_total " << s.total_frames << "\n";

  os << "sunedge_frame_latency_ms{path=\"total\"} " << s.avg_latency_ms << "\n";
  os << "sunedge_frame_latency_ms{path=\"parallel\"} " << s.parallel_avg_latency_ms << "\n";
  os << "sunedge_frame_latency_ms{path=\"sequential\"} " << s.sequential_avg_latency_ms << "\n";
  os << "sunedge_frame_latency_min_ms " << s.min_latency_ms << "\n";
  os << "sunedge_frame_latency_max_ms " << s.max_latency_ms << "\n";

  os << "sunedge_speedup_ratio " << s.speedup << "\n";
  os << "sunedge_throughput_fps " << s.throughput_per_sec << "\n";
  return os.str();
}
