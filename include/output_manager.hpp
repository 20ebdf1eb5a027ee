#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

#include "metrics.hpp"
#include "types.hpp"

struct OutputConfig {
  // Logging settings
  bool verbose_logging = false;
  std::string log_level = "info";
  int performance_summary_interval = 30;  // seconds

  // CSV logging settings
  bool enable_csv_logging = true;
  std::string csv_output_path = "output/frame_log.csv";
};

struct PerformanceStats {
  uint64_t total_frames = 0;
  uint64_t frames_with_flares = 0;
  uint64_t flare_events = 0;
  uint64_t largest_flare = 0;

  std::chrono::steady_clock::time_point start_time;
  std::chrono::steady_clock::time_point last_summary;

  void reset() {
    total_frames = 0;
    frames_with_flares = 0;
    flare_events = 0;
    largest_flare = 0;
    start_time = std::chrono::steady_clock::now();
    last_summary = start_time;
  }

  double getFlareFrameRate() const {
    return total_frames > 0
               ? static_cast<double>(frames_with_flares) / static_cast<double>(total_frames) * 100.0
               : 0.0;
  }
};

// Per-frame reporting for a consumer of the result stream: one log line per frame
// (verbose mode), an optional CSV row, and a periodic performance summary.
class OutputManager {
public:
  OutputManager(const OutputConfig& config, const MetricsCollector& metrics);
  ~OutputManager();

  void cleanup();

  void processFrame(uint64_t frame_id, const ProcessedResult& result,
                    const std::vector<FlareEvent>& flares);

  void logFrameInfo(uint64_t frame_id, const ProcessedResult& result,
                    const std::vector<FlareEvent>& flares);

  // Rate-limited by performance_summary_interval unless forced.
  void logPerformanceSummary(bool force = false);

  // CSV logging methods
  void initializeCSV();
  void writeCSVHeader();
  void writeCSVRow(uint64_t frame_id, const ProcessedResult& result, size_t flare_count);
  void closeCSV();

  PerformanceStats stats() const;
  std::vector<FlareEvent> latestFlares() const;

private:
  void ensureOutputDirectory();

  OutputConfig config_;
  const MetricsCollector& metrics_;
  PerformanceStats stats_;
  std::vector<FlareEvent> latest_flares_;
  mutable std::mutex mu_;

  std::ofstream csv_file_;
  bool csv_header_written_;
  bool cleaned_up_;
};
