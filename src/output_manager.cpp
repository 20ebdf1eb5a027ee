#include "output_manager.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <filesystem>

OutputManager::OutputManager(const OutputConfig& config, const MetricsCollector& metrics)
    : config_(config), metrics_(metrics), csv_header_written_(false), cleaned_up_(false) {
  // Set logging level
  if (config_.log_level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (config_.log_level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (config_.log_level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (config_.log_level == "error") {
    spdlog::set_level(spdlog::level::err);
  }

  stats_.reset();

  if (config_.enable_csv_logging) {
    initializeCSV();
  }

  if (!config_.verbose_logging) {
    spdlog::info("Verbose logging disabled - performance summaries every {}s",
                 config_.performance_summary_interval);
  }
}

OutputManager::~OutputManager() { cleanup(); }

void OutputManager::cleanup() {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (cleaned_up_) return;
    cleaned_up_ = true;
  }
  closeCSV();
  logPerformanceSummary(true);
}

void OutputManager::processFrame(uint64_t frame_id, const ProcessedResult& result,
                                 const std::vector<FlareEvent>& flares) {
  {
    std::lock_guard<std::mutex> g(mu_);
    stats_.total_frames++;
    if (!flares.empty()) stats_.frames_with_flares++;
    stats_.flare_events += flares.size();
    for (const auto& f : flares) {
      stats_.largest_flare = std::max<uint64_t>(stats_.largest_flare, f.size);
    }
    latest_flares_ = flares;
  }

  if (config_.enable_csv_logging) {
    writeCSVRow(frame_id, result, flares.size());
  }

  if (config_.verbose_logging) {
    logFrameInfo(frame_id, result, flares);
  } else {
    for (const auto& f : flares) {
      spdlog::info("Frame {}: {}", frame_id, f.to_string());
    }
    logPerformanceSummary();
  }
}

void OutputManager::logFrameInfo(uint64_t frame_id, const ProcessedResult& result,
                                 const std::vector<FlareEvent>& flares) {
  std::string flare_info = "";
  if (!flares.empty()) {
    const auto biggest = std::max_element(
        flares.begin(), flares.end(),
        [](const FlareEvent& a, const FlareEvent& b) { return a.size < b.size; });
    flare_info = fmt::format(" | flares={} largest=({},{}) size={}", flares.size(), biggest->x,
                             biggest->y, biggest->size);
  }

  spdlog::info(
      "frame_id={} parallel_ms={:.2f} sequential_ms={:.2f} speedup={:.1f}x size_kb={}{}",
      frame_id, result.parallel_duration_ns() / 1e6, result.sequential_duration_ns() / 1e6,
      result.speedup(), result.original_size_bytes() / 1024, flare_info);
}

void OutputManager::logPerformanceSummary(bool force) {
  auto now = std::chrono::steady_clock::now();
  PerformanceStats st;
  {
    std::lock_guard<std::mutex> g(mu_);
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - stats_.last_summary);
    if (!force && duration.count() < config_.performance_summary_interval) {
      return;
    }
    stats_.last_summary = now;
    st = stats_;
  }

  const MetricsSnapshot m = metrics_.snapshot();
  spdlog::info("=== PERFORMANCE SUMMARY ===");
  spdlog::info("Frames processed: {}", m.total_frames);
  spdlog::info("Data downloaded: {:.2f} MB in {} downloads",
               static_cast<double>(m.total_bytes) / 1024.0 / 1024.0, m.total_downloads);
  spdlog::info("Parallel average latency: {:.2f}ms", m.parallel_avg_latency_ms);
  spdlog::info("Sequential average latency: {:.2f}ms", m.sequential_avg_latency_ms);
  spdlog::info("Frame latency min/avg/max: {}/{:.2f}/{}ms", m.min_latency_ms, m.avg_latency_ms,
               m.max_latency_ms);
  spdlog::info("Overall speedup: {:.1f}x", m.speedup);
  spdlog::info("Throughput: {:.2f} frames/sec", m.throughput_per_sec);
  spdlog::info("Frames with flares: {}/{} ({:.1f}%), {} events, largest {} px",
               st.frames_with_flares, st.total_frames, st.getFlareFrameRate(), st.flare_events,
               st.largest_flare);
}

void OutputManager::ensureOutputDirectory() {
  std::filesystem::path csv_path(config_.csv_output_path);
  std::filesystem::path directory = csv_path.parent_path();

  if (!directory.empty() && !std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
    spdlog::info("Created CSV output directory: {}", directory.string());
  }
}

void OutputManager::initializeCSV() {
  if (!config_.enable_csv_logging) return;

  ensureOutputDirectory();

  csv_file_.open(config_.csv_output_path, std::ios::out | std::ios::trunc);
  if (!csv_file_.is_open()) {
    spdlog::error("Failed to open CSV file for writing: {}", config_.csv_output_path);
    return;
  }

  writeCSVHeader();
  csv_header_written_ = true;

  spdlog::info("CSV logging initialized: {}", config_.csv_output_path);
}

void OutputManager::writeCSVHeader() {
  if (!csv_file_.is_open()) return;
  csv_file_ << "frame_id,parallel_ms,sequential_ms,speedup,original_bytes,output_bytes,"
               "flare_count\n";
  csv_file_.flush();
}

void OutputManager::writeCSVRow(uint64_t frame_id, const ProcessedResult& result,
                                size_t flare_count) {
  std::lock_guard<std::mutex> g(mu_);
  if (!csv_file_.is_open() || !csv_header_written_) return;

  csv_file_ << fmt::format("{},{:.3f},{:.3f},{:.3f},{},{},{}\n", frame_id,
                           result.parallel_duration_ns() / 1e6,
                           result.sequential_duration_ns() / 1e6, result.speedup(),
                           result.original_size_bytes(), result.data().size(), flare_count);
  csv_file_.flush();
}

void OutputManager::closeCSV() {
  std::lock_guard<std::mutex> g(mu_);
  if (csv_file_.is_open()) {
    csv_file_.close();
    if (config_.enable_csv_logging) {
      spdlog::info("CSV logging completed: {}", config_.csv_output_path);
    }
  }
}

PerformanceStats OutputManager::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  return stats_;
}

std::vector<FlareEvent> OutputManager::latestFlares() const {
  std::lock_guard<std::mutex> g(mu_);
  return latest_flares_;
}
