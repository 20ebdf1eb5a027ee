#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "metrics.hpp"
#include "output_manager.hpp"
#include "pipeline.hpp"
#include "region_detector.hpp"
#include "util.hpp"

namespace {

// Downstream consumer: flare analysis plus per-frame reporting. Runs until the
// stream closes, `max_frames` results have been seen (0 = unlimited) or the
// deadline passes.
void consume(Subscription<ProcessedResultPtr>& sub, const RegionDetector& detector,
             OutputManager& output, uint64_t max_frames, std::atomic<uint64_t>& seen,
             TimePoint deadline = TimePoint::max()) {
  while (!sub.closed()) {
    if (Clock::now() >= deadline) {
      spdlog::warn("Timeout waiting for images ({} received)", seen.load());
      break;
    }
    auto next = sub.next(std::chrono::seconds(1));
    if (!next) continue;
    const ProcessedResult& r = **next;
    const Bytes& frame = r.sequential_output() ? *r.sequential_output() : r.data();
    const auto flares = detector.detect(frame);
    const uint64_t frame_id = seen.fetch_add(1) + 1;
    output.processFrame(frame_id, r, flares);
    if (max_frames > 0 && frame_id >= max_frames) break;
  }
}

nlohmann::json stats_json(const MetricsSnapshot& s, const Pipeline& pipe) {
  return nlohmann::json{{"state", to_string(pipe.state())},
                        {"frames", pipe.frame_count()},
                        {"downloads", s.total_downloads},
                        {"bytes", s.total_bytes},
                        {"avg_latency_ms", s.avg_latency_ms},
                        {"parallel_avg_latency_ms", s.parallel_avg_latency_ms},
                        {"sequential_avg_latency_ms", s.sequential_avg_latency_ms},
                        {"min_latency_ms", s.min_latency_ms},
                        {"max_latency_ms", s.max_latency_ms},
                        {"speedup", s.speedup},
                        {"throughput_fps", s.throughput_per_sec}};
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"SunEdge-RT: periodic solar image edge detection and flare analysis"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  uint64_t frames = 0;
  cli_app.add_option("-n,--frames", frames,
                     "Process this many frames, print final statistics and exit (no HTTP server)");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "SunEdge-RT v1.0.0" << std::endl;
    std::cout << "Parallel vs sequential Sobel comparison on live SOHO imagery" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("SunEdge-RT starting (config: {})", cfg_path);
  spdlog::info("Available processors: {}", std::thread::hardware_concurrency());

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config '{}': {}", cfg_path, e.what());
    return 1;
  }

  MetricsCollector metrics;
  Pipeline pipe(app.pipeline, metrics);
  OutputManager output(app.output_config, metrics);
  RegionDetector detector(app.detector);

  auto sub = pipe.subscribe();
  std::atomic<uint64_t> seen{0};

  if (frames > 0) {
    spdlog::info("Will process {} images and show performance comparison", frames);
    pipe.start();
    consume(sub, detector, output, frames, seen, Clock::now() + std::chrono::minutes(2));
    pipe.stop();
    output.cleanup();
    return seen.load() >= frames ? 0 : 1;
  }

  std::thread consumer([&] { consume(sub, detector, output, 0, seen); });

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(std::string("{\"ready\":") + (pipe.running() ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Post("/pipeline/stop", [&](const httplib::Request&, httplib::Response& res) {
    pipe.stop();
    res.set_content("{\"stopped\":true}", "application/json");
    svr.stop();
  });

  svr.Get("/pipeline/stats", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(stats_json(pipe.metrics_snapshot(), pipe).dump(2), "application/json");
  });

  svr.Get("/pipeline/flares", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& f : output.latestFlares()) {
      j.push_back({{"x", f.x}, {"y", f.y}, {"size", f.size}, {"intensity", f.intensity}});
    }
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(metrics.prometheus_text(pipe.metrics_snapshot()), "text/plain; version=0.0.4");
  });

  pipe.start();

  spdlog::info("HTTP server listening on 0.0.0.0:{}", app.metrics_port);
  if (!svr.listen("0.0.0.0", app.metrics_port)) {
    spdlog::error("HTTP server could not listen on port {}", app.metrics_port);
  }

  // Cleanup
  pipe.stop();
  consumer.join();
  output.cleanup();
  spdlog::info("Shutdown complete.");
  return 0;
}
