#include "util.hpp"

#include <yaml-cpp/yaml.h>

namespace {

Millis as_millis(const YAML::Node& n) { return Millis(n.as<int64_t>()); }

}  // namespace

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["source"]) {
    auto s = y["source"];
    if (s["primary_url"]) c.pipeline.primary_url = s["primary_url"].as<std::string>();
    if (s["fallback_url"]) c.pipeline.fallback_url = s["fallback_url"].as<std::string>();
  }
  if (y["pipeline"]) {
    auto p = y["pipeline"];
    if (p["interval_ms"]) c.pipeline.interval = as_millis(p["interval_ms"]);
    if (p["fetch_timeout_ms"]) c.pipeline.fetch_timeout = as_millis(p["fetch_timeout_ms"]);
    if (p["subscriber_queue_capacity"])
      c.pipeline.subscriber_queue_capacity = p["subscriber_queue_capacity"].as<size_t>();
    if (p["log_every_n_frames"]) c.pipeline.log_every_n_frames = p["log_every_n_frames"].as<int>();
  }
  if (y["pool"]) {
    auto n = y["pool"];
    if (n["max_connections"]) c.pipeline.pool.max_connections = n["max_connections"].as<size_t>();
    if (n["max_idle_ms"]) c.pipeline.pool.max_idle = as_millis(n["max_idle_ms"]);
    if (n["max_lifetime_ms"]) c.pipeline.pool.max_lifetime = as_millis(n["max_lifetime_ms"]);
    if (n["max_pending_acquires"])
      c.pipeline.pool.max_pending_acquires = n["max_pending_acquires"].as<size_t>();
    if (n["evict_interval_ms"]) c.pipeline.pool.evict_interval = as_millis(n["evict_interval_ms"]);
  }
  if (y["processing"]) {
    auto n = y["processing"];
    if (n["jpeg_quality"]) c.pipeline.processing.jpeg_quality = n["jpeg_quality"].as<int>();
    if (n["parallel_workers"])
      c.pipeline.processing.parallel_workers = n["parallel_workers"].as<int>();
  }
  if (y["detector"]) {
    auto n = y["detector"];
    if (n["brightness_threshold"])
      c.detector.brightness_threshold = n["brightness_threshold"].as<int>();
    if (n["min_region_size"]) c.detector.min_region_size = n["min_region_size"].as<int>();
  }
  if (y["telemetry"] && y["telemetry"]["metrics_port"])
    c.metrics_port = y["telemetry"]["metrics_port"].as<int>();

  // Load Output configuration
  if (y["output"]) {
    auto output = y["output"];

    // Logging settings
    if (output["logging"]) {
      auto logging = output["logging"];
      if (logging["verbose_logging"])
        c.output_config.verbose_logging = logging["verbose_logging"].as<bool>();
      if (logging["log_level"]) c.output_config.log_level = logging["log_level"].as<std::string>();
      if (logging["performance_summary_interval"])
        c.output_config.performance_summary_interval =
            logging["performance_summary_interval"].as<int>();
    }

    // CSV logging settings
    if (output["csv"]) {
      auto csv = output["csv"];
      if (csv["enable_csv_logging"])
        c.output_config.enable_csv_logging = csv["enable_csv_logging"].as<bool>();
      if (csv["csv_output_path"])
        c.output_config.csv_output_path = csv["csv_output_path"].as<std::string>();
    }
  }

  return c;
}
