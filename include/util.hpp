#pragma once
#include <string>

#include "output_manager.hpp"
#include "pipeline.hpp"
#include "region_detector.hpp"
#include "types.hpp"

struct AppConfig {
  PipelineConfig pipeline;
  RegionDetectorConfig detector;
  OutputConfig output_config;
  int metrics_port{9090};
};

AppConfig load_config(const std::string& path);
