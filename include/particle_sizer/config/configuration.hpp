#pragma once

#include "particle_sizer/core/types.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace particle_sizer::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  std::string mode = "production"; // production | test
};

struct CalibrationConfig {
  bool enabled = false;            // scale-bar calibration; otherwise pixel_size
  Rect selection;                  // scale-bar selection in image pixels
  double physical_length = 100.0;  // scale-bar length in `unit`
  std::string unit = "nm";
  double pixel_size = 1.0;         // used directly when calibration is disabled
  bool use_fits_scale = true;      // FITS input: SCALE keyword replaces pixel_size
};

struct ThresholdConfig {
  float level = 0.5f;              // foreground iff intensity < level
  bool seed_growing = false;       // hole repair (slow)
};

struct MarkersConfig {
  double quantile = 0.9;
};

struct BorderConfig {
  int width = 10;
};

struct SizeWindowConfig {
  double min = 0.0;
  double max = 20.0;
  int histogram_bins = 100;
};

struct DistanceConfig {
  int histogram_bins = 50;
};

struct OutputConfig {
  std::string results_file = "results.json";
  bool write_debug_images = true;
  bool write_fits_artifacts = false;
};

struct Config {
  PipelineConfig pipeline;
  CalibrationConfig calibration;
  ThresholdConfig threshold;
  MarkersConfig markers;
  BorderConfig border;
  SizeWindowConfig size_window;
  DistanceConfig distance;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace particle_sizer::config
