#pragma once

#include "particle_sizer/config/configuration.hpp"
#include "particle_sizer/core/events.hpp"
#include "particle_sizer/io/fits_io.hpp"
#include "particle_sizer/pipeline/session.hpp"

#include <filesystem>
#include <optional>
#include <string>

int run_pipeline_command(const std::string &config_path,
                         const std::string &image_path,
                         const std::string &out_dir,
                         const std::string &run_id_override);

// Pixel size taken from the input FITS header instead of calibration.pixel_size;
// empty when calibration is enabled, use_fits_scale is off or SCALE is missing
std::optional<double>
header_pixel_size(const particle_sizer::config::Config &cfg,
                  const particle_sizer::io::FitsHeader &header);

// Segment table, sizes, fit and histograms of a finished session
particle_sizer::core::json
build_results(particle_sizer::pipeline::PipelineSession &session,
              const particle_sizer::config::Config &cfg);

// Debug PNGs and, when enabled, FITS artifacts of every computed stage
void write_artifacts(particle_sizer::pipeline::PipelineSession &session,
                     const particle_sizer::config::Config &cfg,
                     const std::filesystem::path &artifacts_dir);
