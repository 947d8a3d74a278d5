#include "runner_pipeline.hpp"

#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/types.hpp"
#include "particle_sizer/core/utils.hpp"
#include "particle_sizer/io/fits_io.hpp"
#include "particle_sizer/io/image_io.hpp"
#include "particle_sizer/segmentation/segments.hpp"
#include "particle_sizer/statistics/size_estimation.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using particle_sizer::Histogram;
using particle_sizer::Label2D;
using particle_sizer::Matrix2Df;
using particle_sizer::ParticleSizerError;
using particle_sizer::Phase;
using particle_sizer::core::json;

namespace config = particle_sizer::config;
namespace core = particle_sizer::core;
namespace io = particle_sizer::io;
namespace pipeline = particle_sizer::pipeline;
namespace segmentation = particle_sizer::segmentation;
namespace statistics = particle_sizer::statistics;

json histogram_json(const Histogram &h) {
  return {{"lo", h.lo}, {"hi", h.hi}, {"edges", h.edges}, {"values", h.values}};
}

Matrix2Df labels_as_float(const Label2D &labels) {
  return labels.cast<float>();
}

} // namespace

std::optional<double> header_pixel_size(const config::Config &cfg,
                                        const io::FitsHeader &header) {
  if (cfg.calibration.enabled || !cfg.calibration.use_fits_scale) {
    return std::nullopt;
  }
  return io::fits_pixel_scale(header);
}

json build_results(pipeline::PipelineSession &session, const config::Config &cfg) {
  const double scale = session.scale_factor();
  const std::string &unit = cfg.calibration.unit;

  json results;
  results["image_size"] = {{"rows", session.image().rows()},
                           {"cols", session.image().cols()}};

  json scale_json = {{"factor", scale}, {"unit", unit}};
  if (const auto *cal = session.calibration()) {
    scale_json["source"] = "scale_bar";
    scale_json["physical_length"] = cal->physical_length;
    scale_json["min_col"] = cal->min_col;
    scale_json["max_col"] = cal->max_col;
    scale_json["bar_intensity"] = cal->bar_intensity;
  } else {
    scale_json["source"] = "pixel_size";
  }
  results["scale"] = scale_json;

  results["parameters"] = {{"threshold", session.threshold_level()},
                           {"seed_growing", session.repair()},
                           {"quantile", session.marker_quantile()},
                           {"border_width", session.border_margin()},
                           {"size_min", session.min_size()},
                           {"size_max", session.max_size()}};

  const Matrix2Df &dist = session.distance();
  std::vector<double> physical(static_cast<size_t>(dist.size()));
  for (Eigen::Index i = 0; i < dist.size(); ++i) {
    physical[static_cast<size_t>(i)] = static_cast<double>(dist.data()[i]) * scale;
  }
  results["distance"] = {
      {"max", dist.maxCoeff() * scale},
      {"marker_threshold", session.marker_threshold() * scale},
      {"histogram",
       histogram_json(statistics::histogram(physical, cfg.distance.histogram_bins, false))}};

  const auto &sizes = session.sizes();
  const auto &removed = session.border_removed();
  std::set<int32_t> border_set(removed.begin(), removed.end());
  std::set<int32_t> kept_set;
  for (const auto &s : sizes.samples) kept_set.insert(s.label);

  json segments = json::array();
  for (const auto &seg : segmentation::segment_stats(session.labels())) {
    const double size = std::sqrt(static_cast<double>(seg.pixel_count)) * scale;
    segments.push_back({{"label", seg.label},
                        {"pixel_count", seg.pixel_count},
                        {"min_row", seg.min_row},
                        {"max_row", seg.max_row},
                        {"min_col", seg.min_col},
                        {"max_col", seg.max_col},
                        {"size", size},
                        {"border", border_set.count(seg.label) > 0},
                        {"kept", kept_set.count(seg.label) > 0}});
  }
  results["segments"] = segments;

  const std::vector<double> kept = statistics::sizes_of(sizes.samples);
  results["sizes"] = kept;
  results["fit"] = {{"mean", sizes.fit.mean},
                    {"stddev", sizes.fit.stddev},
                    {"n", sizes.fit.n}};
  results["summary"] = statistics::format_summary(sizes.fit, unit);

  const Histogram size_hist =
      statistics::histogram(kept, cfg.size_window.histogram_bins, true);
  std::vector<double> fitted_pdf;
  fitted_pdf.reserve(size_hist.values.size());
  for (size_t i = 0; i + 1 < size_hist.edges.size(); ++i) {
    const double center = 0.5 * (size_hist.edges[i] + size_hist.edges[i + 1]);
    fitted_pdf.push_back(statistics::normal_pdf(center, sizes.fit.mean, sizes.fit.stddev));
  }
  results["size_histogram"] = histogram_json(size_hist);
  results["fitted_pdf"] = fitted_pdf;

  return results;
}

void write_artifacts(pipeline::PipelineSession &session, const config::Config &cfg,
                     const fs::path &artifacts_dir) {
  const bool test_mode = cfg.pipeline.mode == "test";

  if (cfg.output.write_debug_images || test_mode) {
    if (const auto *cal = session.calibration()) {
      io::write_mask_png(artifacts_dir / "scale_bar.png", cal->bar_mask);
    }
    io::write_mask_png(artifacts_dir / "mask.png", session.mask());
    io::write_distance_png(artifacts_dir / "distance.png", session.distance());
    io::write_labels_png(artifacts_dir / "markers.png", session.markers());
    io::write_labels_png(artifacts_dir / "labels.png", session.labels());
    io::write_labels_png(artifacts_dir / "labels_filtered.png", session.filtered_labels());
  }

  if (cfg.output.write_fits_artifacts || test_mode) {
    io::FitsHeader header;
    header.set("SCALE", session.scale_factor());
    header.set("BUNIT", cfg.calibration.unit);
    header.set("THRESH", static_cast<double>(session.threshold_level()));
    header.set("QUANTILE", session.marker_quantile());
    header.set("BORDER", session.border_margin());

    io::write_fits_float(artifacts_dir / "distance.fits", session.distance(), header);
    io::write_fits_float(artifacts_dir / "labels.fits",
                         labels_as_float(session.filtered_labels()), header);
  }
}

int run_pipeline_command(const std::string &config_path,
                         const std::string &image_path,
                         const std::string &out_dir,
                         const std::string &run_id_override) {
  fs::path cfg_path(config_path);
  fs::path img_path(image_path);

  if (!fs::exists(img_path)) {
    std::cerr << "Error: Image not found: " << image_path << std::endl;
    return 1;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(cfg_path);
    cfg.validate();
  } catch (const ParticleSizerError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::string run_id = run_id_override.empty() ? core::get_run_id() : run_id_override;
  fs::path run_dir = fs::absolute(fs::path(out_dir) / run_id);
  fs::create_directories(run_dir / "logs");
  fs::create_directories(run_dir / "outputs");
  fs::create_directories(run_dir / "artifacts");

  try {
    cfg.save(run_dir / "config.yaml");
  } catch (const ParticleSizerError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl",
                               std::ios::out | std::ios::trunc);
  if (!event_log_file.is_open()) {
    std::cerr << "Error: cannot open events log file: "
              << (run_dir / "logs" / "run_events.jsonl") << std::endl;
    return 1;
  }

  core::EventEmitter emitter(run_id, std::cout, &event_log_file);

  std::string image_sha, config_sha;
  try {
    image_sha = core::sha256_file(img_path);
    config_sha = core::sha256_file(cfg_path);
  } catch (const ParticleSizerError &e) {
    emitter.error(e.what());
    emitter.run_end(false, "error");
    return 1;
  }

  emitter.run_start({{"config_path", config_path},
                     {"config_sha256", config_sha},
                     {"image_path", image_path},
                     {"image_sha256", image_sha},
                     {"run_dir", run_dir.string()},
                     {"mode", cfg.pipeline.mode}});

  pipeline::PipelineSession session;
  io::FitsHeader fits_header;
  try {
    session.set_image(io::load_grayscale(img_path, &fits_header));
  } catch (const ParticleSizerError &e) {
    emitter.error(e.what());
    emitter.run_end(false, "error");
    return 1;
  }
  session.apply_config(cfg);
  if (auto pixel_size = header_pixel_size(cfg, fits_header)) {
    session.set_pixel_size(*pixel_size);
    emitter.warning("pixel size " + std::to_string(*pixel_size) + " " +
                    cfg.calibration.unit +
                    " taken from FITS SCALE keyword, calibration.pixel_size ignored");
  }
  session.set_progress_callback([&emitter](Phase phase, float p) {
    emitter.phase_progress(phase, p, "region growing");
  });

  // Each phase forces its artifact; the session caches it for the next one
  auto run_phase = [&](Phase phase, auto &&fn) -> bool {
    emitter.phase_start(phase);
    try {
      json extra = fn();
      emitter.phase_end(phase, "ok", extra);
      return true;
    } catch (const ParticleSizerError &e) {
      emitter.error(e.what(), phase);
      emitter.phase_end(phase, "error", {{"error", e.what()}});
      return false;
    }
  };

  const bool ok =
      run_phase(Phase::CALIBRATION,
                [&] {
                  const double scale = session.scale_factor();
                  return json{{"scale_factor", scale},
                              {"unit", cfg.calibration.unit},
                              {"from_scale_bar", session.calibration() != nullptr}};
                }) &&
      run_phase(Phase::BINARIZE,
                [&] {
                  const auto &mask = session.mask();
                  return json{{"foreground_pixels", static_cast<int64_t>(mask.cast<int64_t>().sum())},
                              {"seed_growing", session.repair()}};
                }) &&
      run_phase(Phase::DISTANCE_FIELD,
                [&] {
                  return json{{"max_distance", session.distance().maxCoeff()}};
                }) &&
      run_phase(Phase::MARKERS,
                [&] {
                  const auto &markers = session.markers();
                  return json{{"marker_threshold", session.marker_threshold()},
                              {"markers", markers.size() > 0 ? markers.maxCoeff() : 0}};
                }) &&
      run_phase(Phase::WATERSHED,
                [&] {
                  const auto segs = segmentation::segment_stats(session.labels());
                  return json{{"segments", segs.size()}};
                }) &&
      run_phase(Phase::BORDER_FILTER,
                [&] {
                  session.filtered_labels();
                  return json{{"removed", session.border_removed().size()}};
                }) &&
      run_phase(Phase::SIZE_ESTIMATION, [&] {
        const auto &sizes = session.sizes();
        if (!sizes.rejected.empty()) {
          emitter.warning(std::to_string(sizes.rejected.size()) +
                          " segment(s) outside the size window");
        }
        return json{{"kept", sizes.samples.size()},
                    {"rejected", sizes.rejected.size()},
                    {"mean", sizes.fit.mean},
                    {"stddev", sizes.fit.stddev}};
      });

  if (!ok) {
    emitter.run_end(false, "error");
    return 1;
  }

  try {
    json results = build_results(session, cfg);
    results["run_id"] = run_id;
    results["image"] = image_path;
    results["image_sha256"] = image_sha;
    core::write_text(run_dir / "outputs" / cfg.output.results_file, results.dump(2));

    write_artifacts(session, cfg, run_dir / "artifacts");
    std::cout << results["summary"].get<std::string>() << std::endl;
  } catch (const ParticleSizerError &e) {
    emitter.error(e.what());
    emitter.run_end(false, "error");
    return 1;
  }

  emitter.run_end(true, "ok");
  return 0;
}
