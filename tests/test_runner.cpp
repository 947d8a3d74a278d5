#include "runner_pipeline.hpp"

#include "particle_sizer/io/fits_io.hpp"

#include <cmath>
#include <filesystem>
#include <sstream>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

using particle_sizer::Matrix2Df;
using particle_sizer::config::Config;
using particle_sizer::io::FitsHeader;
using particle_sizer::pipeline::PipelineSession;

namespace {

Matrix2Df disk_image() {
    Matrix2Df img = Matrix2Df::Ones(100, 100);
    for (int r = 0; r < 100; ++r) {
        for (int c = 0; c < 100; ++c) {
            if ((r - 50) * (r - 50) + (c - 50) * (c - 50) <= 100) img(r, c) = 0.0f;
        }
    }
    return img;
}

double sum_of(const particle_sizer::core::json& values) {
    double s = 0.0;
    for (const auto& v : values) s += v.get<double>();
    return s;
}

} // namespace

TEST_CASE("build_results_reports_disk_segment_and_fit") {
    Config cfg;
    PipelineSession session(disk_image());
    session.apply_config(cfg);

    auto results = build_results(session, cfg);

    REQUIRE(results["image_size"]["rows"].get<int>() == 100);
    REQUIRE(results["scale"]["source"].get<std::string>() == "pixel_size");
    REQUIRE(results["scale"]["factor"].get<double>() == Catch::Approx(1.0));

    const auto& segments = results["segments"];
    REQUIRE(segments.size() == 1);
    REQUIRE(segments[0]["label"].get<int>() == 1);
    REQUIRE(segments[0]["pixel_count"].get<int64_t>() == 317);
    REQUIRE(segments[0]["min_row"].get<int>() == 40);
    REQUIRE(segments[0]["max_row"].get<int>() == 60);
    REQUIRE_FALSE(segments[0]["border"].get<bool>());
    REQUIRE(segments[0]["kept"].get<bool>());

    REQUIRE(results["sizes"].size() == 1);
    REQUIRE(results["fit"]["n"].get<size_t>() == 1);
    REQUIRE(results["fit"]["mean"].get<double>() == Catch::Approx(std::sqrt(317.0)));
    REQUIRE(results["summary"].get<std::string>() == "µ=17.8 nm, σ=0 nm, n=1 particles");

    // Distance histogram holds raw counts of every pixel
    const auto& dist_hist = results["distance"]["histogram"];
    REQUIRE(dist_hist["values"].size() == 50);
    REQUIRE(dist_hist["edges"].size() == 51);
    REQUIRE(sum_of(dist_hist["values"]) == Catch::Approx(10000.0));
    REQUIRE(results["distance"]["max"].get<double>() == Catch::Approx(10.0).margin(0.5));

    // Size histogram is a density; a constant sample spans +-0.5 around it
    const auto& size_hist = results["size_histogram"];
    REQUIRE(size_hist["values"].size() == 100);
    REQUIRE(size_hist["lo"].get<double>() == Catch::Approx(std::sqrt(317.0) - 0.5));
    REQUIRE(size_hist["hi"].get<double>() == Catch::Approx(std::sqrt(317.0) + 0.5));
    const double width = (size_hist["hi"].get<double>() - size_hist["lo"].get<double>()) / 100.0;
    REQUIRE(sum_of(size_hist["values"]) * width == Catch::Approx(1.0));

    // Zero spread gives a zero pdf at every bin centre
    REQUIRE(results["fitted_pdf"].size() == 100);
    REQUIRE(sum_of(results["fitted_pdf"]) == 0.0);
}

TEST_CASE("build_results_flags_border_segments") {
    Config cfg;
    cfg.border.width = 20;
    cfg.size_window.max = 40.0;

    Matrix2Df img = disk_image();
    for (int r = 0; r < 100; ++r) {
        for (int c = 0; c < 100; ++c) {
            if ((r - 80) * (r - 80) + (c - 80) * (c - 80) <= 25) img(r, c) = 0.0f;
        }
    }

    PipelineSession session(img);
    session.apply_config(cfg);
    auto results = build_results(session, cfg);

    REQUIRE(results["segments"].size() == 2);
    int border_count = 0;
    int kept_count = 0;
    for (const auto& seg : results["segments"]) {
        if (seg["border"].get<bool>()) ++border_count;
        if (seg["kept"].get<bool>()) ++kept_count;
        REQUIRE(seg["border"].get<bool>() != seg["kept"].get<bool>());
    }
    REQUIRE(border_count == 1);
    REQUIRE(kept_count == 1);
    REQUIRE(results["fit"]["n"].get<size_t>() == 1);
}

TEST_CASE("write_artifacts_in_test_mode_writes_png_and_fits") {
    Config cfg;
    cfg.pipeline.mode = "test";
    cfg.output.write_debug_images = false;

    PipelineSession session(disk_image());
    session.apply_config(cfg);
    session.sizes();

    fs::path dir = fs::temp_directory_path() / "particle_sizer_test_artifacts";
    fs::create_directories(dir);
    write_artifacts(session, cfg, dir);

    for (const char* name : {"mask.png", "distance.png", "markers.png", "labels.png",
                             "labels_filtered.png", "distance.fits", "labels.fits"}) {
        INFO(name);
        REQUIRE(fs::exists(dir / name));
    }

    auto [labels, header] = particle_sizer::io::read_fits_float(dir / "labels.fits");
    REQUIRE(labels.rows() == 100);
    REQUIRE(labels(50, 50) == Catch::Approx(1.0f));
    REQUIRE(header.get_int("BORDER").value() == 10);

    fs::remove_all(dir);
}

TEST_CASE("header_pixel_size_applies_only_without_calibration") {
    FitsHeader header;
    header.set("SCALE", 0.25);

    Config cfg;
    REQUIRE(header_pixel_size(cfg, header).value() == Catch::Approx(0.25));

    cfg.calibration.use_fits_scale = false;
    REQUIRE_FALSE(header_pixel_size(cfg, header).has_value());

    cfg.calibration.use_fits_scale = true;
    cfg.calibration.enabled = true;
    REQUIRE_FALSE(header_pixel_size(cfg, header).has_value());

    cfg.calibration.enabled = false;
    REQUIRE_FALSE(header_pixel_size(cfg, FitsHeader{}).has_value());

    FitsHeader negative;
    negative.set("SCALE", -1.0);
    REQUIRE_FALSE(header_pixel_size(cfg, negative).has_value());
}

TEST_CASE("event_emitter_writes_warning_lines") {
    std::ostringstream out;
    particle_sizer::core::EventEmitter emitter("run42", out);
    emitter.warning("2 segment(s) outside the size window");

    auto event = particle_sizer::core::json::parse(out.str());
    REQUIRE(event["type"].get<std::string>() == "warning");
    REQUIRE(event["run_id"].get<std::string>() == "run42");
    REQUIRE(event["message"].get<std::string>() == "2 segment(s) outside the size window");
}
