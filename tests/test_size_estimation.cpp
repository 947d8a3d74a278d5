#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/statistics/size_estimation.hpp"

#include <cmath>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using particle_sizer::Label2D;
namespace stats = particle_sizer::statistics;

namespace {

// Square segments of 4, 9, 16 and 25 pixels
Label2D square_segments() {
    Label2D labels = Label2D::Zero(30, 30);
    labels.block(1, 1, 2, 2).setConstant(1);
    labels.block(5, 5, 3, 3).setConstant(2);
    labels.block(10, 10, 4, 4).setConstant(3);
    labels.block(20, 20, 5, 5).setConstant(4);
    return labels;
}

} // namespace

TEST_CASE("fit_normal_uses_population_stddev") {
    auto fit = stats::fit_normal({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0});
    REQUIRE(fit.mean == Catch::Approx(5.0));
    REQUIRE(fit.stddev == Catch::Approx(2.0));
    REQUIRE(fit.n == 8);
}

TEST_CASE("fit_normal_of_nothing_is_an_empty_sample") {
    REQUIRE_THROWS_AS(stats::fit_normal({}), particle_sizer::EmptySampleError);
}

TEST_CASE("estimate_sizes_converts_pixel_counts") {
    auto dist = stats::estimate_sizes(square_segments(), 1.0, 0.0, 20.0);

    REQUIRE(dist.samples.size() == 4);
    REQUIRE(dist.rejected.empty());
    REQUIRE(dist.samples[0].label == 1);
    REQUIRE(dist.samples[0].pixel_count == 4);
    REQUIRE(dist.samples[3].size == Catch::Approx(5.0));
    REQUIRE(dist.fit.mean == Catch::Approx(3.5));
    REQUIRE(dist.fit.stddev == Catch::Approx(std::sqrt(1.25)));

    auto scaled = stats::estimate_sizes(square_segments(), 2.0, 0.0, 20.0);
    REQUIRE(scaled.fit.mean == Catch::Approx(7.0));
}

TEST_CASE("estimate_sizes_window_is_strict") {
    auto dist = stats::estimate_sizes(square_segments(), 1.0, 2.0, 5.0);

    REQUIRE(dist.samples.size() == 2);
    REQUIRE(dist.samples[0].size == Catch::Approx(3.0));
    REQUIRE(dist.samples[1].size == Catch::Approx(4.0));
    REQUIRE(dist.rejected.size() == 2);
    REQUIRE(dist.fit.mean == Catch::Approx(3.5));
    REQUIRE(dist.fit.stddev == Catch::Approx(0.5));
}

TEST_CASE("estimate_sizes_fails_when_window_excludes_everything") {
    REQUIRE_THROWS_AS(stats::estimate_sizes(square_segments(), 1.0, 10.0, 20.0),
                      particle_sizer::EmptySampleError);
    REQUIRE_THROWS_AS(stats::estimate_sizes(Label2D::Zero(5, 5), 1.0, 0.0, 20.0),
                      particle_sizer::EmptySampleError);
}

TEST_CASE("estimate_sizes_validates_arguments") {
    REQUIRE_THROWS_AS(stats::estimate_sizes(square_segments(), 0.0, 0.0, 20.0),
                      particle_sizer::ValidationError);
    REQUIRE_THROWS_AS(stats::estimate_sizes(square_segments(), 1.0, 5.0, 5.0),
                      particle_sizer::ValidationError);
    REQUIRE_THROWS_AS(stats::estimate_sizes(square_segments(), NAN, 0.0, 20.0),
                      particle_sizer::ValidationError);
}

TEST_CASE("histogram_density_integrates_to_one") {
    std::vector<double> v{1.0, 1.5, 2.0, 2.5, 3.0, 3.0, 4.0};
    auto h = stats::histogram(v, 6, true);

    REQUIRE(h.edges.size() == 7);
    REQUIRE(h.values.size() == 6);
    REQUIRE(h.edges.front() == Catch::Approx(1.0));
    REQUIRE(h.edges.back() == Catch::Approx(4.0));

    double area = 0.0;
    for (size_t i = 0; i < h.values.size(); ++i) {
        area += h.values[i] * (h.edges[i + 1] - h.edges[i]);
    }
    REQUIRE(area == Catch::Approx(1.0));

    auto counts = stats::histogram(v, 6, false);
    REQUIRE(counts.values.back() == Catch::Approx(1.0));  // max lands in the last bin
}

TEST_CASE("normal_pdf_peak_and_summary") {
    REQUIRE(stats::normal_pdf(0.0, 0.0, 1.0) == Catch::Approx(0.3989422804));
    REQUIRE(stats::normal_pdf(1.0, 1.0, 0.0) == 0.0);

    particle_sizer::NormalFit fit;
    fit.mean = 3.5;
    fit.stddev = std::sqrt(1.25);
    fit.n = 4;
    REQUIRE(stats::format_summary(fit, "nm") == "µ=3.5 nm, σ=1.12 nm, n=4 particles");
}

TEST_CASE("format_summary_keeps_long_units_intact") {
    particle_sizer::NormalFit fit;
    fit.mean = 12.0;
    fit.stddev = 1.5;
    fit.n = 42;

    const std::string unit(200, 'u');
    const std::string summary = stats::format_summary(fit, unit);
    REQUIRE(summary == "µ=12 " + unit + ", σ=1.5 " + unit + ", n=42 particles");
}
