#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/image/region_growing.hpp"
#include "particle_sizer/image/threshold.hpp"

#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using particle_sizer::Mask2D;
using particle_sizer::Matrix2Df;
namespace image = particle_sizer::image;

namespace {

// Dark ring (0.1) of radius 3..8 around (20, 20) on a bright background.
// The bright core inside radius 3 is a hole the threshold misses.
Matrix2Df ring_image() {
    Matrix2Df img = Matrix2Df::Constant(40, 40, 0.9f);
    for (int r = 0; r < 40; ++r) {
        for (int c = 0; c < 40; ++c) {
            const int d2 = (r - 20) * (r - 20) + (c - 20) * (c - 20);
            if (d2 <= 64 && d2 > 9) img(r, c) = 0.1f;
        }
    }
    return img;
}

} // namespace

TEST_CASE("binarize_uses_strict_less_than") {
    Matrix2Df img(1, 3);
    img << 0.49f, 0.5f, 0.51f;

    Mask2D m = image::binarize(img, 0.5f, false);
    REQUIRE(m(0, 0) == 1);
    REQUIRE(m(0, 1) == 0);
    REQUIRE(m(0, 2) == 0);
}

TEST_CASE("binarize_is_idempotent") {
    Matrix2Df img = ring_image();
    Mask2D a = image::binarize(img, 0.5f, true);
    Mask2D b = image::binarize(img, 0.5f, true);
    REQUIRE(a == b);
}

TEST_CASE("binarize_without_repair_keeps_hole") {
    Mask2D m = image::binarize(ring_image(), 0.5f, false);
    REQUIRE(m(20, 20) == 0);
    REQUIRE(m(20, 25) == 1);
    REQUIRE(m(0, 0) == 0);
}

TEST_CASE("binarize_with_repair_fills_enclosed_hole") {
    Matrix2Df img = ring_image();
    Mask2D raw = image::binarize(img, 0.5f, false);
    Mask2D repaired = image::binarize(img, 0.5f, true);

    REQUIRE(repaired(20, 20) == 1);
    REQUIRE(repaired(0, 0) == 0);
    REQUIRE(repaired(39, 39) == 0);

    // Only the enclosed core changes
    int added = 0;
    for (int r = 0; r < 40; ++r) {
        for (int c = 0; c < 40; ++c) {
            REQUIRE(repaired(r, c) >= raw(r, c));
            if (repaired(r, c) != raw(r, c)) {
                ++added;
                const int d2 = (r - 20) * (r - 20) + (c - 20) * (c - 20);
                REQUIRE(d2 <= 9);
            }
        }
    }
    REQUIRE(added == 29);
}

TEST_CASE("binarize_repair_reports_progress") {
    float last = -1.0f;
    int calls = 0;
    image::binarize(ring_image(), 0.5f, true, [&](float p) {
        REQUIRE(p >= last);
        last = p;
        ++calls;
    });
    REQUIRE(calls > 0);
    REQUIRE(last == Catch::Approx(1.0f));
}

TEST_CASE("binarize_rejects_bad_input") {
    REQUIRE_THROWS_AS(image::binarize(Matrix2Df(), 0.5f, false), particle_sizer::ValidationError);
    REQUIRE_THROWS_AS(image::binarize(Matrix2Df::Zero(3, 3), 1.5f, false),
                      particle_sizer::ValidationError);
}

TEST_CASE("seeded_region_growing_splits_two_plateaus") {
    Matrix2Df img = Matrix2Df::Zero(5, 10);
    img.rightCols(5).setConstant(1.0f);

    std::vector<image::Seed> seeds{{2, 0, 1}, {2, 9, 2}};
    auto labels = image::seeded_region_growing(img, seeds);

    for (int r = 0; r < 5; ++r) {
        for (int c = 0; c < 10; ++c) {
            REQUIRE(labels(r, c) == (c < 5 ? 1 : 2));
        }
    }
}

TEST_CASE("seeded_region_growing_rejects_bad_seeds") {
    Matrix2Df img = Matrix2Df::Zero(4, 4);
    REQUIRE_THROWS_AS(image::seeded_region_growing(img, {}), particle_sizer::ValidationError);
    REQUIRE_THROWS_AS(image::seeded_region_growing(img, {{5, 0, 1}}),
                      particle_sizer::ValidationError);
    REQUIRE_THROWS_AS(image::seeded_region_growing(img, {{0, 0, 0}}),
                      particle_sizer::ValidationError);
}
