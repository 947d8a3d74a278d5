#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/types.hpp"
#include "particle_sizer/core/utils.hpp"

#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace core = particle_sizer::core;

TEST_CASE("compute_quantile_interpolates_linearly") {
    std::vector<float> v{9, 3, 0, 7, 1, 5, 2, 8, 4, 6};

    REQUIRE(core::compute_quantile(v, 0.0) == Catch::Approx(0.0));
    REQUIRE(core::compute_quantile(v, 0.5) == Catch::Approx(4.5));
    REQUIRE(core::compute_quantile(v, 0.9) == Catch::Approx(8.1));
    REQUIRE(core::compute_quantile(v, 1.0) == Catch::Approx(9.0));
}

TEST_CASE("compute_quantile_of_matrix_uses_every_value") {
    particle_sizer::Matrix2Df m(2, 2);
    m << 0.0f, 0.0f,
         0.0f, 4.0f;

    REQUIRE(core::compute_quantile(m, 0.5) == Catch::Approx(0.0));
    REQUIRE(core::compute_quantile(m, 1.0) == Catch::Approx(4.0));
}

TEST_CASE("compute_quantile_rejects_out_of_range_q") {
    std::vector<float> v{1, 2, 3};
    REQUIRE_THROWS_AS(core::compute_quantile(v, -0.1), particle_sizer::ValidationError);
    REQUIRE_THROWS_AS(core::compute_quantile(v, 1.5), particle_sizer::ValidationError);
}

TEST_CASE("sha256_bytes_matches_known_digest") {
    const std::string s = "abc";
    std::vector<uint8_t> data(s.begin(), s.end());
    REQUIRE(core::sha256_bytes(data) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("require_same_shape_reports_dimension_mismatch") {
    particle_sizer::Matrix2Df a(3, 4);
    particle_sizer::Mask2D b(4, 3);
    REQUIRE_THROWS_AS(core::require_same_shape(a, b, "test"), particle_sizer::DimensionMismatchError);

    particle_sizer::Mask2D c(3, 4);
    REQUIRE_NOTHROW(core::require_same_shape(a, c, "test"));
}

TEST_CASE("string_helpers") {
    REQUIRE(core::to_lower("Image.FITS") == "image.fits");
    REQUIRE(core::ends_with("results.json", ".json"));
    REQUIRE_FALSE(core::ends_with("json", "results.json"));
}
