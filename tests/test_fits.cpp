#include "particle_sizer/core/types.hpp"
#include "particle_sizer/io/fits_io.hpp"
#include "particle_sizer/io/image_io.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
namespace io = particle_sizer::io;
using particle_sizer::Matrix2Df;

TEST_CASE("fits_float_round_trip_keeps_layout_and_header") {
    Matrix2Df data(2, 3);
    data << 1.0f, 2.0f, 3.0f,
            4.0f, 5.0f, 6.0f;

    io::FitsHeader header;
    header.set("SCALE", 2.5);
    header.set("BORDER", 10);
    header.set("BUNIT", std::string("nm"));

    fs::path path = fs::temp_directory_path() / "particle_sizer_test_roundtrip.fits";
    io::write_fits_float(path, data, header);
    auto [loaded, loaded_header] = io::read_fits_float(path);

    REQUIRE(loaded.rows() == 2);
    REQUIRE(loaded.cols() == 3);
    REQUIRE(loaded(0, 2) == Catch::Approx(3.0f));
    REQUIRE(loaded(1, 0) == Catch::Approx(4.0f));
    REQUIRE(loaded_header.get_double("SCALE").value() == Catch::Approx(2.5));
    REQUIRE(loaded_header.get_int("BORDER").value() == 10);
    REQUIRE(loaded_header.get_string("BUNIT").value() == "nm");

    // FITS input is min-max normalized to [0,1]
    io::FitsHeader input_header;
    Matrix2Df norm = io::load_grayscale(path, &input_header);
    REQUIRE(norm(0, 0) == Catch::Approx(0.0f));
    REQUIRE(norm(1, 2) == Catch::Approx(1.0f));
    REQUIRE(norm(0, 2) == Catch::Approx(0.4f));
    REQUIRE(io::fits_pixel_scale(input_header).value() == Catch::Approx(2.5));

    fs::remove(path);
}

TEST_CASE("fits_pixel_scale_requires_positive_finite_value") {
    io::FitsHeader header;
    REQUIRE_FALSE(io::fits_pixel_scale(header).has_value());

    header.set("SCALE", 0.0);
    REQUIRE_FALSE(io::fits_pixel_scale(header).has_value());

    io::FitsHeader integer_scale;
    integer_scale.set("SCALE", 3);
    REQUIRE(io::fits_pixel_scale(integer_scale).value() == Catch::Approx(3.0));
}

TEST_CASE("fits_path_detection") {
    REQUIRE(io::is_fits_image_path("a/b/image.FITS"));
    REQUIRE(io::is_fits_image_path("x.fit"));
    REQUIRE_FALSE(io::is_fits_image_path("x.png"));
}

TEST_CASE("label_color_is_deterministic_and_black_for_background") {
    REQUIRE(io::label_color(0) == std::array<uint8_t, 3>{0, 0, 0});
    REQUIRE(io::label_color(7) == io::label_color(7));
    REQUIRE(io::label_color(1) != io::label_color(2));
    for (int32_t l = 1; l < 50; ++l) {
        const auto c = io::label_color(l);
        REQUIRE(c[0] >= 64);
        REQUIRE(c[1] >= 64);
        REQUIRE(c[2] >= 64);
    }
}

TEST_CASE("png_writers_and_loader_agree") {
    particle_sizer::Mask2D mask = particle_sizer::Mask2D::Zero(4, 5);
    mask(1, 2) = 1;

    fs::path path = fs::temp_directory_path() / "particle_sizer_test_mask.png";
    io::write_mask_png(path, mask);
    Matrix2Df img = io::load_grayscale(path);
    fs::remove(path);

    REQUIRE(img.rows() == 4);
    REQUIRE(img.cols() == 5);
    REQUIRE(img(1, 2) == Catch::Approx(1.0f));
    REQUIRE(img(0, 0) == Catch::Approx(0.0f));
}
