#pragma once

#include "particle_sizer/core/types.hpp"
#include "particle_sizer/io/fits_io.hpp"

#include <array>
#include <cstdint>

namespace particle_sizer::io {

/**
 * Load a micrograph as a single-channel float grid in [0,1].
 *
 * FITS files are min-max normalized. Raster images (PNG, TIFF, JPEG, ...)
 * are converted to grayscale and divided by their type range; float
 * rasters are clamped to [0,1]. For FITS input the primary header is
 * stored in `fits_header` when given; it is left untouched otherwise.
 */
Matrix2Df load_grayscale(const fs::path& path, FitsHeader* fits_header = nullptr);

// Deterministic display color for a segment label; label 0 maps to black.
std::array<uint8_t, 3> label_color(int32_t label);

// 0/1 mask as 8-bit PNG (foreground white)
void write_mask_png(const fs::path& path, const Mask2D& mask);

void write_labels_png(const fs::path& path, const Label2D& labels);

// Distance field rescaled to 0..255 by its maximum
void write_distance_png(const fs::path& path, const Matrix2Df& dist);

} // namespace particle_sizer::io
