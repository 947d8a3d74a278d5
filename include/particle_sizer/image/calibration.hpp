#pragma once

#include "particle_sizer/core/types.hpp"

namespace particle_sizer::image {

// Sub-region of an image clamped to its bounds; empty when the clamp is empty.
Matrix2Df extract_region(const Matrix2Df& img, const Rect& r);

/**
 * Derive physical units per pixel from a scale bar.
 *
 * The brightest finite pixels inside `selection` are taken as the bar; the
 * scale factor is physical_length / (max_col - min_col) over those pixels.
 *
 * Throws ValidationError for physical_length <= 0, EmptySelectionError when
 * the clamped selection holds no finite pixel, DegenerateScaleError when the
 * bar spans a single column or the result is not finite.
 */
ScaleCalibration calibrate(const Matrix2Df& img, const Rect& selection, double physical_length);

} // namespace particle_sizer::image
