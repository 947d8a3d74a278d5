#pragma once

#include "particle_sizer/core/types.hpp"

namespace particle_sizer::segmentation {

/**
 * d*(q): the q-th quantile (linear interpolation) of all distance values,
 * background zeros included. Throws ValidationError for q outside [0,1] or an
 * empty field.
 */
double marker_threshold(const Matrix2Df& dist, double quantile);

// Pixels strictly farther from background than d*(q).
Mask2D marker_candidates(const Matrix2Df& dist, double quantile);

// Candidates grouped into 8-connected seeds labeled 1..n in raster order.
Label2D extract_markers(const Matrix2Df& dist, double quantile, int32_t* num_markers = nullptr);

} // namespace particle_sizer::segmentation
