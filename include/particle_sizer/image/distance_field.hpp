#pragma once

#include "particle_sizer/core/types.hpp"

namespace particle_sizer::image {

/**
 * Exact Euclidean distance from every foreground pixel to the nearest
 * background pixel; background pixels are 0. Pixels outside the grid do not
 * count as background.
 *
 * Throws ValidationError for an empty mask or a mask without background.
 */
Matrix2Df distance_field(const Mask2D& mask);

} // namespace particle_sizer::image
