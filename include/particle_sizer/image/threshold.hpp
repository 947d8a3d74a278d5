#pragma once

#include "particle_sizer/core/types.hpp"

#include <functional>

namespace particle_sizer::image {

// Foreground (1) iff intensity < level. Pixels equal to level, and NaN, are background.
Mask2D threshold_mask(const Matrix2Df& img, float level);

/**
 * Fill background pockets enclosed by particles.
 *
 * The first background pixel in raster order seeds one region, every
 * foreground pixel seeds the other, and both grow over the grayscale image
 * (seeded_region_growing). Pixels not claimed by the background region form
 * the repaired mask. Background that the particles cut off from the seed,
 * including gaps between particles touching each other, is absorbed into the
 * foreground as well; this can merge neighbouring particles.
 *
 * A mask with no background or no foreground is returned unchanged.
 */
Mask2D repair_holes(const Matrix2Df& img, const Mask2D& mask,
                    std::function<void(float)> progress_cb = nullptr);

// threshold_mask followed by repair_holes when `repair` is set.
// Throws ValidationError for an empty image or a level outside [0,1].
Mask2D binarize(const Matrix2Df& img, float level, bool repair,
                std::function<void(float)> progress_cb = nullptr);

} // namespace particle_sizer::image
