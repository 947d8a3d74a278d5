#pragma once

#include "particle_sizer/core/types.hpp"

#include <functional>
#include <vector>

namespace particle_sizer::image {

struct Seed {
    int row = 0;
    int col = 0;
    int32_t label = 1;  // must be > 0
};

/**
 * Seeded region growing (Adams & Bischof) over a grayscale image.
 *
 * Unclaimed 8-neighbours of every region wait in one priority queue keyed by
 * |I(p) - mean(region)| at push time, ties resolved in push order. A popped
 * pixel joins the adjacent region whose current mean is closest to its
 * intensity (lower label on equal distance) and that region's mean is
 * updated. Runs until every pixel connected to a seed is claimed.
 *
 * Cost is O(N log N) in the pixel count with up to 8 queue entries per pixel.
 * Throws ValidationError for an empty image, no seeds, a seed out of bounds
 * or a non-positive seed label.
 */
Label2D seeded_region_growing(const Matrix2Df& img, const std::vector<Seed>& seeds,
                              std::function<void(float)> progress_cb = nullptr);

} // namespace particle_sizer::image
