#pragma once

#include "particle_sizer/core/types.hpp"

#include <vector>

namespace particle_sizer::segmentation {

/**
 * 8-connected component labeling of the non-zero pixels of `mask`.
 * Labels are 1..n in order of each component's first pixel in raster order.
 */
Label2D label_components(const Mask2D& mask, int32_t* num_labels = nullptr);

// Pixel count and bounding extent per label > 0, ascending label order.
std::vector<SegmentInfo> segment_stats(const Label2D& labels);

} // namespace particle_sizer::segmentation
