#pragma once

#include "particle_sizer/core/types.hpp"

#include <vector>

namespace particle_sizer::segmentation {

// True when the segment has a pixel with row <= margin, row >= rows-1-margin,
// col <= margin or col >= cols-1-margin (0-based).
bool touches_border(const SegmentInfo& segment, int rows, int cols, int margin);

/**
 * Zero every segment that comes within `margin` pixels of the image edge.
 * margin = 0 removes segments on the outermost pixel ring.
 * Throws ValidationError for a negative margin.
 */
Label2D filter_border(const Label2D& labels, int margin, std::vector<int32_t>* removed = nullptr);

} // namespace particle_sizer::segmentation
