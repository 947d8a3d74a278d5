#pragma once

#include "particle_sizer/core/types.hpp"

namespace particle_sizer::segmentation {

/**
 * Marker-driven watershed by immersion on a distance field.
 *
 * Floods proceed from the markers towards decreasing distance (the inverted
 * field rising from its minima). Pixels waiting at equal height are resolved
 * in the order they were queued; initial queueing scans the markers in raster
 * order. A pixel reached by two or more different labels becomes a watershed
 * line (0) and is never reassigned. Pixels that no flood reaches stay 0.
 *
 * Throws DimensionMismatchError when dist and markers differ in shape.
 */
Label2D flood(const Matrix2Df& dist, const Label2D& markers);

// flood() clipped to the foreground of `mask`.
Label2D watershed(const Matrix2Df& dist, const Label2D& markers, const Mask2D& mask);

} // namespace particle_sizer::segmentation
