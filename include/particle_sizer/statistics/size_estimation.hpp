#pragma once

#include "particle_sizer/core/types.hpp"

#include <string>
#include <vector>

namespace particle_sizer::statistics {

// Maximum-likelihood Normal fit: sample mean and population standard deviation.
// Throws EmptySampleError for no values, ValidationError for non-finite values.
NormalFit fit_normal(const std::vector<double>& values);

double normal_pdf(double x, double mean, double stddev);

/**
 * Equal-width histogram over [min(values), max(values)], the last bin closed.
 * With `density` the bin values integrate to 1. A constant sample is given a
 * unit-wide range centred on its value; no values gives empty edges/values.
 */
Histogram histogram(const std::vector<double>& values, int bins, bool density);

/**
 * Equivalent side length sqrt(pixel_count) * scale_factor for every label > 0.
 * Sizes strictly inside (min_size, max_size) are kept and fitted; the rest are
 * reported as rejected.
 *
 * Throws ValidationError for a non-positive scale factor or a window that is
 * not 0 <= min_size < max_size, EmptySampleError when nothing is kept.
 */
SizeDistribution estimate_sizes(const Label2D& labels, double scale_factor,
                                double min_size, double max_size);

std::vector<double> sizes_of(const std::vector<SizeSample>& samples);

// "µ=4.52 nm, σ=0.613 nm, n=12 particles"
std::string format_summary(const NormalFit& fit, const std::string& unit);

} // namespace particle_sizer::statistics
