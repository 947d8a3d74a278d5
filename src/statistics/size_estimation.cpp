#include "particle_sizer/statistics/size_estimation.hpp"
#include "particle_sizer/segmentation/segments.hpp"
#include "particle_sizer/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace particle_sizer::statistics {

NormalFit fit_normal(const std::vector<double>& values) {
    if (values.empty()) {
        throw EmptySampleError("cannot fit a distribution to zero samples");
    }

    double sum = 0.0;
    for (double v : values) {
        if (!std::isfinite(v)) {
            throw ValidationError("sample contains a non-finite value");
        }
        sum += v;
    }
    const double n = static_cast<double>(values.size());
    const double mean = sum / n;

    double ss = 0.0;
    for (double v : values) {
        ss += (v - mean) * (v - mean);
    }

    NormalFit fit;
    fit.mean = mean;
    fit.stddev = std::sqrt(ss / n);
    fit.n = values.size();
    return fit;
}

double normal_pdf(double x, double mean, double stddev) {
    if (!(stddev > 0.0)) return 0.0;
    const double z = (x - mean) / stddev;
    return std::exp(-0.5 * z * z) / (stddev * std::sqrt(2.0 * M_PI));
}

Histogram histogram(const std::vector<double>& values, int bins, bool density) {
    if (bins < 1) {
        throw ValidationError("histogram needs at least one bin");
    }

    Histogram h;
    if (values.empty()) return h;

    auto [lo_it, hi_it] = std::minmax_element(values.begin(), values.end());
    double lo = *lo_it;
    double hi = *hi_it;
    if (!(hi > lo)) {
        lo -= 0.5;
        hi += 0.5;
    }
    h.lo = lo;
    h.hi = hi;

    const double width = (hi - lo) / static_cast<double>(bins);
    h.edges.resize(static_cast<size_t>(bins) + 1);
    for (int i = 0; i <= bins; ++i) {
        h.edges[static_cast<size_t>(i)] = lo + width * static_cast<double>(i);
    }
    h.edges.back() = hi;

    h.values.assign(static_cast<size_t>(bins), 0.0);
    for (double v : values) {
        int idx = static_cast<int>(std::floor((v - lo) / width));
        idx = std::clamp(idx, 0, bins - 1);
        h.values[static_cast<size_t>(idx)] += 1.0;
    }

    if (density) {
        const double norm = static_cast<double>(values.size()) * width;
        for (auto& v : h.values) v /= norm;
    }
    return h;
}

SizeDistribution estimate_sizes(const Label2D& labels, double scale_factor,
                                double min_size, double max_size) {
    if (!(scale_factor > 0.0) || !std::isfinite(scale_factor)) {
        throw ValidationError("scale factor must be a positive finite number");
    }
    if (!(min_size >= 0.0) || !std::isfinite(max_size) || !(min_size < max_size)) {
        throw ValidationError("size window must satisfy 0 <= min < max");
    }

    SizeDistribution out;
    for (const auto& seg : segmentation::segment_stats(labels)) {
        SizeSample s;
        s.label = seg.label;
        s.pixel_count = seg.pixel_count;
        s.size = std::sqrt(static_cast<double>(seg.pixel_count)) * scale_factor;

        if (s.size > min_size && s.size < max_size) {
            out.samples.push_back(s);
        } else {
            out.rejected.push_back(s);
        }
    }

    if (out.samples.empty()) {
        throw EmptySampleError("no particle inside the size window (" + std::to_string(min_size) +
                               ", " + std::to_string(max_size) + ")");
    }

    out.fit = fit_normal(sizes_of(out.samples));
    return out;
}

std::vector<double> sizes_of(const std::vector<SizeSample>& samples) {
    std::vector<double> sizes;
    sizes.reserve(samples.size());
    for (const auto& s : samples) sizes.push_back(s.size);
    return sizes;
}

std::string format_summary(const NormalFit& fit, const std::string& unit) {
    const char* fmt = "µ=%.3g %s, σ=%.3g %s, n=%zu particles";
    const int len = std::snprintf(nullptr, 0, fmt, fit.mean, unit.c_str(),
                                  fit.stddev, unit.c_str(), fit.n);
    if (len < 0) {
        throw ValidationError("cannot format size summary");
    }
    std::string out(static_cast<size_t>(len) + 1, '\0');
    std::snprintf(out.data(), out.size(), fmt, fit.mean, unit.c_str(),
                  fit.stddev, unit.c_str(), fit.n);
    out.resize(static_cast<size_t>(len));
    return out;
}

} // namespace particle_sizer::statistics
