#include "particle_sizer/image/calibration.hpp"
#include "particle_sizer/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace particle_sizer::image {

Matrix2Df extract_region(const Matrix2Df& img, const Rect& r) {
    // 64-bit so that x + width cannot overflow for large selections
    const int64_t cols = img.cols();
    const int64_t rows = img.rows();
    const int64_t x0 = std::max<int64_t>(0, r.x);
    const int64_t y0 = std::max<int64_t>(0, r.y);
    const int64_t x1 = std::min(cols, static_cast<int64_t>(r.x) + r.width);
    const int64_t y1 = std::min(rows, static_cast<int64_t>(r.y) + r.height);
    if (x1 <= x0 || y1 <= y0)
        return Matrix2Df();
    return img.block(y0, x0, y1 - y0, x1 - x0);
}

ScaleCalibration calibrate(const Matrix2Df& img, const Rect& selection, double physical_length) {
    if (!(physical_length > 0.0) || !std::isfinite(physical_length)) {
        throw ValidationError("physical length must be a positive finite number");
    }

    Matrix2Df region = extract_region(img, selection);
    if (region.size() == 0) {
        throw EmptySelectionError("selection does not overlap the image");
    }

    float maxi = -std::numeric_limits<float>::infinity();
    for (Eigen::Index i = 0; i < region.size(); ++i) {
        const float v = region.data()[i];
        if (std::isfinite(v) && v > maxi) maxi = v;
    }
    if (!std::isfinite(maxi)) {
        throw EmptySelectionError("selection holds no finite pixel");
    }

    const int x0 = std::max(0, selection.x);
    ScaleCalibration out;
    out.bar_mask = Mask2D::Zero(region.rows(), region.cols());
    out.bar_intensity = maxi;
    out.physical_length = physical_length;

    int min_col = std::numeric_limits<int>::max();
    int max_col = std::numeric_limits<int>::min();
    for (int r = 0; r < region.rows(); ++r) {
        for (int c = 0; c < region.cols(); ++c) {
            if (region(r, c) == maxi) {
                out.bar_mask(r, c) = 1;
                min_col = std::min(min_col, c);
                max_col = std::max(max_col, c);
            }
        }
    }

    out.min_col = x0 + min_col;
    out.max_col = x0 + max_col;

    if (max_col == min_col) {
        throw DegenerateScaleError("scale bar spans a single column (" +
                                   std::to_string(out.min_col) + ")");
    }

    out.scale_factor = physical_length / static_cast<double>(max_col - min_col);
    if (!std::isfinite(out.scale_factor) || !(out.scale_factor > 0.0)) {
        throw DegenerateScaleError("scale factor is not finite");
    }
    return out;
}

} // namespace particle_sizer::image
