#include "particle_sizer/image/distance_field.hpp"
#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/utils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace particle_sizer::image {

Matrix2Df distance_field(const Mask2D& mask) {
    core::require_non_empty(mask, "mask");

    const int rows = static_cast<int>(mask.rows());
    const int cols = static_cast<int>(mask.cols());

    cv::Mat src(rows, cols, CV_8U);
    bool any_background = false;
    for (int r = 0; r < rows; ++r) {
        uint8_t* dst = src.ptr<uint8_t>(r);
        for (int c = 0; c < cols; ++c) {
            dst[c] = mask(r, c) ? 255 : 0;
            any_background = any_background || mask(r, c) == 0;
        }
    }
    if (!any_background) {
        throw ValidationError("distance field needs at least one background pixel");
    }

    cv::Mat dist;
    cv::distanceTransform(src, dist, cv::DIST_L2, cv::DIST_MASK_PRECISE, CV_32F);

    Matrix2Df out(rows, cols);
    for (int r = 0; r < rows; ++r) {
        const float* row = dist.ptr<float>(r);
        for (int c = 0; c < cols; ++c) {
            out(r, c) = mask(r, c) ? row[c] : 0.0f;
        }
    }
    return out;
}

} // namespace particle_sizer::image
