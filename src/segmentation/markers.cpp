#include "particle_sizer/segmentation/markers.hpp"
#include "particle_sizer/segmentation/segments.hpp"
#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/utils.hpp"

namespace particle_sizer::segmentation {

double marker_threshold(const Matrix2Df& dist, double quantile) {
    core::require_non_empty(dist, "distance field");
    if (!(quantile >= 0.0 && quantile <= 1.0)) {
        throw ValidationError("marker quantile must be in [0,1], got " + std::to_string(quantile));
    }
    return core::compute_quantile(dist, quantile);
}

Mask2D marker_candidates(const Matrix2Df& dist, double quantile) {
    const double d_star = marker_threshold(dist, quantile);
    Mask2D out(dist.rows(), dist.cols());
    for (Eigen::Index i = 0; i < dist.size(); ++i) {
        out.data()[i] = static_cast<double>(dist.data()[i]) > d_star ? 1 : 0;
    }
    return out;
}

Label2D extract_markers(const Matrix2Df& dist, double quantile, int32_t* num_markers) {
    return label_components(marker_candidates(dist, quantile), num_markers);
}

} // namespace particle_sizer::segmentation
