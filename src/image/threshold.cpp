#include "particle_sizer/image/threshold.hpp"
#include "particle_sizer/image/region_growing.hpp"
#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/utils.hpp"

#include <vector>

namespace particle_sizer::image {

Mask2D threshold_mask(const Matrix2Df& img, float level) {
    Mask2D mask(img.rows(), img.cols());
    for (Eigen::Index i = 0; i < img.size(); ++i) {
        mask.data()[i] = img.data()[i] < level ? 1 : 0;
    }
    return mask;
}

Mask2D repair_holes(const Matrix2Df& img, const Mask2D& mask,
                    std::function<void(float)> progress_cb) {
    core::require_same_shape(img, mask, "repair_holes image/mask");

    std::vector<Seed> seeds;
    bool have_background = false;
    for (int r = 0; r < mask.rows(); ++r) {
        for (int c = 0; c < mask.cols(); ++c) {
            if (mask(r, c)) {
                seeds.push_back({r, c, 2});
            } else if (!have_background) {
                // Background seed goes first so it owns its pixel
                seeds.insert(seeds.begin(), Seed{r, c, 1});
                have_background = true;
            }
        }
    }

    if (!have_background || seeds.size() < 2) {
        return mask;
    }

    Label2D regions = seeded_region_growing(img, seeds, std::move(progress_cb));

    Mask2D repaired(mask.rows(), mask.cols());
    for (Eigen::Index i = 0; i < regions.size(); ++i) {
        repaired.data()[i] = regions.data()[i] != 1 ? 1 : 0;
    }
    return repaired;
}

Mask2D binarize(const Matrix2Df& img, float level, bool repair,
                std::function<void(float)> progress_cb) {
    core::require_non_empty(img, "image");
    if (!(level >= 0.0f && level <= 1.0f)) {
        throw ValidationError("threshold must be in [0,1], got " + std::to_string(level));
    }

    Mask2D mask = threshold_mask(img, level);
    if (repair) {
        mask = repair_holes(img, mask, std::move(progress_cb));
    }
    return mask;
}

} // namespace particle_sizer::image
