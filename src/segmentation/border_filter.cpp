#include "particle_sizer/segmentation/border_filter.hpp"
#include "particle_sizer/segmentation/segments.hpp"
#include "particle_sizer/core/errors.hpp"

#include <unordered_set>

namespace particle_sizer::segmentation {

bool touches_border(const SegmentInfo& segment, int rows, int cols, int margin) {
    return segment.min_row <= margin || segment.max_row >= rows - 1 - margin ||
           segment.min_col <= margin || segment.max_col >= cols - 1 - margin;
}

Label2D filter_border(const Label2D& labels, int margin, std::vector<int32_t>* removed) {
    if (margin < 0) {
        throw ValidationError("border margin must be >= 0, got " + std::to_string(margin));
    }

    const int rows = static_cast<int>(labels.rows());
    const int cols = static_cast<int>(labels.cols());

    std::unordered_set<int32_t> drop;
    for (const auto& s : segment_stats(labels)) {
        if (touches_border(s, rows, cols, margin)) {
            drop.insert(s.label);
            if (removed) removed->push_back(s.label);
        }
    }

    Label2D out = labels;
    if (drop.empty()) return out;

    for (Eigen::Index i = 0; i < out.size(); ++i) {
        if (drop.count(out.data()[i])) out.data()[i] = 0;
    }
    return out;
}

} // namespace particle_sizer::segmentation
