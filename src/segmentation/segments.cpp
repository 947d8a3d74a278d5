#include "particle_sizer/segmentation/segments.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <vector>

namespace particle_sizer::segmentation {

Label2D label_components(const Mask2D& mask, int32_t* num_labels) {
    const int rows = static_cast<int>(mask.rows());
    const int cols = static_cast<int>(mask.cols());
    Label2D labels = Label2D::Zero(rows, cols);
    if (rows == 0 || cols == 0) {
        if (num_labels) *num_labels = 0;
        return labels;
    }

    cv::Mat src(rows, cols, CV_8U);
    for (int r = 0; r < rows; ++r) {
        uint8_t* dst = src.ptr<uint8_t>(r);
        for (int c = 0; c < cols; ++c) {
            dst[c] = mask(r, c) ? 1 : 0;
        }
    }

    cv::Mat cc;
    const int n = cv::connectedComponents(src, cc, 8, CV_32S);

    // Block-based labeling does not number components by their first pixel;
    // renumber in raster order of first occurrence.
    std::vector<int32_t> remap(static_cast<size_t>(std::max(n, 1)), 0);
    int32_t next = 0;
    for (int r = 0; r < rows; ++r) {
        const int32_t* row = cc.ptr<int32_t>(r);
        for (int c = 0; c < cols; ++c) {
            const int32_t l = row[c];
            if (l <= 0) continue;
            int32_t& target = remap[static_cast<size_t>(l)];
            if (target == 0) target = ++next;
            labels(r, c) = target;
        }
    }

    if (num_labels) *num_labels = next;
    return labels;
}

std::vector<SegmentInfo> segment_stats(const Label2D& labels) {
    std::map<int32_t, SegmentInfo> by_label;
    for (int r = 0; r < labels.rows(); ++r) {
        for (int c = 0; c < labels.cols(); ++c) {
            const int32_t l = labels(r, c);
            if (l <= 0) continue;

            auto it = by_label.find(l);
            if (it == by_label.end()) {
                SegmentInfo info;
                info.label = l;
                info.min_row = info.max_row = r;
                info.min_col = info.max_col = c;
                it = by_label.emplace(l, info).first;
            }
            SegmentInfo& s = it->second;
            ++s.pixel_count;
            s.min_row = std::min(s.min_row, r);
            s.max_row = std::max(s.max_row, r);
            s.min_col = std::min(s.min_col, c);
            s.max_col = std::max(s.max_col, c);
        }
    }

    std::vector<SegmentInfo> out;
    out.reserve(by_label.size());
    for (const auto& [label, info] : by_label) {
        out.push_back(info);
    }
    return out;
}

} // namespace particle_sizer::segmentation
