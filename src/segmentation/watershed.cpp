#include "particle_sizer/segmentation/watershed.hpp"
#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/utils.hpp"

#include <queue>
#include <vector>

namespace particle_sizer::segmentation {

namespace {

constexpr int32_t kInQueue = -2;
constexpr int32_t kWatershedLine = -1;

constexpr int kDr[8] = {-1, -1, -1, 0, 0, 1, 1, 1};
constexpr int kDc[8] = {-1, 0, 1, -1, 1, -1, 0, 1};

// Min-heap entry: height is the negated distance, age breaks ties
struct FloodPixel {
    float height;
    uint64_t age;
    int r, c;

    bool operator>(const FloodPixel& other) const {
        if (height != other.height) return height > other.height;
        return age > other.age;
    }
};

} // namespace

Label2D flood(const Matrix2Df& dist, const Label2D& markers) {
    core::require_same_shape(dist, markers, "watershed distance/markers");

    const int rows = static_cast<int>(dist.rows());
    const int cols = static_cast<int>(dist.cols());

    Label2D labels(rows, cols);
    for (Eigen::Index i = 0; i < markers.size(); ++i) {
        labels.data()[i] = markers.data()[i] > 0 ? markers.data()[i] : 0;
    }

    std::priority_queue<FloodPixel, std::vector<FloodPixel>, std::greater<FloodPixel>> pq;
    uint64_t age_counter = 0;

    auto enqueue_neighbours = [&](int r, int c) {
        for (int i = 0; i < 8; ++i) {
            const int nr = r + kDr[i];
            const int nc = c + kDc[i];
            if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
            if (labels(nr, nc) != 0) continue;
            pq.push({-dist(nr, nc), age_counter++, nr, nc});
            labels(nr, nc) = kInQueue;
        }
    };

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (labels(r, c) > 0) enqueue_neighbours(r, c);
        }
    }

    while (!pq.empty()) {
        const FloodPixel cur = pq.top();
        pq.pop();

        int32_t label = 0;
        bool conflict = false;
        for (int i = 0; i < 8 && !conflict; ++i) {
            const int nr = cur.r + kDr[i];
            const int nc = cur.c + kDc[i];
            if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
            const int32_t l = labels(nr, nc);
            if (l <= 0) continue;
            if (label == 0) {
                label = l;
            } else if (l != label) {
                conflict = true;
            }
        }

        if (conflict) {
            labels(cur.r, cur.c) = kWatershedLine;
            continue;
        }

        labels(cur.r, cur.c) = label;
        enqueue_neighbours(cur.r, cur.c);
    }

    for (Eigen::Index i = 0; i < labels.size(); ++i) {
        if (labels.data()[i] < 0) labels.data()[i] = 0;
    }
    return labels;
}

Label2D watershed(const Matrix2Df& dist, const Label2D& markers, const Mask2D& mask) {
    core::require_same_shape(dist, mask, "watershed distance/mask");

    Label2D labels = flood(dist, markers);
    for (Eigen::Index i = 0; i < labels.size(); ++i) {
        if (mask.data()[i] == 0) labels.data()[i] = 0;
    }
    return labels;
}

} // namespace particle_sizer::segmentation
