#include "particle_sizer/image/region_growing.hpp"
#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>

namespace particle_sizer::image {

namespace {

constexpr int kDr[8] = {-1, -1, -1, 0, 0, 1, 1, 1};
constexpr int kDc[8] = {-1, 0, 1, -1, 1, -1, 0, 1};

struct QueuedPixel {
    double delta;
    uint64_t age;
    int r, c;

    bool operator>(const QueuedPixel& other) const {
        if (delta != other.delta) return delta > other.delta;
        return age > other.age;
    }
};

struct RegionStats {
    double sum = 0.0;
    int64_t count = 0;

    double mean() const { return count > 0 ? sum / static_cast<double>(count) : 0.0; }

    void add(float v) {
        if (!std::isfinite(v)) return;
        sum += v;
        ++count;
    }
};

double similarity(float v, const RegionStats& region) {
    if (!std::isfinite(v)) return std::numeric_limits<double>::infinity();
    return std::abs(static_cast<double>(v) - region.mean());
}

} // namespace

Label2D seeded_region_growing(const Matrix2Df& img, const std::vector<Seed>& seeds,
                              std::function<void(float)> progress_cb) {
    core::require_non_empty(img, "region growing image");
    if (seeds.empty()) {
        throw ValidationError("region growing needs at least one seed");
    }

    const int rows = static_cast<int>(img.rows());
    const int cols = static_cast<int>(img.cols());

    int32_t max_label = 0;
    for (const auto& s : seeds) {
        if (s.row < 0 || s.row >= rows || s.col < 0 || s.col >= cols) {
            throw ValidationError("seed (" + std::to_string(s.row) + ", " +
                                  std::to_string(s.col) + ") outside image");
        }
        if (s.label <= 0) {
            throw ValidationError("seed labels must be > 0");
        }
        max_label = std::max(max_label, s.label);
    }

    Label2D labels = Label2D::Zero(rows, cols);
    std::vector<RegionStats> regions(static_cast<size_t>(max_label) + 1);

    int64_t claimed = 0;
    for (const auto& s : seeds) {
        // First seed at a position wins
        if (labels(s.row, s.col) != 0) continue;
        labels(s.row, s.col) = s.label;
        regions[static_cast<size_t>(s.label)].add(img(s.row, s.col));
        ++claimed;
    }

    std::priority_queue<QueuedPixel, std::vector<QueuedPixel>, std::greater<QueuedPixel>> pq;
    uint64_t age_counter = 0;

    auto push_neighbours = [&](int r, int c) {
        const auto& region = regions[static_cast<size_t>(labels(r, c))];
        for (int i = 0; i < 8; ++i) {
            const int nr = r + kDr[i];
            const int nc = c + kDc[i];
            if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
            if (labels(nr, nc) != 0) continue;
            pq.push({similarity(img(nr, nc), region), age_counter++, nr, nc});
        }
    };

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (labels(r, c) > 0) push_neighbours(r, c);
        }
    }

    const int64_t total = static_cast<int64_t>(rows) * cols;
    const int64_t report_every = std::max<int64_t>(1, total / 100);
    int64_t since_report = 0;

    while (!pq.empty()) {
        const QueuedPixel cur = pq.top();
        pq.pop();
        if (labels(cur.r, cur.c) != 0) continue;

        const float v = img(cur.r, cur.c);
        int32_t best = 0;
        double best_delta = std::numeric_limits<double>::infinity();
        for (int i = 0; i < 8; ++i) {
            const int nr = cur.r + kDr[i];
            const int nc = cur.c + kDc[i];
            if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
            const int32_t l = labels(nr, nc);
            if (l <= 0) continue;
            const double d = similarity(v, regions[static_cast<size_t>(l)]);
            if (best == 0 || d < best_delta || (d == best_delta && l < best)) {
                best = l;
                best_delta = d;
            }
        }

        labels(cur.r, cur.c) = best;
        regions[static_cast<size_t>(best)].add(v);
        push_neighbours(cur.r, cur.c);

        ++claimed;
        if (progress_cb && ++since_report >= report_every) {
            since_report = 0;
            progress_cb(static_cast<float>(claimed) / static_cast<float>(total));
        }
    }

    if (progress_cb) progress_cb(1.0f);
    return labels;
}

} // namespace particle_sizer::image
