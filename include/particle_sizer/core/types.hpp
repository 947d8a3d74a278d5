#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace particle_sizer {

namespace fs = std::filesystem;

// Grid types (row-major, indexed (row, col))
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Mask2D = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Label2D = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Pixel-space selection rectangle
struct Rect {
    int x = 0;       // Leftmost column
    int y = 0;       // Top row
    int width = 0;
    int height = 0;
};

// Result of the scale-bar calibration
struct ScaleCalibration {
    double scale_factor = 1.0;  // physical units per pixel
    double physical_length = 0.0;
    int min_col = 0;            // extreme bar columns (image coordinates)
    int max_col = 0;
    float bar_intensity = 0.0f;
    Mask2D bar_mask;            // detected bar inside the selection
};

// Bounding extent and size of one labeled segment
struct SegmentInfo {
    int32_t label = 0;
    int64_t pixel_count = 0;
    int min_row = 0;
    int max_row = 0;
    int min_col = 0;
    int max_col = 0;
};

struct NormalFit {
    double mean = 0.0;
    double stddev = 0.0;  // population (maximum-likelihood) estimate
    size_t n = 0;
};

struct SizeSample {
    int32_t label = 0;
    int64_t pixel_count = 0;
    double size = 0.0;    // sqrt(pixel_count) * scale_factor
};

struct SizeDistribution {
    std::vector<SizeSample> samples;   // kept samples, ascending label order
    std::vector<SizeSample> rejected;  // outside the size window
    NormalFit fit;
};

struct Histogram {
    double lo = 0.0;
    double hi = 0.0;
    std::vector<double> edges;   // bins + 1 entries
    std::vector<double> values;  // counts, or densities when normalized
};

// Pipeline phase enumeration
enum class Phase {
    CALIBRATION = 0,
    BINARIZE = 1,
    DISTANCE_FIELD = 2,
    MARKERS = 3,
    WATERSHED = 4,
    BORDER_FILTER = 5,
    SIZE_ESTIMATION = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::CALIBRATION: return "CALIBRATION";
        case Phase::BINARIZE: return "BINARIZE";
        case Phase::DISTANCE_FIELD: return "DISTANCE_FIELD";
        case Phase::MARKERS: return "MARKERS";
        case Phase::WATERSHED: return "WATERSHED";
        case Phase::BORDER_FILTER: return "BORDER_FILTER";
        case Phase::SIZE_ESTIMATION: return "SIZE_ESTIMATION";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

inline Phase int_to_phase(int i) {
    if (i >= 0 && i <= 7) {
        return static_cast<Phase>(i);
    }
    return Phase::CALIBRATION;
}

} // namespace particle_sizer
