#pragma once

#include "particle_sizer/config/configuration.hpp"
#include "particle_sizer/core/types.hpp"

#include <functional>
#include <optional>

namespace particle_sizer::pipeline {

/**
 * Latest artifact of every stage for one image.
 *
 * Artifacts are computed on first access and cached. Changing a parameter
 * drops the artifact of its stage and of every stage after it; a new scale
 * only drops the size distribution. Accessors throw PipelineError when no
 * image is loaded, and the stage errors of the underlying functions
 * otherwise.
 */
class PipelineSession {
public:
    using ProgressCallback = std::function<void(Phase, float)>;

    PipelineSession() = default;
    explicit PipelineSession(Matrix2Df image);

    void set_image(Matrix2Df image);
    bool has_image() const { return image_.size() > 0; }
    const Matrix2Df& image() const;

    // Takes every stage parameter from the config
    void apply_config(const config::Config& cfg);

    void set_calibration(const Rect& selection, double physical_length);
    void set_pixel_size(double pixel_size);
    void set_threshold(float level, bool repair);
    void set_marker_quantile(double quantile);
    void set_border_margin(int margin);
    void set_size_window(double min_size, double max_size);

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    // Scale-bar result; nullptr when the scale comes from set_pixel_size
    const ScaleCalibration* calibration();
    double scale_factor();

    const Mask2D& mask();
    const Matrix2Df& distance();
    double marker_threshold();
    const Label2D& markers();
    const Label2D& labels();
    const Label2D& filtered_labels();
    const std::vector<int32_t>& border_removed();
    const SizeDistribution& sizes();

    bool is_cached(Phase phase) const;
    void invalidate_from(Phase phase);

    float threshold_level() const { return threshold_level_; }
    bool repair() const { return repair_; }
    double marker_quantile() const { return quantile_; }
    int border_margin() const { return border_margin_; }
    double min_size() const { return min_size_; }
    double max_size() const { return max_size_; }

private:
    void require_image() const;

    Matrix2Df image_;

    std::optional<Rect> selection_;
    double physical_length_ = 100.0;
    double pixel_size_ = 1.0;
    float threshold_level_ = 0.5f;
    bool repair_ = false;
    double quantile_ = 0.9;
    int border_margin_ = 10;
    double min_size_ = 0.0;
    double max_size_ = 20.0;

    ProgressCallback progress_cb_;

    std::optional<ScaleCalibration> calibration_;
    std::optional<double> scale_;
    std::optional<Mask2D> mask_;
    std::optional<Matrix2Df> distance_;
    std::optional<double> marker_threshold_;
    std::optional<Label2D> markers_;
    std::optional<Label2D> labels_;
    std::optional<Label2D> filtered_;
    std::vector<int32_t> border_removed_;
    std::optional<SizeDistribution> sizes_;
};

} // namespace particle_sizer::pipeline
