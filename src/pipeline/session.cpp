#include "particle_sizer/pipeline/session.hpp"
#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/image/calibration.hpp"
#include "particle_sizer/image/distance_field.hpp"
#include "particle_sizer/image/threshold.hpp"
#include "particle_sizer/segmentation/border_filter.hpp"
#include "particle_sizer/segmentation/markers.hpp"
#include "particle_sizer/segmentation/watershed.hpp"
#include "particle_sizer/statistics/size_estimation.hpp"

#include <utility>

namespace particle_sizer::pipeline {

PipelineSession::PipelineSession(Matrix2Df image) {
    set_image(std::move(image));
}

void PipelineSession::set_image(Matrix2Df image) {
    image_ = std::move(image);
    invalidate_from(Phase::CALIBRATION);
    invalidate_from(Phase::BINARIZE);
}

const Matrix2Df& PipelineSession::image() const {
    require_image();
    return image_;
}

void PipelineSession::require_image() const {
    if (image_.size() == 0) {
        throw PipelineError("no image loaded");
    }
}

void PipelineSession::apply_config(const config::Config& cfg) {
    if (cfg.calibration.enabled) {
        set_calibration(cfg.calibration.selection, cfg.calibration.physical_length);
    } else {
        set_pixel_size(cfg.calibration.pixel_size);
    }
    set_threshold(cfg.threshold.level, cfg.threshold.seed_growing);
    set_marker_quantile(cfg.markers.quantile);
    set_border_margin(cfg.border.width);
    set_size_window(cfg.size_window.min, cfg.size_window.max);
}

void PipelineSession::set_calibration(const Rect& selection, double physical_length) {
    const bool same = selection_ && selection_->x == selection.x && selection_->y == selection.y &&
                      selection_->width == selection.width &&
                      selection_->height == selection.height &&
                      physical_length_ == physical_length;
    if (same) return;
    selection_ = selection;
    physical_length_ = physical_length;
    invalidate_from(Phase::CALIBRATION);
}

void PipelineSession::set_pixel_size(double pixel_size) {
    if (!selection_ && pixel_size_ == pixel_size) return;
    selection_.reset();
    pixel_size_ = pixel_size;
    invalidate_from(Phase::CALIBRATION);
}

void PipelineSession::set_threshold(float level, bool repair) {
    if (level == threshold_level_ && repair == repair_) return;
    threshold_level_ = level;
    repair_ = repair;
    invalidate_from(Phase::BINARIZE);
}

void PipelineSession::set_marker_quantile(double quantile) {
    if (quantile == quantile_) return;
    quantile_ = quantile;
    invalidate_from(Phase::MARKERS);
}

void PipelineSession::set_border_margin(int margin) {
    if (margin == border_margin_) return;
    border_margin_ = margin;
    invalidate_from(Phase::BORDER_FILTER);
}

void PipelineSession::set_size_window(double min_size, double max_size) {
    if (min_size == min_size_ && max_size == max_size_) return;
    min_size_ = min_size;
    max_size_ = max_size;
    invalidate_from(Phase::SIZE_ESTIMATION);
}

void PipelineSession::invalidate_from(Phase phase) {
    // The scale feeds only the size estimate
    if (phase == Phase::CALIBRATION) {
        calibration_.reset();
        scale_.reset();
        sizes_.reset();
        return;
    }

    const int p = phase_to_int(phase);
    if (p <= phase_to_int(Phase::BINARIZE)) mask_.reset();
    if (p <= phase_to_int(Phase::DISTANCE_FIELD)) distance_.reset();
    if (p <= phase_to_int(Phase::MARKERS)) {
        marker_threshold_.reset();
        markers_.reset();
    }
    if (p <= phase_to_int(Phase::WATERSHED)) labels_.reset();
    if (p <= phase_to_int(Phase::BORDER_FILTER)) {
        filtered_.reset();
        border_removed_.clear();
    }
    if (p <= phase_to_int(Phase::SIZE_ESTIMATION)) sizes_.reset();
}

bool PipelineSession::is_cached(Phase phase) const {
    switch (phase) {
        case Phase::CALIBRATION: return scale_.has_value();
        case Phase::BINARIZE: return mask_.has_value();
        case Phase::DISTANCE_FIELD: return distance_.has_value();
        case Phase::MARKERS: return markers_.has_value();
        case Phase::WATERSHED: return labels_.has_value();
        case Phase::BORDER_FILTER: return filtered_.has_value();
        case Phase::SIZE_ESTIMATION: return sizes_.has_value();
        default: return false;
    }
}

const ScaleCalibration* PipelineSession::calibration() {
    scale_factor();
    return calibration_ ? &*calibration_ : nullptr;
}

double PipelineSession::scale_factor() {
    if (!scale_) {
        if (selection_) {
            require_image();
            calibration_ = image::calibrate(image_, *selection_, physical_length_);
            scale_ = calibration_->scale_factor;
        } else {
            scale_ = pixel_size_;
        }
    }
    return *scale_;
}

const Mask2D& PipelineSession::mask() {
    if (!mask_) {
        require_image();
        std::function<void(float)> cb = nullptr;
        if (progress_cb_) {
            cb = [this](float p) { progress_cb_(Phase::BINARIZE, p); };
        }
        mask_ = image::binarize(image_, threshold_level_, repair_, cb);
    }
    return *mask_;
}

const Matrix2Df& PipelineSession::distance() {
    if (!distance_) {
        distance_ = image::distance_field(mask());
    }
    return *distance_;
}

double PipelineSession::marker_threshold() {
    markers();
    return *marker_threshold_;
}

const Label2D& PipelineSession::markers() {
    if (!markers_) {
        const Matrix2Df& dist = distance();
        marker_threshold_ = segmentation::marker_threshold(dist, quantile_);
        markers_ = segmentation::extract_markers(dist, quantile_);
    }
    return *markers_;
}

const Label2D& PipelineSession::labels() {
    if (!labels_) {
        labels_ = segmentation::watershed(distance(), markers(), mask());
    }
    return *labels_;
}

const Label2D& PipelineSession::filtered_labels() {
    if (!filtered_) {
        border_removed_.clear();
        filtered_ = segmentation::filter_border(labels(), border_margin_, &border_removed_);
    }
    return *filtered_;
}

const std::vector<int32_t>& PipelineSession::border_removed() {
    filtered_labels();
    return border_removed_;
}

const SizeDistribution& PipelineSession::sizes() {
    if (!sizes_) {
        const Label2D& filtered = filtered_labels();
        sizes_ = statistics::estimate_sizes(filtered, scale_factor(), min_size_, max_size_);
    }
    return *sizes_;
}

} // namespace particle_sizer::pipeline
