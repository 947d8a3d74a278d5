#include "particle_sizer/io/image_io.hpp"
#include "particle_sizer/io/fits_io.hpp"
#include "particle_sizer/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace particle_sizer::io {

namespace {

Matrix2Df min_max_normalize(const Matrix2Df& raw) {
    float lo = std::numeric_limits<float>::infinity();
    float hi = -std::numeric_limits<float>::infinity();
    for (Eigen::Index i = 0; i < raw.size(); ++i) {
        const float v = raw.data()[i];
        if (!std::isfinite(v)) continue;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    if (!std::isfinite(lo) || !std::isfinite(hi)) {
        throw IOError("Image holds no finite pixel values");
    }

    Matrix2Df out(raw.rows(), raw.cols());
    const float range = hi - lo;
    for (Eigen::Index i = 0; i < raw.size(); ++i) {
        const float v = raw.data()[i];
        if (!std::isfinite(v)) {
            out.data()[i] = v;
        } else {
            out.data()[i] = range > 0.0f ? (v - lo) / range : 0.0f;
        }
    }
    return out;
}

void write_png(const fs::path& path, const cv::Mat& img) {
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write image " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

} // namespace

Matrix2Df load_grayscale(const fs::path& path, FitsHeader* fits_header) {
    if (!fs::exists(path)) {
        throw IOError("Image file not found: " + path.string());
    }

    if (is_fits_image_path(path)) {
        auto [raw, header] = read_fits_float(path);
        if (fits_header) *fits_header = std::move(header);
        return min_max_normalize(raw);
    }

    cv::Mat img = cv::imread(path.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_ANYCOLOR);
    if (img.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }

    if (img.channels() == 4) {
        cv::cvtColor(img, img, cv::COLOR_BGRA2GRAY);
    } else if (img.channels() == 3) {
        cv::cvtColor(img, img, cv::COLOR_BGR2GRAY);
    }

    double scale = 1.0;
    switch (img.depth()) {
        case CV_8U: scale = 1.0 / 255.0; break;
        case CV_16U: scale = 1.0 / 65535.0; break;
        case CV_8S: scale = 1.0 / 127.0; break;
        case CV_16S: scale = 1.0 / 32767.0; break;
        case CV_32S: scale = 1.0 / 2147483647.0; break;
        default: scale = 1.0; break;
    }

    cv::Mat f32;
    img.convertTo(f32, CV_32F, scale);
    const bool clamp = img.depth() == CV_32F || img.depth() == CV_64F;

    Matrix2Df out(f32.rows, f32.cols);
    for (int r = 0; r < f32.rows; ++r) {
        const float* src = f32.ptr<float>(r);
        for (int c = 0; c < f32.cols; ++c) {
            out(r, c) = clamp ? std::clamp(src[c], 0.0f, 1.0f) : src[c];
        }
    }
    return out;
}

std::array<uint8_t, 3> label_color(int32_t label) {
    if (label <= 0) return {0, 0, 0};

    // splitmix32-style mixing; keep channels away from black
    uint32_t h = static_cast<uint32_t>(label) * 0x9E3779B9u;
    h ^= h >> 16;
    h *= 0x85EBCA6Bu;
    h ^= h >> 13;
    h *= 0xC2B2AE35u;
    h ^= h >> 16;

    return {static_cast<uint8_t>(64 + (h & 0xFF) % 192),
            static_cast<uint8_t>(64 + ((h >> 8) & 0xFF) % 192),
            static_cast<uint8_t>(64 + ((h >> 16) & 0xFF) % 192)};
}

void write_mask_png(const fs::path& path, const Mask2D& mask) {
    cv::Mat img(static_cast<int>(mask.rows()), static_cast<int>(mask.cols()), CV_8U);
    for (int r = 0; r < img.rows; ++r) {
        uint8_t* dst = img.ptr<uint8_t>(r);
        for (int c = 0; c < img.cols; ++c) {
            dst[c] = mask(r, c) ? 255 : 0;
        }
    }
    write_png(path, img);
}

void write_labels_png(const fs::path& path, const Label2D& labels) {
    cv::Mat img(static_cast<int>(labels.rows()), static_cast<int>(labels.cols()), CV_8UC3);
    for (int r = 0; r < img.rows; ++r) {
        cv::Vec3b* dst = img.ptr<cv::Vec3b>(r);
        for (int c = 0; c < img.cols; ++c) {
            const auto rgb = label_color(labels(r, c));
            dst[c] = cv::Vec3b(rgb[2], rgb[1], rgb[0]);
        }
    }
    write_png(path, img);
}

void write_distance_png(const fs::path& path, const Matrix2Df& dist) {
    float hi = 0.0f;
    for (Eigen::Index i = 0; i < dist.size(); ++i) {
        if (std::isfinite(dist.data()[i])) hi = std::max(hi, dist.data()[i]);
    }
    const float k = hi > 0.0f ? 255.0f / hi : 0.0f;

    cv::Mat img(static_cast<int>(dist.rows()), static_cast<int>(dist.cols()), CV_8U);
    for (int r = 0; r < img.rows; ++r) {
        uint8_t* dst = img.ptr<uint8_t>(r);
        for (int c = 0; c < img.cols; ++c) {
            const float v = dist(r, c);
            dst[c] = std::isfinite(v) ? cv::saturate_cast<uint8_t>(v * k) : 0;
        }
    }
    write_png(path, img);
}

} // namespace particle_sizer::io
