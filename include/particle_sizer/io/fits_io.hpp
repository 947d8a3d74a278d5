#pragma once

#include "particle_sizer/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace particle_sizer::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
};

bool is_fits_image_path(const fs::path& path);

// Reads the primary HDU as float, row-major (row = NAXIS2, col = NAXIS1).
// Raw values; no normalization.
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

// Physical units per pixel from the SCALE keyword, when present, finite and > 0.
std::optional<double> fits_pixel_scale(const FitsHeader& header);

} // namespace particle_sizer::io
