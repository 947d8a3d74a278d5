#pragma once

#include "types.hpp"
#include "errors.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace particle_sizer::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities

// Linearly interpolated quantile (Hyndman-Fan type 7) of all values,
// q in [0,1]. Returns 0 for an empty input.
double compute_quantile(std::vector<float> values, double q);
double compute_quantile(const Matrix2Df& data, double q);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);

// Grid shape checks shared by every stage
template <typename A, typename B>
void require_same_shape(const A& a, const B& b, const std::string& what) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        throw DimensionMismatchError(
            what + ": " + std::to_string(a.rows()) + "x" + std::to_string(a.cols()) +
            " vs " + std::to_string(b.rows()) + "x" + std::to_string(b.cols()));
    }
}

template <typename A>
void require_non_empty(const A& a, const std::string& what) {
    if (a.rows() == 0 || a.cols() == 0) {
        throw ValidationError(what + " is empty");
    }
}

} // namespace particle_sizer::core
