#include "particle_sizer/io/fits_io.hpp"
#include "particle_sizer/core/errors.hpp"
#include "particle_sizer/core/utils.hpp"

#include <fitsio.h>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace particle_sizer::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    auto it_int = int_values.find(key);
    if (it_int != int_values.end()) {
        return static_cast<double>(it_int->second);
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

std::optional<double> fits_pixel_scale(const FitsHeader& header) {
    auto scale = header.get_double("SCALE");
    if (!scale || !std::isfinite(*scale) || !(*scale > 0.0)) {
        return std::nullopt;
    }
    return scale;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

static void parse_header_card(const char* card, FitsHeader& header) {
    int status = 0;
    char keyname[FLEN_KEYWORD];
    char value[FLEN_VALUE];
    char comment[FLEN_COMMENT];
    int keylen = 0;

    fits_get_keyname(const_cast<char*>(card), keyname, &keylen, &status);
    if (status) return;

    std::string key(keyname);
    if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
        return;
    }

    fits_parse_value(const_cast<char*>(card), value, comment, &status);
    if (status) return;

    char dtype = 'C';
    fits_get_keytype(value, &dtype, &status);
    if (status) return;

    std::string val_str(value);
    val_str.erase(0, val_str.find_first_not_of(" '"));
    val_str.erase(val_str.find_last_not_of(" '") + 1);

    char* end = nullptr;
    switch (dtype) {
        case 'I': {
            long v = std::strtol(val_str.c_str(), &end, 10);
            if (end && *end == '\0') {
                header.set(key, static_cast<int>(v));
                return;
            }
            break;
        }
        case 'F': {
            double v = std::strtod(val_str.c_str(), &end);
            if (end && *end == '\0') {
                header.set(key, v);
                return;
            }
            break;
        }
        default:
            break;
    }
    header.set(key, val_str);
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    long width = naxes[0];
    long height = naxes[1];
    long npixels = width * height;

    // Row-major buffer maps directly onto FITS axis order
    Matrix2Df data(height, width);
    long fpixel[3] = {1, 1, 1};

    fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, data.data(), nullptr, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    FitsHeader header;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys && !status; ++i) {
        if (fits_read_record(fptr, i, card, &status)) break;
        parse_header_card(card, header);
    }

    status = 0;
    fits_close_file(fptr, &status);

    return {data, header};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    std::vector<float> buffer(data.data(), data.data() + data.size());

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(buffer.size()), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
}

} // namespace particle_sizer::io
