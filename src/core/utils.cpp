#include "particle_sizer/core/utils.hpp"
#include "particle_sizer/core/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace particle_sizer::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw ParticleSizerError("Cannot allocate SHA-256 context");
    }
    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;
    if (ok && !data.empty()) {
        ok = EVP_DigestUpdate(ctx, data.data(), data.size()) == 1;
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (ok) {
        ok = EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    }
    EVP_MD_CTX_free(ctx);
    if (!ok) {
        throw ParticleSizerError("SHA-256 digest failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_file(const fs::path& path) {
    return sha256_bytes(read_bytes(path));
}

double compute_quantile(std::vector<float> values, double q) {
    if (values.empty()) return 0.0;
    if (!(q >= 0.0 && q <= 1.0)) {
        throw ValidationError("quantile must be in [0,1], got " + std::to_string(q));
    }

    std::sort(values.begin(), values.end());

    const double h = q * static_cast<double>(values.size() - 1);
    const size_t lower = static_cast<size_t>(std::floor(h));
    const size_t upper = std::min(lower + 1, values.size() - 1);
    const double frac = h - static_cast<double>(lower);

    return static_cast<double>(values[lower]) +
           frac * (static_cast<double>(values[upper]) - static_cast<double>(values[lower]));
}

double compute_quantile(const Matrix2Df& data, double q) {
    std::vector<float> values(data.data(), data.data() + data.size());
    return compute_quantile(std::move(values), q);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace particle_sizer::core
