#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace culturerank {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) return false;
    }

    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << content;
        if (!out.good()) return false;
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string hex_encode(const unsigned char* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// ── Numeric guards ───────────────────────────────────────────────

double clamp(double value, double lo, double hi) {
    if (!std::isfinite(value)) return lo;
    return std::max(lo, std::min(hi, value));
}

double clamp01(double value) {
    return clamp(value, 0.0, 1.0);
}

double round9(double value) {
    if (!std::isfinite(value)) return 0.0;
    double r = std::floor(value * 1e9 + 0.5) / 1e9;
    return r == 0.0 ? 0.0 : r; // no negative zero
}

double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

double finite_or(double value, double fallback) {
    return std::isfinite(value) ? value : fallback;
}

int64_t saturate_int(double value, int64_t lo, int64_t hi) {
    if (std::isnan(value)) return lo;
    double f = std::floor(value);
    // Compare in double space; 2^63 is the first double outside int64_t.
    if (f <= static_cast<double>(lo)) return lo;
    if (f >= static_cast<double>(hi)) return hi;
    return static_cast<int64_t>(f);
}

} // namespace culturerank
