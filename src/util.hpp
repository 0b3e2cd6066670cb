#pragma once
#include <string>
#include <cstdint>

namespace culturerank {

// Trim whitespace
std::string trim(const std::string& s);

// Lowercase ASCII copy
std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write to a temp file beside `path`, then rename over it.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file. Throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string& path);

// Lowercase hex of a byte buffer
std::string hex_encode(const unsigned char* data, size_t len);

// ── Numeric guards ───────────────────────────────────────────────

// Clamp to [lo, hi]; non-finite values map to lo.
double clamp(double value, double lo, double hi);

// Clamp to [0, 1]; non-finite values map to 0.
double clamp01(double value);

// Round to 9 decimal digits, halves toward +inf. Non-finite values map to 0.
double round9(double value);

// Linear interpolation a + (b - a) * t
double lerp(double a, double b, double t);

// Finite value or fallback
double finite_or(double value, double fallback);

// Floor to an integer, saturating at [lo, hi]. NaN maps to lo.
int64_t saturate_int(double value, int64_t lo, int64_t hi);

} // namespace culturerank
