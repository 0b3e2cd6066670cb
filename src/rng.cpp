#include "rng.hpp"
#include <cmath>
#include <set>

namespace culturerank {

uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = kFnv1aOffsetBasis;
    for (unsigned char byte : data) {
        hash ^= byte;
        hash *= kFnv1aPrime;
    }
    return hash;
}

uint64_t derive_seed(const std::optional<std::string>& request_seed,
                     const std::string& request_id) {
    const std::string& source =
        (request_seed && !request_seed->empty()) ? *request_seed : request_id;
    uint64_t seed = fnv1a64(source);
    return seed == 0 ? 1 : seed;
}

Xorshift64::Xorshift64(uint64_t seed) : state_(seed == 0 ? 1 : seed) {}

double Xorshift64::next() {
    uint64_t x = state_;
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    if (x == 0) x = 1;
    state_ = x;

    double r = static_cast<double>(x & 0xFFFFFFFFULL) / 4294967296.0;
    if (!(r >= 0.0)) return 0.0;
    if (r >= 1.0) return std::nextafter(1.0, 0.0);
    return r;
}

int64_t Xorshift64::next_int(int64_t min, int64_t max) {
    if (max < min) return min;
    double span = static_cast<double>(max - min) + 1.0;
    auto offset = static_cast<int64_t>(std::floor(next() * span));
    if (offset > max - min) offset = max - min;
    return min + offset;
}

std::vector<int64_t> unique_random_indices(Xorshift64& rng, int64_t count,
                                           int64_t min, int64_t max) {
    std::vector<int64_t> result;
    if (count <= 0 || max < min) return result;

    const int64_t range = max - min + 1;
    if (count >= range) {
        result.reserve(static_cast<size_t>(range));
        for (int64_t i = min; i <= max; i++) result.push_back(i);
        return result;
    }

    std::set<int64_t> picked;
    while (static_cast<int64_t>(picked.size()) < count) {
        picked.insert(rng.next_int(min, max));
    }
    result.assign(picked.begin(), picked.end());
    return result;
}

} // namespace culturerank
