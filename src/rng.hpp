#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace culturerank {

constexpr uint64_t kFnv1aOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnv1aPrime = 1099511628211ULL;

// 64-bit FNV-1a over the bytes of `data`.
uint64_t fnv1a64(const std::string& data);

// Seed for a ranking call: hash of the request seed, or of the request id
// when no (non-empty) seed was sent. Never 0.
uint64_t derive_seed(const std::optional<std::string>& request_seed,
                     const std::string& request_id);

// xorshift64 (13, 7, 17). Same seed, same sequence, on every platform.
class Xorshift64 {
public:
    explicit Xorshift64(uint64_t seed);

    // Uniform double in [0, 1), built from the low 32 bits of the state.
    double next();

    // Uniform integer in [min, max]; returns min when max < min.
    int64_t next_int(int64_t min, int64_t max);

    uint64_t state() const { return state_; }

private:
    uint64_t state_;
};

// `count` distinct integers drawn from [min, max], sorted ascending.
// Returns the whole range when count >= its size.
std::vector<int64_t> unique_random_indices(Xorshift64& rng, int64_t count,
                                           int64_t min, int64_t max);

} // namespace culturerank
