#include "similarity_cache.hpp"
#include "../math/similarity.hpp"
#include <algorithm>

namespace culturerank {

SimilarityCache::SimilarityCache(const std::vector<ScoredCandidate>& candidates)
    : candidates_(candidates) {}

uint64_t SimilarityCache::pair_key(size_t i, size_t j) {
    auto lo = static_cast<uint64_t>(std::min(i, j));
    auto hi = static_cast<uint64_t>(std::max(i, j));
    return (lo << 32) | (hi & 0xFFFFFFFFULL);
}

double SimilarityCache::get(size_t i, size_t j) {
    if (i == j) return 1.0;

    uint64_t key = pair_key(i, j);
    auto it = cache_.find(key);
    if (it != cache_.end()) return it->second;

    double sim = candidate_similarity(*candidates_[i].candidate, *candidates_[j].candidate);
    cache_.emplace(key, sim);
    return sim;
}

} // namespace culturerank
