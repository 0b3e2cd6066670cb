#pragma once
#include "reranker.hpp"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace culturerank {

// Pairwise candidate similarity, memoized for one rerank call.
// Keys are the unordered index pair, packed as (min << 32) | max.
class SimilarityCache {
public:
    explicit SimilarityCache(const std::vector<ScoredCandidate>& candidates);

    double get(size_t i, size_t j);

    size_t size() const { return cache_.size(); }

private:
    static uint64_t pair_key(size_t i, size_t j);

    const std::vector<ScoredCandidate>& candidates_;
    std::unordered_map<uint64_t, double> cache_;
};

} // namespace culturerank
