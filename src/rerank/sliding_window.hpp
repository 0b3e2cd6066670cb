#pragma once
#include "../types.hpp"
#include <cstdint>
#include <vector>

namespace culturerank {

struct SlidingWindowConfig {
    uint32_t window_size = 20;
    uint32_t max_per_cluster = 5;
    double similarity_threshold = 1.0; // reject at or above this similarity
    uint32_t lookback = 5;             // recent kept items compared against
};

struct SlidingWindowResult {
    std::vector<size_t> kept; // indices into the input, in input order
    uint32_t cluster_violations = 0;
    uint32_t similarity_violations = 0;

    uint32_t total_filtered() const { return cluster_violations + similarity_violations; }
};

// Raw cosine of the embeddings when both carry one, cluster similarity
// otherwise. Unlike candidate_similarity this is not mapped into [0, 1].
double window_similarity(const Candidate& a, const Candidate& b);

// Hard constraint pass over a list in priority order. An item is dropped
// when its cluster already holds max_per_cluster kept items, or when it is
// too similar to one of the last `lookback` kept items. Stops once
// window_size items are kept; later items are not counted.
SlidingWindowResult sliding_window_filter(const std::vector<const Candidate*>& items,
                                          const SlidingWindowConfig& config = {});

} // namespace culturerank
