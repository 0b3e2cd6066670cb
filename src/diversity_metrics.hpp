#pragma once
#include "types.hpp"
#include <vector>

namespace culturerank {

// Offline-style diagnostics for a ranked list.
struct DiversityMetrics {
    double cluster_entropy = 0.0;          // Shannon entropy of the cluster mix, bits
    double average_pairwise_distance = 0.0; // mean of 1 - candidate_similarity
    uint32_t unique_clusters = 0;
    double max_cluster_ratio = 0.0;        // share of the most frequent cluster
};

// Empty input yields all zeros; a single item has distance 0.
DiversityMetrics compute_diversity_metrics(const std::vector<const Candidate*>& items);

} // namespace culturerank
