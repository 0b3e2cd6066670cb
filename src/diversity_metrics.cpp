#include "diversity_metrics.hpp"
#include "math/similarity.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace culturerank {

DiversityMetrics compute_diversity_metrics(const std::vector<const Candidate*>& items) {
    DiversityMetrics m;
    if (items.empty()) return m;

    std::map<std::string, uint32_t> counts;
    for (const Candidate* c : items) counts[c->cluster_id]++;

    const double total = static_cast<double>(items.size());
    uint32_t max_count = 0;
    for (const auto& [cluster, count] : counts) {
        double p = static_cast<double>(count) / total;
        if (p > 0.0) m.cluster_entropy -= p * std::log2(p);
        max_count = std::max(max_count, count);
    }
    m.cluster_entropy = std::max(0.0, m.cluster_entropy);
    m.unique_clusters = static_cast<uint32_t>(counts.size());
    m.max_cluster_ratio = static_cast<double>(max_count) / total;

    double distance_sum = 0.0;
    size_t pairs = 0;
    for (size_t i = 0; i < items.size(); i++) {
        for (size_t j = i + 1; j < items.size(); j++) {
            distance_sum += 1.0 - candidate_similarity(*items[i], *items[j]);
            pairs++;
        }
    }
    if (pairs > 0) {
        m.average_pairwise_distance = clamp01(distance_sum / static_cast<double>(pairs));
    }
    return m;
}

} // namespace culturerank
