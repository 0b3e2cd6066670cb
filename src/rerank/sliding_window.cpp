#include "sliding_window.hpp"
#include "../math/similarity.hpp"
#include <algorithm>
#include <map>
#include <string>

namespace culturerank {

double window_similarity(const Candidate& a, const Candidate& b) {
    const auto& ea = a.features.embedding;
    const auto& eb = b.features.embedding;
    if (ea && eb && !ea->empty() && !eb->empty()) {
        return cosine_similarity(*ea, *eb);
    }
    return cluster_similarity(a.cluster_id, b.cluster_id);
}

SlidingWindowResult sliding_window_filter(const std::vector<const Candidate*>& items,
                                          const SlidingWindowConfig& config) {
    SlidingWindowResult result;
    std::map<std::string, uint32_t> cluster_counts;

    for (size_t i = 0; i < items.size(); i++) {
        if (result.kept.size() >= config.window_size) break;
        const Candidate& c = *items[i];

        uint32_t& count = cluster_counts[c.cluster_id];
        if (count >= config.max_per_cluster) {
            result.cluster_violations++;
            continue;
        }

        size_t from = result.kept.size() - std::min<size_t>(result.kept.size(), config.lookback);
        bool too_similar = false;
        for (size_t r = from; r < result.kept.size(); r++) {
            if (window_similarity(c, *items[result.kept[r]]) >= config.similarity_threshold) {
                too_similar = true;
                break;
            }
        }
        if (too_similar) {
            result.similarity_violations++;
            continue;
        }

        result.kept.push_back(i);
        count++;
    }
    return result;
}

} // namespace culturerank
