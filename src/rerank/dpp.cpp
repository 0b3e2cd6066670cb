#include "dpp.hpp"
#include "../explain.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace culturerank {

Matrix build_dpp_kernel(const std::vector<ScoredCandidate>& candidates, size_t count,
                        double diversity_weight, SimilarityCache& similarities) {
    const size_t n = std::min(count, candidates.size());
    Matrix kernel(n, std::vector<double>(n, 0.0));

    std::vector<double> quality(n);
    for (size_t i = 0; i < n; i++) {
        double score = candidates[i].score.final_score;
        quality[i] = std::isfinite(score) ? std::max(score, 1e-10) : 1e-10;
    }

    for (size_t i = 0; i < n; i++) {
        kernel[i][i] = quality[i] * quality[i];
        for (size_t j = i + 1; j < n; j++) {
            double factor = std::max(0.0, 1.0 - diversity_weight * similarities.get(i, j));
            double value = quality[i] * factor * quality[j];
            kernel[i][j] = value;
            kernel[j][i] = value;
        }
    }
    return kernel;
}

std::vector<size_t> dpp_greedy_select(const Matrix& kernel, size_t k, const DppConfig& config) {
    std::vector<size_t> selected;
    std::vector<bool> taken(kernel.size(), false);
    const double exponent = 1.0 / std::max(config.temperature, 1e-6);

    while (selected.size() < k && selected.size() < kernel.size()) {
        size_t best = kernel.size();
        double best_gain = 0.0;

        std::vector<size_t> trial = selected;
        trial.push_back(0);

        for (size_t idx = 0; idx < kernel.size(); idx++) {
            if (taken[idx]) continue;
            trial.back() = idx;

            double det = determinant(principal_submatrix(kernel, trial), config.regularization);
            double gain = std::isfinite(det) ? std::max(0.0, det) : 0.0;

            double scaled = 0.0;
            if (gain > 0.0) {
                scaled = std::pow(gain, exponent);
                if (!std::isfinite(scaled)) scaled = 0.0;
            }

            if (scaled > best_gain) {
                best_gain = scaled;
                best = idx;
            }
        }

        if (best == kernel.size()) break; // no positive gain left

        selected.push_back(best);
        taken[best] = true;
    }
    return selected;
}

RerankResult DppReranker::rerank(const std::vector<ScoredCandidate>& candidates,
                                 const ClusterExposures& exposures,
                                 const RerankOptions& options) const {
    RerankResult result;
    ConstraintsReport& report = result.report;
    report.effective_diversity_cap_k = options.cluster_cap;
    report.effective_exploration_budget = options.exploration_budget;

    const size_t n = std::min<size_t>(options.target_size, candidates.size());
    if (n == 0) {
        report.used_strategy = Strategy::None;
        return result;
    }
    report.used_strategy = Strategy::Dpp;

    const size_t pool = std::min<size_t>(options.dpp.max_items, candidates.size());
    SimilarityCache similarities(candidates);
    Matrix kernel = build_dpp_kernel(candidates, pool, options.dpp.diversity_weight, similarities);

    std::map<std::string, uint32_t> cluster_counts;
    for (size_t idx : dpp_greedy_select(kernel, n, options.dpp)) {
        const Candidate& c = *candidates[idx].candidate;
        uint32_t& count = cluster_counts[c.cluster_id];
        if (count >= options.cluster_cap) report.cap_applied_count++;
        count++;

        RerankedItem item;
        item.index = idx;
        item.reason_codes = determine_reason_codes(c, exposures, options.explain);
        result.items.push_back(std::move(item));
    }
    return result;
}

} // namespace culturerank
