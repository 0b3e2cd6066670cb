#pragma once
#include "reranker.hpp"
#include "similarity_cache.hpp"
#include "../math/matrix.hpp"

namespace culturerank {

// L kernel over the first `count` candidates:
//   L[i][i] = q_i^2,  L[i][j] = q_i * max(0, 1 - w * sim(i, j)) * q_j,
// with q_i = max(final_score_i, 1e-10).
Matrix build_dpp_kernel(const std::vector<ScoredCandidate>& candidates, size_t count,
                        double diversity_weight, SimilarityCache& similarities);

// Greedy MAP approximation: repeatedly add the index whose inclusion gives
// the largest regularized determinant, scaled by gain^(1/temperature).
// Stops after `k` picks or when no index yields a positive gain.
std::vector<size_t> dpp_greedy_select(const Matrix& kernel, size_t k, const DppConfig& config);

// Determinantal point process selection. The cluster cap is not enforced;
// picks that land on a full cluster are only counted in the report.
class DppReranker : public Reranker {
public:
    Strategy strategy() const override { return Strategy::Dpp; }

    RerankResult rerank(const std::vector<ScoredCandidate>& candidates,
                        const ClusterExposures& exposures,
                        const RerankOptions& options) const override;
};

} // namespace culturerank
