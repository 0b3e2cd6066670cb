#pragma once
#include "reranker.hpp"

namespace culturerank {

// Greedy Maximal Marginal Relevance with a soft per-cluster cap and
// seeded exploration slots.
//
// Position 0 takes the best final score. Positions drawn by the seeded
// generator from [1, N-1] become exploration slots, filled by the best
// 0.7*DNS + 0.3*final candidate from an under-exposed cluster. Every other
// position takes the candidate maximizing
//     final - lambda * max_similarity(candidate, selected).
// Candidates whose cluster already holds K picks are skipped and counted;
// when every remaining candidate is capped the cap is ignored for that step.
class MmrReranker : public Reranker {
public:
    Strategy strategy() const override { return Strategy::Mmr; }

    RerankResult rerank(const std::vector<ScoredCandidate>& candidates,
                        const ClusterExposures& exposures,
                        const RerankOptions& options) const override;
};

} // namespace culturerank
