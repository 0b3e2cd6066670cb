#pragma once
#include "config.hpp"
#include "rerank/reranker.hpp"
#include "surface_policy.hpp"
#include "types.hpp"
#include <vector>

namespace culturerank {

// Total primary order: final score desc, created_at desc, item_key asc.
bool ranks_before(const ScoredCandidate& a, const ScoredCandidate& b);

// Drop hard-blocked candidates and those the surface filter rejects, score
// the rest with `weights`, and sort them into primary order.
std::vector<ScoredCandidate> primary_rank(const std::vector<Candidate>& candidates,
                                          const ClusterExposures& exposures,
                                          int64_t now_ts,
                                          const ScoreWeights& weights,
                                          const ScoringConfig& scoring,
                                          const SurfaceFilter& filter);

// Full ranking pipeline for one request. Holds no per-request state, so a
// single instance can serve any number of calls.
class Ranker {
public:
    Ranker(const Config& config, const SurfacePolicy& policy);

    RankResponse rank(const RankRequest& request) const;

    // Effective parameters for a request (configured defaults + overrides).
    AlgorithmParams effective_params(const RankRequest& request) const;

private:
    const Config& config_;
    const SurfacePolicy& policy_;
};

} // namespace culturerank
