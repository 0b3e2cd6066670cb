#pragma once
#include "../params.hpp"
#include "../types.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace culturerank {

// A candidate that survived filtering, with its score for this call.
// Points into the request's candidate list, which outlives the call.
struct ScoredCandidate {
    const Candidate* candidate = nullptr;
    ScoreBreakdown score;
};

struct RerankOptions {
    uint32_t target_size = 0;       // N, already bounded by the caller
    uint32_t cluster_cap = 1;       // effective K
    double exploration_budget = 0.0;
    double mmr_lambda = 0.3;
    int64_t exploration_exposure_ceiling = 2;
    double exploration_dns_weight = 0.7;
    double exploration_score_weight = 0.3;
    uint64_t seed = 1;
    DppConfig dpp;
    ExplainThresholds explain;
};

struct RerankedItem {
    size_t index = 0; // into the scored candidate list
    std::vector<ReasonCode> reason_codes;
};

struct RerankResult {
    std::vector<RerankedItem> items;
    ConstraintsReport report; // effective_weights is filled by the caller
};

// Diversity-aware reranking strategy. Input must already be in primary
// order (final score desc, created_at desc, item_key asc). Implementations
// are stateless: all per-call state lives inside rerank().
class Reranker {
public:
    virtual ~Reranker() = default;

    virtual Strategy strategy() const = 0;

    virtual RerankResult rerank(const std::vector<ScoredCandidate>& candidates,
                                const ClusterExposures& exposures,
                                const RerankOptions& options) const = 0;
};

// MMR for Strategy::Mmr and Strategy::None, DPP for Strategy::Dpp.
std::unique_ptr<Reranker> create_reranker(Strategy strategy);

} // namespace culturerank
