#include "ranker.hpp"
#include "fingerprint.hpp"
#include "rng.hpp"
#include "scoring.hpp"
#include "weights.hpp"
#include <algorithm>
#include <iostream>

namespace culturerank {

bool ranks_before(const ScoredCandidate& a, const ScoredCandidate& b) {
    if (a.score.final_score != b.score.final_score)
        return a.score.final_score > b.score.final_score;
    if (a.candidate->created_at != b.candidate->created_at)
        return a.candidate->created_at > b.candidate->created_at;
    return a.candidate->item_key < b.candidate->item_key;
}

std::vector<ScoredCandidate> primary_rank(const std::vector<Candidate>& candidates,
                                          const ClusterExposures& exposures,
                                          int64_t now_ts,
                                          const ScoreWeights& weights,
                                          const ScoringConfig& scoring,
                                          const SurfaceFilter& filter) {
    std::vector<ScoredCandidate> scored;
    scored.reserve(candidates.size());

    for (const auto& c : candidates) {
        if (c.quality.hard_block) continue;
        if (!filter.admits(c)) continue;
        scored.push_back({&c, calculate_mixed_score(c, exposures, now_ts, weights, scoring)});
    }

    std::sort(scored.begin(), scored.end(), ranks_before);
    return scored;
}

Ranker::Ranker(const Config& config, const SurfacePolicy& policy)
    : config_(config), policy_(policy) {}

AlgorithmParams Ranker::effective_params(const RankRequest& request) const {
    return resolve_params(config_.params, request.params);
}

RankResponse Ranker::rank(const RankRequest& request) const {
    const AlgorithmParams params = effective_params(request);
    const UserState& user = request.user_state;

    SliderAdjustment adjusted = adjust_for_diversity_slider(
        params.weights, user.diversity_slider, params.diversity_cap_k,
        params.exploration_budget, params.slider);

    std::vector<ScoredCandidate> scored = primary_rank(
        request.candidates, user.recent_cluster_exposures, request.context.now_ts,
        adjusted.weights, params.scoring, policy_.filter_for(request.context.surface));

    if (scored.size() > static_cast<size_t>(params.rerank_max_candidates)) {
        scored.resize(static_cast<size_t>(params.rerank_max_candidates));
    }

    RerankOptions options;
    options.target_size = static_cast<uint32_t>(
        std::min<int64_t>(params.diversity_cap_n, static_cast<int64_t>(scored.size())));
    options.cluster_cap = adjusted.effective_k;
    options.exploration_budget = adjusted.effective_budget;
    options.mmr_lambda = params.mmr_lambda;
    options.exploration_exposure_ceiling = params.exploration_exposure_ceiling;
    options.exploration_dns_weight = params.exploration_dns_weight;
    options.exploration_score_weight = params.exploration_score_weight;
    options.seed = derive_seed(request.request_seed, request.request_id);
    options.dpp = params.dpp;
    options.explain = params.explain;

    Strategy strategy = params.strategy;
    if (strategy == Strategy::Dpp && options.target_size > params.dpp.max_items) {
        std::cerr << "[rerank] DPP requested for N=" << options.target_size
                  << " (limit " << params.dpp.max_items << "), using MMR\n";
        strategy = Strategy::Mmr;
    }

    auto reranker = create_reranker(strategy);
    RerankResult reranked = reranker->rerank(scored, user.recent_cluster_exposures, options);
    reranked.report.effective_weights = adjusted.weights;

    RankResponse response;
    response.request_id = request.request_id;
    response.param_set_id = param_set_id(params, config_.fingerprint);
    response.variant_id = request.variant_id;
    response.constraints_report = reranked.report;

    response.ranked.reserve(reranked.items.size());
    for (auto& item : reranked.items) {
        const ScoredCandidate& sc = scored[item.index];
        RankedItem out;
        out.item_key = sc.candidate->item_key;
        out.type = sc.candidate->type;
        out.cluster_id = sc.candidate->cluster_id;
        out.final_score = sc.score.final_score;
        out.reason_codes = std::move(item.reason_codes);
        out.score_breakdown = sc.score;
        response.ranked.push_back(std::move(out));
    }

    return response;
}

} // namespace culturerank
