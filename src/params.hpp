#pragma once
#include "types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>

namespace culturerank {

struct CvsWeights {
    double like = 0.35;
    double context = 0.25;
    double collection = 0.15;
    double bridge = 0.15;
    double sustain = 0.10;
};

struct ScoringConfig {
    CvsWeights cvs_weights;
    double cluster_novelty_factor = 0.06;
    double time_half_life_hours = 72.0;
    double dns_cluster_weight = 0.6;
    double dns_time_weight = 0.4;
    double spam_penalty = 0.5;
};

// Maps the user's diversity slider onto weights, cluster cap and exploration.
struct SliderConfig {
    double delta_max = 0.10;
    double min_weight = 0.05;
    double max_weight = 0.90;
    uint32_t max_iterations = 3;
    double dns_ratio = 0.6;
    double cvs_ratio = 0.4;
    double k_min_multiplier = 0.5;
    double k_max_multiplier = 1.5;
    double exploration_min_multiplier = 0.5;
    double exploration_max_multiplier = 1.5;
    double budget_min = 0.0;
    double budget_max = 0.5;
};

struct DppConfig {
    double diversity_weight = 0.5;
    double temperature = 1.0;
    double regularization = 1e-6;
    uint32_t max_items = 100; // determinant cost is cubic in subset size
};

struct ExplainThresholds {
    double context_high = 0.70;
    double bridge_high = 0.70;
    double support_density_high = 0.15;
    int64_t new_cluster_exposure_limit = 2; // NEW_IN_CLUSTER when exposure < limit
    double prs_similarity_min = 0.65;
    double support_prior_likes = 1.0;
    double support_prior_views = 10.0;
};

struct AlgorithmParams {
    int64_t diversity_cap_n = 20;
    int64_t diversity_cap_k = 5;
    double exploration_budget = 0.15;
    ScoreWeights weights;
    int64_t rerank_max_candidates = 200;
    Strategy strategy = Strategy::Mmr;
    double mmr_lambda = 0.3;
    int64_t exploration_exposure_ceiling = 2;
    double exploration_dns_weight = 0.7;
    double exploration_score_weight = 0.3;
    DppConfig dpp;
    ScoringConfig scoring;
    SliderConfig slider;
    ExplainThresholds explain;
};

// Apply a partial JSON override (camelCase keys) on top of `base`.
// Unknown keys and wrong-typed values are ignored; numbers are clamped
// into their valid ranges afterwards.
AlgorithmParams resolve_params(const AlgorithmParams& base, const nlohmann::json& overrides);

// Full parameter set as JSON. nlohmann::json objects keep keys sorted,
// so dump() of this value is canonical.
nlohmann::json params_to_json(const AlgorithmParams& params);

} // namespace culturerank
