#include "params.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace culturerank {

using json = nlohmann::json;

namespace {

void read_double(const json& j, const char* key, double& out) {
    if (j.contains(key) && j[key].is_number()) {
        double v = j[key].get<double>();
        if (std::isfinite(v)) out = v;
    }
}

void read_int(const json& j, const char* key, int64_t& out) {
    if (j.contains(key) && j[key].is_number()) {
        double v = j[key].get<double>();
        if (std::isfinite(v)) out = saturate_int(v, INT64_MIN, INT64_MAX);
    }
}

void read_uint(const json& j, const char* key, uint32_t& out) {
    int64_t v = out;
    read_int(j, key, v);
    out = static_cast<uint32_t>(std::max<int64_t>(0, std::min<int64_t>(v, UINT32_MAX)));
}

void apply_scoring(ScoringConfig& s, const json& j) {
    if (j.contains("cvsWeights") && j["cvsWeights"].is_object()) {
        auto& w = j["cvsWeights"];
        read_double(w, "like", s.cvs_weights.like);
        read_double(w, "context", s.cvs_weights.context);
        read_double(w, "collection", s.cvs_weights.collection);
        read_double(w, "bridge", s.cvs_weights.bridge);
        read_double(w, "sustain", s.cvs_weights.sustain);
    }
    read_double(j, "clusterNoveltyFactor", s.cluster_novelty_factor);
    read_double(j, "timeHalfLifeHours", s.time_half_life_hours);
    read_double(j, "dnsClusterWeight", s.dns_cluster_weight);
    read_double(j, "dnsTimeWeight", s.dns_time_weight);
    read_double(j, "spamPenalty", s.spam_penalty);
}

void apply_slider(SliderConfig& s, const json& j) {
    read_double(j, "deltaMax", s.delta_max);
    read_double(j, "minWeight", s.min_weight);
    read_double(j, "maxWeight", s.max_weight);
    read_uint(j, "maxIterations", s.max_iterations);
    read_double(j, "dnsRatio", s.dns_ratio);
    read_double(j, "cvsRatio", s.cvs_ratio);
    read_double(j, "kMinMultiplier", s.k_min_multiplier);
    read_double(j, "kMaxMultiplier", s.k_max_multiplier);
    read_double(j, "explorationMinMultiplier", s.exploration_min_multiplier);
    read_double(j, "explorationMaxMultiplier", s.exploration_max_multiplier);
    read_double(j, "budgetMin", s.budget_min);
    read_double(j, "budgetMax", s.budget_max);
}

void apply_dpp(DppConfig& d, const json& j) {
    read_double(j, "diversityWeight", d.diversity_weight);
    read_double(j, "temperature", d.temperature);
    read_double(j, "regularization", d.regularization);
    read_uint(j, "maxItems", d.max_items);
}

void apply_explain(ExplainThresholds& e, const json& j) {
    read_double(j, "contextHigh", e.context_high);
    read_double(j, "bridgeHigh", e.bridge_high);
    read_double(j, "supportDensityHigh", e.support_density_high);
    read_int(j, "newClusterExposureLimit", e.new_cluster_exposure_limit);
    read_double(j, "prsSimilarityMin", e.prs_similarity_min);
    read_double(j, "supportPriorLikes", e.support_prior_likes);
    read_double(j, "supportPriorViews", e.support_prior_views);
}

void sanitize(AlgorithmParams& p) {
    p.diversity_cap_n = std::clamp<int64_t>(p.diversity_cap_n, 0, UINT32_MAX);
    p.diversity_cap_k = std::clamp<int64_t>(p.diversity_cap_k, 0, UINT32_MAX);
    p.exploration_budget = clamp01(p.exploration_budget);
    p.rerank_max_candidates = std::clamp<int64_t>(p.rerank_max_candidates, 1, UINT32_MAX);
    p.weights.prs = std::max(0.0, p.weights.prs);
    p.weights.cvs = std::max(0.0, p.weights.cvs);
    p.weights.dns = std::max(0.0, p.weights.dns);
    p.mmr_lambda = std::max(0.0, p.mmr_lambda);
    p.exploration_exposure_ceiling = std::max<int64_t>(0, p.exploration_exposure_ceiling);
    p.dpp.diversity_weight = std::max(0.0, p.dpp.diversity_weight);
    p.dpp.temperature = std::max(1e-6, p.dpp.temperature);
    p.dpp.regularization = std::max(0.0, p.dpp.regularization);
    p.scoring.cluster_novelty_factor = std::max(0.0, p.scoring.cluster_novelty_factor);
    p.scoring.time_half_life_hours = std::max(1e-6, p.scoring.time_half_life_hours);
    p.slider.min_weight = clamp01(p.slider.min_weight);
    p.slider.max_weight = clamp(p.slider.max_weight, p.slider.min_weight, 1.0);
    p.slider.budget_min = clamp01(p.slider.budget_min);
    p.slider.budget_max = clamp(p.slider.budget_max, p.slider.budget_min, 1.0);
}

} // namespace

AlgorithmParams resolve_params(const AlgorithmParams& base, const json& overrides) {
    AlgorithmParams p = base;
    if (!overrides.is_object()) {
        sanitize(p);
        return p;
    }
    const json& j = overrides;

    read_int(j, "diversityCapN", p.diversity_cap_n);
    read_int(j, "diversityCapK", p.diversity_cap_k);
    read_double(j, "explorationBudget", p.exploration_budget);
    read_int(j, "rerankMaxCandidates", p.rerank_max_candidates);
    read_double(j, "mmrLambda", p.mmr_lambda);
    read_int(j, "explorationExposureCeiling", p.exploration_exposure_ceiling);
    read_double(j, "explorationDnsWeight", p.exploration_dns_weight);
    read_double(j, "explorationScoreWeight", p.exploration_score_weight);

    if (j.contains("weights") && j["weights"].is_object()) {
        auto& w = j["weights"];
        read_double(w, "prs", p.weights.prs);
        read_double(w, "cvs", p.weights.cvs);
        read_double(w, "dns", p.weights.dns);
    }

    if (j.contains("strategy") && j["strategy"].is_string()) {
        auto name = j["strategy"].get<std::string>();
        auto parsed = parse_strategy(name);
        if (parsed && *parsed != Strategy::None) {
            p.strategy = *parsed;
        } else {
            std::cerr << "[params] Unknown strategy '" << name << "', keeping "
                      << strategy_name(p.strategy) << "\n";
        }
    }

    if (j.contains("dpp") && j["dpp"].is_object()) apply_dpp(p.dpp, j["dpp"]);
    if (j.contains("scoring") && j["scoring"].is_object()) apply_scoring(p.scoring, j["scoring"]);
    if (j.contains("slider") && j["slider"].is_object()) apply_slider(p.slider, j["slider"]);
    if (j.contains("explainThresholds") && j["explainThresholds"].is_object())
        apply_explain(p.explain, j["explainThresholds"]);

    sanitize(p);
    return p;
}

json params_to_json(const AlgorithmParams& p) {
    return {
        {"diversityCapN", p.diversity_cap_n},
        {"diversityCapK", p.diversity_cap_k},
        {"explorationBudget", p.exploration_budget},
        {"weights", {{"prs", p.weights.prs}, {"cvs", p.weights.cvs}, {"dns", p.weights.dns}}},
        {"rerankMaxCandidates", p.rerank_max_candidates},
        {"strategy", strategy_name(p.strategy)},
        {"mmrLambda", p.mmr_lambda},
        {"explorationExposureCeiling", p.exploration_exposure_ceiling},
        {"explorationDnsWeight", p.exploration_dns_weight},
        {"explorationScoreWeight", p.exploration_score_weight},
        {"dpp", {
            {"diversityWeight", p.dpp.diversity_weight},
            {"temperature", p.dpp.temperature},
            {"regularization", p.dpp.regularization},
            {"maxItems", p.dpp.max_items}
        }},
        {"scoring", {
            {"cvsWeights", {
                {"like", p.scoring.cvs_weights.like},
                {"context", p.scoring.cvs_weights.context},
                {"collection", p.scoring.cvs_weights.collection},
                {"bridge", p.scoring.cvs_weights.bridge},
                {"sustain", p.scoring.cvs_weights.sustain}
            }},
            {"clusterNoveltyFactor", p.scoring.cluster_novelty_factor},
            {"timeHalfLifeHours", p.scoring.time_half_life_hours},
            {"dnsClusterWeight", p.scoring.dns_cluster_weight},
            {"dnsTimeWeight", p.scoring.dns_time_weight},
            {"spamPenalty", p.scoring.spam_penalty}
        }},
        {"slider", {
            {"deltaMax", p.slider.delta_max},
            {"minWeight", p.slider.min_weight},
            {"maxWeight", p.slider.max_weight},
            {"maxIterations", p.slider.max_iterations},
            {"dnsRatio", p.slider.dns_ratio},
            {"cvsRatio", p.slider.cvs_ratio},
            {"kMinMultiplier", p.slider.k_min_multiplier},
            {"kMaxMultiplier", p.slider.k_max_multiplier},
            {"explorationMinMultiplier", p.slider.exploration_min_multiplier},
            {"explorationMaxMultiplier", p.slider.exploration_max_multiplier},
            {"budgetMin", p.slider.budget_min},
            {"budgetMax", p.slider.budget_max}
        }},
        {"explainThresholds", {
            {"contextHigh", p.explain.context_high},
            {"bridgeHigh", p.explain.bridge_high},
            {"supportDensityHigh", p.explain.support_density_high},
            {"newClusterExposureLimit", p.explain.new_cluster_exposure_limit},
            {"prsSimilarityMin", p.explain.prs_similarity_min},
            {"supportPriorLikes", p.explain.support_prior_likes},
            {"supportPriorViews", p.explain.support_prior_views}
        }}
    };
}

} // namespace culturerank
