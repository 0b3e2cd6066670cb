#include "scoring.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

namespace culturerank {

double calculate_cvs(const CvsComponents& c, const CvsWeights& w) {
    double cvs = w.like * finite_or(c.like, 0.0) +
                 w.context * finite_or(c.context, 0.0) +
                 w.collection * finite_or(c.collection, 0.0) +
                 w.bridge * finite_or(c.bridge, 0.0) +
                 w.sustain * finite_or(c.sustain, 0.0);
    return clamp01(cvs);
}

double calculate_dns(const Candidate& candidate, const ClusterExposures& exposures,
                     int64_t now_ts, const ScoringConfig& config) {
    auto exposure = static_cast<double>(exposure_count(exposures, candidate.cluster_id));
    double factor = std::max(0.0, finite_or(config.cluster_novelty_factor, 0.0));
    double cluster_novelty = 1.0 / (1.0 + exposure * factor);

    double age_ms = static_cast<double>(now_ts) - static_cast<double>(candidate.created_at);
    double age_hours = std::max(0.0, age_ms / kMsPerHour);
    double half_life = std::max(1e-6, finite_or(config.time_half_life_hours, 1e-6));
    double time_novelty = std::exp(-std::log(2.0) * age_hours / half_life);

    double dns = config.dns_cluster_weight * cluster_novelty +
                 config.dns_time_weight * time_novelty;
    return clamp01(dns);
}

double calculate_penalty(const Candidate& candidate, const ScoringConfig& config) {
    double penalty = 0.0;
    if (candidate.quality.spam_suspect) {
        penalty += config.spam_penalty;
    }
    return clamp01(penalty);
}

ScoreBreakdown calculate_mixed_score(const Candidate& candidate,
                                     const ClusterExposures& exposures,
                                     int64_t now_ts,
                                     const ScoreWeights& weights,
                                     const ScoringConfig& config) {
    ScoreBreakdown b;
    b.prs = clamp01(candidate.features.prs.value_or(0.0));
    b.cvs = calculate_cvs(candidate.features.cvs, config.cvs_weights);
    b.dns = calculate_dns(candidate, exposures, now_ts, config);
    b.penalty = calculate_penalty(candidate, config);

    double raw = weights.prs * b.prs + weights.cvs * b.cvs + weights.dns * b.dns - b.penalty;
    b.final_score = round9(raw);

    b.prs = round9(b.prs);
    b.cvs = round9(b.cvs);
    b.dns = round9(b.dns);
    b.penalty = round9(b.penalty);
    return b;
}

} // namespace culturerank
